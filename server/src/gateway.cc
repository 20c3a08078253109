// gateway.cc
//
// Request path for content retrieval and notice intake.
//
// Order of operations for /ipfs/, /ipns/ and /content/:
//   1) split "<cid>[/<rest>]" from the captured path
//   2) access decision (AccessCache::is_blocked)
//   3) blocked: 451 with the active jurisdiction's wording, nothing forwarded
//   4) allowed: ProxyStreamer, body relayed chunk by chunk
//
// The decision is made before any upstream connection is opened.

#include "gateway.h"

#include "audit_fields.h"
#include "cid_util.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <utility>

namespace cidgate {

using nlohmann::json;

static constexpr std::chrono::milliseconds kClientPollInterval{250};

static void reply_json(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_header("Content-Type", "application/json; charset=utf-8");
    res.set_header("Cache-Control", "no-store");
    res.body = body;
}

static void reply_text(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_header("Content-Type", "text/plain; charset=utf-8");
    res.body = body;
}

static std::string html_escape(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '&': o += "&amp;"; break;
            case '<': o += "&lt;"; break;
            case '>': o += "&gt;"; break;
            case '"': o += "&quot;"; break;
            case '\'': o += "&#39;"; break;
            default: o += c;
        }
    }
    return o;
}

static void emit(const GatewayContext& ctx,
                 const std::string& event,
                 const std::string& outcome,
                 int level,
                 std::map<std::string, std::string> f) {
    if (!ctx.audit) return;
    AuditEvent ev;
    ev.event = event;
    ev.outcome = outcome;
    ev.level = level;
    ev.f = std::move(f);
    ctx.audit(ev);
}

bool split_cid_path(const std::string& captured, CidPath* out) {
    std::string s = captured;
    while (!s.empty() && s.front() == '/') s.erase(s.begin());

    const auto slash = s.find('/');
    CidPath cp;
    if (slash == std::string::npos) {
        cp.cid = s;
    } else {
        cp.cid = s.substr(0, slash);
        cp.rest = s.substr(slash + 1);
    }
    if (cp.cid.empty()) return false;

    if (out) *out = std::move(cp);
    return true;
}

std::string make_notice_reference() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &tm);
    return std::string("DMCA-") + buf + "-" + random_hex(2);
}

// ---- 451 -------------------------------------------------------------------

static std::string blocked_html(const BlockedPageText& t,
                                const std::string& cid,
                                const std::string& ref) {
    std::string h;
    h += "<!doctype html>\n<html lang=\"" + html_escape(t.language) + "\">\n<head>\n";
    h += "<meta charset=\"utf-8\">\n<title>" + html_escape(t.title) + "</title>\n</head>\n<body>\n";
    h += "<h1>" + html_escape(t.title) + "</h1>\n";
    h += "<p>" + html_escape(t.message) + "</p>\n";
    h += "<p><strong>" + html_escape(t.reason_text.empty() ? t.reason : t.reason_text) + "</strong></p>\n";
    if (!t.law.empty()) h += "<p>" + html_escape(t.law) + "</p>\n";
    if (!t.action.empty()) {
        h += "<p>" + html_escape(t.action);
        if (!t.link.empty())
            h += " <a href=\"" + html_escape(t.link) + "\">" + html_escape(t.link) + "</a>";
        h += "</p>\n";
    }
    if (!t.note.empty()) h += "<p><small>" + html_escape(t.note) + "</small></p>\n";
    h += "<p><code>" + html_escape(cid) + "</code></p>\n";
    h += "<p><small>ref " + html_escape(ref) + "</small></p>\n";
    h += "</body>\n</html>\n";
    return h;
}

void render_blocked(const GatewayContext& ctx,
                    const httplib::Request& req,
                    httplib::Response& res,
                    const std::string& cid,
                    const std::string& reason) {
    std::string lang = lower_ascii(trim_ws(req.get_param_value("lang")));
    if (lang.empty()) lang = ctx.language;

    ProfilePtr prof = ctx.jurisdictions ? ctx.jurisdictions->active() : nullptr;
    const BlockedPageText t = prof ? prof->blocked_page_text(reason, lang)
                                   : generic_blocked_page_text(reason);

    const std::string ref = random_hex(4);

    res.status = 451;
    res.set_header("Cache-Control", "no-cache, no-store, must-revalidate");
    res.set_header("X-Block-Reason", reason);

    const std::string accept = req.get_header_value("Accept");
    if (accept.find("text/html") != std::string::npos) {
        res.set_content(blocked_html(t, cid, ref), "text/html; charset=utf-8");
        return;
    }

    json j = {
        {"error", "Unavailable For Legal Reasons"},
        {"status", 451},
        {"cid", cid},
        {"reference", ref},
        {"jurisdiction", prof ? json(prof->country_code()) : json(nullptr)},
        {"title", t.title},
        {"message", t.message},
        {"reason", t.reason},
        {"reason_text", t.reason_text},
        {"language", t.language},
    };
    if (!t.law.empty()) j["law"] = t.law;
    if (!t.action.empty()) j["action"] = t.action;
    if (!t.link.empty()) j["link"] = t.link;
    if (!t.note.empty()) j["note"] = t.note;

    res.set_content(j.dump(), "application/json; charset=utf-8");
}

// ---- proxy -----------------------------------------------------------------

static void relay_outcome(const GatewayContext& ctx,
                          httplib::Response& res,
                          StreamOutcome so,
                          const std::string& target,
                          const std::string& ip) {
    switch (so.kind) {
        case StreamKind::NOT_FOUND:
            reply_text(res, 404, "Not Found");
            return;

        case StreamKind::TIMEOUT:
            std::cerr << "[proxy] timeout target=" << target << " detail=" << so.detail << std::endl;
            emit(ctx, "upstream.timeout", "fail", 1,
                 {{"target", shorten(target, 128)}, {"ip", ip}, {"detail", so.detail}});
            reply_text(res, 504, "Gateway Timeout");
            return;

        case StreamKind::UNREACHABLE:
            std::cerr << "[proxy] unreachable target=" << target << " detail=" << so.detail << std::endl;
            emit(ctx, "upstream.error", "fail", 1,
                 {{"target", shorten(target, 128)}, {"ip", ip}, {"detail", so.detail}});
            reply_text(res, 503, "Service Unavailable");
            return;

        case StreamKind::OK:
            break;
    }

    res.status = so.status;
    res.set_header("Access-Control-Allow-Origin", "*");
    if (so.status >= 200 && so.status < 400) {
        res.set_header("Cache-Control", so.cache_control);
    } else {
        res.set_header("Cache-Control", "no-cache");
    }

    std::shared_ptr<BodyStream> body = so.body;
    res.set_chunked_content_provider(
        so.content_type,
        [body, target](size_t /*offset*/, httplib::DataSink& sink) {
            std::string chunk;
            ChunkChannel::PopRc rc;
            // Upstream may stall; poll the client side so a disconnect is seen.
            while ((rc = body->read_for(&chunk, kClientPollInterval)) == ChunkChannel::PopRc::EMPTY) {
                if (sink.is_writable && !sink.is_writable()) {
                    body->cancel();
                    return false;
                }
            }
            if (rc == ChunkChannel::PopRc::CHUNK) {
                if (!sink.write(chunk.data(), chunk.size())) {
                    body->cancel();
                    return false;
                }
                return true;
            }
            if (body->truncated()) {
                std::cerr << "[proxy] truncated response target=" << target << std::endl;
                return false;
            }
            sink.done();
            return true;
        },
        [body](bool success) {
            if (!success) body->cancel();
        });
}

static void handle_content(const GatewayContext& ctx,
                           const httplib::Request& req,
                           httplib::Response& res,
                           bool name_based) {
    if (req.matches.size() < 2) {
        reply_text(res, 400, "Bad Request");
        return;
    }

    const std::string captured = req.matches[1].str();
    CidPath cp;
    if (!split_cid_path(captured, &cp)) {
        reply_text(res, 400, "Bad Request");
        return;
    }

    const std::string ip = client_ip(req);
    const std::string ns = name_based ? "ipns" : "ipfs";

    emit(ctx, name_based ? "ipns.access" : "content.access", "ok", 0,
         {{name_based ? "name" : "cid", cp.cid},
          {"path", shorten(cp.rest, 128)},
          {"ip", ip},
          {"ua", shorten(req.get_header_value("User-Agent"))}});

    if (auto reason = ctx.cache->is_blocked(cp.cid)) {
        ProfilePtr prof = ctx.jurisdictions ? ctx.jurisdictions->active() : nullptr;
        emit(ctx, "blacklist.hit", "deny", 1,
             {{"cid", cp.cid},
              {"ns", ns},
              {"reason", *reason},
              {"jurisdiction", prof ? prof->country_code() : ""},
              {"ip", ip}});
        render_blocked(ctx, req, res, cp.cid, *reason);
        return;
    }

    std::string upstream_path = cp.cid;
    if (!cp.rest.empty() || (!captured.empty() && captured.back() == '/'))
        upstream_path += "/" + cp.rest;

    const std::string target = "/" + ns + "/" + upstream_path;
    relay_outcome(ctx, res, ctx.proxy->stream(upstream_path, name_based), target, ip);
}

void register_gateway_routes(httplib::Server& srv, const GatewayContext& ctx) {
    srv.Get(R"(/ipfs/(.+))", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_content(ctx, req, res, false);
    });

    srv.Get(R"(/ipns/(.+))", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_content(ctx, req, res, true);
    });

    // Legacy alias of /ipfs/.
    srv.Get(R"(/content/(.+))", [ctx](const httplib::Request& req, httplib::Response& res) {
        handle_content(ctx, req, res, false);
    });
}

// ---- notice intake ---------------------------------------------------------

// JSON object or urlencoded form -> flat string fields.
// Booleans map to "on" / "" so checkbox semantics hold for both encodings.
static bool collect_notice_fields(const httplib::Request& req, NoticeFields* out, std::string* err) {
    const std::string ct = lower_ascii(req.get_header_value("Content-Type"));

    if (ct.find("application/json") != std::string::npos) {
        json j;
        try {
            j = json::parse(req.body);
        } catch (const json::parse_error&) {
            if (err) *err = "invalid JSON";
            return false;
        }
        if (!j.is_object()) {
            if (err) *err = "expected a JSON object";
            return false;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            const json& v = it.value();
            if (v.is_string())       (*out)[it.key()] = v.get<std::string>();
            else if (v.is_boolean()) (*out)[it.key()] = v.get<bool>() ? "on" : "";
            else if (v.is_null())    (*out)[it.key()] = "";
            else                     (*out)[it.key()] = v.dump();
        }
        return true;
    }

    for (const auto& kv : req.params) (*out)[kv.first] = kv.second;
    return true;
}

static ProfilePtr require_profile(const GatewayContext& ctx, httplib::Response& res) {
    ProfilePtr p = ctx.jurisdictions ? ctx.jurisdictions->active() : nullptr;
    if (!p) {
        reply_json(res, 503, json({{"ok", false},
                                   {"error", "no_jurisdiction"},
                                   {"message", "No copyright plugin active"}}).dump());
    }
    return p;
}

void register_copyright_routes(httplib::Server& srv, const GatewayContext& ctx) {
    srv.Get("/copyright/template", [ctx](const httplib::Request&, httplib::Response& res) {
        ProfilePtr p = require_profile(ctx, res);
        if (!p) return;

        json j = {
            {"ok", true},
            {"jurisdiction", p->country_code()},
            {"law_name", p->law_name()},
            {"law_reference", p->law_reference()},
            {"sla_hours", p->sla_hours()},
            {"required_fields", p->required_fields()},
            {"notice_template", p->notice_template()},
            {"counter_notice_template", p->counter_notice_template()},
        };
        reply_json(res, 200, j.dump());
    });

    srv.Get("/copyright/counter-notice", [ctx](const httplib::Request&, httplib::Response& res) {
        ProfilePtr p = require_profile(ctx, res);
        if (!p) return;
        res.set_content(p->counter_notice_template(), "text/markdown; charset=utf-8");
    });

    srv.Get("/copyright/footer", [ctx](const httplib::Request&, httplib::Response& res) {
        ProfilePtr p = ctx.jurisdictions ? ctx.jurisdictions->active() : nullptr;
        res.set_content(p ? p->footer_html() : std::string(), "text/html; charset=utf-8");
    });

    srv.Get("/copyright/reasons", [ctx](const httplib::Request&, httplib::Response& res) {
        ProfilePtr p = require_profile(ctx, res);
        if (!p) return;

        json arr = json::array();
        for (const auto& r : p->takedown_reasons())
            arr.push_back({{"code", r.first}, {"description", r.second}});
        reply_json(res, 200, json({{"ok", true},
                                   {"jurisdiction", p->country_code()},
                                   {"reasons", arr}}).dump());
    });

    srv.Post("/copyright/report", [ctx](const httplib::Request& req, httplib::Response& res) {
        ProfilePtr p = require_profile(ctx, res);
        if (!p) return;

        const std::string ip = client_ip(req);

        NoticeFields fields;
        std::string err;
        if (!collect_notice_fields(req, &fields, &err)) {
            reply_json(res, 400, json({{"ok", false},
                                       {"error", "bad_request"},
                                       {"message", err}}).dump());
            return;
        }

        const NoticeValidation v = p->validate_notice(fields);
        if (!v.ok) {
            emit(ctx, "copyright.notice", "fail", 1,
                 {{"jurisdiction", p->country_code()},
                  {"ip", ip},
                  {"detail", shorten(v.message, 128)}});
            reply_json(res, 400, json({{"ok", false},
                                       {"error", "invalid_notice"},
                                       {"message", v.message}}).dump());
            return;
        }

        const std::string ref = make_notice_reference();
        const auto cid_it = fields.find("infringing_cid");

        emit(ctx, "copyright.notice", "ok", 2,
             {{"jurisdiction", p->country_code()},
              {"reference", ref},
              {"cid", cid_it != fields.end() ? trim_ws(cid_it->second) : ""},
              {"ip", ip}});

        reply_json(res, 200, json({{"ok", true},
                                   {"reference", ref},
                                   {"jurisdiction", p->country_code()},
                                   {"sla_hours", p->sla_hours()},
                                   {"message", p->format_notice_response(ref)}}).dump());
    });
}

} // namespace cidgate
