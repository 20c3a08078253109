#include "admin_routes.h"

#include "audit_fields.h"
#include "cid_util.h"
#include "denylist_scheduler.h"

#include <nlohmann/json.hpp>
#include <sodium.h>

#include <iostream>
#include <utility>

namespace cidgate {

using nlohmann::json;

static void reply_json(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_header("Content-Type", "application/json; charset=utf-8");
    res.set_header("Cache-Control", "no-store");
    res.body = body;
}

// ---- AdminOps --------------------------------------------------------------

AdminOps::AdminOps(AccessCache& cache,
                   DenylistSync& sync,
                   JurisdictionRegistry& jurisdictions,
                   AuditFn audit)
    : cache_(cache), sync_(sync), jurisdictions_(jurisdictions), audit_(std::move(audit)) {}

void AdminOps::emit_(const std::string& event, const std::string& outcome,
                     std::map<std::string, std::string> f) {
    if (!audit_) return;
    AuditEvent ev;
    ev.event = event;
    ev.outcome = outcome;
    ev.level = 2;
    ev.f = std::move(f);
    audit_(ev);
}

std::size_t AdminOps::reload_blacklist(const std::string& actor) {
    const std::size_t n = cache_.reload();
    std::cerr << "[admin] blacklist reloaded entries=" << n << std::endl;
    emit_("blacklist.reload", "ok", {{"count", std::to_string(n)}, {"actor", actor}});
    return n;
}

SyncResult AdminOps::sync_denylist(const std::string& actor) {
    // run_denylist_sync emits denylist.sync with trigger=admin.
    AuditFn audit = audit_;
    if (audit) {
        audit = [this, actor](const AuditEvent& e) {
            AuditEvent ev = e;
            ev.f["actor"] = actor;
            audit_(ev);
        };
    }
    return run_denylist_sync(sync_, cache_, audit, "admin");
}

std::string AdminOps::active_jurisdiction() const {
    ProfilePtr p = jurisdictions_.active();
    return p ? p->country_code() : std::string();
}

bool AdminOps::set_jurisdiction(const std::string& code,
                                const std::string& actor,
                                std::string* previous) {
    const std::string before = active_jurisdiction();
    if (previous) *previous = before;

    const bool ok = jurisdictions_.set_active(code);
    emit_("jurisdiction.change", ok ? "ok" : "fail",
          {{"from", before},
           {"to", ok ? active_jurisdiction() : upper_ascii(trim_ws(code))},
           {"actor", actor}});
    return ok;
}

std::map<std::string, std::string> AdminOps::list_jurisdictions() const {
    return jurisdictions_.list_available();
}

BlacklistStats AdminOps::blacklist_stats(std::size_t sample) {
    return cache_.stats(sample);
}

std::optional<std::string> AdminOps::test_blacklist(const std::string& cid) {
    return cache_.is_blocked(trim_ws(cid));
}

// ---- guard -----------------------------------------------------------------

bool is_loopback_addr(const std::string& addr) {
    std::string a = lower_ascii(trim_ws(addr));
    if (a == "::1") return true;

    const std::string mapped = "::ffff:";
    if (a.compare(0, mapped.size(), mapped) == 0) a = a.substr(mapped.size());

    return a.compare(0, 4, "127.") == 0;
}

/*
require_admin
=============

The gateway has no user accounts; admin operations are reachable either from
the host itself or with the operator's bearer token.

- Requests relayed by a reverse proxy carry X-Forwarded-For; their loopback
  peer address is the proxy, not the operator, so they must use the token.
- Tokens are compared with sodium_memcmp (constant time for equal lengths).
*/
bool require_admin(const httplib::Request& req,
                   httplib::Response& res,
                   const std::string& admin_token) {
    const std::string auth = req.get_header_value("Authorization");
    const std::string prefix = "Bearer ";

    if (!admin_token.empty() && auth.compare(0, prefix.size(), prefix) == 0) {
        const std::string presented = trim_ws(auth.substr(prefix.size()));
        if (presented.size() == admin_token.size() &&
            sodium_memcmp(presented.data(), admin_token.data(), admin_token.size()) == 0) {
            return true;
        }
        reply_json(res, 401, json({{"ok", false},
                                   {"error", "unauthorized"},
                                   {"message", "invalid admin token"}}).dump());
        return false;
    }

    const bool proxied = !req.get_header_value("X-Forwarded-For").empty();
    if (!proxied && is_loopback_addr(req.remote_addr)) return true;

    if (!admin_token.empty()) {
        reply_json(res, 401, json({{"ok", false},
                                   {"error", "unauthorized"},
                                   {"message", "admin token required"}}).dump());
        return false;
    }

    reply_json(res, 403, json({{"ok", false},
                               {"error", "forbidden"},
                               {"message", "admin endpoints are local only"}}).dump());
    return false;
}

// ---- routes ----------------------------------------------------------------

void register_admin_routes(httplib::Server& srv, AdminOps& ops, const std::string& admin_token) {
    srv.Post("/admin/reload-blacklist", [&ops, admin_token](const httplib::Request& req, httplib::Response& res) {
        if (!require_admin(req, res, admin_token)) return;

        const std::size_t n = ops.reload_blacklist(client_ip(req));
        reply_json(res, 200, json({{"ok", true}, {"count", n}}).dump());
    });

    srv.Post("/admin/sync-denylist", [&ops, admin_token](const httplib::Request& req, httplib::Response& res) {
        if (!require_admin(req, res, admin_token)) return;

        const SyncResult r = ops.sync_denylist(client_ip(req));
        json j = {
            {"ok", r.ok},
            {"rc", sync_rc_str(r.rc)},
            {"count", r.count},
            {"http_status", r.http_status},
            {"fetched_at", r.fetched_at},
            {"message", r.detail},
        };
        reply_json(res, r.ok ? 200 : 502, j.dump());
    });

    srv.Post("/admin/jurisdiction", [&ops, admin_token](const httplib::Request& req, httplib::Response& res) {
        if (!require_admin(req, res, admin_token)) return;

        std::string code;
        try {
            const json body = json::parse(req.body);
            if (body.is_object()) code = body.value("country", std::string());
        } catch (const json::exception&) {
            reply_json(res, 400, json({{"ok", false},
                                       {"error", "bad_request"},
                                       {"message", "expected JSON {\"country\":\"XX\"}"}}).dump());
            return;
        }
        if (trim_ws(code).empty()) {
            reply_json(res, 400, json({{"ok", false},
                                       {"error", "bad_request"},
                                       {"message", "missing country"}}).dump());
            return;
        }

        std::string previous;
        if (!ops.set_jurisdiction(code, client_ip(req), &previous)) {
            json avail = json::array();
            for (const auto& kv : ops.list_jurisdictions()) avail.push_back(kv.first);
            reply_json(res, 400, json({{"ok", false},
                                       {"error", "unknown_jurisdiction"},
                                       {"message", "Jurisdiction not found"},
                                       {"active", previous},
                                       {"available", avail}}).dump());
            return;
        }

        reply_json(res, 200, json({{"ok", true},
                                   {"previous", previous},
                                   {"active", ops.active_jurisdiction()}}).dump());
    });

    srv.Get("/admin/jurisdictions", [&ops, admin_token](const httplib::Request& req, httplib::Response& res) {
        if (!require_admin(req, res, admin_token)) return;

        json list = json::object();
        for (const auto& kv : ops.list_jurisdictions()) list[kv.first] = kv.second;
        const std::string active = ops.active_jurisdiction();
        reply_json(res, 200, json({{"ok", true},
                                   {"active", active.empty() ? json(nullptr) : json(active)},
                                   {"available", list}}).dump());
    });

    srv.Get("/admin/blacklist-stats", [&ops, admin_token](const httplib::Request& req, httplib::Response& res) {
        if (!require_admin(req, res, admin_token)) return;

        const BlacklistStats st = ops.blacklist_stats(10);
        json by_reason = json::object();
        for (const auto& kv : st.by_reason) by_reason[kv.first] = kv.second;

        reply_json(res, 200, json({{"ok", true},
                                   {"total", st.total},
                                   {"override_count", st.override_count},
                                   {"denylist_count", st.denylist_count},
                                   {"by_reason", by_reason},
                                   {"sample", st.sample_cids}}).dump());
    });

    srv.Get(R"(/admin/test-blacklist/([^/]+))", [&ops, admin_token](const httplib::Request& req, httplib::Response& res) {
        if (!require_admin(req, res, admin_token)) return;

        const std::string cid = req.matches.size() > 1 ? req.matches[1].str() : "";
        const auto reason = ops.test_blacklist(cid);
        reply_json(res, 200, json({{"ok", true},
                                   {"cid", cid},
                                   {"blocked", reason.has_value()},
                                   {"reason", reason ? json(*reason) : json(nullptr)}}).dump());
    });
}

} // namespace cidgate
