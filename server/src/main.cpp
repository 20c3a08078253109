#include <atomic>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "httplib.h"
#include <nlohmann/json.hpp>
#include <sodium.h>

#include "access_cache.h"
#include "admin_routes.h"
#include "audit_log.h"
#include "cid_util.h"
#include "denylist_scheduler.h"
#include "denylist_sync.h"
#include "gateway.h"
#include "gateway_config.h"
#include "jurisdiction.h"
#include "proxy_streamer.h"

using nlohmann::json;

static void reply_json(httplib::Response& res, int code, const std::string& body_json) {
    res.status = code;
    res.set_header("Content-Type", "application/json");
    res.set_header("Cache-Control", "no-store");
    res.body = body_json;
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    const cidgate::GatewayConfig cfg = cidgate::load_gateway_config();

    // ---- Audit log (hash-chained JSONL) ----
    try {
        std::filesystem::create_directories(cfg.audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    const std::string audit_jsonl_path = (std::filesystem::path(cfg.audit_dir) / "cidgate_audit.jsonl").string();
    const std::string audit_state_path = (std::filesystem::path(cfg.audit_dir) / "cidgate_audit.state").string();
    cidgate::AuditLog audit(audit_jsonl_path, audit_state_path);

    if (!cfg.audit_min_level.empty()) {
        if (!audit.set_min_level_str(cfg.audit_min_level)) {
            std::cerr << "[settings] WARNING: invalid audit_min_level=" << cfg.audit_min_level << std::endl;
        }
    }
    std::cerr << "[settings] audit_min_level=" << audit.min_level_str() << std::endl;

    const cidgate::AuditFn audit_fn = [&audit](const cidgate::AuditEvent& e) {
        if (!audit.append(e)) {
            std::cerr << "[audit] WARNING: append failed event=" << e.event << std::endl;
        }
    };

    // ---- Jurisdiction ----
    cidgate::JurisdictionRegistry jurisdictions;
    if (!jurisdictions.set_active(cfg.jurisdiction)) {
        std::cerr << "[jurisdiction] WARNING: unknown CIDGATE_JURISDICTION=" << cfg.jurisdiction
                  << ", falling back to US" << std::endl;
        if (!jurisdictions.set_active("US")) {
            std::cerr << "[jurisdiction] WARNING: no US profile registered, block pages use generic text" << std::endl;
        }
    }

    // ---- Access policy ----
    cidgate::AccessCacheConfig cache_cfg;
    cache_cfg.override_path = cfg.override_path;
    cache_cfg.snapshot_path = cfg.denylist_path;
    cache_cfg.window_sec = cfg.cache_window_sec;
    cidgate::AccessCache cache(cache_cfg);

    cidgate::DenylistSyncConfig sync_cfg;
    sync_cfg.source_url = cfg.denylist_url;
    sync_cfg.snapshot_path = cfg.denylist_path;
    cidgate::DenylistSync denylist(sync_cfg);

    // ---- Upstream ----
    cidgate::ProxyStreamerConfig proxy_cfg;
    proxy_cfg.upstream_base = cfg.upstream;
    proxy_cfg.read_timeout_sec = cfg.upstream_timeout_sec;
    proxy_cfg.connect_timeout_sec = cfg.upstream_connect_timeout_sec;
    cidgate::ProxyStreamer proxy(proxy_cfg);

    std::cerr << "[gateway] upstream=" << cfg.upstream
              << " overrides=" << cfg.override_path
              << " denylist=" << cfg.denylist_path
              << " blacklist_entries=" << cache.reload() << std::endl;

    // ---- HTTP ----
    httplib::Server srv;

    cidgate::GatewayContext gctx;
    gctx.cache = &cache;
    gctx.jurisdictions = &jurisdictions;
    gctx.proxy = &proxy;
    gctx.audit = audit_fn;
    gctx.language = cidgate::lower_ascii(cfg.language);

    cidgate::register_gateway_routes(srv, gctx);
    cidgate::register_copyright_routes(srv, gctx);

    cidgate::AdminOps admin_ops(cache, denylist, jurisdictions, audit_fn);
    cidgate::register_admin_routes(srv, admin_ops, cfg.admin_token);

    if (cfg.admin_token.empty()) {
        std::cerr << "[admin] no CIDGATE_ADMIN_TOKEN, admin endpoints are loopback-only" << std::endl;
    }

    srv.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        const std::string upstream_state = cidgate::probe_upstream(cfg.upstream, 4);
        cidgate::ProfilePtr prof = jurisdictions.active();

        json j = {
            {"timestamp", cidgate::now_iso_utc()},
            {"ipfs", upstream_state},
            {"blacklist", cache.merged()->size()},
            {"jurisdiction", prof ? json(prof->country_code()) : json(nullptr)},
            {"audit", std::filesystem::exists(audit_jsonl_path) ? "ok" : "empty"},
        };
        reply_json(res, upstream_state == "ok" ? 200 : 503, j.dump());
    });

    srv.Get("/api/v1/audit/verify", [&](const httplib::Request& req, httplib::Response& res) {
        if (!cidgate::require_admin(req, res, cfg.admin_token)) return;

        const cidgate::AuditLog::VerifyResult vr = audit.verify_chain();
        json j = {
            {"ok", vr.ok},
            {"lines", vr.lines},
            {"first_bad_line", vr.first_bad_line},
            {"last_line_hash", vr.last_line_hash},
            {"state_hash", vr.state_hash},
            {"detail", vr.detail},
        };
        reply_json(res, 200, j.dump());
    });

    // ---- Background denylist refresh ----
    std::atomic<bool> scheduler_stop{false};
    cidgate::DenylistSchedulerConfig sched_cfg;
    sched_cfg.interval_sec = cfg.denylist_interval_sec;
    sched_cfg.max_age_sec = cfg.denylist_interval_sec;
    std::thread scheduler = cidgate::start_denylist_scheduler(
        denylist, cache, audit_fn, sched_cfg, scheduler_stop);

    {
        cidgate::AuditEvent ev;
        ev.event = "service.startup";
        ev.outcome = "ok";
        ev.level = 2;
        ev.f["listen"] = cfg.listen_host + ":" + std::to_string(cfg.listen_port);
        ev.f["upstream"] = cfg.upstream;
        ev.f["jurisdiction"] = jurisdictions.active() ? jurisdictions.active()->country_code() : "";
        audit_fn(ev);
    }

    std::cerr << "cidgate listening on " << cfg.listen_host << ":" << cfg.listen_port << std::endl;
    const bool listened = srv.listen(cfg.listen_host, cfg.listen_port);
    if (!listened) {
        std::cerr << "listen failed on " << cfg.listen_host << ":" << cfg.listen_port << std::endl;
    }

    scheduler_stop.store(true);
    if (scheduler.joinable()) scheduler.join();

    return listened ? 0 : 1;
}
