// tests/admin/test_admin_ops.cpp
//
// Admin guard, admin operations and configuration layering.
//
// What it tests:
// 1) require_admin: loopback peer passes, proxied loopback does not,
//    bearer token passes from anywhere, wrong token is 401
// 2) AdminOps mutate state and emit their audit events
// 3) admin HTTP routes answer with the documented shapes
// 4) settings file + environment layering, invalid values ignored

#include <sodium.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "httplib.h"

#include "access_cache.h"
#include "admin_routes.h"
#include "cid_util.h"
#include "denylist_sync.h"
#include "gateway_config.h"
#include "jurisdiction.h"

namespace fs = std::filesystem;
using nlohmann::json;

static int g_failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        g_failures++;
    }
}

static bool guard(const std::string& remote, const std::string& auth, const std::string& xff,
                  const std::string& token, int* status) {
    httplib::Request req;
    httplib::Response res;
    req.remote_addr = remote;
    if (!auth.empty()) req.headers.emplace("Authorization", auth);
    if (!xff.empty()) req.headers.emplace("X-Forwarded-For", xff);
    const bool ok = cidgate::require_admin(req, res, token);
    if (status) *status = ok ? 200 : res.status;
    return ok;
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }

    // ---- loopback detection ----
    expect(cidgate::is_loopback_addr("127.0.0.1"), "127.0.0.1 loopback");
    expect(cidgate::is_loopback_addr("127.8.9.10"), "127/8 loopback");
    expect(cidgate::is_loopback_addr("::1"), "::1 loopback");
    expect(cidgate::is_loopback_addr("::ffff:127.0.0.1"), "mapped loopback");
    expect(!cidgate::is_loopback_addr("10.0.0.1"), "10.0.0.1 not loopback");
    expect(!cidgate::is_loopback_addr("1127.0.0.1"), "prefix trickery rejected");

    // ---- guard ----
    {
        int st = 0;
        expect(guard("127.0.0.1", "", "", "", &st), "loopback without token configured");
        expect(!guard("10.1.2.3", "", "", "", &st) && st == 403, "remote without token configured => 403");
        expect(!guard("127.0.0.1", "", "203.0.113.9", "", &st) && st == 403, "proxied loopback => 403");

        const std::string tok = "s3cret-token";
        expect(guard("10.1.2.3", "Bearer s3cret-token", "", tok, &st), "remote with right token");
        expect(!guard("10.1.2.3", "Bearer wrong-token!", "", tok, &st) && st == 401, "wrong token => 401");
        expect(!guard("127.0.0.1", "Bearer nope", "", tok, &st) && st == 401, "wrong token even from loopback => 401");
        expect(!guard("10.1.2.3", "", "", tok, &st) && st == 401, "remote without header => 401");
        expect(guard("::1", "", "", tok, &st), "loopback still allowed when token configured");
    }

    // ---- AdminOps ----
    const fs::path dir = fs::temp_directory_path() / ("cidgate_admin_" + cidgate::random_hex(4));
    fs::create_directories(dir);
    const fs::path overrides = dir / "blacklist.txt";
    {
        std::ofstream f(overrides);
        f << "QmAdmin111 malware\n";
    }

    cidgate::AccessCacheConfig ccfg;
    ccfg.override_path = overrides.string();
    ccfg.snapshot_path = (dir / "snapshot.txt").string();
    cidgate::AccessCache cache(ccfg);

    cidgate::DenylistSyncConfig scfg;
    scfg.source_url = "http://127.0.0.1:1/denylist.conf";
    scfg.snapshot_path = ccfg.snapshot_path;
    scfg.timeout_sec = 1;
    cidgate::DenylistSync sync(scfg);

    cidgate::JurisdictionRegistry reg;
    reg.set_active("US");

    std::vector<cidgate::AuditEvent> events;
    cidgate::AdminOps ops(cache, sync, reg, [&](const cidgate::AuditEvent& e) { events.push_back(e); });

    {
        std::string prev;
        expect(ops.set_jurisdiction("pl", "tester", &prev), "switch to PL");
        expect(prev == "US" && ops.active_jurisdiction() == "PL", "previous/active codes");
        expect(!ops.set_jurisdiction("ZZ", "tester", &prev), "unknown code rejected");
        expect(ops.active_jurisdiction() == "PL", "active unchanged");

        int changes = 0, failed_changes = 0;
        for (const auto& e : events) {
            if (e.event != "jurisdiction.change") continue;
            if (e.outcome == "ok") changes++;
            else failed_changes++;
        }
        expect(changes == 1 && failed_changes == 1, "jurisdiction.change audited for both attempts");

        expect(ops.test_blacklist("QmAdmin111").value_or("") == "malware", "test_blacklist hit");
        expect(!ops.test_blacklist("QmNope000"), "test_blacklist miss");

        {
            std::ofstream f(overrides, std::ios::app);
            f << "QmAdmin222 phishing\n";
        }
        expect(ops.reload_blacklist("tester") == 2, "reload picks up edit");
        expect(ops.blacklist_stats().override_count == 2, "stats after reload");

        const cidgate::SyncResult r = ops.sync_denylist("tester");
        expect(!r.ok && r.rc == cidgate::SyncRc::NETWORK, "sync failure reported");
        bool sync_event = false;
        for (const auto& e : events) {
            if (e.event == "denylist.sync" && e.outcome == "fail" &&
                e.f.count("actor") && e.f.at("actor") == "tester") sync_event = true;
        }
        expect(sync_event, "failed sync audited with actor");
    }

    // ---- HTTP surface (loopback client, no token) ----
    {
        httplib::Server srv;
        cidgate::register_admin_routes(srv, ops, "");
        const int port = srv.bind_to_any_port("127.0.0.1");
        if (port <= 0) {
            std::cerr << "FAIL: could not bind admin server\n";
            return 3;
        }
        std::thread th([&]() { srv.listen_after_bind(); });
        while (!srv.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(5));

        httplib::Client cli("127.0.0.1", port);

        auto r = cli.Post("/admin/jurisdiction", R"({"country":"fr"})", "application/json");
        expect(r && r->status == 200, "POST /admin/jurisdiction ok");
        if (r) {
            const json j = json::parse(r->body, nullptr, false);
            expect(j.is_object() && j.value("active", "") == "FR" && j.value("previous", "") == "PL",
                   "jurisdiction switch body");
        }

        r = cli.Post("/admin/jurisdiction", R"({"country":"XX"})", "application/json");
        expect(r && r->status == 400, "unknown jurisdiction => 400");

        r = cli.Post("/admin/jurisdiction", "not json", "application/json");
        expect(r && r->status == 400, "bad body => 400");

        r = cli.Get("/admin/jurisdictions");
        expect(r && r->status == 200, "GET /admin/jurisdictions");
        if (r) {
            const json j = json::parse(r->body, nullptr, false);
            expect(j.is_object() && j["available"].size() == 4 && j.value("active", "") == "FR",
                   "jurisdiction list body");
        }

        r = cli.Get("/admin/test-blacklist/QmAdmin222");
        expect(r && r->status == 200, "GET /admin/test-blacklist");
        if (r) {
            const json j = json::parse(r->body, nullptr, false);
            expect(j.is_object() && j.value("blocked", false) && j.value("reason", "") == "phishing",
                   "test-blacklist body");
        }

        r = cli.Post("/admin/reload-blacklist", "", "application/json");
        expect(r && r->status == 200 && r->body.find("\"count\":2") != std::string::npos, "reload endpoint");

        r = cli.Get("/admin/blacklist-stats");
        expect(r && r->status == 200 && r->body.find("\"malware\":1") != std::string::npos, "stats endpoint");

        r = cli.Post("/admin/sync-denylist", "", "application/json");
        expect(r && r->status == 502, "failed sync => 502");

        srv.stop();
        th.join();
    }

    // ---- configuration layering ----
    {
        const fs::path settings = dir / "settings.json";
        {
            std::ofstream f(settings);
            f << R"({
  // comments are allowed
  "listen_port": 9090,
  "upstream": "http://10.0.0.5:8080",
  "jurisdiction": "EU",
  "cache_window_sec": 60,
  "language": 42
})";
        }

        std::map<std::string, std::string> env = {
            {"CIDGATE_SETTINGS_PATH", settings.string()},
            {"CIDGATE_JURISDICTION", "PL"},
            {"CIDGATE_UPSTREAM_TIMEOUT", "not-a-number"},
            {"CIDGATE_ADMIN_TOKEN", "abc"},
        };
        cidgate::EnvLookup lookup = [&env](const char* name) -> const char* {
            auto it = env.find(name);
            return it == env.end() ? nullptr : it->second.c_str();
        };

        const cidgate::GatewayConfig cfg = cidgate::load_gateway_config(lookup);
        expect(cfg.listen_port == 9090, "port from settings file");
        expect(cfg.upstream == "http://10.0.0.5:8080", "upstream from settings file");
        expect(cfg.jurisdiction == "PL", "env overrides settings file");
        expect(cfg.cache_window_sec == 60, "cache window from settings file");
        expect(cfg.language == "en", "wrong JSON type ignored");
        expect(cfg.upstream_timeout_sec == 120, "invalid env number ignored");
        expect(cfg.admin_token == "abc", "admin token from env");
        expect(cfg.listen_host == "0.0.0.0" && cfg.denylist_path == "blacklist-ipfs-official.txt",
               "untouched defaults");

        cidgate::GatewayConfig broken;
        {
            std::ofstream f(dir / "broken.json");
            f << "{ not json";
        }
        std::string err;
        expect(!cidgate::apply_settings_file((dir / "broken.json").string(), &broken, &err) && !err.empty(),
               "broken settings file reported");
        expect(cidgate::apply_settings_file((dir / "absent.json").string(), &broken, &err),
               "absent settings file is fine");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (g_failures) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: admin and config tests passed\n";
    return 0;
}
