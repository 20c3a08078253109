// tests/denylist/test_denylist_sync.cpp
//
// Denylist sync regression test.
//
// What it tests:
// 1) nginx `location` lines yield exactly their CIDs; noise is skipped
// 2) split_url edge cases
// 3) sync() against a local fake source writes a full replacement snapshot
// 4) non-2xx and unreachable sources leave the previous snapshot untouched
// 5) run_denylist_sync() reloads the access cache on success
// 6) snapshot staleness by mtime

#include <sodium.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "httplib.h"

#include "access_cache.h"
#include "cid_util.h"
#include "denylist_scheduler.h"
#include "denylist_sync.h"

namespace fs = std::filesystem;

static int g_failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        g_failures++;
    }
}

static std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static const char* kConf =
    "# IPFS gateway denylist\n"
    "location ~ \"^/ipfs/QmXYZabc123\" { return 410; }\n"
    "location ~ \"^/ipfs/bafybeigdyrzt5sfp7udm7hu76uh7y26nf3efuylqabf3oclgtqy55fbzdi/sub/path\" { return 410; }\n"
    "location ~ \"^/ipns/k51qzi5uqu5dlvj2baxnqndepeb86cbk3ng7n3i46uzyxzyqj2xjonzllnv0v8\" { return 410; }\n"
    "location ~ \"^/ipfs/notacid\" { return 410; }\n"
    "rewrite ^/ipfs/QmIgnoredNoLocation /x;\n"
    "garbage line without anything\n";

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }

    // ---- parser ----
    {
        const auto one = cidgate::parse_denylist_conf("location ~ \"^/ipfs/QmXYZ...\" { return 410; }\n");
        expect(one.size() == 1, "single nginx line yields exactly one entry");
        if (!one.empty()) {
            expect(one[0].cid == "QmXYZ...", "cid up to closing quote, got " + one[0].cid);
            expect(one[0].reason == cidgate::kDenylistReason, "denylist reason tag");
        }

        const auto all = cidgate::parse_denylist_conf(kConf);
        expect(all.size() == 3, "three valid CIDs in fixture, got " + std::to_string(all.size()));
        if (all.size() == 3) {
            expect(all[0].cid == "QmXYZabc123", "ipfs cid");
            expect(all[1].cid == "bafybeigdyrzt5sfp7udm7hu76uh7y26nf3efuylqabf3oclgtqy55fbzdi",
                   "cid stops at '/'");
            expect(all[2].cid.rfind("k51", 0) == 0, "ipns key accepted");
        }

        expect(cidgate::parse_denylist_conf("").empty(), "empty text => no entries");
        expect(cidgate::parse_denylist_conf("location ~ \"^/ipfs/\" {}").empty(), "empty segment skipped");
    }

    // ---- split_url ----
    {
        std::string base, path;
        expect(cidgate::split_url("http://127.0.0.1:9000/a/b.conf?x=1", &base, &path), "split ok");
        expect(base == "http://127.0.0.1:9000" && path == "/a/b.conf?x=1", "split parts");
        expect(cidgate::split_url("https://example.org", &base, &path) && path == "/", "bare host => /");
        expect(!cidgate::split_url("example.org/x", &base, &path), "missing scheme rejected");
        expect(!cidgate::split_url("http:///x", &base, &path), "empty host rejected");
    }

    // ---- fake source ----
    std::atomic<int> status_to_serve{200};

    httplib::Server src;
    src.Get("/denylist.conf", [&](const httplib::Request&, httplib::Response& res) {
        res.status = status_to_serve.load();
        res.set_content(kConf, "text/plain");
    });
    const int port = src.bind_to_any_port("127.0.0.1");
    if (port <= 0) {
        std::cerr << "FAIL: could not bind fake denylist source\n";
        return 3;
    }
    std::thread src_thread([&]() { src.listen_after_bind(); });
    while (!src.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    const fs::path dir = fs::temp_directory_path() / ("cidgate_denylist_" + cidgate::random_hex(4));
    fs::create_directories(dir);
    const fs::path snapshot = dir / "blacklist-ipfs-official.txt";
    const fs::path overrides = dir / "blacklist.txt";

    cidgate::DenylistSyncConfig scfg;
    scfg.source_url = "http://127.0.0.1:" + std::to_string(port) + "/denylist.conf";
    scfg.snapshot_path = snapshot.string();
    scfg.timeout_sec = 5;
    cidgate::DenylistSync sync(scfg);

    expect(sync.snapshot_is_stale(86400), "missing snapshot is stale");

    // ---- success ----
    {
        const cidgate::SyncResult r = sync.sync();
        expect(r.ok && r.rc == cidgate::SyncRc::OK, "sync ok: " + r.detail);
        expect(r.count == 3, "sync count");
        expect(r.http_status == 200, "http status recorded");

        const std::string text = slurp(snapshot);
        expect(text.find("# Source: " + scfg.source_url) != std::string::npos, "snapshot source header");
        expect(text.find("# Downloaded: ") != std::string::npos, "snapshot timestamp header");
        expect(text.find("QmXYZabc123 ipfs-official-denylist") != std::string::npos, "snapshot entry line");
        expect(!fs::exists(snapshot.string() + ".tmp"), "temp file renamed away");
        expect(!sync.snapshot_is_stale(86400), "fresh snapshot not stale");
    }

    // ---- non-2xx keeps snapshot ----
    {
        const std::string before = slurp(snapshot);
        status_to_serve.store(500);
        const cidgate::SyncResult r = sync.sync();
        expect(!r.ok && r.rc == cidgate::SyncRc::HTTP_STATUS, "500 => HTTP_STATUS");
        expect(r.http_status == 500, "500 recorded");
        expect(slurp(snapshot) == before, "snapshot unchanged after failed sync");
        status_to_serve.store(200);
    }

    // ---- unreachable source keeps snapshot ----
    {
        const std::string before = slurp(snapshot);
        cidgate::DenylistSyncConfig bad = scfg;
        bad.source_url = "http://127.0.0.1:1/denylist.conf";
        bad.timeout_sec = 2;
        cidgate::DenylistSync dead(bad);
        const cidgate::SyncResult r = dead.sync();
        expect(!r.ok && r.rc == cidgate::SyncRc::NETWORK, "connection refused => NETWORK");
        expect(slurp(snapshot) == before, "snapshot unchanged after network failure");

        bad.source_url = "not a url";
        cidgate::DenylistSync nonsense(bad);
        expect(nonsense.sync().rc == cidgate::SyncRc::BAD_URL, "bad url rc");
    }

    // ---- full pass reloads the cache and audits ----
    {
        cidgate::write_blocklist_file_atomic(snapshot.string(), {"stale"}, {}, nullptr);

        cidgate::AccessCacheConfig ccfg;
        ccfg.override_path = overrides.string();
        ccfg.snapshot_path = snapshot.string();
        cidgate::AccessCache cache(ccfg);
        expect(!cache.is_blocked("QmXYZabc123"), "not blocked before sync");

        int audited = 0;
        std::string audited_trigger;
        cidgate::AuditFn audit = [&](const cidgate::AuditEvent& e) {
            if (e.event == "denylist.sync") {
                audited++;
                audited_trigger = e.f.count("trigger") ? e.f.at("trigger") : "";
            }
        };

        const cidgate::SyncResult r = cidgate::run_denylist_sync(sync, cache, audit, "admin");
        expect(r.ok, "run_denylist_sync ok");
        expect(audited == 1 && audited_trigger == "admin", "denylist.sync audited once");
        expect(cache.is_blocked("QmXYZabc123").value_or("") == cidgate::kDenylistReason,
               "synced CID blocked right after the pass");
    }

    // ---- scheduler: startup pass when stale, clean stop ----
    {
        std::error_code ec;
        fs::remove(snapshot, ec);

        cidgate::AccessCacheConfig ccfg;
        ccfg.override_path = overrides.string();
        ccfg.snapshot_path = snapshot.string();
        cidgate::AccessCache cache(ccfg);

        std::atomic<int> passes{0};
        cidgate::AuditFn audit = [&](const cidgate::AuditEvent& e) {
            if (e.event == "denylist.sync") passes++;
        };

        std::atomic<bool> stop{false};
        cidgate::DenylistSchedulerConfig sc;
        sc.interval_sec = 3600;
        std::thread t = cidgate::start_denylist_scheduler(sync, cache, audit, sc, stop);

        for (int i = 0; i < 100 && passes.load() == 0; i++)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));

        const auto t0 = std::chrono::steady_clock::now();
        stop.store(true);
        t.join();
        const auto waited = std::chrono::steady_clock::now() - t0;

        expect(passes.load() == 1, "exactly one startup pass for a missing snapshot");
        expect(fs::exists(snapshot), "startup pass wrote snapshot");
        expect(waited < std::chrono::seconds(2), "scheduler observes stop flag promptly");
    }

    src.stop();
    src_thread.join();

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (g_failures) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: denylist sync tests passed\n";
    return 0;
}
