// tests/access_cache/test_access_cache.cpp
//
// Access decision regression test.
//
// What it tests:
// 1) Override reason wins over the denylist snapshot for the same CID
// 2) CID in neither source is allowed; missing files are empty sets
// 3) An empty snapshot drops denylist-only entries immediately
// 4) Override edits become visible only after the 300 s window (injected clock)
// 5) reload() makes override edits visible at once
// 6) stats() counts per source and per reason
// 7) a re-read that was in flight when reload() ran cannot bring back the
//    old override set
// 8) an override file that fails to load keeps the previous set and is
//    retried once per window

#include <sodium.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "access_cache.h"
#include "blocklist_file.h"
#include "cid_util.h"
#include "override_store.h"

namespace fs = std::filesystem;

static int g_failures = 0;

static void expect(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        g_failures++;
    }
}

static void write_file(const fs::path& p, const std::string& text) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
}

static std::string reason_or_none(const std::optional<std::string>& r) {
    return r ? *r : std::string("<allowed>");
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed\n";
        return 2;
    }

    const fs::path dir = fs::temp_directory_path() / ("cidgate_cache_" + cidgate::random_hex(4));
    fs::create_directories(dir);

    const fs::path overrides = dir / "blacklist.txt";
    const fs::path snapshot = dir / "blacklist-ipfs-official.txt";

    long fake_now = 1000000;

    cidgate::AccessCacheConfig cfg;
    cfg.override_path = overrides.string();
    cfg.snapshot_path = snapshot.string();
    cfg.window_sec = 300;
    cfg.now = [&fake_now]() { return fake_now; };

    // ---- merge_blacklist is pure and override-first ----
    {
        cidgate::BlockMap snap = {{"QmShared", "ipfs-official-denylist"}, {"QmOnlySnap", "ipfs-official-denylist"}};
        cidgate::BlockMap ov = {{"QmShared", "malware"}};
        const cidgate::BlockMap m = cidgate::merge_blacklist(snap, ov);
        expect(m.size() == 2, "merge size");
        expect(m.at("QmShared") == "malware", "merge: override reason wins");
        expect(m.at("QmOnlySnap") == "ipfs-official-denylist", "merge: snapshot-only entry kept");
    }

    // ---- missing files: nothing blocked, no error ----
    {
        cidgate::AccessCache cache(cfg);
        expect(!cache.is_blocked("QmMissingEverywhere111"), "missing files => allowed");
        expect(cache.merged()->empty(), "missing files => empty merged set");
    }

    // ---- override precedence ----
    write_file(overrides,
               "# operator list\n"
               "\n"
               "QmABC123xyz malware\n"
               "bafyNoReason\n"
               "QmDup first\n"
               "QmDup second\n");

    cidgate::write_blocklist_file_atomic(snapshot.string(),
                                         {"test snapshot"},
                                         {{"QmABC123xyz", cidgate::kDenylistReason},
                                          {"QmDenyOnly999", cidgate::kDenylistReason}},
                                         nullptr);

    cidgate::AccessCache cache(cfg);

    expect(reason_or_none(cache.is_blocked("QmABC123xyz")) == "malware",
           "override reason must win, got " + reason_or_none(cache.is_blocked("QmABC123xyz")));
    expect(reason_or_none(cache.is_blocked("QmDenyOnly999")) == cidgate::kDenylistReason,
           "denylist-only entry blocked with denylist reason");
    expect(reason_or_none(cache.is_blocked("bafyNoReason")) == cidgate::kDefaultOverrideReason,
           "override line without reason gets policy_violation");
    expect(reason_or_none(cache.is_blocked("QmDup")) == "second", "duplicate CID: last line wins");
    expect(!cache.is_blocked("QmNotListed000"), "unlisted CID allowed");
    expect(!cache.is_blocked("qmabc123xyz"), "lookup is case-sensitive");

    // ---- empty snapshot drops denylist-only entries at once ----
    cidgate::write_blocklist_file_atomic(snapshot.string(), {"empty"}, {}, nullptr);
    expect(!cache.is_blocked("QmDenyOnly999"), "empty snapshot => denylist-only entry allowed");
    expect(reason_or_none(cache.is_blocked("QmABC123xyz")) == "malware", "override survives empty snapshot");

    // ---- override window ----
    write_file(overrides, "QmABC123xyz malware\nQmLateAdd456 phishing\n");

    fake_now += 299;
    expect(!cache.is_blocked("QmLateAdd456"), "override edit hidden inside the window");

    fake_now += 1;
    expect(reason_or_none(cache.is_blocked("QmLateAdd456")) == "phishing",
           "override edit visible once the window elapsed");

    // ---- reload() bypasses the window ----
    write_file(overrides, "QmABC123xyz malware\n");
    expect(cache.is_blocked("QmLateAdd456").has_value(), "still cached before reload");
    const std::size_t n = cache.reload();
    expect(n == 1, "reload returns merged size, got " + std::to_string(n));
    expect(!cache.is_blocked("QmLateAdd456"), "removed override gone after reload");

    // ---- stats ----
    cidgate::write_blocklist_file_atomic(snapshot.string(), {"stats"},
                                         {{"QmS1aaaa", cidgate::kDenylistReason},
                                          {"QmS2bbbb", cidgate::kDenylistReason}},
                                         nullptr);
    const cidgate::BlacklistStats st = cache.stats(2);
    expect(st.total == 3, "stats total");
    expect(st.override_count == 1, "stats override_count");
    expect(st.denylist_count == 2, "stats denylist_count");
    expect(st.by_reason.count("malware") && st.by_reason.at("malware") == 1, "stats by_reason malware");
    expect(st.sample_cids.size() == 2, "stats sample capped");

    // ---- reload() racing an in-flight re-read ----
    {
        const fs::path fifo = dir / "inflight.txt";
        const fs::path fresh = dir / "inflight.new";

        cidgate::AccessCacheConfig icfg = cfg;
        icfg.override_path = fifo.string();
        icfg.snapshot_path = (dir / "inflight-snapshot.txt").string();

        if (::mkfifo(fifo.c_str(), 0600) != 0) {
            expect(false, "mkfifo for in-flight reader");
        } else {
            cidgate::AccessCache icache(icfg);

            std::optional<std::string> inflight;
            std::thread reader([&]() { inflight = icache.is_blocked("QmStale111"); });

            // Returns once the reader has the fifo open and is waiting for data.
            const int wfd = ::open(fifo.c_str(), O_WRONLY);
            expect(wfd >= 0, "open fifo for writing");

            // Operator empties the list and reloads while the reader is stuck.
            write_file(fresh, "# emptied\n");
            fs::rename(fresh, fifo);
            const std::size_t merged = icache.reload();
            expect(merged == 0, "reload sees the emptied list, got " + std::to_string(merged));

            if (wfd >= 0) {
                const std::string old_line = "QmStale111 malware\n";
                expect(::write(wfd, old_line.data(), old_line.size()) == (ssize_t)old_line.size(),
                       "write old line to fifo");
                ::close(wfd);
            }
            reader.join();

            expect(!inflight, "in-flight lookup answers from the reloaded set, got " + reason_or_none(inflight));
            expect(!icache.is_blocked("QmStale111"),
                   "stale re-read must not replace the reloaded set, got " +
                   reason_or_none(icache.is_blocked("QmStale111")));
        }
    }

    // ---- unreadable override file: previous set kept, retried per window ----
    {
        const fs::path ov = dir / "flaky.txt";
        cidgate::AccessCacheConfig fcfg = cfg;
        fcfg.override_path = ov.string();
        fcfg.snapshot_path = (dir / "flaky-snapshot.txt").string();

        write_file(ov, "QmKeep111 malware\n");
        cidgate::AccessCache fcache(fcfg);
        expect(reason_or_none(fcache.is_blocked("QmKeep111")) == "malware", "flaky: initial load");

        // Path turns into a directory: load fails.
        fs::remove(ov);
        fs::create_directories(ov);
        fake_now += 300;
        expect(reason_or_none(fcache.is_blocked("QmKeep111")) == "malware",
               "failed load keeps previous override set");

        // Fixed within the window: the failed attempt counts as this window's read.
        fs::remove(ov);
        write_file(ov, "QmNew222 dmca\n");
        fake_now += 150;
        expect(!fcache.is_blocked("QmNew222"), "no re-read before the window after a failed load");
        expect(fcache.is_blocked("QmKeep111").has_value(), "retained set still served");

        fake_now += 150;
        expect(reason_or_none(fcache.is_blocked("QmNew222")) == "dmca", "re-read once the window elapsed");
        expect(!fcache.is_blocked("QmKeep111"), "old set replaced after successful re-read");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (g_failures) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: access cache tests passed\n";
    return 0;
}
