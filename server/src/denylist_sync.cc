#include "denylist_sync.h"
#include "access_cache.h"
#include "cid_util.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>

#include "httplib.h"

namespace cidgate {

/*
Denylist synchronization
========================

The public IPFS gateway operators publish their denylist as an nginx config
fragment. We only need the CIDs out of it, so parsing is deliberately loose:
anything we do not recognize is skipped.

Snapshot layout (same shape as the override list):

    # IPFS Official Denylist - Auto-generated
    # Source: <url>
    # Downloaded: <iso-8601 utc>

    <cid> ipfs-official-denylist
    ...
*/

const char* sync_rc_str(SyncRc rc) {
    switch (rc) {
        case SyncRc::OK:           return "ok";
        case SyncRc::BAD_URL:      return "bad_url";
        case SyncRc::NETWORK:      return "network";
        case SyncRc::HTTP_STATUS:  return "http_status";
        case SyncRc::WRITE_FAILED: return "write_failed";
        case SyncRc::INTERNAL:     return "internal";
    }
    return "internal";
}

static bool extract_after(const std::string& line, const std::string& marker, std::string* cid) {
    const auto pos = line.find(marker);
    if (pos == std::string::npos) return false;

    const auto start = pos + marker.size();
    const auto end = line.find_first_of("\"/", start);
    *cid = line.substr(start, end == std::string::npos ? std::string::npos : end - start);
    return true;
}

std::vector<BlockEntry> parse_denylist_conf(const std::string& text) {
    std::vector<BlockEntry> out;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        line = trim_ws(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.find("location") == std::string::npos) continue;

        std::string cid;
        if (!extract_after(line, "/ipfs/", &cid) &&
            !extract_after(line, "/ipns/", &cid)) {
            continue;
        }

        cid = trim_ws(cid);
        if (!looks_like_cid(cid)) continue;

        out.push_back(BlockEntry{cid, kDenylistReason});
    }
    return out;
}

bool split_url(const std::string& url, std::string* scheme_host_port, std::string* path) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) return false;

    const auto host_start = scheme_end + 3;
    if (host_start >= url.size()) return false;

    const auto slash = url.find('/', host_start);
    if (slash == std::string::npos) {
        *scheme_host_port = url;
        *path = "/";
    } else {
        if (slash == host_start) return false;
        *scheme_host_port = url.substr(0, slash);
        *path = url.substr(slash);
    }
    return true;
}

DenylistSync::DenylistSync(DenylistSyncConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.timeout_sec < 1) cfg_.timeout_sec = 1;
}

bool DenylistSync::snapshot_is_stale(long max_age_sec) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(cfg_.snapshot_path, ec) || ec) return true;

    const auto mtime = fs::last_write_time(cfg_.snapshot_path, ec);
    if (ec) return true;

    // file_clock -> system_clock without C++20 clock_cast.
    const auto age = fs::file_time_type::clock::now() - mtime;
    const long age_sec = (long)std::chrono::duration_cast<std::chrono::seconds>(age).count();
    return age_sec > max_age_sec;
}

SyncResult DenylistSync::sync() {
    std::lock_guard<std::mutex> lk(run_mu_);

    SyncResult r;
    r.fetched_at = now_iso_utc();

    std::string base, path;
    if (!split_url(cfg_.source_url, &base, &path)) {
        r.rc = SyncRc::BAD_URL;
        r.detail = "invalid denylist url";
        std::cerr << "[denylist] " << r.detail << ": " << cfg_.source_url << std::endl;
        return r;
    }

    std::cerr << "[denylist] downloading " << cfg_.source_url << std::endl;

    httplib::Client cli(base);
    cli.set_connection_timeout(cfg_.timeout_sec, 0);
    cli.set_read_timeout(cfg_.timeout_sec, 0);
    cli.set_follow_location(true);

    auto res = cli.Get(path);
    if (!res) {
        r.rc = SyncRc::NETWORK;
        r.detail = httplib::to_string(res.error());
        std::cerr << "[denylist] network error: " << r.detail << std::endl;
        return r;
    }

    r.http_status = res->status;
    if (res->status < 200 || res->status >= 300) {
        r.rc = SyncRc::HTTP_STATUS;
        r.detail = "HTTP " + std::to_string(res->status);
        std::cerr << "[denylist] download failed: " << r.detail << std::endl;
        return r;
    }

    const std::vector<BlockEntry> entries = parse_denylist_conf(res->body);

    const std::vector<std::string> header = {
        "IPFS Official Denylist - Auto-generated",
        "Source: " + cfg_.source_url,
        "Downloaded: " + r.fetched_at,
    };

    std::string err;
    if (!write_blocklist_file_atomic(cfg_.snapshot_path, header, entries, &err)) {
        r.rc = SyncRc::WRITE_FAILED;
        r.detail = shorten(err, 200);
        std::cerr << "[denylist] snapshot write failed: " << err << std::endl;
        return r;
    }

    r.ok = true;
    r.rc = SyncRc::OK;
    r.count = entries.size();
    r.detail = "downloaded " + std::to_string(entries.size()) + " CIDs";
    std::cerr << "[denylist] " << r.detail << " -> " << cfg_.snapshot_path << std::endl;
    return r;
}

} // namespace cidgate
