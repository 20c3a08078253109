#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "blocklist_file.h"

namespace cidgate {

inline constexpr const char* kDefaultDenylistUrl =
    "https://raw.githubusercontent.com/ipfs/infra/master/ipfs/gateway/denylist.conf";

enum class SyncRc : int {
    OK = 0,

    BAD_URL = 10,

    NETWORK = 20,
    HTTP_STATUS = 21,

    WRITE_FAILED = 30,

    INTERNAL = 99,
};

const char* sync_rc_str(SyncRc rc);

struct SyncResult {
    bool ok = false;
    SyncRc rc = SyncRc::INTERNAL;

    std::size_t count = 0;   // accepted entries written to the snapshot
    int http_status = 0;     // 0 when no response was received
    std::string fetched_at;  // ISO-8601 UTC

    std::string detail;      // short, for logs and admin responses
};

struct DenylistSyncConfig {
    std::string source_url = kDefaultDenylistUrl;
    std::string snapshot_path;
    int timeout_sec = 30;
};

/*
Parse the upstream denylist (nginx `location` directive format).

Candidate lines contain "location" and an /ipfs/ or /ipns/ path:

    location ~ "^/ipfs/QmXYZ..." { return 410; }

The CID is the path segment after the namespace, up to the next '"' or '/'.
Tokens that fail looks_like_cid() are skipped. Line order is irrelevant and
malformed input yields fewer entries, never an error.
*/
std::vector<BlockEntry> parse_denylist_conf(const std::string& text);

// Split "scheme://host[:port]/path?q" into {"scheme://host[:port]", "/path?q"}.
bool split_url(const std::string& url, std::string* scheme_host_port, std::string* path);

/*
DenylistSync
============

One sync pass: fetch -> parse -> write full replacement snapshot.

- A failed pass leaves the existing snapshot untouched.
- The snapshot replaces the previous one wholesale; there is no diffing, so
  a CID dropped upstream disappears after the next successful pass.
- Passes are serialized (startup, scheduler and admin can race).
*/
class DenylistSync {
public:
    explicit DenylistSync(DenylistSyncConfig cfg);

    SyncResult sync();

    // True if the snapshot is missing or its mtime is older than max_age_sec.
    bool snapshot_is_stale(long max_age_sec) const;

    const DenylistSyncConfig& config() const { return cfg_; }

private:
    DenylistSyncConfig cfg_;
    std::mutex run_mu_;
};

} // namespace cidgate
