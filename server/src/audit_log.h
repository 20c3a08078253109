#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace cidgate {

/*
AuditEvent
==========

One discrete gateway event: content access, block hit, sync outcome,
jurisdiction change, notice intake, ...

All fields are strings to keep JSONL lines flat and diffable.
*/
struct AuditEvent {
    // ISO-8601 UTC with milliseconds, e.g. 2026-01-19T12:34:56.123Z.
    // Filled in by append() when empty.
    std::string ts_utc;

    // "<subsystem>.<action>", e.g. "content.access", "blacklist.hit",
    // "denylist.sync", "jurisdiction.change".
    std::string event;

    // "ok" | "fail" | "deny"
    std::string outcome;

    // Verbosity class, compared against AuditLog's minimum level.
    // 0=DEBUG 1=INFO 2=ADMIN 3=SECURITY
    int level = 1;

    // Identifiers and details (cid, ip, reason, count, ...). string -> string only.
    std::map<std::string, std::string> f;
};

// Fire-and-forget sink signature used by the request path and background jobs.
using AuditFn = std::function<void(const AuditEvent&)>;

/*
AuditLog
========

Append-only, hash-chained JSONL audit log.

Each line carries:
- prev_hash : line_hash of the previous line (64 zeros for genesis)
- line_hash : SHA256(prev_hash + json_without_line_hash)

Editing, inserting, removing or reordering lines breaks the chain from that
point on. This is tamper evidence, not tamper prevention: whoever can rewrite
both the JSONL and the state file can rewrite history.
*/
class AuditLog {
public:
    AuditLog(std::string jsonl_path, std::string state_path);

    enum class MinLevel : int {
        DEBUG    = 0,
        INFO     = 1,
        ADMIN    = 2,
        SECURITY = 3,
    };

    /*
    Append one event. Thread-safe; calls are serialized to keep the chain linear.

    Never throws. Returns false when the event was not written (I/O failure);
    events below the minimum level are dropped and count as success.
    */
    bool append(const AuditEvent& e) noexcept;

    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    struct VerifyResult {
        bool ok = false;
        std::size_t lines = 0;
        std::size_t first_bad_line = 0;   // 1-based, 0 when ok
        std::string last_line_hash;
        std::string state_hash;
        std::string detail;
    };

    // Recompute the whole chain and compare the tail with the state file.
    VerifyResult verify_chain() const;

    const std::string& jsonl_path() const { return jsonl_path_; }

    static std::string now_iso_utc();

    // SHA-256 lowercase hex (integrity only).
    static std::string sha256_hex(const std::string& s);

private:
    std::atomic<int> min_level_{static_cast<int>(MinLevel::INFO)};

    std::string jsonl_path_;
    std::string state_path_;

    std::mutex mu_;

    std::string load_prev_hash_() const;
    bool store_prev_hash_(const std::string& h);

    static std::string json_escape_(const std::string& s);

    // Build the event JSON, with or without line_hash.
    static std::string build_json_(const AuditEvent& e,
                                   const std::string& prev_hash,
                                   const std::string* line_hash);
};

} // namespace cidgate
