#pragma once
#include <atomic>
#include <string>
#include <thread>

#include "access_cache.h"
#include "audit_log.h"
#include "denylist_sync.h"

namespace cidgate {

inline constexpr long kDenylistIntervalSec = 86400;

// One full pass as every trigger runs it: sync, then on success drop the
// cache window, then audit `denylist.sync`. `trigger` is "startup",
// "schedule" or "admin".
SyncResult run_denylist_sync(DenylistSync& sync,
                             AccessCache& cache,
                             const AuditFn& audit,
                             const std::string& trigger);

struct DenylistSchedulerConfig {
    // Fixed period between passes; failures do not shorten it.
    long interval_sec = kDenylistIntervalSec;

    // Snapshot older than this (or missing) triggers a pass at thread start.
    long max_age_sec = kDenylistIntervalSec;
};

// Background refresher. Checks stop_flag every 100 ms; the caller joins the
// returned thread after setting it.
std::thread start_denylist_scheduler(DenylistSync& sync,
                                     AccessCache& cache,
                                     AuditFn audit,
                                     DenylistSchedulerConfig cfg,
                                     std::atomic<bool>& stop_flag);

} // namespace cidgate
