#include "denylist_scheduler.h"

#include <chrono>
#include <iostream>

namespace cidgate {

SyncResult run_denylist_sync(DenylistSync& sync,
                             AccessCache& cache,
                             const AuditFn& audit,
                             const std::string& trigger) {
    SyncResult r = sync.sync();

    std::size_t merged = 0;
    if (r.ok) merged = cache.reload();

    std::cerr << "[denylist] " << trigger << " sync "
              << (r.ok ? "OK" : "FAILED")
              << " rc=" << sync_rc_str(r.rc)
              << " count=" << r.count;
    if (r.ok) std::cerr << " merged=" << merged;
    if (!r.detail.empty()) std::cerr << " detail=" << r.detail;
    std::cerr << std::endl;

    if (audit) {
        AuditEvent ev;
        ev.event = "denylist.sync";
        ev.outcome = r.ok ? "ok" : "fail";
        ev.level = 2;
        ev.f["trigger"] = trigger;
        ev.f["rc"] = sync_rc_str(r.rc);
        ev.f["count"] = std::to_string(r.count);
        ev.f["http_status"] = std::to_string(r.http_status);
        ev.f["source"] = sync.config().source_url;
        if (!r.detail.empty()) ev.f["detail"] = r.detail;
        audit(ev);
    }
    return r;
}

// Sleep in 100 ms slices; false when stop was requested.
static bool sleep_unless_stopped(long seconds, std::atomic<bool>& stop_flag) {
    const long slices = seconds * 10;
    for (long i = 0; i < slices; i++) {
        if (stop_flag.load()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return !stop_flag.load();
}

std::thread start_denylist_scheduler(DenylistSync& sync,
                                     AccessCache& cache,
                                     AuditFn audit,
                                     DenylistSchedulerConfig cfg,
                                     std::atomic<bool>& stop_flag) {
    if (cfg.interval_sec < 1) cfg.interval_sec = 1;

    return std::thread([&sync, &cache, audit, cfg, &stop_flag]() {
        if (stop_flag.load()) return;

        if (sync.snapshot_is_stale(cfg.max_age_sec)) {
            (void)run_denylist_sync(sync, cache, audit, "startup");
        } else {
            std::cerr << "[denylist] snapshot fresh, skipping startup sync" << std::endl;
        }

        for (;;) {
            if (!sleep_unless_stopped(cfg.interval_sec, stop_flag)) return;
            (void)run_denylist_sync(sync, cache, audit, "schedule");
        }
    });
}

} // namespace cidgate
