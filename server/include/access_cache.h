#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "blocklist_file.h"

namespace cidgate {

inline constexpr const char* kDenylistReason = "ipfs-official-denylist";

// Pure merge: snapshot entries plus overrides, overrides win on collision.
BlockMap merge_blacklist(const BlockMap& snapshot, const BlockMap& overrides);

struct AccessCacheConfig {
    std::string override_path;
    std::string snapshot_path;

    // Override list is re-read at most once per window.
    long window_sec = 300;

    // Empty => cidgate::now_epoch()
    std::function<long()> now;
};

struct BlacklistStats {
    std::size_t total = 0;
    std::size_t override_count = 0;
    std::size_t denylist_count = 0;
    std::map<std::string, std::size_t> by_reason;
    std::vector<std::string> sample_cids;
};

/*
AccessCache
===========

Answers "is this CID blocked?" for the request path.

Staleness model:
- Overrides: cached as an explicit entry {computed_at, value}. The file is
  re-read when now - computed_at >= window_sec, or after reload().
  Operator edits are therefore visible within one window.
- Denylist snapshot: read from disk on every merge. Sync replaces the file
  atomically, so a lookup observes either the old or the new snapshot in full
  and sync results are visible immediately.

Threading:
- The override entry is guarded by mu_ and holds an immutable shared map;
  lookups copy the shared_ptr and release the lock before doing any work.
- Two threads may both decide the window expired and both re-read the file.
  That is wasted work only: the merge is a pure function of the files.
- reload() bumps the entry generation. A re-read that started under an older
  generation never publishes its map; it returns the newer entry instead, or
  reads again if the newer entry is not built yet.
- A failed re-read keeps the previous set and restamps it, so a broken file
  is retried once per window.
*/
class AccessCache {
public:
    explicit AccessCache(AccessCacheConfig cfg);

    // Reason tag when blocked, std::nullopt when allowed.
    std::optional<std::string> is_blocked(const std::string& cid);

    // Current merged view (override window rule applies).
    std::shared_ptr<const BlockMap> merged();

    // Drop the override window and rebuild now. Returns merged size.
    std::size_t reload();

    BlacklistStats stats(std::size_t sample = 10);

    const AccessCacheConfig& config() const { return cfg_; }

private:
    struct OverrideEntry {
        bool valid = false;
        long computed_at = 0;
        std::uint64_t generation = 0;
        std::shared_ptr<const BlockMap> value;
    };

    long now_() const;
    std::shared_ptr<const BlockMap> overrides_();
    BlockMap read_snapshot_() const;

    AccessCacheConfig cfg_;

    std::mutex mu_;       // guards win_ (generation included)
    OverrideEntry win_;
};

} // namespace cidgate
