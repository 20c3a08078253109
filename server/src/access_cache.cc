#include "access_cache.h"
#include "cid_util.h"
#include "override_store.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace cidgate {

/*
Access decision cache
=====================

This is the policy surface of the gateway: it decides, before any upstream
byte is requested, whether a CID may be served.

Sources (both optional, absence == empty set):
- override list  (operator, authoritative)
- denylist snapshot (written by DenylistSync, never hand-edited)

There is no negative cache: a CID missing from both sources is looked up
again on every request, and is allowed every time until a source changes.
*/

BlockMap merge_blacklist(const BlockMap& snapshot, const BlockMap& overrides) {
    BlockMap out = snapshot;
    for (const auto& kv : overrides) out[kv.first] = kv.second;
    return out;
}

AccessCache::AccessCache(AccessCacheConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.window_sec < 1) cfg_.window_sec = 1;
}

long AccessCache::now_() const {
    return cfg_.now ? cfg_.now() : now_epoch();
}

std::shared_ptr<const BlockMap> AccessCache::overrides_() {
    const long now = now_();

    for (;;) {
        std::uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (win_.valid && (now - win_.computed_at) < cfg_.window_sec) return win_.value;
            gen = win_.generation;
        }

        // Re-read outside the lock; concurrent recomputation is idempotent.
        OverrideStore store(cfg_.override_path);
        std::string err;
        const bool loaded = store.load(&err);

        std::lock_guard<std::mutex> lk(mu_);
        if (win_.generation != gen) {
            // reload() ran while we were reading: our view may predate it.
            if (win_.valid && win_.value) return win_.value;
            continue;
        }

        if (!loaded) {
            // Previous set stays in effect until the next window.
            if (!win_.value) win_.value = std::make_shared<const BlockMap>();
            win_.valid = true;
            win_.computed_at = now;
            return win_.value;
        }

        win_.valid = true;
        win_.computed_at = now;
        win_.value = std::make_shared<const BlockMap>(store.entries());
        return win_.value;
    }
}

BlockMap AccessCache::read_snapshot_() const {
    BlockMap snap;
    std::string err;
    if (!load_blocklist_file(cfg_.snapshot_path, kDenylistReason, &snap, &err)) {
        std::cerr << "[cache] denylist snapshot unreadable: " << err << std::endl;
        return BlockMap{};
    }
    return snap;
}

std::shared_ptr<const BlockMap> AccessCache::merged() {
    auto ov = overrides_();
    return std::make_shared<const BlockMap>(merge_blacklist(read_snapshot_(), *ov));
}

std::optional<std::string> AccessCache::is_blocked(const std::string& cid) {
    if (cid.empty()) return std::nullopt;

    auto m = merged();
    auto it = m->find(cid);
    if (it == m->end()) return std::nullopt;
    return it->second;
}

std::size_t AccessCache::reload() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        win_.valid = false;
        win_.generation++;
    }
    const std::size_t n = merged()->size();
    std::cerr << "[cache] reloaded, " << n << " blocked CIDs" << std::endl;
    return n;
}

BlacklistStats AccessCache::stats(std::size_t sample) {
    auto ov = overrides_();
    const BlockMap snap = read_snapshot_();
    const BlockMap m = merge_blacklist(snap, *ov);

    BlacklistStats st;
    st.total = m.size();
    st.override_count = ov->size();
    st.denylist_count = snap.size();

    for (const auto& kv : m) st.by_reason[kv.second]++;

    // Stable sample for the admin view.
    std::vector<std::string> keys;
    keys.reserve(m.size());
    for (const auto& kv : m) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    if (keys.size() > sample) keys.resize(sample);
    st.sample_cids = std::move(keys);
    return st;
}

} // namespace cidgate
