#pragma once
#include <optional>
#include <string>

#include "blocklist_file.h"

namespace cidgate {

/*
Override store
==============

Operator-maintained block list (`blacklist.txt` by default).

Key design principle:
- This list is locally authoritative. When the same CID appears in the synced
  denylist snapshot with a different reason, the override reason wins.
- It answers "is this CID blocked, and why?" only. Merging with the denylist
  and time-windowed caching happen in AccessCache.

File format: see blocklist_file.h. Lines without a reason get
kDefaultOverrideReason.
*/

inline constexpr const char* kDefaultOverrideReason = "policy_violation";

class OverrideStore {
public:
    explicit OverrideStore(std::string path);

    /*
    Load the override list from disk.

    Return value:
    - true  on success, including a missing file (empty list)
    - false on an I/O error; the previously loaded entries are kept

    The new map is built aside and swapped in, so a failed load never leaves
    partially-loaded state behind.
    */
    bool load(std::string* err = nullptr);

    // Exact-match lookup. Returns the reason tag when the CID is listed.
    std::optional<std::string> find(const std::string& cid) const;

    const BlockMap& entries() const { return m_; }
    bool empty() const { return m_.empty(); }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    BlockMap m_;
};

} // namespace cidgate
