#include "override_store.h"

#include <iostream>
#include <utility>

namespace cidgate {

OverrideStore::OverrideStore(std::string path) : path_(std::move(path)) {}

bool OverrideStore::load(std::string* err) {
    BlockMap tmp;
    std::string e;
    if (!load_blocklist_file(path_, kDefaultOverrideReason, &tmp, &e)) {
        std::cerr << "[override] load failed: " << e << std::endl;
        if (err) *err = e;
        return false;
    }

    m_.swap(tmp);
    return true;
}

std::optional<std::string> OverrideStore::find(const std::string& cid) const {
    auto it = m_.find(cid);
    if (it == m_.end()) return std::nullopt;
    return it->second;
}

} // namespace cidgate
