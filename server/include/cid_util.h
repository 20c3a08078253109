#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace cidgate {

    long now_epoch();
    std::string now_iso_utc();
    std::string lower_ascii(std::string s);
    std::string upper_ascii(std::string s);

    // Trim ASCII whitespace (space, tab, CR, LF) on both ends.
    std::string trim_ws(std::string s);
    std::string trim_slashes(std::string s);

    // Cheap CID heuristic: the token begins with one of the known
    // multihash / multibase prefixes (Qm..., bafy..., k51...).
    // No multibase or multihash decoding is attempted.
    bool looks_like_cid(const std::string& token);

    // Random lowercase hex string of `nbytes` bytes (2*nbytes chars), libsodium RNG.
    std::string random_hex(std::size_t nbytes);

    // Checkbox-style attestation value: non-empty and not an explicit "off".
    bool is_checked(const std::string& v);

} // namespace cidgate
