#include "cid_util.h"

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <sodium.h>

namespace cidgate {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string upper_ascii(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

std::string trim_ws(std::string s) {
    // ASCII only; no locale.
    auto is_ws = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
    while (!s.empty() && is_ws((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && is_ws((unsigned char)s.back()))  s.pop_back();
    return s;
}

std::string trim_slashes(std::string s) {
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

bool looks_like_cid(const std::string& token) {
    // CIDv0 (base58 sha2-256), CIDv1 dag-pb base32, libp2p-key base36 (IPNS).
    static const std::array<const char*, 3> kPrefixes = {"Qm", "bafy", "k51"};
    for (const char* p : kPrefixes) {
        const std::string pre(p);
        if (token.size() > pre.size() && token.compare(0, pre.size(), pre) == 0) return true;
    }
    return false;
}

std::string random_hex(std::size_t nbytes) {
    static const char* kHex = "0123456789abcdef";
    std::vector<unsigned char> buf(nbytes);
    randombytes_buf(buf.data(), buf.size());

    std::string out;
    out.resize(nbytes * 2);
    for (std::size_t i = 0; i < nbytes; i++) {
        out[i*2+0] = kHex[(buf[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(buf[i] >> 0) & 0xF];
    }
    return out;
}

bool is_checked(const std::string& v) {
    const std::string s = lower_ascii(trim_ws(v));
    if (s.empty()) return false;
    return s != "0" && s != "false" && s != "off" && s != "no";
}

} // namespace cidgate
