#pragma once
#include <cstddef>
#include <string>

#include "httplib.h"

namespace cidgate {

    // Keep audit fields to non-secret request metadata.
    //
    // OK to log:
    /// - cid / ipns name (public identifiers)
    /// - reason tags, outcome codes, http status
    /// - client ip (first hop) and shortened user agent
    /// - jurisdiction codes
    ///
    /// NOT OK:
    /// - admin bearer token
    /// - full notice bodies (free text may contain personal data; log field names and ids)

    inline std::string shorten(const std::string& s, size_t maxlen = 64) {
        if (s.size() <= maxlen) return s;
        return s.substr(0, maxlen) + "...";
    }

    // Client address as seen through an optional fronting proxy.
    inline std::string client_ip(const httplib::Request& req) {
        auto trim = [](std::string s) {
            while (!s.empty() && (s.front()==' ' || s.front()=='\t')) s.erase(s.begin());
            while (!s.empty() && (s.back()==' ' || s.back()=='\t')) s.pop_back();
            return s;
        };

        std::string xff = req.get_header_value("X-Forwarded-For");
        if (!xff.empty()) {
            auto comma = xff.find(',');
            std::string ip = trim(comma == std::string::npos ? xff : xff.substr(0, comma));
            if (!ip.empty()) return ip;
        }
        return req.remote_addr.empty() ? "?" : req.remote_addr;
    }

} // namespace cidgate
