#pragma once
#include <functional>
#include <string>

#include "denylist_sync.h"

namespace cidgate {

struct GatewayConfig {
    std::string listen_host = "0.0.0.0";
    int listen_port = 8081;

    std::string upstream = "http://127.0.0.1:8080";
    int upstream_timeout_sec = 120;
    int upstream_connect_timeout_sec = 10;

    std::string override_path = "blacklist.txt";
    std::string denylist_path = "blacklist-ipfs-official.txt";
    std::string denylist_url = kDefaultDenylistUrl;
    long denylist_interval_sec = 86400;

    long cache_window_sec = 300;

    // Unknown codes fall back to US at startup.
    std::string jurisdiction = "US";
    std::string language = "en";

    // Empty: admin endpoints are loopback-only.
    std::string admin_token;

    std::string audit_dir = "./audit";
    std::string audit_min_level;   // empty: AuditLog default

    // Where file settings came from ("" when none).
    std::string settings_path;
};

using EnvLookup = std::function<const char*(const char*)>;

/*
Layering, later wins:
  1) built-in defaults
  2) JSON settings file (path from CIDGATE_SETTINGS_PATH), keys named like
     the struct members
  3) CIDGATE_* environment variables

Bad values (non-numeric ports, wrong JSON types) are reported on stderr and
leave the previous layer's value in place.
*/
GatewayConfig load_gateway_config(const EnvLookup& env = EnvLookup());

// Layer 2 only. Missing file is not an error (returns true, cfg untouched).
bool apply_settings_file(const std::string& path, GatewayConfig* cfg, std::string* err = nullptr);

// Layer 3 only.
void apply_env(const EnvLookup& env, GatewayConfig* cfg);

} // namespace cidgate
