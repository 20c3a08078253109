#include "gateway_config.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace cidgate {

using json = nlohmann::json;

static bool parse_long(const std::string& s, long* out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    *out = v;
    return true;
}

static void set_long(const char* name, const std::string& raw, long min_v, long max_v, long* dst) {
    long v = 0;
    if (!parse_long(raw, &v) || v < min_v || v > max_v) {
        std::cerr << "[settings] WARNING: ignoring invalid " << name << "=" << raw << std::endl;
        return;
    }
    *dst = v;
}

static void set_int(const char* name, const std::string& raw, long min_v, long max_v, int* dst) {
    long v = *dst;
    set_long(name, raw, min_v, max_v, &v);
    *dst = (int)v;
}

bool apply_settings_file(const std::string& path, GatewayConfig* cfg, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) return true;

    json j;
    try {
        j = json::parse(f, nullptr, true, true);
    } catch (const json::exception& e) {
        if (err) *err = std::string("parse error: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "settings root must be an object";
        return false;
    }

    auto str = [&](const char* key, std::string* dst) {
        auto it = j.find(key);
        if (it == j.end()) return;
        if (!it->is_string()) {
            std::cerr << "[settings] WARNING: " << key << " must be a string" << std::endl;
            return;
        }
        *dst = it->get<std::string>();
    };
    auto num = [&](const char* key, long min_v, long max_v, long* dst) {
        auto it = j.find(key);
        if (it == j.end()) return;
        if (!it->is_number_integer()) {
            std::cerr << "[settings] WARNING: " << key << " must be an integer" << std::endl;
            return;
        }
        set_long(key, std::to_string(it->get<long>()), min_v, max_v, dst);
    };

    str("listen_host", &cfg->listen_host);
    str("upstream", &cfg->upstream);
    str("override_path", &cfg->override_path);
    str("denylist_path", &cfg->denylist_path);
    str("denylist_url", &cfg->denylist_url);
    str("jurisdiction", &cfg->jurisdiction);
    str("language", &cfg->language);
    str("admin_token", &cfg->admin_token);
    str("audit_dir", &cfg->audit_dir);
    str("audit_min_level", &cfg->audit_min_level);

    long port = cfg->listen_port;
    num("listen_port", 1, 65535, &port);
    cfg->listen_port = (int)port;

    long up_to = cfg->upstream_timeout_sec;
    num("upstream_timeout_sec", 1, 3600, &up_to);
    cfg->upstream_timeout_sec = (int)up_to;

    long conn_to = cfg->upstream_connect_timeout_sec;
    num("upstream_connect_timeout_sec", 1, 600, &conn_to);
    cfg->upstream_connect_timeout_sec = (int)conn_to;

    num("denylist_interval_sec", 1, 30L * 86400L, &cfg->denylist_interval_sec);
    num("cache_window_sec", 0, 86400, &cfg->cache_window_sec);

    cfg->settings_path = path;
    return true;
}

void apply_env(const EnvLookup& env, GatewayConfig* cfg) {
    const EnvLookup get = env ? env : EnvLookup([](const char* n) { return std::getenv(n); });

    if (const char* v = get("CIDGATE_LISTEN_HOST")) cfg->listen_host = v;
    if (const char* v = get("CIDGATE_LISTEN_PORT")) set_int("CIDGATE_LISTEN_PORT", v, 1, 65535, &cfg->listen_port);
    if (const char* v = get("CIDGATE_UPSTREAM")) cfg->upstream = v;
    if (const char* v = get("CIDGATE_UPSTREAM_TIMEOUT")) set_int("CIDGATE_UPSTREAM_TIMEOUT", v, 1, 3600, &cfg->upstream_timeout_sec);
    if (const char* v = get("CIDGATE_OVERRIDE_PATH")) cfg->override_path = v;
    if (const char* v = get("CIDGATE_DENYLIST_PATH")) cfg->denylist_path = v;
    if (const char* v = get("CIDGATE_DENYLIST_URL")) cfg->denylist_url = v;
    if (const char* v = get("CIDGATE_DENYLIST_INTERVAL")) set_long("CIDGATE_DENYLIST_INTERVAL", v, 1, 30L * 86400L, &cfg->denylist_interval_sec);
    if (const char* v = get("CIDGATE_JURISDICTION")) cfg->jurisdiction = v;
    if (const char* v = get("CIDGATE_LANGUAGE")) cfg->language = v;
    if (const char* v = get("CIDGATE_ADMIN_TOKEN")) cfg->admin_token = v;
    if (const char* v = get("CIDGATE_AUDIT_DIR")) cfg->audit_dir = v;
    if (const char* v = get("CIDGATE_AUDIT_MIN_LEVEL")) cfg->audit_min_level = v;
}

GatewayConfig load_gateway_config(const EnvLookup& env) {
    const EnvLookup get = env ? env : EnvLookup([](const char* n) { return std::getenv(n); });

    GatewayConfig cfg;

    if (const char* p = get("CIDGATE_SETTINGS_PATH")) {
        std::string err;
        if (!apply_settings_file(p, &cfg, &err)) {
            std::cerr << "[settings] WARNING: failed to load " << p << ": " << err << std::endl;
        } else if (!cfg.settings_path.empty()) {
            std::cerr << "[settings] loaded " << cfg.settings_path << std::endl;
        }
    }

    apply_env(get, &cfg);
    return cfg;
}

} // namespace cidgate
