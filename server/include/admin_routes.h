#pragma once
#include "httplib.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "access_cache.h"
#include "audit_log.h"
#include "denylist_sync.h"
#include "jurisdiction.h"

namespace cidgate {

/*
Operator controls.

AdminOps is the callable surface (used by the HTTP routes below and by tests);
each mutating operation emits its audit event itself so every caller leaves
the same trail.
*/
class AdminOps {
public:
    AdminOps(AccessCache& cache,
             DenylistSync& sync,
             JurisdictionRegistry& jurisdictions,
             AuditFn audit);

    // Drop the cache window and rebuild. Returns merged entry count.
    std::size_t reload_blacklist(const std::string& actor);

    // Full sync pass; the cache is reloaded on success.
    SyncResult sync_denylist(const std::string& actor);

    // Case-insensitive. On unknown code returns false, active unchanged.
    // `previous` receives the former active code ("" when none).
    bool set_jurisdiction(const std::string& code,
                          const std::string& actor,
                          std::string* previous = nullptr);

    std::map<std::string, std::string> list_jurisdictions() const;
    std::string active_jurisdiction() const;

    BlacklistStats blacklist_stats(std::size_t sample = 10);

    std::optional<std::string> test_blacklist(const std::string& cid);

private:
    void emit_(const std::string& event, const std::string& outcome,
               std::map<std::string, std::string> f);

    AccessCache& cache_;
    DenylistSync& sync_;
    JurisdictionRegistry& jurisdictions_;
    AuditFn audit_;
};

// 127.0.0.0/8, ::1 and their IPv4-mapped forms.
bool is_loopback_addr(const std::string& addr);

// Admin gate. Passes for a direct loopback peer (no X-Forwarded-For), or for
// `Authorization: Bearer <admin_token>` when admin_token is non-empty.
// On failure writes the 401/403 response and returns false.
bool require_admin(const httplib::Request& req,
                   httplib::Response& res,
                   const std::string& admin_token);

// /admin/reload-blacklist, /admin/sync-denylist, /admin/jurisdiction,
// /admin/jurisdictions, /admin/blacklist-stats, /admin/test-blacklist/<cid>
void register_admin_routes(httplib::Server& srv, AdminOps& ops, const std::string& admin_token);

} // namespace cidgate
