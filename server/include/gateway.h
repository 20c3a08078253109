#pragma once
#include "httplib.h"

#include <string>

#include "access_cache.h"
#include "jurisdiction.h"
#include "proxy_streamer.h"
#include "audit_log.h"

namespace cidgate {

// Everything the request path needs; all pointers are owned by main.cpp and
// outlive the server.
struct GatewayContext {
    AccessCache* cache = nullptr;
    JurisdictionRegistry* jurisdictions = nullptr;
    const ProxyStreamer* proxy = nullptr;

    // Optional; unset means no audit trail.
    AuditFn audit;

    // Preferred language for block pages ("en", "pl", "fr").
    // A `lang` query parameter overrides it per request.
    std::string language = "en";
};

// "<cid>[/<rest>]" as captured after /ipfs/, /ipns/ or /content/.
struct CidPath {
    std::string cid;
    std::string rest;   // without leading '/', may be empty
};

// False when the first segment is empty.
bool split_cid_path(const std::string& captured, CidPath* out);

// "DMCA-YYYYMMDDHHMMSS-xxxx" (UTC, 4 random hex chars).
std::string make_notice_reference();

/*
Blocked response (451).

Headers:
  Cache-Control: no-cache, no-store, must-revalidate
  X-Block-Reason: <reason tag>

Body is JSON unless the client's Accept header mentions text/html, in which
case a minimal HTML page carries the same text. Either way it contains the
CID and a short random reference id for support requests.
*/
void render_blocked(const GatewayContext& ctx,
                    const httplib::Request& req,
                    httplib::Response& res,
                    const std::string& cid,
                    const std::string& reason);

// /ipfs/<path>, /ipns/<path>, /content/<path>
void register_gateway_routes(httplib::Server& srv, const GatewayContext& ctx);

// /copyright/template, /copyright/counter-notice, /copyright/report,
// /copyright/footer, /copyright/reasons
void register_copyright_routes(httplib::Server& srv, const GatewayContext& ctx);

} // namespace cidgate
