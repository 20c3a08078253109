#pragma once
#include <string>
#include <vector>

#include "jurisdiction.h"

namespace cidgate::jurisdictions {

// Checks shared by every profile, parameterized by the profile's wording.
struct CommonChecks {
    std::string email_field = "contact_email";
    bool email_requires_dot = false;

    // "{field}" is replaced by the field name.
    std::string missing_field_msg = "Missing required field: {field}";
    std::string invalid_cid_msg = "Invalid IPFS CID format";
    std::string invalid_email_msg = "Invalid email address";
};

// 1) every required field present and non-empty, in declared order
// 2) infringing_cid passes the CID prefix heuristic
// 3) the email field contains '@' (and '.', when configured)
NoticeValidation check_common(const JurisdictionProfile& p,
                              const NoticeFields& fields,
                              const CommonChecks& c);

std::string field_value(const NoticeFields& fields, const std::string& name);

// Built-in descriptions of the gateway's own reason tags
// (malware, phishing, dmca, copyright, policy_violation, ipfs-official-denylist)
// for "en", "pl" and "fr". Falls back to the profile's takedown reasons,
// then to the tag itself.
std::string describe_reason(const JurisdictionProfile& p,
                            const std::string& reason,
                            const std::string& language);

} // namespace cidgate::jurisdictions
