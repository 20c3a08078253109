#include "profile_common.h"
#include "cid_util.h"

#include <map>

namespace cidgate::jurisdictions {

std::string field_value(const NoticeFields& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end()) return std::string();
    return trim_ws(it->second);
}

NoticeValidation check_common(const JurisdictionProfile& p,
                              const NoticeFields& fields,
                              const CommonChecks& c) {
    NoticeValidation v;

    for (const auto& name : p.required_fields()) {
        if (field_value(fields, name).empty()) {
            std::string msg = c.missing_field_msg;
            const auto pos = msg.find("{field}");
            if (pos != std::string::npos) msg.replace(pos, 7, name);
            v.message = msg;
            return v;
        }
    }

    if (!looks_like_cid(field_value(fields, "infringing_cid"))) {
        v.message = c.invalid_cid_msg;
        return v;
    }

    const std::string email = field_value(fields, c.email_field);
    if (email.find('@') == std::string::npos ||
        (c.email_requires_dot && email.find('.') == std::string::npos)) {
        v.message = c.invalid_email_msg;
        return v;
    }

    v.ok = true;
    return v;
}

std::string describe_reason(const JurisdictionProfile& p,
                            const std::string& reason,
                            const std::string& language) {
    using Table = std::map<std::string, std::string>;
    static const std::map<std::string, Table> kBuiltin = {
        {"en", {
            {"malware", "Malware detected"},
            {"phishing", "Phishing attempt"},
            {"dmca", "Copyright infringement (DMCA)"},
            {"copyright", "Copyright infringement"},
            {"policy_violation", "Terms of service violation"},
            {"ipfs-official-denylist", "Blocked by the official IPFS denylist"},
        }},
        {"pl", {
            {"malware", "Wykryto złośliwe oprogramowanie"},
            {"phishing", "Próba wyłudzenia danych (phishing)"},
            {"dmca", "Naruszenie praw autorskich (DMCA)"},
            {"copyright", "Naruszenie praw autorskich"},
            {"policy_violation", "Naruszenie regulaminu"},
            {"ipfs-official-denylist", "Zablokowane przez oficjalną listę IPFS"},
        }},
        {"fr", {
            {"malware", "Logiciel malveillant détecté"},
            {"phishing", "Tentative d'hameçonnage"},
            {"dmca", "Violation du droit d'auteur (DMCA)"},
            {"copyright", "Violation du droit d'auteur"},
            {"policy_violation", "Violation des conditions d'utilisation"},
            {"ipfs-official-denylist", "Bloqué par la liste officielle IPFS"},
        }},
    };

    auto lang = kBuiltin.find(language);
    if (lang != kBuiltin.end()) {
        auto it = lang->second.find(reason);
        if (it != lang->second.end()) return it->second;
    }

    for (const auto& kv : p.takedown_reasons()) {
        if (kv.first == reason) return kv.second;
    }
    return reason;
}

} // namespace cidgate::jurisdictions
