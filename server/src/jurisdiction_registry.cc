#include "jurisdiction.h"
#include "cid_util.h"

#include <atomic>
#include <iostream>

namespace cidgate {

BlockedPageText generic_blocked_page_text(const std::string& reason) {
    BlockedPageText t;
    t.language = "en";
    t.title = "451 - Content Unavailable For Legal Reasons";
    t.message = "This content has been blocked for legal reasons.";
    t.reason = reason;
    t.reason_text = reason;
    return t;
}

std::string JurisdictionProfile::format_notice_response(const std::string& reference_id) const {
    const std::string sla = std::to_string(sla_hours());
    return "Copyright Notice Received - " + law_name() + "\n\n"
           "Reference: " + reference_id + "\n"
           "Jurisdiction: " + country_code() + "\n"
           "Response time: " + sla + " hours\n\n"
           "We have received your notice and will review it according to " + law_reference() + ".\n\n"
           "You will receive a response within " + sla + " hours.\n";
}

const std::vector<ProfileFactory>& builtin_profile_factories() {
    static const std::vector<ProfileFactory> kFactories = {
        make_us_dmca_profile,
        make_eu_dsa_profile,
        make_fr_droit_auteur_profile,
        make_pl_prawa_autorskie_profile,
    };
    return kFactories;
}

JurisdictionRegistry::JurisdictionRegistry(const std::vector<ProfileFactory>& factories) {
    for (const auto& make : factories) {
        ProfilePtr p = make ? make() : nullptr;
        if (!p) continue;

        const std::string code = upper_ascii(p->country_code());
        if (by_code_.count(code)) {
            std::cerr << "[jurisdiction] duplicate profile " << code << " ignored" << std::endl;
            continue;
        }
        by_code_[code] = p;
        std::cerr << "[jurisdiction] loaded " << code << " (" << p->law_name() << ")" << std::endl;
    }
}

bool JurisdictionRegistry::set_active(const std::string& country_code) {
    const std::string code = upper_ascii(trim_ws(country_code));

    auto it = by_code_.find(code);
    if (it == by_code_.end()) {
        std::cerr << "[jurisdiction] no profile for '" << code << "', active unchanged" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lk(write_mu_);
    std::atomic_store(&active_, it->second);
    std::cerr << "[jurisdiction] active: " << code << " - " << it->second->law_name() << std::endl;
    return true;
}

ProfilePtr JurisdictionRegistry::active() const {
    return std::atomic_load(&active_);
}

ProfilePtr JurisdictionRegistry::get(const std::string& country_code) const {
    auto it = by_code_.find(upper_ascii(trim_ws(country_code)));
    if (it == by_code_.end()) return nullptr;
    return it->second;
}

std::map<std::string, std::string> JurisdictionRegistry::list_available() const {
    std::map<std::string, std::string> out;
    for (const auto& kv : by_code_) out[kv.first] = kv.second->law_name();
    return out;
}

NoticeValidation JurisdictionRegistry::validate_notice(const NoticeFields& fields) const {
    ProfilePtr p = active();
    if (!p) {
        NoticeValidation v;
        v.message = "No copyright plugin active";
        return v;
    }
    return p->validate_notice(fields);
}

} // namespace cidgate
