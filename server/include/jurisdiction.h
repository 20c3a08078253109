#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cidgate {

/*
Jurisdiction profiles
=====================

A profile bundles everything that differs between compliance regimes:
legal metadata, the notice form schema and its validation rules, notice and
counter-notice templates, and the localized text of the 451 page.

Profiles are immutable after construction and shared across request threads.
Adding a jurisdiction means adding one factory to builtin_profile_factories();
the dispatcher only ever talks to this interface.
*/

// Notice submission: form field name -> submitted value.
using NoticeFields = std::map<std::string, std::string>;

struct NoticeValidation {
    bool ok = false;
    std::string message;   // human-readable, in the profile's language; empty when ok
};

// Localized copy for the 451 response. Empty optional members are omitted.
struct BlockedPageText {
    std::string title;
    std::string message;
    std::string reason;        // machine tag, as stored in the block list
    std::string reason_text;   // localized description of the tag
    std::string law;
    std::string action;        // optional
    std::string link;          // optional
    std::string note;          // optional
    std::string language;
};

// Fixed English payload used when no profile is active.
BlockedPageText generic_blocked_page_text(const std::string& reason);

class JurisdictionProfile {
public:
    virtual ~JurisdictionProfile() = default;

    // ISO country / region code ("US", "EU", "FR", "PL").
    virtual std::string country_code() const = 0;
    virtual std::string law_name() const = 0;
    virtual std::string law_reference() const = 0;

    // Markdown templates.
    virtual std::string notice_template() const = 0;
    virtual std::string counter_notice_template() const = 0;

    // Ordered; validation reports the first missing field in this order.
    virtual std::vector<std::string> required_fields() const = 0;
    virtual int sla_hours() const = 0;

    // Language used for messages and as fallback for unknown languages.
    virtual std::string default_language() const = 0;

    virtual NoticeValidation validate_notice(const NoticeFields& fields) const = 0;

    virtual BlockedPageText blocked_page_text(const std::string& reason,
                                              const std::string& language) const = 0;

    virtual std::string footer_html() const = 0;

    // reason_code -> description, in declaration order.
    virtual std::vector<std::pair<std::string, std::string>> takedown_reasons() const = 0;

    // Acknowledgement sent back to the complainant.
    virtual std::string format_notice_response(const std::string& reference_id) const;
};

using ProfilePtr = std::shared_ptr<const JurisdictionProfile>;
using ProfileFactory = std::function<ProfilePtr()>;

ProfilePtr make_us_dmca_profile();
ProfilePtr make_eu_dsa_profile();
ProfilePtr make_fr_droit_auteur_profile();
ProfilePtr make_pl_prawa_autorskie_profile();

// Explicit registration list (no runtime discovery).
const std::vector<ProfileFactory>& builtin_profile_factories();

/*
JurisdictionRegistry
====================

Owns the fixed profile set and the process-wide "active" handle.

- The set is built once in the constructor and never changes.
- active() is read on every blocked request; it is an atomic load of an
  immutable shared_ptr, so readers never block and never see a torn value.
- set_active() is serialized by a mutex (single writer).

No profile is active until set_active() succeeds at least once.
*/
class JurisdictionRegistry {
public:
    explicit JurisdictionRegistry(const std::vector<ProfileFactory>& factories = builtin_profile_factories());

    // Case-insensitive. Unknown code: returns false, active profile unchanged.
    bool set_active(const std::string& country_code);

    ProfilePtr active() const;
    ProfilePtr get(const std::string& country_code) const;

    // code -> law name, sorted by code.
    std::map<std::string, std::string> list_available() const;

    // Validate against the active profile.
    NoticeValidation validate_notice(const NoticeFields& fields) const;

private:
    std::map<std::string, ProfilePtr> by_code_;

    std::mutex write_mu_;
    ProfilePtr active_;   // accessed via std::atomic_load / std::atomic_store
};

} // namespace cidgate
