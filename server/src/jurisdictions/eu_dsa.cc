// European Union: Digital Services Act, Regulation (EU) 2022/2065.
// Notice-and-action per Article 16; complaints per Article 20.

#include "jurisdiction.h"
#include "profile_common.h"
#include "cid_util.h"

namespace cidgate {

namespace {

class EuDsaProfile final : public JurisdictionProfile {
public:
    std::string country_code() const override { return "EU"; }
    std::string law_name() const override { return "DSA (Digital Services Act)"; }
    std::string law_reference() const override { return "Regulation (EU) 2022/2065"; }
    std::string default_language() const override { return "en"; }

    int sla_hours() const override { return 24; }

    std::vector<std::string> required_fields() const override {
        return {
            "complainant_name",
            "complainant_email",
            "infringing_cid",
            "illegal_content_explanation",
            "good_faith_statement",
        };
    }

    NoticeValidation validate_notice(const NoticeFields& fields) const override {
        jurisdictions::CommonChecks c;
        c.email_field = "complainant_email";

        NoticeValidation v = jurisdictions::check_common(*this, fields, c);
        if (!v.ok) return v;

        if (!is_checked(jurisdictions::field_value(fields, "good_faith_statement"))) {
            v.ok = false;
            v.message = "Statement of good faith is required";
        }
        return v;
    }

    BlockedPageText blocked_page_text(const std::string& reason,
                                      const std::string& language) const override {
        BlockedPageText t;
        t.reason = reason;
        t.link = "/dsa-complaint";

        if (language == "pl") {
            t.language = "pl";
            t.title = "451 - Treść niedostępna z przyczyn prawnych";
            t.message = "Ta treść została zablokowana zgodnie z Digital Services Act (DSA).";
            t.law = "Rozporządzenie (UE) 2022/2065";
            t.action = "Jeśli uważasz, że usunięcie było błędne, możesz złożyć skargę.";
        } else {
            t.language = "en";
            t.title = "451 - Content Unavailable For Legal Reasons";
            t.message = "This content has been blocked under the Digital Services Act (DSA).";
            t.law = "Regulation (EU) 2022/2065";
            t.action = "If you believe this removal was incorrect, you may file a complaint.";
        }
        t.reason_text = jurisdictions::describe_reason(*this, reason, t.language);
        return t;
    }

    std::string footer_html() const override {
        return R"(<div class="dsa-badge">
    DSA Compliant Gateway (European Union)<br>
    <a href="/copyright/report">Report Illegal Content</a> |
    <a href="/transparency">Transparency Report</a> |
    <a href="/dsa-complaint">File Complaint</a><br>
    <small>Regulation (EU) 2022/2065 compliant</small>
</div>
)";
    }

    std::vector<std::pair<std::string, std::string>> takedown_reasons() const override {
        return {
            {"copyright", "Copyright Infringement"},
            {"illegal_content", "Illegal Content (DSA)"},
            {"hate_speech", "Hate Speech"},
            {"csam", "Child Sexual Abuse Material"},
            {"terrorism", "Terrorist Content"},
        };
    }

    std::string notice_template() const override {
        return R"(# DSA Notice and Action Mechanism

## Article 16 Requirements - Notification of Illegal Content

### 1. Complainant Information
- **Full Name or Company Name:** [Your name/company]
- **Email Address:** [your@email.com]
- **Phone Number (optional):** [Your phone]

### 2. Description of Illegal Content
- **IPFS CID:** `ipfs://...`
- **Gateway URL:** `https://gateway.example.com/ipfs/...`
- **Legal Basis:** [Which law/regulation is violated]
- **Explanation:** [Detailed explanation why this content is illegal]

### 3. Statement of Good Faith
*"I confirm that I have a good faith belief that the information and allegations in this notice are accurate and complete."*

[ ] I agree to this statement

---

## Your Rights Under DSA

- **Article 20:** Right to complain about content moderation decisions
- **Article 23:** We will provide a Statement of Reasons for our decision
- **Transparency:** All takedown decisions are logged in our transparency report

**Response Time:** 24 hours for illegal content

**Appeal:** If you disagree with our decision, you can file a complaint within 6 months.
)";
    }

    std::string counter_notice_template() const override {
        return R"(# DSA Complaint (Article 20)

## Right to Complain About Content Moderation Decisions

### 1. Your Information
- **Name:** [Your name]
- **Email:** [your@email.com]
- **Reference ID:** [ID from takedown notice]

### 2. Content Reference
- **CID:** [The blocked CID]
- **Date of Removal:** [When it was blocked]
- **Original Decision:** [Copy of the Statement of Reasons you received]

### 3. Grounds for Complaint
[Explain why you believe the removal was unjustified or the decision was incorrect]

### 4. Supporting Evidence
[Attach any evidence supporting your complaint]

---

**Processing Time:** We will review your complaint within 7 days and provide a detailed Statement of Reasons for our final decision.

**Further Appeal:** If unsatisfied, you may submit the dispute to a certified out-of-court dispute settlement body.
)";
    }
};

} // namespace

ProfilePtr make_eu_dsa_profile() {
    return std::make_shared<const EuDsaProfile>();
}

} // namespace cidgate
