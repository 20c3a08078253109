// United States: DMCA safe harbor, 17 U.S.C. § 512.

#include "jurisdiction.h"
#include "profile_common.h"
#include "cid_util.h"

namespace cidgate {

namespace {

class UsDmcaProfile final : public JurisdictionProfile {
public:
    std::string country_code() const override { return "US"; }
    std::string law_name() const override { return "DMCA (Digital Millennium Copyright Act)"; }
    std::string law_reference() const override { return "17 U.S.C. § 512"; }
    std::string default_language() const override { return "en"; }

    // DMCA asks for "expeditious" removal.
    int sla_hours() const override { return 48; }

    std::vector<std::string> required_fields() const override {
        return {
            "copyright_owner",
            "contact_email",
            "contact_address",
            "contact_phone",
            "infringing_cid",
            "copyrighted_work_description",
            "good_faith_statement",
            "accuracy_statement",
            "signature",
        };
    }

    NoticeValidation validate_notice(const NoticeFields& fields) const override {
        jurisdictions::CommonChecks c;
        c.email_requires_dot = true;

        NoticeValidation v = jurisdictions::check_common(*this, fields, c);
        if (!v.ok) return v;

        v.ok = false;
        if (!is_checked(jurisdictions::field_value(fields, "good_faith_statement"))) {
            v.message = "Good faith statement is required";
            return v;
        }
        if (!is_checked(jurisdictions::field_value(fields, "accuracy_statement"))) {
            v.message = "Accuracy statement under penalty of perjury is required";
            return v;
        }
        if (jurisdictions::field_value(fields, "signature").empty()) {
            v.message = "Physical or electronic signature is required";
            return v;
        }

        v.ok = true;
        return v;
    }

    BlockedPageText blocked_page_text(const std::string& reason,
                                      const std::string& /*language*/) const override {
        // English only.
        BlockedPageText t;
        t.language = "en";
        t.title = "451 - Content Unavailable For Legal Reasons";
        t.message = "This content has been removed in response to a DMCA takedown notice.";
        t.reason = reason;
        t.reason_text = jurisdictions::describe_reason(*this, reason, t.language);
        t.law = "17 U.S.C. § 512";
        t.action = "If you believe this removal was in error, you may file a DMCA counter-notice.";
        t.link = "/copyright/counter-notice";
        return t;
    }

    std::string footer_html() const override {
        return R"(<div class="dmca-badge">
    DMCA Compliant Gateway (USA)<br>
    <a href="/copyright/report">Report Copyright Infringement</a><br>
    <small>Protected by 17 U.S.C. § 512 Safe Harbor provisions</small>
</div>
)";
    }

    std::vector<std::pair<std::string, std::string>> takedown_reasons() const override {
        return {
            {"dmca", "DMCA Takedown Notice"},
            {"copyright", "Copyright Infringement"},
            {"trademark", "Trademark Infringement"},
        };
    }

    std::string notice_template() const override {
        return R"(# DMCA Takedown Notice

## Required Information Under 17 U.S.C. § 512(c)(3)

### 1. Identification of Copyrighted Work
- **Title:** [Title of your copyrighted work]
- **Author:** [Author name]
- **Copyright Registration Number:** [If available]
- **Description:** [Detailed description of the copyrighted work]

### 2. Identification of Infringing Material
- **IPFS CID:** `ipfs://...`
- **Gateway URL:** `https://gateway.example.com/ipfs/...`
- **Description:** [How the material infringes your copyright]

### 3. Contact Information
- **Full Legal Name:** [Your name or company name]
- **Physical Address:** [Street address, city, state, ZIP]
- **Email Address:** [your@email.com]
- **Phone Number:** [Your phone number]

### 4. Good Faith Statement
*"I have a good faith belief that use of the copyrighted material described above in the manner complained of is not authorized by the copyright owner, its agent, or the law."*

[ ] I agree to this statement

### 5. Accuracy Statement (Under Penalty of Perjury)
*"The information in this notification is accurate, and under penalty of perjury, I am the copyright owner or authorized to act on behalf of the owner of an exclusive right that is allegedly infringed."*

[ ] I agree to this statement under penalty of perjury

### 6. Signature
- **Physical or Electronic Signature:** [Your signature]
- **Date:** [Date of submission]

---

**Important:** False claims may result in liability for damages, costs, and attorney's fees under 17 U.S.C. § 512(f).

**Response Time:** We will respond within 48 hours.
)";
    }

    std::string counter_notice_template() const override {
        return R"(# DMCA Counter-Notice

## Under 17 U.S.C. § 512(g)

### 1. Identification of Removed Material
- **CID:** [The CID that was removed]
- **Original URL:** [Original gateway URL]
- **Date of Removal:** [When it was removed]

### 2. Your Contact Information
- **Name:** [Your full name]
- **Address:** [Your physical address]
- **Phone:** [Your phone number]
- **Email:** [Your email address]

### 3. Statement Under Penalty of Perjury
*"I swear, under penalty of perjury, that I have a good faith belief that the material was removed or disabled as a result of mistake or misidentification of the material to be removed or disabled."*

[ ] I agree under penalty of perjury

### 4. Consent to Jurisdiction
*"I consent to the jurisdiction of Federal District Court for the judicial district in which my address is located, or if my address is outside of the United States, for any judicial district in which the service provider may be found, and I will accept service of process from the person who provided the original DMCA notice or an agent of such person."*

[ ] I agree to this statement

### 5. Signature
- **Signature:** [Your signature]
- **Date:** [Date]

---

**Processing Time:** Content may be restored in 10-14 business days unless the original complainant files a court action.
)";
    }
};

} // namespace

ProfilePtr make_us_dmca_profile() {
    return std::make_shared<const UsDmcaProfile>();
}

} // namespace cidgate
