// France: droit d'auteur, Code de la propriété intellectuelle.
//
// Unlike the DMCA, French law separates moral rights (perpetual, inalienable,
// L121-1) from economic rights (L111-1); a notice must attest to both.

#include "jurisdiction.h"
#include "profile_common.h"
#include "cid_util.h"

namespace cidgate {

namespace {

class FrDroitAuteurProfile final : public JurisdictionProfile {
public:
    std::string country_code() const override { return "FR"; }
    std::string law_name() const override { return "Droit d'auteur (CPI)"; }
    std::string law_reference() const override {
        return "Code de la propriété intellectuelle (Articles L111-1 à L343-7)";
    }
    std::string default_language() const override { return "fr"; }

    // Not fixed by statute.
    int sla_hours() const override { return 72; }

    std::vector<std::string> required_fields() const override {
        return {
            "author_name",
            "contact_email",
            "contact_address",
            "infringing_cid",
            "work_description",
            "moral_rights_statement",
            "economic_rights_statement",
            "good_faith_statement",
            "signature",
        };
    }

    NoticeValidation validate_notice(const NoticeFields& fields) const override {
        jurisdictions::CommonChecks c;
        c.missing_field_msg = "Champ requis manquant: {field}";
        c.invalid_cid_msg = "Format CID IPFS invalide";
        c.invalid_email_msg = "Adresse email invalide";

        NoticeValidation v = jurisdictions::check_common(*this, fields, c);
        if (!v.ok) return v;

        v.ok = false;
        if (!is_checked(jurisdictions::field_value(fields, "moral_rights_statement"))) {
            v.message = "La déclaration sur les droits moraux est requise (spécificité du droit français)";
            return v;
        }
        if (!is_checked(jurisdictions::field_value(fields, "economic_rights_statement"))) {
            v.message = "La déclaration sur les droits patrimoniaux est requise";
            return v;
        }
        if (!is_checked(jurisdictions::field_value(fields, "good_faith_statement"))) {
            v.message = "L'attestation sur l'honneur est requise";
            return v;
        }

        v.ok = true;
        return v;
    }

    BlockedPageText blocked_page_text(const std::string& reason,
                                      const std::string& language) const override {
        BlockedPageText t;
        t.reason = reason;
        t.link = "/copyright/counter-notice";

        if (language == "en") {
            t.language = "en";
            t.title = "451 - Content Unavailable For Legal Reasons";
            t.message = "This content has been blocked for infringing French copyright law.";
            t.law = "Code de la propriété intellectuelle";
            t.action = "If you believe this removal was in error, you may contest the decision.";
            t.note = "Note: French moral rights are perpetual and inalienable (Article L121-1 CPI)";
        } else {
            t.language = "fr";
            t.title = "451 - Contenu indisponible pour des raisons légales";
            t.message = "Ce contenu a été bloqué en raison d'une violation du droit d'auteur français.";
            t.law = "Code de la propriété intellectuelle";
            t.action = "Si vous pensez que ce retrait est erroné, vous pouvez contester la décision.";
            t.note = "Note: Le droit moral français est perpétuel et inaliénable (Article L121-1 CPI)";
        }
        t.reason_text = jurisdictions::describe_reason(*this, reason, t.language);
        return t;
    }

    std::string footer_html() const override {
        return R"(<div class="fr-copyright-badge">
    Conformité Droit d'auteur français<br>
    <a href="/copyright/report">Signaler une violation</a><br>
    <small>Code de la propriété intellectuelle - Articles L111-1 à L343-7</small><br>
    <small>Droits moraux: perpétuels, inaliénables et imprescriptibles</small>
</div>
)";
    }

    std::vector<std::pair<std::string, std::string>> takedown_reasons() const override {
        return {
            {"droit_auteur", "Violation du droit d'auteur"},
            {"droit_moral", "Atteinte aux droits moraux"},
            {"contrefacon", "Contrefaçon"},
            {"droit_voisin", "Violation des droits voisins"},
        };
    }

    std::string format_notice_response(const std::string& reference_id) const override {
        return "Notification reçue - " + law_name() + "\n\n"
               "Référence: " + reference_id + "\n"
               "Juridiction: " + country_code() + "\n"
               "Délai de réponse: " + std::to_string(sla_hours()) + " heures\n\n"
               "Votre notification sera examinée conformément au " + law_reference() + ".\n";
    }

    std::string notice_template() const override {
        return R"(# Notification de violation du droit d'auteur

## Code de la propriété intellectuelle (France)

### 1. Identification de l'auteur
- **Nom de l'auteur:** [Votre nom]
- **Qualité:** [ ] Auteur [ ] Ayant droit [ ] Mandataire
- **Adresse:** [Votre adresse postale]
- **Email:** [votre@email.fr]
- **Téléphone:** [Votre numéro]

### 2. Description de l'œuvre protégée
- **Titre de l'œuvre:** [Titre]
- **Nature de l'œuvre:** [Livre, musique, image, vidéo, logiciel, etc.]
- **Date de création:** [Date]
- **Description détaillée:** [Description de l'œuvre]

### 3. Localisation du contenu contrefaisant
- **CID IPFS:** `ipfs://...`
- **URL:** `https://gateway.example.com/ipfs/...`
- **Description de la contrefaçon:** [En quoi le contenu viole vos droits]

### 4. Droits patrimoniaux (Article L111-1)
*"Je suis titulaire des droits patrimoniaux sur cette œuvre, notamment les droits de reproduction et de représentation."*

[ ] Je confirme être titulaire des droits patrimoniaux

### 5. Droits moraux (Article L121-1)
- [ ] Droit de divulgation (L121-2)
- [ ] Droit au respect du nom (L121-1)
- [ ] Droit au respect de l'œuvre (L121-1)
- [ ] Droit de retrait ou de repentir (L121-4)

*"Je déclare que le contenu signalé porte atteinte à mes droits moraux sur l'œuvre."*

[ ] Je confirme l'atteinte aux droits moraux

### 6. Déclaration de bonne foi
*"J'atteste sur l'honneur que les informations fournies sont exactes et que je suis bien titulaire des droits invoqués ou mandaté pour agir au nom du titulaire."*

[ ] J'atteste de la véracité de ces informations

### 7. Signature
- **Signature:** [Signature électronique ou manuscrite]
- **Date:** [Date]
- **Lieu:** [Lieu]

---

**Fausse déclaration:** Article 226-10 du Code pénal - la dénonciation calomnieuse est punissable.

**Délai de traitement:** 48-72 heures
)";
    }

    std::string counter_notice_template() const override {
        return R"(# Contestation de retrait - Droit d'auteur français

### 1. Vos informations
- **Nom:** [Votre nom]
- **Adresse:** [Votre adresse]
- **Email:** [votre@email.fr]

### 2. Contenu concerné
- **CID retiré:** [CID IPFS]
- **Date du retrait:** [Date]
- **Référence:** [Numéro de référence du retrait]

### 3. Motifs de contestation
- [ ] Exception de courte citation (Article L122-5)
- [ ] Exception pédagogique (Article L122-5)
- [ ] Parodie, pastiche, caricature (Article L122-5)
- [ ] Vous êtes l'auteur ou ayant droit
- [ ] Contenu dans le domaine public
- [ ] Autre: [Précisez]

### 4. Déclaration
*"J'atteste sur l'honneur de la véracité des informations communiquées et avoir un intérêt légitime à la publication de ce contenu."*

[ ] J'atteste

### 5. Signature
- **Signature:** [Signature]
- **Date:** [Date]

---

**Délai de traitement:** 7 jours ouvrés

**Recours:** Si vous n'êtes pas satisfait de notre décision, vous pouvez saisir le tribunal judiciaire compétent.
)";
    }
};

} // namespace

ProfilePtr make_fr_droit_auteur_profile() {
    return std::make_shared<const FrDroitAuteurProfile>();
}

} // namespace cidgate
