// Poland: Ustawa o prawie autorskim i prawach pokrewnych
// (Dz.U. 1994 nr 24 poz. 83 z późn. zm.).
//
// Personal rights of the author (prawa osobiste, Art. 16) are inalienable;
// the notice carries a separate attestation for them.

#include "jurisdiction.h"
#include "profile_common.h"
#include "cid_util.h"

namespace cidgate {

namespace {

class PlPrawaAutorskieProfile final : public JurisdictionProfile {
public:
    std::string country_code() const override { return "PL"; }
    std::string law_name() const override { return "Ustawa o prawie autorskim i prawach pokrewnych"; }
    std::string law_reference() const override { return "Dz.U. 1994 nr 24 poz. 83 z późn. zm."; }
    std::string default_language() const override { return "pl"; }

    // 3 business days.
    int sla_hours() const override { return 72; }

    std::vector<std::string> required_fields() const override {
        return {
            "complainant_name",
            "contact_address",
            "contact_email",
            "contact_phone",
            "work_description",
            "infringing_cid",
            "justification",
            "personal_rights_statement",
            "good_faith_statement",
            "signature",
        };
    }

    NoticeValidation validate_notice(const NoticeFields& fields) const override {
        jurisdictions::CommonChecks c;
        c.email_requires_dot = true;
        c.missing_field_msg = "Brak wymaganego pola: {field}";
        c.invalid_cid_msg = "Nieprawidłowy format CID IPFS";
        c.invalid_email_msg = "Nieprawidłowy adres email";

        NoticeValidation v = jurisdictions::check_common(*this, fields, c);
        if (!v.ok) return v;

        v.ok = false;
        if (!is_checked(jurisdictions::field_value(fields, "personal_rights_statement"))) {
            v.message = "Wymagane jest oświadczenie dotyczące praw osobistych twórcy (Art. 16)";
            return v;
        }
        if (!is_checked(jurisdictions::field_value(fields, "good_faith_statement"))) {
            v.message = "Wymagane jest oświadczenie o działaniu w dobrej wierze";
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
        t.law = "Ustawa o prawie autorskim i prawach pokrewnych (Dz.U. 1994 nr 24 poz. 83)";

        if (language == "en") {
            t.language = "en";
            t.title = "451 - Content Unavailable For Legal Reasons";
            t.message = "This content has been blocked for infringing Polish copyright law.";
            t.action = "If you believe this removal was unjustified, you may file an objection.";
            t.note = "Personal rights of the author are inalienable and unlimited in time (Art. 16 sec. 2)";
        } else {
            t.language = "pl";
            t.title = "451 - Treść niedostępna z przyczyn prawnych";
            t.message = "Ta treść została zablokowana z powodu naruszenia polskiego prawa autorskiego.";
            t.action = "Jeśli uważasz, że usunięcie było nieuzasadnione, możesz złożyć sprzeciw.";
            t.note = "Prawa osobiste twórcy są niezbywalne i nieograniczone w czasie (Art. 16 ust. 2)";
        }
        t.reason_text = jurisdictions::describe_reason(*this, reason, t.language);
        return t;
    }

    std::string footer_html() const override {
        return R"(<div class="pl-copyright-badge">
    Zgodność z polskim prawem autorskim<br>
    <a href="/copyright/report">Zgłoś naruszenie praw autorskich</a><br>
    <small>Ustawa o prawie autorskim i prawach pokrewnych (Dz.U. 1994 nr 24 poz. 83)</small>
</div>
)";
    }

    std::vector<std::pair<std::string, std::string>> takedown_reasons() const override {
        return {
            {"naruszenie_praw_autorskich", "Naruszenie praw autorskich"},
            {"naruszenie_praw_osobistych", "Naruszenie praw osobistych twórcy"},
            {"naruszenie_praw_pokrewnych", "Naruszenie praw pokrewnych"},
            {"plagiat", "Plagiat"},
        };
    }

    std::string format_notice_response(const std::string& reference_id) const override {
        return "Zgłoszenie otrzymane - " + law_name() + "\n\n"
               "Numer referencyjny: " + reference_id + "\n"
               "Jurysdykcja: " + country_code() + "\n"
               "Czas odpowiedzi: " + std::to_string(sla_hours()) + " godzin\n\n"
               "Zgłoszenie zostanie rozpatrzone zgodnie z " + law_reference() + ".\n";
    }

    std::string notice_template() const override {
        return R"(# Zgłoszenie naruszenia praw autorskich

## Ustawa o prawie autorskim i prawach pokrewnych (Polska)

### 1. Dane zgłaszającego
- **Imię i nazwisko / Nazwa podmiotu:** [Twoje dane]
- **Adres:** [Ulica, kod, miasto]
- **Email:** [twoj@email.pl]
- **Telefon:** [Numer telefonu]
- **Działam jako:** [ ] Twórca [ ] Podmiot praw pokrewnych [ ] Pełnomocnik

### 2. Opis utworu chronionego
- **Tytuł utworu:** [Tytuł]
- **Rodzaj utworu:** [Literacki, muzyczny, plastyczny, fotograficzny, programu komputerowego, etc.]
- **Szczegółowy opis:** [Opis utworu]

### 3. Wskazanie naruszenia
- **CID IPFS:** `ipfs://...`
- **URL:** `https://gateway.example.com/ipfs/...`
- **Opis naruszenia:** [W jaki sposób doszło do naruszenia]

### 4. Podstawa prawna roszczenia
**Prawa majątkowe (Art. 17 i nast.):**
- [ ] Prawo do rozporządzania i korzystania z utworu
- [ ] Prawo do wynagrodzenia za korzystanie

**Prawa osobiste (Art. 16):**
- [ ] Prawo do autorstwa utworu
- [ ] Prawo do oznaczenia utworu swoim nazwiskiem lub pseudonimem
- [ ] Prawo do nienaruszalności treści i formy utworu
- [ ] Prawo do decydowania o pierwszym udostępnieniu utworu publiczności
- [ ] Prawo do nadzoru nad sposobem korzystania z utworu

### 5. Uzasadnienie
[Szczegółowe wyjaśnienie, dlaczego uważasz że doszło do naruszenia]

### 6. Oświadczenie
*"Oświadczam, że podane informacje są prawdziwe i działam w dobrej wierze. Jestem uprawniony do reprezentowania właściciela praw autorskich lub praw pokrewnych."*

[ ] Potwierdzam prawdziwość oświadczenia

### 7. Świadomość odpowiedzialności karnej
*"Jestem świadomy odpowiedzialności karnej za złożenie fałszywego oświadczenia (Art. 233 § 1 Kodeksu karnego)."*

[ ] Jestem świadomy odpowiedzialności

### 8. Podpis
- **Podpis:** [Podpis elektroniczny lub własnoręczny]
- **Data:** [Data]
- **Miejsce:** [Miasto]

---

**Czas reakcji:** 72 godziny robocze
)";
    }

    std::string counter_notice_template() const override {
        return R"(# Sprzeciw wobec usunięcia treści

### 1. Twoje dane
- **Imię i nazwisko:** [Twoje dane]
- **Adres:** [Adres]
- **Email:** [email@domena.pl]

### 2. Treść, której dotyczy sprzeciw
- **CID usuniętej treści:** [CID]
- **Data usunięcia:** [Data]
- **Numer referencyjny:** [Numer z powiadomienia]

### 3. Uzasadnienie sprzeciwu
- [ ] Użytek osobisty (Art. 23)
- [ ] Prawo cytatu (Art. 29)
- [ ] Użytek w celach dydaktycznych (Art. 27)
- [ ] Parodia (Art. 29 ust. 1)
- [ ] Jesteś twórcą lub posiadaczem praw
- [ ] Utwór w domenie publicznej
- [ ] Inne: [Określ podstawę prawną]

### 4. Oświadczenie
*"Oświadczam, że przysługuje mi prawo do publikacji tej treści i że nie narusza ona cudzych praw autorskich ani praw pokrewnych. Jestem świadomy odpowiedzialności karnej za złożenie fałszywego oświadczenia (Art. 233 § 1 k.k.)."*

[ ] Potwierdzam

### 5. Podpis
- **Podpis:** [Podpis]
- **Data:** [Data]

---

**Czas rozpatrzenia:** 7 dni roboczych

**Dalsze kroki:** W przypadku negatywnej decyzji możesz skierować sprawę do sądu powszechnego.
)";
    }
};

} // namespace

ProfilePtr make_pl_prawa_autorskie_profile() {
    return std::make_shared<const PlPrawaAutorskieProfile>();
}

} // namespace cidgate
