#include <catch2/catch_test_macros.hpp>
#include "anonymizer/anonymizer.hpp"
#include "anonymizer/merge_engine.hpp"
#include "anonymizer/safety_report.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utf8.hpp"
#include "mocks/accepted_set_access.hpp"

#include <stdexcept>

using namespace promptguard;

TEST_CASE("Anonymizer: per-category placeholders", "[anonymizer]") {

    SECTION("Email and phone are replaced, everything else is untouched") {
        const std::string prompt = "Contactame a ana@mail.com o al 11-4555-2233";
        const auto accepted = MergeEngine::merge({
            {entity::kEmail, 13, 25, 1.0},
            {entity::kPhone, 31, 43, 0.8},
        });
        CHECK(Anonymizer::anonymize(prompt, accepted) == "Contactame a <EMAIL> o al <PHONE>");
    }

    SECTION("No matches returns the prompt unchanged") {
        const std::string prompt = "Hola, necesito ayuda con un contrato.";
        CHECK(Anonymizer::anonymize(prompt, MergeEngine::merge({})) == prompt);
    }

    SECTION("Offsets are code points; multi-byte text around spans survives") {
        // "Sr. Pérez vive en Córdoba": Pérez = 4..9, Córdoba = 18..25
        const std::string prompt = "Sr. P\xC3\xA9rez vive en C\xC3\xB3rdoba.";
        const auto accepted = MergeEngine::merge({
            {entity::kPerson, 4, 9, 0.7},
            {entity::kLocation, 18, 25, 0.85},
        });
        CHECK(Anonymizer::anonymize(prompt, accepted) == "Sr. <PERSON> vive en <LOCATION>.");
    }

    SECTION("Span at the very start and end") {
        const std::string prompt = "ana@mail.com";
        const auto accepted = MergeEngine::merge({{entity::kEmail, 0, 12, 1.0}});
        CHECK(Anonymizer::anonymize(prompt, accepted) == "<EMAIL>");
    }

    SECTION("Malformed bytes outside spans are preserved byte for byte") {
        const std::string prompt = "\xFF id 30123456 \xFE";
        const auto accepted = MergeEngine::merge({{entity::kNationalId, 5, 13, 0.85}});
        CHECK(Anonymizer::anonymize(prompt, accepted) == "\xFF id <NATIONAL_ID> \xFE");
    }
}

TEST_CASE("Anonymizer: numbered placeholders", "[anonymizer]") {
    // "a@x.com b@y.com a@x.com 555-1234"
    const std::string prompt = "a@x.com b@y.com a@x.com 555-1234";
    const auto accepted = MergeEngine::merge({
        {entity::kEmail, 0, 7, 1.0},
        {entity::kEmail, 8, 15, 1.0},
        {entity::kEmail, 16, 23, 1.0},
        {entity::kPhone, 24, 32, 0.8},
    });

    CHECK(Anonymizer::anonymize(prompt, accepted, PlaceholderStyle::NUMBERED) ==
          "<EMAIL_1> <EMAIL_2> <EMAIL_1> <PHONE_1>");
}

TEST_CASE("Anonymizer: error cases", "[anonymizer]") {

    SECTION("Span past the end of the text") {
        const auto accepted = MergeEngine::merge({{entity::kEmail, 0, 50, 1.0}});
        REQUIRE_THROWS_AS(Anonymizer::anonymize("short", accepted), std::out_of_range);
    }

    SECTION("Overlapping spans fail loudly") {
        const auto accepted = AcceptedSetTestAccess::make({
            {entity::kEmail, 0, 6, 1.0},
            {entity::kPhone, 4, 10, 0.8},
        });
        REQUIRE_THROWS_AS(Anonymizer::anonymize("0123456789ab", accepted), MergeInvariantViolation);
    }

    SECTION("Decoded text of another prompt") {
        const auto decoded = utf8::decode("something else");
        REQUIRE_THROWS_AS(Anonymizer::anonymize("short", decoded, MergeEngine::merge({})),
                          std::invalid_argument);
    }
}

TEST_CASE("Anonymizer::placeholder", "[anonymizer]") {
    CHECK(Anonymizer::placeholder(entity::kEmail) == "<EMAIL>");
    CHECK(Anonymizer::placeholder(entity::kBankAccount, 3) == "<BANK_ACCOUNT_3>");
}

TEST_CASE("SafetyReportBuilder", "[anonymizer]") {

    SECTION("Distinct categories, sorted") {
        const auto accepted = MergeEngine::merge({
            {entity::kPhone, 31, 43, 0.8},
            {entity::kEmail, 13, 25, 1.0},
            {entity::kEmail, 0, 10, 1.0},
        });
        const auto report = SafetyReportBuilder::build(accepted, "sanitized");
        CHECK(report.detected_items == std::vector<std::string>{"EMAIL", "PHONE"});
        CHECK(report.sanitized_prompt == "sanitized");
    }

    SECTION("Empty set gives an empty report") {
        CHECK(SafetyReportBuilder::detected_items(MergeEngine::merge({})).empty());
    }
}
