#include <catch2/catch_test_macros.hpp>
#include "anonymizer/merge_engine.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utf8.hpp"
#include "recognizer/pattern_recognizer.hpp"
#include "mocks/accepted_set_access.hpp"

#include <algorithm>
#include <random>

using namespace promptguard;

namespace {

void check_non_overlapping(const AcceptedSet& accepted) {
    for (size_t i = 1; i < accepted.size(); ++i) {
        CHECK(accepted[i - 1].end <= accepted[i].start);
    }
}

} // anonymous namespace

TEST_CASE("MergeEngine: conflict resolution", "[merge]") {

    SECTION("Empty input") {
        const auto accepted = MergeEngine::merge({});
        CHECK(accepted.empty());
    }

    SECTION("Same span: higher score wins") {
        const auto accepted = MergeEngine::merge({
            {entity::kBankAccount, 31, 43, 0.6, "BankAccountRecognizer", 2},
            {entity::kPhone, 31, 43, 0.8, "PhoneRecognizer", 1},
        });
        REQUIRE(accepted.size() == 1);
        CHECK(accepted[0].entity_type == entity::kPhone);
    }

    SECTION("Same start and score: longer span wins") {
        const auto accepted = MergeEngine::merge({
            {entity::kMoneyAmount, 5, 8, 0.8},
            {entity::kMoneyAmount, 5, 14, 0.8},
        });
        REQUIRE(accepted.size() == 1);
        CHECK(accepted[0].end == 14);
    }

    SECTION("Full tie: earlier registered recognizer wins") {
        const auto accepted = MergeEngine::merge({
            {entity::kLocation, 0, 6, 0.85, "EntityRecognizer", 5},
            {entity::kOrganization, 0, 6, 0.85, "OrgRecognizer", 3},
        });
        REQUIRE(accepted.size() == 1);
        CHECK(accepted[0].source_order == 3);
    }

    SECTION("Earlier start wins over a higher score that overlaps it") {
        const auto accepted = MergeEngine::merge({
            {entity::kPhone, 12, 27, 0.8},
            {entity::kBankAccount, 11, 27, 0.6},
        });
        REQUIRE(accepted.size() == 1);
        CHECK(accepted[0].entity_type == entity::kBankAccount);
    }

    SECTION("Adjacent spans are both kept") {
        const auto accepted = MergeEngine::merge({
            {entity::kEmail, 0, 5, 1.0},
            {entity::kPhone, 5, 9, 0.8},
        });
        CHECK(accepted.size() == 2);
    }

    SECTION("Output is sorted by start") {
        const auto accepted = MergeEngine::merge({
            {entity::kMoneyAmount, 28, 38, 0.8},
            {entity::kNationalId, 10, 20, 0.85},
        });
        REQUIRE(accepted.size() == 2);
        CHECK(accepted[0].entity_type == entity::kNationalId);
        CHECK(accepted[1].entity_type == entity::kMoneyAmount);
        REQUIRE_NOTHROW(MergeEngine::verify(accepted));
    }
}

TEST_CASE("MergeEngine: higher-score category beats bank account on a 20-digit token", "[merge]") {
    auto table = apply_overrides(default_rule_table(), {
        {"customer_id_pattern", "CUSTOMER_ID", R"(\b\d{20}\b)", 0.85, false}
    });
    const auto recognizers = PatternRecognizer::from_table(table);
    const auto decoded = utf8::decode("Mi cuenta 12345678901234567890 esta activa");

    std::vector<Match> raw;
    for (size_t i = 0; i < recognizers.size(); ++i) {
        for (auto m : recognizers[i]->detect(decoded, "es", {})) {
            m.source_order = i;
            raw.push_back(std::move(m));
        }
    }
    REQUIRE(raw.size() == 2);

    const auto accepted = MergeEngine::merge(raw);
    REQUIRE(accepted.size() == 1);
    CHECK(accepted[0].entity_type == "CUSTOMER_ID");
    CHECK(accepted[0].start == 10);
    CHECK(accepted[0].end == 30);
}

TEST_CASE("MergeEngine: properties over random inputs", "[merge]") {
    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> pos(0, 60);
    std::uniform_int_distribution<size_t> len(1, 12);
    std::uniform_int_distribution<int> score(0, 10);
    std::uniform_int_distribution<size_t> order(0, 4);
    const char* types[] = {entity::kEmail, entity::kPhone, entity::kBankAccount,
                           entity::kNationalId, entity::kMoneyAmount};

    for (int round = 0; round < 200; ++round) {
        std::vector<Match> raw;
        const size_t n = round % 15;
        for (size_t i = 0; i < n; ++i) {
            const size_t s = pos(rng);
            const size_t o = order(rng);
            raw.emplace_back(types[o], s, s + len(rng), score(rng) / 10.0, "R", o);
        }

        const auto accepted = MergeEngine::merge(raw);

        // Pairwise non-overlapping and verified
        check_non_overlapping(accepted);
        REQUIRE_NOTHROW(MergeEngine::verify(accepted));

        // Every accepted match came from the input
        for (const auto& m : accepted) {
            CHECK(std::find(raw.begin(), raw.end(), m) != raw.end());
        }

        // Every rejected match overlaps an accepted one
        for (const auto& m : raw) {
            const bool kept = std::find(accepted.begin(), accepted.end(), m) != accepted.end();
            const bool blocked = std::any_of(accepted.begin(), accepted.end(),
                [&](const Match& a) { return a.overlaps(m); });
            CHECK((kept || blocked));
        }

        // Deterministic under input permutation
        auto shuffled = raw;
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        const auto again = MergeEngine::merge(shuffled);
        REQUIRE(again.size() == accepted.size());
        for (size_t i = 0; i < again.size(); ++i) {
            CHECK(again[i].start == accepted[i].start);
            CHECK(again[i].end == accepted[i].end);
            CHECK(again[i].score == accepted[i].score);
        }

        // Idempotent
        CHECK(MergeEngine::merge(accepted.matches()) == accepted);
    }
}

TEST_CASE("MergeEngine: sort key", "[merge]") {
    const Match a{entity::kPhone, 3, 8, 0.8, "", 1};
    CHECK(MergeEngine::precedes({entity::kPhone, 2, 4, 0.1}, a));
    CHECK(MergeEngine::precedes({entity::kPhone, 3, 5, 0.9}, a));
    CHECK(MergeEngine::precedes({entity::kPhone, 3, 9, 0.8}, a));
    CHECK(MergeEngine::precedes({entity::kPhone, 3, 8, 0.8, "", 0}, a));
    CHECK_FALSE(MergeEngine::precedes(a, a));
}

TEST_CASE("MergeEngine::verify rejects broken sets", "[merge]") {

    SECTION("Overlapping spans") {
        const auto accepted = AcceptedSetTestAccess::make({
            {entity::kEmail, 0, 10, 1.0},
            {entity::kPhone, 5, 15, 0.8},
        });
        REQUIRE_THROWS_AS(MergeEngine::verify(accepted), MergeInvariantViolation);
    }

    SECTION("Out of order") {
        const auto accepted = AcceptedSetTestAccess::make({
            {entity::kPhone, 20, 30, 0.8},
            {entity::kEmail, 0, 10, 1.0},
        });
        REQUIRE_THROWS_AS(MergeEngine::verify(accepted), MergeInvariantViolation);
    }

    SECTION("Malformed span") {
        const auto accepted = AcceptedSetTestAccess::make({{entity::kEmail, 7, 7, 1.0}});
        REQUIRE_THROWS_AS(MergeEngine::verify(accepted), MergeInvariantViolation);
    }

    SECTION("Touching spans are fine") {
        const auto accepted = AcceptedSetTestAccess::make({
            {entity::kEmail, 0, 10, 1.0},
            {entity::kPhone, 10, 15, 0.8},
        });
        REQUIRE_NOTHROW(MergeEngine::verify(accepted));
    }
}
