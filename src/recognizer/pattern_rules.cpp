#include "recognizer/pattern_rules.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utf8.hpp"

#include <algorithm>
#include <format>
#include <regex>

namespace promptguard {

namespace {

// Latin-1 letters; std::wregex classes stay ASCII under the "C" locale
constexpr const char* kLatinLetters = "À-ÖØ-öø-ÿ";

// Local part and domain capped at the RFC 5321 lengths (64 / 255)
std::string email_regex() {
    return std::format(R"([\w{0}.-]{{1,64}}@[\w{0}.-]{{1,255}}\.\w{{2,4}}\b)", kLatinLetters);
}

std::string money_regex() {
    constexpr const char* kNumber = R"(\d(?:[.,]?\d){0,24})";
    constexpr const char* kWords = R"((?:pesos|d[óÓ]lares|dolares|euros|usd|eur)\b|us\$)";
    return std::format(
        R"((?:\b(?:us\$|usd|eur)|\$|€)\s?{0}(?:\s?(?:{1}))?|\b{0}\s?(?:{1}))",
        kNumber, kWords);
}

} // anonymous namespace

RuleTable default_rule_table() {
    RuleTable table;
    table.version = "1";
    table.language = "es";
    table.rules = {
        {"email_pattern", entity::kEmail, email_regex(), 1.0, false},
        {"phone_pattern", entity::kPhone,
         // optional "9 " mobile marker after the country code (+54 9 11 ...)
         R"((?:\+\d{1,3}[- ]?(?:9[- ])?|\b\d{1,3}[- ](?:9[- ])?)?(?:\(\d{2,4}\)|\b\d{2,4})[- ]?\d{3,4}[- ]?\d{3,4}\b)",
         0.8, false},
        {"bank_pattern", entity::kBankAccount,
         R"(\b(?=[A-Z]{0,29}\d)[A-Z0-9]{15,30}\b|\b\d(?:[ -]?\d){9,21}\b)",
         0.6, false},
        {"dni_pattern", entity::kNationalId,
         R"(\b\d{1,2}\.?\d{3}\.?\d{3}\b)",
         0.85, false},
        {"money_pattern", entity::kMoneyAmount, money_regex(), 0.8, true},
    };
    return table;
}

std::wregex compile_rule(const PatternRule& rule) {
    auto flags = std::regex_constants::ECMAScript | std::regex_constants::optimize;
    if (rule.case_insensitive) {
        flags |= std::regex_constants::icase;
    }
    try {
        return std::wregex(utf8::widen(rule.regex), flags);
    } catch (const std::regex_error& e) {
        throw ConfigurationError(std::format(
            "pattern rule '{}' has an invalid regex (code {})",
            rule.name, static_cast<int>(e.code())));
    }
}

RuleTable apply_overrides(RuleTable base, const std::vector<PatternRule>& extra) {
    for (const auto& rule : extra) {
        auto it = std::find_if(base.rules.begin(), base.rules.end(),
            [&](const PatternRule& r) { return r.name == rule.name; });
        if (it != base.rules.end()) {
            *it = rule;
        } else {
            base.rules.push_back(rule);
        }
    }
    validate_rule_table(base);
    return base;
}

void validate_rule_table(const RuleTable& table) {
    for (size_t i = 0; i < table.rules.size(); ++i) {
        const auto& rule = table.rules[i];
        if (rule.name.empty()) {
            throw ConfigurationError(std::format("pattern rule #{} has no name", i));
        }
        if (rule.entity_type.empty()) {
            throw ConfigurationError(std::format("pattern rule '{}' has no entity_type", rule.name));
        }
        if (rule.regex.empty()) {
            throw ConfigurationError(std::format("pattern rule '{}' has an empty regex", rule.name));
        }
        if (rule.score < 0.0 || rule.score > 1.0) {
            throw ConfigurationError(std::format(
                "pattern rule '{}' score {} is outside [0, 1]", rule.name, rule.score));
        }
        for (size_t j = 0; j < i; ++j) {
            if (table.rules[j].name == rule.name) {
                throw ConfigurationError(std::format("duplicate pattern rule '{}'", rule.name));
            }
        }

        (void)compile_rule(rule);
    }
}

} // namespace promptguard
