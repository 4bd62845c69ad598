#pragma once

#include <regex>
#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief One declarative detection rule: (entity_type, regex, score)
 *
 * Regexes are ECMAScript, written in UTF-8 and matched over code points.
 * `\w`, `\d` and `\b` follow ASCII semantics; rules that need accented
 * letters list them explicitly.
 */
struct PatternRule {
    std::string name;           // unique within a table, e.g. "email_pattern"
    std::string entity_type;
    std::string regex;
    double score = 0.0;
    bool case_insensitive = false;
};

/**
 * @brief Versioned rule table, loaded independently of registry wiring
 */
struct RuleTable {
    std::string version;
    std::string language;
    std::vector<PatternRule> rules;
};

/**
 * @brief Baseline table (version "1", language "es")
 *
 * Rules: email_pattern, phone_pattern, bank_pattern, dni_pattern,
 * money_pattern.
 */
[[nodiscard]] RuleTable default_rule_table();

/**
 * @brief Merge configured rules into a table
 *
 * A rule whose name already exists replaces that rule in place; any other
 * rule is appended. The result is validated.
 * @throws ConfigurationError if any resulting rule is invalid
 */
[[nodiscard]] RuleTable apply_overrides(RuleTable base, const std::vector<PatternRule>& extra);

/**
 * @brief Compile one rule to a code point regex
 * @throws ConfigurationError naming the rule if the regex does not compile
 */
[[nodiscard]] std::wregex compile_rule(const PatternRule& rule);

/**
 * @brief Check names, entity types, scores and regex syntax of every rule
 * @throws ConfigurationError naming the first offending rule
 */
void validate_rule_table(const RuleTable& table);

} // namespace promptguard
