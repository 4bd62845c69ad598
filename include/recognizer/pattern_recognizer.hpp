#pragma once

#include "recognizer/pattern_rules.hpp"
#include "recognizer/recognizer.hpp"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Regex recognizer for one entity type
 *
 * Holds one or more compiled rules; every match of every rule is emitted.
 */
class PatternRecognizer : public IRecognizer {
public:
    struct CompiledPattern {
        std::string rule_name;
        std::wregex regex;
        double score;
    };

    /**
     * @throws ConfigurationError if a rule targets another entity type or
     *         does not compile
     */
    PatternRecognizer(std::string entity_type,
                      std::string language,
                      const std::vector<PatternRule>& rules);

    [[nodiscard]] std::vector<Match> detect(
        const utf8::DecodedText& text,
        std::string_view language,
        std::stop_token stop) const override;

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] std::string_view supported_language() const override { return language_; }
    [[nodiscard]] std::vector<std::string> supported_entities() const override {
        return {entity_type_};
    }

    [[nodiscard]] size_t pattern_count() const { return patterns_.size(); }

    /**
     * @brief One recognizer per entity type, in first-appearance order
     */
    [[nodiscard]] static std::vector<std::unique_ptr<IRecognizer>> from_table(
        const RuleTable& table);

private:
    std::string entity_type_;
    std::string language_;
    std::string name_;
    std::vector<CompiledPattern> patterns_;
};

} // namespace promptguard
