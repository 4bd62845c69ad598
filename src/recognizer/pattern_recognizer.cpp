#include "recognizer/pattern_recognizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <regex>

namespace promptguard {

namespace {

// "BANK_ACCOUNT" -> "BankAccountRecognizer"
std::string recognizer_name(const std::string& entity_type) {
    std::string out;
    bool upper = true;
    for (char c : entity_type) {
        if (c == '_') {
            upper = true;
            continue;
        }
        const auto uc = static_cast<unsigned char>(c);
        out += static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
        upper = false;
    }
    return out + "Recognizer";
}

} // anonymous namespace

PatternRecognizer::PatternRecognizer(std::string entity_type,
                                     std::string language,
                                     const std::vector<PatternRule>& rules)
    : entity_type_(std::move(entity_type)),
      language_(std::move(language)),
      name_(recognizer_name(entity_type_)) {
    if (rules.empty()) {
        throw ConfigurationError(std::format("{} has no patterns", name_));
    }
    patterns_.reserve(rules.size());
    for (const auto& rule : rules) {
        if (rule.entity_type != entity_type_) {
            throw ConfigurationError(std::format(
                "pattern rule '{}' targets {}, not {}",
                rule.name, rule.entity_type, entity_type_));
        }
        patterns_.push_back({rule.name, compile_rule(rule), rule.score});
    }
}

std::vector<Match> PatternRecognizer::detect(
    const utf8::DecodedText& text,
    std::string_view /*language*/,
    std::stop_token stop) const {

    std::vector<Match> matches;
    for (const auto& pattern : patterns_) {
        try {
            auto it = std::wsregex_iterator(text.text.begin(), text.text.end(), pattern.regex);
            const std::wsregex_iterator last;
            for (; it != last; ++it) {
                if (stop.stop_requested()) {
                    throw RequestCancelled(std::format("{} cancelled", name_));
                }
                const auto& m = *it;
                if (m.length(0) == 0) {
                    continue;
                }
                const auto start = static_cast<size_t>(m.position(0));
                matches.emplace_back(entity_type_, start,
                                     start + static_cast<size_t>(m.length(0)),
                                     pattern.score);
            }
        } catch (const std::regex_error& e) {
            // libstdc++ reports runaway matching as error_complexity / error_stack
            throw RecognitionError(std::format("{}: rule '{}' aborted (regex code {})",
                name_, pattern.rule_name, static_cast<int>(e.code())));
        }
    }
    if (stop.stop_requested()) {
        throw RequestCancelled(std::format("{} cancelled", name_));
    }
    return matches;
}

std::vector<std::unique_ptr<IRecognizer>> PatternRecognizer::from_table(const RuleTable& table) {
    std::vector<std::string> order;
    for (const auto& rule : table.rules) {
        if (std::find(order.begin(), order.end(), rule.entity_type) == order.end()) {
            order.push_back(rule.entity_type);
        }
    }

    std::vector<std::unique_ptr<IRecognizer>> recognizers;
    recognizers.reserve(order.size());
    for (const auto& type : order) {
        std::vector<PatternRule> rules;
        std::copy_if(table.rules.begin(), table.rules.end(), std::back_inserter(rules),
            [&](const PatternRule& r) { return r.entity_type == type; });
        recognizers.push_back(
            std::make_unique<PatternRecognizer>(type, table.language, rules));
        utils::log::debug(std::format("Pattern recognizer {} ready ({} rule(s), table v{})",
            recognizers.back()->name(), rules.size(), table.version));
    }
    return recognizers;
}

} // namespace promptguard
