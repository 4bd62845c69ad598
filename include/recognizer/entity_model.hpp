#pragma once

#include <cstddef>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace promptguard {

/**
 * @brief One labelled span produced by a named-entity model
 *
 * Offsets are code point indexes, end exclusive. Labels are model-native
 * (PER, LOC, ORG, ...).
 */
struct EntitySpan {
    std::string label;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;
};

/**
 * @brief Named-entity model interface
 *
 * Loaded once at startup, read-only afterwards; predict() must be safe to
 * call concurrently.
 */
class IEntityModel {
public:
    virtual ~IEntityModel() = default;

    /// @throws RequestCancelled once `stop` fires
    [[nodiscard]] virtual std::vector<EntitySpan> predict(std::wstring_view text,
                                                          std::stop_token stop = {}) const = 0;

    [[nodiscard]] virtual std::string_view language() const = 0;
};

/**
 * @brief Lexicon model: gazetteer phrases plus context cues
 *
 * Model file format (UTF-8, tab separated, '#' starts a comment line):
 *   ENT        <label> <phrase> [score]   known entity, matched case-insensitively
 *   CUE        <label> <phrase> [score]   the capitalised run after the cue gets <label>
 *   CONNECTOR  <word>                     lower-case word allowed inside a run ("de")
 *
 * Gazetteer lookup is longest match first. All-caps tokens and tokens
 * inside <...> placeholders never start a cue run.
 */
class LexiconEntityModel : public IEntityModel {
public:
    static constexpr double kDefaultEntryScore = 0.85;
    static constexpr double kDefaultCueScore = 0.7;
    static constexpr size_t kMaxRunTokens = 4;
    static constexpr size_t kStopCheckTokens = 64;    // tokens between stop-token polls

    /**
     * @throws ConfigurationError if the file is missing, unreadable,
     *         malformed or holds no entries
     */
    [[nodiscard]] static LexiconEntityModel load_from_file(const std::string& path,
                                                          std::string language);

    /// Same format as load_from_file; `origin` only names the source in errors.
    [[nodiscard]] static LexiconEntityModel load_from_string(std::string_view content,
                                                            std::string language,
                                                            std::string_view origin = "<memory>");

    [[nodiscard]] std::vector<EntitySpan> predict(std::wstring_view text,
                                                  std::stop_token stop = {}) const override;

    [[nodiscard]] std::string_view language() const override { return language_; }

    [[nodiscard]] size_t entry_count() const { return entry_count_; }
    [[nodiscard]] size_t cue_count() const { return cue_count_; }

private:
    struct Phrase {
        std::vector<std::wstring> tokens;   // case-folded
        std::string label;
        double score;
    };

    struct Token {
        size_t start;
        size_t end;
        std::wstring folded;
        bool capitalised;
        bool all_caps;
        bool placeholder;
    };

    LexiconEntityModel() = default;

    [[nodiscard]] static std::vector<Token> tokenize(std::wstring_view text);

    [[nodiscard]] static bool add_phrase(
        std::unordered_map<std::wstring, std::vector<Phrase>>& index,
        std::wstring_view phrase, std::string label, double score);

    // Longest phrase of `index` starting at token `pos`, or nullptr
    [[nodiscard]] static const Phrase* match_at(
        const std::unordered_map<std::wstring, std::vector<Phrase>>& index,
        std::wstring_view text, const std::vector<Token>& tokens, size_t pos);

    // Index of the last token of the capitalised run starting at `first`
    [[nodiscard]] size_t extend_run(std::wstring_view text,
                                    const std::vector<Token>& tokens, size_t first) const;

    std::string language_;
    // First folded token -> phrases starting with it, longest first
    std::unordered_map<std::wstring, std::vector<Phrase>> entries_;
    std::unordered_map<std::wstring, std::vector<Phrase>> cues_;
    std::unordered_set<std::wstring> connectors_;
    size_t entry_count_ = 0;
    size_t cue_count_ = 0;
};

} // namespace promptguard
