#pragma once

#include "core/types.hpp"
#include "core/utf8.hpp"
#include "recognizer/recognizer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

struct RegistryOptions {
    bool parallel = false;              // fan out with std::async
    size_t parallel_min_chars = 256;    // shorter prompts always run sequentially
};

/**
 * @brief Immutable, ordered set of recognizers
 *
 * Built once at startup and shared read-only by every request. Each
 * recognizer runs independently; one that throws loses its contribution for
 * that request only. Output is in registration order whether or not the
 * recognizers ran concurrently.
 */
class RecognizerRegistry {
public:
    struct Stats {
        uint64_t analyses;
        uint64_t recognizer_failures;
        uint64_t dropped_matches;
    };

    /**
     * @param recognizers Registration order (the merge tie-break)
     * @param languages Languages the process serves
     * @throws ConfigurationError if a language has no recognizer
     */
    RecognizerRegistry(std::vector<std::unique_ptr<IRecognizer>> recognizers,
                       std::vector<std::string> languages,
                       RegistryOptions options = {});

    RecognizerRegistry(const RecognizerRegistry&) = delete;
    RecognizerRegistry& operator=(const RecognizerRegistry&) = delete;

    /**
     * @brief Run every recognizer for `language` over the prompt
     *
     * A recognizer that throws, or emits a malformed match, loses its
     * contribution; the failure comes back as a RecognitionError in
     * AnalysisResult::errors.
     * @throws ConfigurationError for an unsupported language
     * @throws RequestCancelled if `stop` fires
     */
    [[nodiscard]] AnalysisResult analyze(const utf8::DecodedText& text,
                                         std::string_view language,
                                         std::stop_token stop = {}) const;

    [[nodiscard]] AnalysisResult analyze(std::string_view utf8_text,
                                         std::string_view language,
                                         std::stop_token stop = {}) const;

    [[nodiscard]] bool supports(std::string_view language) const;

    [[nodiscard]] const std::vector<std::string>& languages() const { return languages_; }

    [[nodiscard]] size_t size() const { return recognizers_.size(); }

    [[nodiscard]] std::vector<std::string> recognizer_names() const;

    [[nodiscard]] Stats get_stats() const;

private:
    struct Outcome {
        std::vector<Match> matches;
        std::optional<RecognitionError> error;
    };

    [[nodiscard]] Outcome run_one(size_t index,
                                  const utf8::DecodedText& text,
                                  std::string_view language,
                                  std::stop_token stop) const;

    std::vector<std::unique_ptr<IRecognizer>> recognizers_;
    std::vector<std::string> languages_;
    RegistryOptions options_;

    mutable std::atomic<uint64_t> analyses_{0};
    mutable std::atomic<uint64_t> recognizer_failures_{0};
    mutable std::atomic<uint64_t> dropped_matches_{0};
};

} // namespace promptguard
