#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "recognizer/recognizer.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace promptguard::testing {

/**
 * @brief Recognizer that returns canned matches, or throws
 */
class MockRecognizer : public IRecognizer {
public:
    MockRecognizer(std::string name, std::vector<Match> matches,
                   std::string language = "es")
        : name_(std::move(name)), matches_(std::move(matches)), language_(std::move(language)) {}

    [[nodiscard]] std::vector<Match> detect(const utf8::DecodedText& /*text*/,
                                            std::string_view /*language*/,
                                            std::stop_token /*stop*/) const override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        if (throw_recognition_error_) {
            throw RecognitionError(name_ + ": model unavailable");
        }
        if (throw_on_detect_) {
            throw std::runtime_error("mock recognizer failure");
        }
        return matches_;
    }

    [[nodiscard]] std::string_view name() const override { return name_; }
    [[nodiscard]] std::string_view supported_language() const override { return language_; }
    [[nodiscard]] std::vector<std::string> supported_entities() const override {
        std::vector<std::string> types;
        for (const auto& m : matches_) types.push_back(m.entity_type);
        return types;
    }

    void set_throw_on_detect(bool v) { throw_on_detect_ = v; }
    void set_throw_recognition_error(bool v) { throw_recognition_error_ = v; }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::vector<Match> matches_;
    std::string language_;
    bool throw_on_detect_ = false;
    bool throw_recognition_error_ = false;
    mutable std::atomic<uint64_t> call_count_{0};
};

} // namespace promptguard::testing
