#pragma once

#include <stdexcept>
#include <string>

namespace promptguard {

/**
 * @brief Error categories for the redaction service
 *
 * Every request-level failure surfaces to the caller as a generic server
 * error; the category only feeds logs and stats.
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,     // unsupported language, bad rule, missing model
    RECOGNITION_ERROR,       // one recognizer failed on one request
    MERGE_INVARIANT,         // accepted set overlaps (internal defect)
    PROVIDER_ERROR,          // LLM unreachable, unauthorized or timed out
    CANCELLED,               // caller or shutdown aborted the request
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorCategory::RECOGNITION_ERROR:   return "recognition_error";
        case ErrorCategory::MERGE_INVARIANT:     return "merge_invariant_violation";
        case ErrorCategory::PROVIDER_ERROR:      return "provider_error";
        case ErrorCategory::CANCELLED:           return "cancelled";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
        default:                                 return "unknown";
    }
}

/**
 * @brief Base class of every exception thrown by promptguard code
 *
 * Messages never contain prompt text or matched spans.
 */
class PromptGuardError : public std::runtime_error {
public:
    PromptGuardError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/// Fatal at startup: the process must not serve.
class ConfigurationError : public PromptGuardError {
public:
    explicit ConfigurationError(const std::string& message)
        : PromptGuardError(ErrorCategory::CONFIGURATION_ERROR, message) {}
};

/// Raised inside a recognizer; isolated by the registry.
class RecognitionError : public PromptGuardError {
public:
    explicit RecognitionError(const std::string& message)
        : PromptGuardError(ErrorCategory::RECOGNITION_ERROR, message) {}
};

class MergeInvariantViolation : public PromptGuardError {
public:
    explicit MergeInvariantViolation(const std::string& message)
        : PromptGuardError(ErrorCategory::MERGE_INVARIANT, message) {}
};

class ProviderError : public PromptGuardError {
public:
    explicit ProviderError(const std::string& message)
        : PromptGuardError(ErrorCategory::PROVIDER_ERROR, message) {}
};

class RequestCancelled : public PromptGuardError {
public:
    explicit RequestCancelled(const std::string& message)
        : PromptGuardError(ErrorCategory::CANCELLED, message) {}
};

} // namespace promptguard
