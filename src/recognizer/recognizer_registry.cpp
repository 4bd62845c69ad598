#include "recognizer/recognizer_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <iterator>
#include <new>
#include <regex>

namespace promptguard {

namespace {

// Error class for logs: never the exception text, which may quote input
std::string describe_failure(const std::exception& e) {
    if (const auto* re = dynamic_cast<const std::regex_error*>(&e)) {
        return std::format("regex_error (code {})", static_cast<int>(re->code()));
    }
    if (dynamic_cast<const std::bad_alloc*>(&e) != nullptr) {
        return "bad_alloc";
    }
    if (const auto* pe = dynamic_cast<const PromptGuardError*>(&e)) {
        return error_category_to_string(pe->category());
    }
    return "std::exception";
}

} // anonymous namespace

RecognizerRegistry::RecognizerRegistry(std::vector<std::unique_ptr<IRecognizer>> recognizers,
                                       std::vector<std::string> languages,
                                       RegistryOptions options)
    : recognizers_(std::move(recognizers)),
      languages_(std::move(languages)),
      options_(options) {

    if (languages_.empty()) {
        throw ConfigurationError("recognizer registry needs at least one language");
    }
    for (const auto& r : recognizers_) {
        if (!r) {
            throw ConfigurationError("recognizer registry received a null recognizer");
        }
    }
    for (const auto& lang : languages_) {
        if (!supports(lang)) {
            throw ConfigurationError(std::format("no recognizer supports language '{}'", lang));
        }
    }

    utils::log::info(std::format("Recognizer registry: {} recognizer(s), languages [{}], {}",
        recognizers_.size(),
        [this] {
            std::string joined;
            for (const auto& l : languages_) {
                if (!joined.empty()) joined += ", ";
                joined += l;
            }
            return joined;
        }(),
        options_.parallel ? "parallel" : "sequential"));
}

bool RecognizerRegistry::supports(std::string_view language) const {
    return std::any_of(recognizers_.begin(), recognizers_.end(),
        [&](const auto& r) { return r->supported_language() == language; });
}

std::vector<std::string> RecognizerRegistry::recognizer_names() const {
    std::vector<std::string> names;
    names.reserve(recognizers_.size());
    for (const auto& r : recognizers_) {
        names.emplace_back(r->name());
    }
    return names;
}

RecognizerRegistry::Outcome RecognizerRegistry::run_one(
    size_t index,
    const utf8::DecodedText& text,
    std::string_view language,
    std::stop_token stop) const {

    const auto& recognizer = *recognizers_[index];
    Outcome outcome;

    try {
        auto raw = recognizer.detect(text, language, stop);
        outcome.matches.reserve(raw.size());
        size_t dropped = 0;
        for (auto& m : raw) {
            if (!m.is_valid() || m.end > text.length()) {
                ++dropped;
                continue;
            }
            m.source = std::string(recognizer.name());
            m.source_order = index;
            outcome.matches.push_back(std::move(m));
        }
        if (dropped > 0) {
            dropped_matches_.fetch_add(dropped, std::memory_order_relaxed);
            outcome.error.emplace(std::format("{} emitted {} invalid match(es)",
                recognizer.name(), dropped));
        }
    } catch (const RequestCancelled&) {
        throw;
    } catch (const RecognitionError& e) {
        outcome.matches.clear();
        outcome.error = e;
    } catch (const std::exception& e) {
        outcome.matches.clear();
        outcome.error.emplace(std::format("{} failed: {}", recognizer.name(), describe_failure(e)));
    }

    if (outcome.error) {
        recognizer_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("{}: {}; contribution dropped",
            error_category_to_string(outcome.error->category()), outcome.error->what()));
    }
    return outcome;
}

AnalysisResult RecognizerRegistry::analyze(const utf8::DecodedText& text,
                                           std::string_view language,
                                           std::stop_token stop) const {
    if (!supports(language)) {
        throw ConfigurationError(std::format("unsupported language '{}'", language));
    }
    if (stop.stop_requested()) {
        throw RequestCancelled("analysis cancelled before start");
    }
    analyses_.fetch_add(1, std::memory_order_relaxed);

    std::vector<size_t> selected;
    for (size_t i = 0; i < recognizers_.size(); ++i) {
        if (recognizers_[i]->supported_language() == language) {
            selected.push_back(i);
        }
    }

    std::vector<Outcome> outcomes;
    outcomes.reserve(selected.size());

    if (options_.parallel && selected.size() > 1
        && text.length() >= options_.parallel_min_chars) {
        std::vector<std::future<Outcome>> futures;
        futures.reserve(selected.size());
        for (size_t index : selected) {
            futures.push_back(std::async(std::launch::async,
                [this, index, &text, language, stop] {
                    return run_one(index, text, language, stop);
                }));
        }
        for (auto& f : futures) {
            outcomes.push_back(f.get());
        }
    } else {
        for (size_t index : selected) {
            if (stop.stop_requested()) {
                break;
            }
            outcomes.push_back(run_one(index, text, language, stop));
        }
    }

    if (stop.stop_requested()) {
        throw RequestCancelled("analysis cancelled");
    }

    AnalysisResult result;
    for (size_t k = 0; k < outcomes.size(); ++k) {
        auto& outcome = outcomes[k];
        if (outcome.error) {
            result.failed_recognizers.emplace_back(recognizers_[selected[k]]->name());
            result.errors.push_back(std::move(*outcome.error));
        }
        std::move(outcome.matches.begin(), outcome.matches.end(),
                  std::back_inserter(result.matches));
    }
    return result;
}

AnalysisResult RecognizerRegistry::analyze(std::string_view utf8_text,
                                           std::string_view language,
                                           std::stop_token stop) const {
    return analyze(utf8::decode(utf8_text), language, std::move(stop));
}

RecognizerRegistry::Stats RecognizerRegistry::get_stats() const {
    return {
        analyses_.load(std::memory_order_relaxed),
        recognizer_failures_.load(std::memory_order_relaxed),
        dropped_matches_.load(std::memory_order_relaxed),
    };
}

} // namespace promptguard
