#include "recognizer/entity_recognizer.hpp"
#include "core/error.hpp"

namespace promptguard {

EntityRecognizer::EntityRecognizer(std::shared_ptr<const IEntityModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw ConfigurationError("EntityRecognizer requires a loaded entity model");
    }
}

std::optional<std::string> EntityRecognizer::map_label(std::string_view label) {
    if (label == "PER") return std::string(entity::kPerson);
    if (label == "LOC") return std::string(entity::kLocation);
    if (label == "ORG") return std::string(entity::kOrganization);
    return std::nullopt;
}

std::vector<std::string> EntityRecognizer::supported_entities() const {
    return {entity::kPerson, entity::kLocation, entity::kOrganization};
}

std::vector<Match> EntityRecognizer::detect(
    const utf8::DecodedText& text,
    std::string_view /*language*/,
    std::stop_token stop) const {

    std::vector<Match> matches;
    for (const auto& span : model_->predict(text.text, stop)) {
        auto type = map_label(span.label);
        if (!type) {
            continue;
        }
        matches.emplace_back(std::move(*type), span.start, span.end, span.score);
    }
    return matches;
}

} // namespace promptguard
