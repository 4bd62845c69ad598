#pragma once

#include "recognizer/entity_model.hpp"
#include "recognizer/recognizer.hpp"

#include <memory>
#include <optional>
#include <string>

namespace promptguard {

/**
 * @brief Statistical recognizer: PERSON, LOCATION and ORGANIZATION spans
 *
 * Wraps a shared, already-loaded IEntityModel. Model labels PER/LOC/ORG are
 * mapped to entity types; any other label is dropped.
 */
class EntityRecognizer : public IRecognizer {
public:
    explicit EntityRecognizer(std::shared_ptr<const IEntityModel> model);

    [[nodiscard]] std::vector<Match> detect(
        const utf8::DecodedText& text,
        std::string_view language,
        std::stop_token stop) const override;

    [[nodiscard]] std::string_view name() const override { return "EntityRecognizer"; }
    [[nodiscard]] std::string_view supported_language() const override {
        return model_->language();
    }
    [[nodiscard]] std::vector<std::string> supported_entities() const override;

    [[nodiscard]] static std::optional<std::string> map_label(std::string_view label);

private:
    std::shared_ptr<const IEntityModel> model_;
};

} // namespace promptguard
