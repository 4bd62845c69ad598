#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/pipeline_builder.hpp"
#include "dialogue/dialogue_assembler.hpp"
#include "recognizer/entity_model.hpp"
#include "recognizer/entity_recognizer.hpp"
#include "recognizer/pattern_recognizer.hpp"
#include "recognizer/recognizer_registry.hpp"
#include "mocks/mock_llm_provider.hpp"
#include "mocks/mock_recognizer.hpp"

using namespace promptguard;
using promptguard::testing::MockLlmProvider;
using promptguard::testing::MockRecognizer;
using Catch::Matchers::StartsWith;

namespace {

std::shared_ptr<const RecognizerRegistry> spanish_registry() {
    auto recognizers = PatternRecognizer::from_table(default_rule_table());
    auto model = std::make_shared<const LexiconEntityModel>(LexiconEntityModel::load_from_file(
        std::string(PROMPTGUARD_SOURCE_DIR) + "/models/es_entities.tsv", "es"));
    recognizers.push_back(std::make_unique<EntityRecognizer>(std::move(model)));
    return std::make_shared<const RecognizerRegistry>(std::move(recognizers),
                                                      std::vector<std::string>{"es"});
}

std::shared_ptr<Pipeline> make_pipeline(std::shared_ptr<ILlmProvider> provider = nullptr,
                                        PlaceholderStyle style = PlaceholderStyle::PER_CATEGORY) {
    return PipelineBuilder()
        .with_registry(spanish_registry())
        .with_dialogue(std::make_shared<const DialogueAssembler>(
            std::move(provider), std::chrono::milliseconds(2000)))
        .with_placeholder_style(style)
        .build();
}

ChatResponse run(Pipeline& pipeline, std::string prompt) {
    ChatRequest request;
    request.prompt = std::move(prompt);
    return pipeline.execute(request);
}

} // anonymous namespace

TEST_CASE("Pipeline: end-to-end scenarios", "[pipeline]") {
    auto pipeline = make_pipeline();

    SECTION("Email and phone") {
        const auto r = run(*pipeline, "Contactame a ana@mail.com o al 11-4555-2233");
        CHECK(r.safety_report.sanitized_prompt == "Contactame a <EMAIL> o al <PHONE>");
        CHECK(r.safety_report.detected_items == std::vector<std::string>{"EMAIL", "PHONE"});
    }

    SECTION("National id and money amount stay separate") {
        const auto r = run(*pipeline, "Mi DNI es 30.123.456 y debo $500 pesos");
        CHECK(r.safety_report.sanitized_prompt == "Mi DNI es <NATIONAL_ID> y debo <MONEY_AMOUNT>");
        CHECK(r.safety_report.detected_items ==
              std::vector<std::string>{"MONEY_AMOUNT", "NATIONAL_ID"});
    }

    SECTION("No PII: text unchanged, reply still produced") {
        const std::string prompt = "Hola, necesito ayuda con un contrato de alquiler.";
        const auto r = run(*pipeline, prompt);
        CHECK(r.safety_report.sanitized_prompt == prompt);
        CHECK(r.safety_report.detected_items.empty());
        CHECK_FALSE(r.ai_response.empty());
    }

    SECTION("Named entities from the lexicon model") {
        const auto r = run(*pipeline, "Me llamo Juan Pérez y vivo en Buenos Aires");
        CHECK(r.safety_report.sanitized_prompt == "Me llamo <PERSON> y vivo en <LOCATION>");
        CHECK(r.safety_report.detected_items == std::vector<std::string>{"LOCATION", "PERSON"});
    }

    SECTION("Empty prompt") {
        const auto r = run(*pipeline, "");
        CHECK(r.safety_report.sanitized_prompt.empty());
        CHECK(r.safety_report.detected_items.empty());
    }
}

TEST_CASE("Pipeline: dialogue", "[pipeline]") {

    SECTION("Unconfigured provider gives the simulation echo") {
        auto pipeline = make_pipeline();
        CHECK(pipeline->mode() == Pipeline::kModeSimulation);
        const auto r = run(*pipeline, "Mi DNI es 30.123.456");
        CHECK(r.simulated);
        CHECK_THAT(r.ai_response, StartsWith("[SIMULACIÓN]"));
        CHECK(r.ai_response == "[SIMULACIÓN] Prompt seguro: Mi DNI es <NATIONAL_ID>");
    }

    SECTION("Provider only ever sees sanitized text") {
        auto provider = std::make_shared<MockLlmProvider>();
        auto pipeline = make_pipeline(provider);
        CHECK(pipeline->mode() == Pipeline::kModeConnected);

        const auto r = run(*pipeline, "Contactame a ana@mail.com");
        CHECK_FALSE(r.simulated);
        CHECK(provider->last_user_text() == "Contactame a <EMAIL>");
        CHECK(r.ai_response == "LLM: Contactame a <EMAIL>");
    }

    SECTION("Provider failure propagates") {
        auto pipeline = make_pipeline(std::make_shared<MockLlmProvider>(MockLlmProvider::Behavior::FAIL));
        REQUIRE_THROWS_AS(run(*pipeline, "hola"), ProviderError);
        CHECK(pipeline->get_stats().requests_failed == 1);
    }
}

TEST_CASE("Pipeline: options and errors", "[pipeline]") {

    SECTION("Numbered placeholders") {
        auto pipeline = make_pipeline(nullptr, PlaceholderStyle::NUMBERED);
        const auto r = run(*pipeline, "ana@mail.com, beto@mail.com y de nuevo ana@mail.com");
        CHECK(r.safety_report.sanitized_prompt == "<EMAIL_1>, <EMAIL_2> y de nuevo <EMAIL_1>");
    }

    SECTION("Unsupported language") {
        auto pipeline = make_pipeline();
        ChatRequest request;
        request.prompt = "hello";
        request.language = "en";
        REQUIRE_THROWS_AS(pipeline->execute(request), ConfigurationError);
    }

    SECTION("Cancelled request") {
        auto pipeline = make_pipeline();
        std::stop_source stop;
        stop.request_stop();
        ChatRequest request;
        request.prompt = "ana@mail.com";
        REQUIRE_THROWS_AS(pipeline->execute(request, stop.get_token()), RequestCancelled);
        CHECK(pipeline->get_stats().requests_cancelled == 1);
    }

    SECTION("A failing recognizer does not fail the request") {
        auto recognizers = PatternRecognizer::from_table(default_rule_table());
        auto broken = std::make_unique<MockRecognizer>("BrokenRecognizer", std::vector<Match>{});
        broken->set_throw_on_detect(true);
        recognizers.push_back(std::move(broken));

        auto pipeline = PipelineBuilder()
            .with_registry(std::make_shared<const RecognizerRegistry>(
                std::move(recognizers), std::vector<std::string>{"es"}))
            .with_dialogue(std::make_shared<const DialogueAssembler>(nullptr, std::chrono::milliseconds(100)))
            .build();

        const auto r = run(*pipeline, "ana@mail.com");
        CHECK(r.safety_report.sanitized_prompt == "<EMAIL>");
    }

    SECTION("Stats") {
        auto pipeline = make_pipeline();
        (void)run(*pipeline, "ana@mail.com");
        (void)run(*pipeline, "hola");
        const auto stats = pipeline->get_stats();
        CHECK(stats.total_requests == 2);
        CHECK(stats.requests_with_pii == 1);
    }
}

TEST_CASE("PipelineBuilder: validation", "[pipeline]") {
    auto dialogue = std::make_shared<const DialogueAssembler>(nullptr, std::chrono::milliseconds(100));

    SECTION("Registry is required") {
        REQUIRE_THROWS_AS(PipelineBuilder().with_dialogue(dialogue).build(), ConfigurationError);
    }

    SECTION("Dialogue is required") {
        REQUIRE_THROWS_AS(PipelineBuilder().with_registry(spanish_registry()).build(),
                          ConfigurationError);
    }

    SECTION("Default language must be served") {
        REQUIRE_THROWS_AS(PipelineBuilder()
            .with_registry(spanish_registry())
            .with_dialogue(dialogue)
            .with_default_language("fr")
            .build(), ConfigurationError);
    }
}
