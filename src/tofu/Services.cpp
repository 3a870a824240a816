#include <tofu/Services.hpp>
#include <tofu/LayoutGenerator.hpp>
#include <tofu/Logger.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <format>

namespace tofu {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

std::expected<std::string, std::string> KeywordTranslator::translate(std::string_view prompt) {
    auto text = trim(prompt);
    if (text.empty()) {
        return std::unexpected("Empty prompt");
    }
    auto word = text.substr(0, text.find_first_of(WHITESPACE));
    auto descriptor = LayoutGenerator::descriptor_for_command(word);
    Logger::instance().debug("Keyword '{}' selects layout '{}'", word, to_string(descriptor.kind()));
    return to_json(descriptor);
}

std::expected<std::string, std::string> clean_model_output(std::string_view raw) {
    auto text = trim(raw);
    if (text.starts_with("```json")) {
        text.remove_prefix(7);
    } else if (text.starts_with("```")) {
        text.remove_prefix(3);
    }
    if (text.ends_with("```")) {
        text.remove_suffix(3);
    }
    text = trim(text);

    if (text.empty()) {
        return std::unexpected("Model returned an empty response");
    }

    rapidjson::Document document;
    document.Parse(text.data(), text.size());
    if (document.HasParseError()) {
        return std::unexpected(std::format("Model returned invalid JSON ({} at offset {}): {}",
            rapidjson::GetParseError_En(document.GetParseError()), document.GetErrorOffset(), text));
    }
    return std::string(text);
}

std::expected<std::string, std::string> transcribe_and_translate(
    TranscriptionService& transcriber,
    TranslationService& translator,
    std::span<const float> samples
) {
    auto transcript = transcriber.transcribe(samples);
    if (!transcript) {
        return std::unexpected(std::format("Transcription failed: {}", transcript.error()));
    }

    auto text = trim(*transcript);
    if (text.empty()) {
        return std::unexpected("Transcription is empty");
    }

    Logger::instance().info("Heard \"{}\"", text);
    auto json = translator.translate(text);
    if (!json) {
        return std::unexpected(std::format("Translation failed: {}", json.error()));
    }
    return json;
}

} // namespace tofu
