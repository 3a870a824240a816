#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace tofu {

/**
 * @brief Natural language to layout JSON
 *
 * Implementations wrap a generative text model (or anything else that can
 * produce protocol JSON from a prompt). The returned text is expected to be
 * well-formed JSON but is not schema-validated.
 */
class TranslationService {
public:
    virtual ~TranslationService() = default;

    [[nodiscard]] virtual std::expected<std::string, std::string> translate(std::string_view prompt) = 0;
};

/// Speech to text over mono 16 kHz PCM samples.
class TranscriptionService {
public:
    static constexpr uint32_t SAMPLE_RATE = 16000;

    virtual ~TranscriptionService() = default;

    [[nodiscard]] virtual std::expected<std::string, std::string> transcribe(std::span<const float> samples) = 0;
};

/**
 * @brief Offline translator for single keywords
 *
 * Maps the first word of the prompt onto a built-in layout ("circle", "grid",
 * "dna"/"helix", "spiral", "wave"; anything else is random) and returns it as
 * protocol JSON. Never fails on non-empty input.
 */
class KeywordTranslator : public TranslationService {
public:
    [[nodiscard]] std::expected<std::string, std::string> translate(std::string_view prompt) override;
};

/**
 * @brief Strip a model's markdown wrapping and check the JSON is well formed
 *
 * Trims whitespace, removes a leading ```json or ``` fence and a trailing ```
 * fence, trims again and parses the result.
 *
 * @return The cleaned JSON text, or why it is unusable
 */
[[nodiscard]] std::expected<std::string, std::string> clean_model_output(std::string_view raw);

/**
 * @brief Voice pipeline: transcribe, then translate the transcript
 *
 * The first failing stage's error is returned; an empty transcript is an error.
 */
[[nodiscard]] std::expected<std::string, std::string> transcribe_and_translate(
    TranscriptionService& transcriber,
    TranslationService& translator,
    std::span<const float> samples
);

} // namespace tofu
