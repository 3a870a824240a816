#pragma once

#include "ParticleData.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tofu {

/// Protocol version this build speaks. Other versions are accepted with a warning.
inline constexpr std::string_view PROTOCOL_VERSION = "1.0";

enum class LayoutKind {
    Circle,
    Grid,
    Helix,
    Spiral,
    Wave,
    Random,
    Custom,
    Unknown
};

/**
 * @brief Map a protocol `type` string onto a layout kind
 *
 * Matching is case-insensitive; "dna_helix" is accepted as an alias of "helix".
 * Anything unrecognised maps to LayoutKind::Unknown.
 */
[[nodiscard]] LayoutKind parse_layout_kind(std::string_view type);

[[nodiscard]] std::string_view to_string(LayoutKind kind);

// Per-kind knobs. Every field is optional; unset fields take the kind's default.

struct CircleParams {
    std::optional<float> radius_factor;
};

struct GridParams {
    std::optional<float> padding;
};

struct HelixParams {
    std::optional<float> amplitude;
    std::optional<float> frequency;
};

struct SpiralParams {
    std::optional<float> max_radius_factor;
    std::optional<float> rotations;
};

struct WaveParams {
    std::optional<float> amplitude;
    std::optional<float> frequency;
};

struct RandomParams {
    std::optional<float> padding;
};

/// Custom layouts carry no knobs, only coordinates.
struct CustomParams {};

/// Unrecognised layout type; keeps the original name for diagnostics.
struct UnknownParams {
    std::string type_name;
};

using LayoutParams = std::variant<
    CircleParams,
    GridParams,
    HelixParams,
    SpiralParams,
    WaveParams,
    RandomParams,
    CustomParams,
    UnknownParams>;

/// Default value table for the per-kind knobs.
struct LayoutDefaults {
    static constexpr float circle_radius_factor = 0.35f;
    static constexpr float grid_padding = 60.0f;
    static constexpr float helix_amplitude = 0.2f;
    static constexpr float helix_frequency = 0.02f;
    static constexpr float spiral_max_radius_factor = 0.4f;
    static constexpr float spiral_rotations = 3.0f;
    static constexpr float wave_amplitude = 0.2f;
    static constexpr float wave_frequency = 0.01f;
    static constexpr float random_padding = 20.0f;
};

/**
 * @brief Parsed "Lego Protocol" layout descriptor
 *
 * When `coordinates` is present it is authoritative: the generator resamples the
 * coordinates and never looks at `params`.
 */
struct LayoutDescriptor {
    std::string version{PROTOCOL_VERSION};
    LayoutParams params;
    std::optional<std::vector<glm::vec2>> coordinates;  ///< Normalized [0,1]^2 points

    [[nodiscard]] LayoutKind kind() const;

    /// Descriptor for a built-in kind with default knobs.
    [[nodiscard]] static LayoutDescriptor of_kind(LayoutKind kind);

    /// Descriptor carrying custom normalized coordinates.
    [[nodiscard]] static LayoutDescriptor custom(std::vector<glm::vec2> coordinates);
};

/**
 * @brief Parse a protocol document
 *
 * Only malformed JSON (or a non-object root) is an error. Semantic problems such
 * as a missing `layout`, an unknown `type` or wrongly typed knobs are tolerated
 * and logged; the generator decides how to degrade.
 *
 * @param json UTF-8 JSON text
 * @return Descriptor, or a description of the parse failure
 */
[[nodiscard]] std::expected<LayoutDescriptor, std::string> parse_layout_descriptor(std::string_view json);

/**
 * @brief Parse a protocol document, degrading to a random layout
 *
 * Malformed JSON or a non-object root is logged as a warning and yields
 * LayoutDescriptor::of_kind(LayoutKind::Random).
 */
[[nodiscard]] LayoutDescriptor parse_layout_descriptor_or_random(std::string_view json);

/// Serialize a descriptor back into protocol JSON.
[[nodiscard]] std::string to_json(const LayoutDescriptor& descriptor);

} // namespace tofu
