#pragma once

#include "LayoutDescriptor.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace tofu {

/**
 * @brief Turns layout descriptors into target formations
 *
 * Stateless: every call maps (descriptor, particle count, screen size) to exactly
 * `particle_count` target points in screen-pixel space. Problems with the
 * descriptor never fail generation; they are logged and the generator degrades
 * to a random scatter.
 *
 * Built-in kinds:
 * - circle: ring around the screen center, radius min(w,h) * radius_factor
 * - grid:   ceil(sqrt(N)) columns of cell centers inside a padded rectangle
 * - helix:  two interleaved sine strands running top to bottom
 * - spiral: Archimedean spiral from the center outwards
 * - wave:   one sine wave across the screen width
 * - random: uniform scatter inside a padded rectangle
 * - custom: normalized coordinates scaled to the screen and resampled to N points
 */
class LayoutGenerator {
public:
    /**
     * @brief Generate N target points for a descriptor
     *
     * @param descriptor Parsed layout descriptor
     * @param particle_count Number of points to produce (0 yields an empty vector)
     * @param screen Screen dimensions in pixels
     * @return Exactly particle_count target points
     */
    [[nodiscard]] static std::vector<TargetPoint> generate(
        const LayoutDescriptor& descriptor,
        uint32_t particle_count,
        ScreenSize screen
    );

    /**
     * @brief Parse protocol JSON and generate from it
     *
     * Malformed JSON falls back to a random layout.
     */
    [[nodiscard]] static std::vector<TargetPoint> generate_from_json(
        std::string_view json,
        uint32_t particle_count,
        ScreenSize screen
    );

    /**
     * @brief Keyword mode: "circle", "grid", "dna"/"helix", "spiral", "wave"
     *
     * Any other word selects a random layout.
     */
    [[nodiscard]] static std::vector<TargetPoint> generate_from_command(
        std::string_view command,
        uint32_t particle_count,
        ScreenSize screen
    );

    /// Map a keyword onto a built-in descriptor with default parameters.
    [[nodiscard]] static LayoutDescriptor descriptor_for_command(std::string_view command);

    // Individual layouts, exposed for tests and the control panel.
    [[nodiscard]] static std::vector<TargetPoint> circle(const CircleParams& params, uint32_t count, ScreenSize screen);
    [[nodiscard]] static std::vector<TargetPoint> grid(const GridParams& params, uint32_t count, ScreenSize screen);
    [[nodiscard]] static std::vector<TargetPoint> helix(const HelixParams& params, uint32_t count, ScreenSize screen);
    [[nodiscard]] static std::vector<TargetPoint> spiral(const SpiralParams& params, uint32_t count, ScreenSize screen);
    [[nodiscard]] static std::vector<TargetPoint> wave(const WaveParams& params, uint32_t count, ScreenSize screen);
    [[nodiscard]] static std::vector<TargetPoint> random(const RandomParams& params, uint32_t count, ScreenSize screen);

    /**
     * @brief Scale normalized coordinates to the screen and resample to N points
     *
     * M >= N picks every (M/N)-th point; 2 <= M < N interpolates linearly along the
     * open polyline, hitting both endpoints exactly. A single coordinate is
     * repeated, and no coordinates at all falls back to random.
     */
    [[nodiscard]] static std::vector<TargetPoint> custom(
        const std::vector<glm::vec2>& coordinates,
        uint32_t count,
        ScreenSize screen
    );
};

} // namespace tofu
