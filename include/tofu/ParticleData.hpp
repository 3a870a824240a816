#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace tofu {

/// A target position in screen-pixel space (origin top-left, y down).
using TargetPoint = glm::vec2;

/// Screen dimensions in pixels.
struct ScreenSize {
    float width = 0.0f;
    float height = 0.0f;
};

/**
 * @brief One particle as it is stored on the CPU and read by the vertex shader
 *
 * The particle array is uploaded verbatim into the per-instance vertex buffer,
 * so the field order and the 64-byte stride are part of the shader interface:
 *
 *   offset  0  position  float2   (instance location 1)
 *   offset  8  target    float2   (instance location 2)
 *   offset 16  color     float4   (instance location 3)
 *   offset 32  size      float    (instance location 4)
 *   offset 36  padding   float[7]
 */
struct Particle {
    glm::vec2 position;  ///< Current position in pixels
    glm::vec2 target;    ///< Position the spring pulls towards
    glm::vec4 color;     ///< RGBA color (0.0-1.0 range)
    float size;          ///< Sprite half-extent in pixels
    float padding[7];    ///< Pads the record to 16 floats
};

static_assert(std::is_standard_layout_v<Particle>, "Particle must be standard layout");
static_assert(std::is_trivially_copyable_v<Particle>, "Particle is copied as raw bytes");
static_assert(sizeof(Particle) == 64, "Particle must be exactly 64 bytes");
static_assert(offsetof(Particle, position) == 0);
static_assert(offsetof(Particle, target) == 8);
static_assert(offsetof(Particle, color) == 16);
static_assert(offsetof(Particle, size) == 32);

/// Per-particle velocity, kept beside the particle array and never uploaded.
using Velocity = glm::vec2;

/**
 * @brief Per-frame uniform block (binding 0, set 0)
 *
 * Matches the `FrameUniforms` constant buffer in particle.vert.slang.
 */
struct FrameUniforms {
    glm::vec2 screen_size;
    float elapsed_time;
    float padding;
};
static_assert(sizeof(FrameUniforms) == 16, "FrameUniforms must be exactly 16 bytes");

} // namespace tofu
