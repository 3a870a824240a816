#pragma once

#include <vulkan/vulkan.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace tofu {

/// A shader interface variable as reported by reflection.
struct StageVariable {
    std::string name;
    uint32_t location;
    vk::Format format;
};

/// Vertex input state for a pipeline: bindings plus attributes.
struct VertexLayout {
    std::vector<vk::VertexInputBindingDescription> bindings;
    std::vector<vk::VertexInputAttributeDescription> attributes;
};

/**
 * @brief Vertex input for the instanced particle draw
 *
 * - binding 0, per vertex, stride 8: quad corner at location 0
 * - binding 1, per instance, stride sizeof(Particle): position (1), target (2),
 *   color (3) and size (4) at the record's own offsets
 */
[[nodiscard]] VertexLayout particle_vertex_layout();

/**
 * @brief Check reflected vertex shader inputs against a CPU-side layout
 *
 * Every reflected input needs an attribute at the same location with the same
 * format. Attributes the shader does not read are allowed.
 *
 * @return Nothing on success, otherwise every mismatch in one message
 */
[[nodiscard]] std::expected<void, std::string> check_vertex_inputs(
    std::span<const StageVariable> reflected,
    const VertexLayout& layout
);

} // namespace tofu
