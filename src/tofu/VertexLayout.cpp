#include <tofu/VertexLayout.hpp>
#include <tofu/ParticleData.hpp>
#include <algorithm>
#include <cstddef>
#include <format>

namespace tofu {

VertexLayout particle_vertex_layout() {
    VertexLayout layout;

    layout.bindings = {
        vk::VertexInputBindingDescription()
            .setBinding(0)
            .setStride(sizeof(glm::vec2))
            .setInputRate(vk::VertexInputRate::eVertex),
        vk::VertexInputBindingDescription()
            .setBinding(1)
            .setStride(sizeof(Particle))
            .setInputRate(vk::VertexInputRate::eInstance),
    };

    layout.attributes = {
        vk::VertexInputAttributeDescription(0, 0, vk::Format::eR32G32Sfloat, 0),
        vk::VertexInputAttributeDescription(1, 1, vk::Format::eR32G32Sfloat, offsetof(Particle, position)),
        vk::VertexInputAttributeDescription(2, 1, vk::Format::eR32G32Sfloat, offsetof(Particle, target)),
        vk::VertexInputAttributeDescription(3, 1, vk::Format::eR32G32B32A32Sfloat, offsetof(Particle, color)),
        vk::VertexInputAttributeDescription(4, 1, vk::Format::eR32Sfloat, offsetof(Particle, size)),
    };

    return layout;
}

std::expected<void, std::string> check_vertex_inputs(
    std::span<const StageVariable> reflected,
    const VertexLayout& layout
) {
    std::string errors;
    auto report = [&errors](std::string message) {
        if (!errors.empty()) {
            errors += "; ";
        }
        errors += message;
    };

    for (const auto& input : reflected) {
        auto it = std::ranges::find(layout.attributes, input.location, &vk::VertexInputAttributeDescription::location);
        if (it == layout.attributes.end()) {
            report(std::format("shader input '{}' at location {} has no vertex attribute", input.name, input.location));
            continue;
        }
        if (it->format != input.format) {
            report(std::format("location {} ('{}'): shader reads {} but the particle record provides {}",
                input.location, input.name, vk::to_string(input.format), vk::to_string(it->format)));
        }
    }

    if (!errors.empty()) {
        return std::unexpected(std::format("Vertex layout mismatch: {}", errors));
    }
    return {};
}

} // namespace tofu
