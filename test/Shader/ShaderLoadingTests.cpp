#include <catch2/catch_test_macros.hpp>

#include <tofu/Logger.hpp>
#include <tofu/ParticleData.hpp>
#include <tofu/Shader.hpp>
#include <tofu/VulkanContext.hpp>
#include <tofu/Window.hpp>

using namespace tofu;

namespace
{

Shader load_shader(vk::Device device, std::string_view name)
{
    auto result = Shader::create(device, name);
    REQUIRE(result.has_value());
    return std::move(result.value());
}

} // anonymous namespace

TEST_CASE("Particle vertex shader loads with its reflection", "[shader][loading][vertex]")
{
    Logger::instance().set_level(spdlog::level::trace);
    REQUIRE(Window::initialize_glfw().has_value());
    VulkanContext ctx("Shader Test");

    auto shader = load_shader(ctx.device(), "particle/particle.vert.slang");

    SECTION("shader module is valid")
    {
        REQUIRE(shader.module());
        REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eVertex);
    }

    SECTION("one uniform buffer holding the frame uniforms")
    {
        const auto& descriptors = shader.descriptor_infos();
        REQUIRE(descriptors.size() == 1);

        const auto& desc = descriptors[0];
        REQUIRE(desc.binding == 0);
        REQUIRE(desc.set == 0);
        REQUIRE(desc.descriptor_count == 1);
        REQUIRE(desc.type == vk::DescriptorType::eUniformBuffer);
        REQUIRE(desc.size == sizeof(FrameUniforms));
    }

    SECTION("vertex inputs match the particle record")
    {
        const auto* details = std::get_if<VertexDetails>(&shader.details());
        REQUIRE(details != nullptr);
        REQUIRE(details->inputs.size() == 5);

        auto check = check_vertex_inputs(details->inputs, particle_vertex_layout());
        INFO((check ? std::string("ok") : check.error()));
        REQUIRE(check.has_value());
    }
}

TEST_CASE("Particle shaders link vertex to fragment", "[shader][validation][matching]")
{
    Logger::instance().set_level(spdlog::level::warn);
    REQUIRE(Window::initialize_glfw().has_value());
    VulkanContext ctx("Shader Validation Test");

    auto vert = load_shader(ctx.device(), "particle/particle.vert.slang");
    auto frag = load_shader(ctx.device(), "particle/particle.frag.slang");

    SECTION("vertex outputs match fragment inputs")
    {
        const auto& vert_details = std::get<VertexDetails>(vert.details());
        const auto& frag_details = std::get<FragmentDetails>(frag.details());
        REQUIRE(vert_details.matches(frag_details));
        REQUIRE(frag_details.inputs.size() == 3); // uv, color, pulse
    }

    SECTION("descriptor bindings merge across stages")
    {
        auto bindings = merge_descriptor_bindings({&vert, &frag});
        REQUIRE(bindings.has_value());
        REQUIRE(bindings->size() == 1);
        REQUIRE(bindings->front().descriptorType == vk::DescriptorType::eUniformBuffer);
    }

    SECTION("missing modules report an error")
    {
        REQUIRE_FALSE(Shader::create(ctx.device(), "particle/does_not_exist.slang").has_value());
    }
}
