#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <tofu/ParticleData.hpp>
#include <tofu/VertexLayout.hpp>

#include <vector>

using namespace tofu;
using Catch::Matchers::ContainsSubstring;

namespace
{

std::vector<StageVariable> particle_shader_inputs()
{
    return {
        {"corner", 0, vk::Format::eR32G32Sfloat},
        {"position", 1, vk::Format::eR32G32Sfloat},
        {"target_position", 2, vk::Format::eR32G32Sfloat},
        {"color", 3, vk::Format::eR32G32B32A32Sfloat},
        {"size", 4, vk::Format::eR32Sfloat},
    };
}

} // anonymous namespace

TEST_CASE("Particle vertex layout", "[renderer][vertex]")
{
    auto layout = particle_vertex_layout();

    SECTION("quad corners per vertex, particles per instance")
    {
        REQUIRE(layout.bindings.size() == 2);
        REQUIRE(layout.bindings[0].binding == 0);
        REQUIRE(layout.bindings[0].stride == 8);
        REQUIRE(layout.bindings[0].inputRate == vk::VertexInputRate::eVertex);
        REQUIRE(layout.bindings[1].binding == 1);
        REQUIRE(layout.bindings[1].stride == 64);
        REQUIRE(layout.bindings[1].inputRate == vk::VertexInputRate::eInstance);
    }

    SECTION("instance attributes use the record offsets")
    {
        REQUIRE(layout.attributes.size() == 5);
        REQUIRE(layout.attributes[1].offset == 0);
        REQUIRE(layout.attributes[2].offset == 8);
        REQUIRE(layout.attributes[3].offset == 16);
        REQUIRE(layout.attributes[4].offset == 32);
        for (size_t i = 1; i < layout.attributes.size(); ++i)
        {
            REQUIRE(layout.attributes[i].binding == 1);
            REQUIRE(layout.attributes[i].location == i);
        }
    }
}

TEST_CASE("Reflected inputs are checked against the layout", "[renderer][vertex]")
{
    auto layout = particle_vertex_layout();

    SECTION("the particle shader interface matches")
    {
        auto inputs = particle_shader_inputs();
        REQUIRE(check_vertex_inputs(inputs, layout).has_value());
    }

    SECTION("unused attributes are fine")
    {
        std::vector<StageVariable> inputs = {{"corner", 0, vk::Format::eR32G32Sfloat}};
        REQUIRE(check_vertex_inputs(inputs, layout).has_value());
    }

    SECTION("format mismatches are reported")
    {
        auto inputs = particle_shader_inputs();
        inputs[3].format = vk::Format::eR32G32B32Sfloat;

        auto result = check_vertex_inputs(inputs, layout);
        REQUIRE_FALSE(result.has_value());
        REQUIRE_THAT(result.error(), ContainsSubstring("Vertex layout mismatch"));
        REQUIRE_THAT(result.error(), ContainsSubstring("shader reads"));
        REQUIRE_THAT(result.error(), ContainsSubstring("color"));
    }

    SECTION("missing locations are reported together")
    {
        auto inputs = particle_shader_inputs();
        inputs.push_back({"velocity", 5, vk::Format::eR32G32Sfloat});
        inputs.push_back({"age", 6, vk::Format::eR32Sfloat});

        auto result = check_vertex_inputs(inputs, layout);
        REQUIRE_FALSE(result.has_value());
        REQUIRE_THAT(result.error(), ContainsSubstring("'velocity' at location 5 has no vertex attribute"));
        REQUIRE_THAT(result.error(), ContainsSubstring("'age' at location 6"));
    }
}
