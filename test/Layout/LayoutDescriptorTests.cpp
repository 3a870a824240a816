#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <tofu/LayoutDescriptor.hpp>
#include <tofu/Logger.hpp>

using namespace tofu;
using Catch::Approx;

TEST_CASE("Layout kinds parse case-insensitively", "[layout][protocol]")
{
    REQUIRE(parse_layout_kind("circle") == LayoutKind::Circle);
    REQUIRE(parse_layout_kind("Grid") == LayoutKind::Grid);
    REQUIRE(parse_layout_kind("HELIX") == LayoutKind::Helix);
    REQUIRE(parse_layout_kind("dna_helix") == LayoutKind::Helix);
    REQUIRE(parse_layout_kind("spiral") == LayoutKind::Spiral);
    REQUIRE(parse_layout_kind("wave") == LayoutKind::Wave);
    REQUIRE(parse_layout_kind("random") == LayoutKind::Random);
    REQUIRE(parse_layout_kind("custom") == LayoutKind::Custom);
    REQUIRE(parse_layout_kind("triangle") == LayoutKind::Unknown);
    REQUIRE(parse_layout_kind("") == LayoutKind::Unknown);
}

TEST_CASE("Protocol documents parse into descriptors", "[layout][protocol]")
{
    Logger::instance().set_level(spdlog::level::err);

    SECTION("type and params")
    {
        auto result = parse_layout_descriptor(
            R"({"version":"1.0","layout":{"type":"spiral","params":{"rotations":5,"max_radius_factor":0.25}}})");
        REQUIRE(result.has_value());
        REQUIRE(result->version == "1.0");
        REQUIRE(result->kind() == LayoutKind::Spiral);
        REQUIRE_FALSE(result->coordinates.has_value());

        const auto& params = std::get<SpiralParams>(result->params);
        REQUIRE(params.rotations.value() == Approx(5.0f));
        REQUIRE(params.max_radius_factor.value() == Approx(0.25f));
    }

    SECTION("missing params keep defaults")
    {
        auto result = parse_layout_descriptor(R"({"version":"1.0","layout":{"type":"wave"}})");
        REQUIRE(result.has_value());
        const auto& params = std::get<WaveParams>(result->params);
        REQUIRE_FALSE(params.amplitude.has_value());
        REQUIRE_FALSE(params.frequency.has_value());
    }

    SECTION("non-numeric params are ignored")
    {
        auto result = parse_layout_descriptor(
            R"({"version":"1.0","layout":{"type":"circle","params":{"radius_factor":"big"}}})");
        REQUIRE(result.has_value());
        REQUIRE_FALSE(std::get<CircleParams>(result->params).radius_factor.has_value());
    }

    SECTION("coordinates are read and malformed entries skipped")
    {
        auto result = parse_layout_descriptor(
            R"({"version":"1.0","layout":{"type":"custom","coordinates":[[0.1,0.2],[0.3],"x",[0.5,0.6]]}})");
        REQUIRE(result.has_value());
        REQUIRE(result->kind() == LayoutKind::Custom);
        REQUIRE(result->coordinates.has_value());
        REQUIRE(result->coordinates->size() == 2);
        REQUIRE((*result->coordinates)[0].x == Approx(0.1f));
        REQUIRE((*result->coordinates)[1].y == Approx(0.6f));
    }

    SECTION("unknown types keep their name")
    {
        auto result = parse_layout_descriptor(R"({"version":"1.0","layout":{"type":"hexagon"}})");
        REQUIRE(result.has_value());
        REQUIRE(result->kind() == LayoutKind::Unknown);
        REQUIRE(std::get<UnknownParams>(result->params).type_name == "hexagon");
    }

    SECTION("missing version reads as empty")
    {
        auto result = parse_layout_descriptor(R"({"layout":{"type":"grid"}})");
        REQUIRE(result.has_value());
        REQUIRE(result->version.empty());
    }

    SECTION("missing layout is an unknown kind")
    {
        auto result = parse_layout_descriptor(R"({"version":"1.0"})");
        REQUIRE(result.has_value());
        REQUIRE(result->kind() == LayoutKind::Unknown);
    }
}

TEST_CASE("Malformed protocol documents are rejected", "[layout][protocol]")
{
    SECTION("broken JSON")
    {
        auto result = parse_layout_descriptor(R"({"version":"1.0","layout":)");
        REQUIRE_FALSE(result.has_value());
        REQUIRE_THAT(result.error(), Catch::Matchers::ContainsSubstring("Invalid layout JSON"));
    }

    SECTION("root is not an object")
    {
        auto result = parse_layout_descriptor("[1, 2, 3]");
        REQUIRE_FALSE(result.has_value());
    }
}

TEST_CASE("Unusable documents degrade to a random layout", "[layout][protocol]")
{
    Logger::instance().set_level(spdlog::level::err);

    REQUIRE(parse_layout_descriptor_or_random(R"({"version":"1.0",)").kind() == LayoutKind::Random);
    REQUIRE(parse_layout_descriptor_or_random("[]").kind() == LayoutKind::Random);
    REQUIRE(parse_layout_descriptor_or_random("").kind() == LayoutKind::Random);

    SECTION("usable documents are kept")
    {
        auto descriptor = parse_layout_descriptor_or_random(R"({"version":"1.0","layout":{"type":"grid"}})");
        REQUIRE(descriptor.kind() == LayoutKind::Grid);
    }
}

TEST_CASE("Descriptors serialize back to protocol JSON", "[layout][protocol]")
{
    LayoutDescriptor descriptor;
    descriptor.params = HelixParams{.amplitude = 0.3f, .frequency = std::nullopt};

    auto reparsed = parse_layout_descriptor(to_json(descriptor));
    REQUIRE(reparsed.has_value());
    REQUIRE(reparsed->version == PROTOCOL_VERSION);
    REQUIRE(reparsed->kind() == LayoutKind::Helix);

    const auto& params = std::get<HelixParams>(reparsed->params);
    REQUIRE(params.amplitude.value() == Approx(0.3f));
    REQUIRE_FALSE(params.frequency.has_value());

    SECTION("custom coordinates survive")
    {
        auto custom = LayoutDescriptor::custom({{0.25f, 0.75f}});
        auto json = to_json(custom);
        REQUIRE_THAT(json, Catch::Matchers::ContainsSubstring("\"coordinates\""));

        auto back = parse_layout_descriptor(json);
        REQUIRE(back.has_value());
        REQUIRE(back->coordinates->size() == 1);
        REQUIRE((*back->coordinates)[0].y == Approx(0.75f));
    }
}
