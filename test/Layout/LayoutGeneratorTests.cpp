#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <tofu/LayoutGenerator.hpp>
#include <tofu/Logger.hpp>

#include <algorithm>
#include <cmath>

using namespace tofu;
using Catch::Approx;

namespace
{

constexpr ScreenSize SCREEN{800.0f, 600.0f};

void require_point(const TargetPoint& point, float x, float y)
{
    REQUIRE(point.x == Approx(x).margin(1e-3));
    REQUIRE(point.y == Approx(y).margin(1e-3));
}

} // anonymous namespace

TEST_CASE("Every built-in layout yields exactly N points", "[layout][generator]")
{
    Logger::instance().set_level(spdlog::level::warn);

    auto kind = GENERATE(
        LayoutKind::Circle,
        LayoutKind::Grid,
        LayoutKind::Helix,
        LayoutKind::Spiral,
        LayoutKind::Wave,
        LayoutKind::Random,
        LayoutKind::Custom,
        LayoutKind::Unknown);
    auto count = GENERATE(1u, 2u, 7u, 100u, 500u);

    auto points = LayoutGenerator::generate(LayoutDescriptor::of_kind(kind), count, SCREEN);
    INFO("kind " << to_string(kind) << ", count " << count);
    REQUIRE(points.size() == count);
}

TEST_CASE("Zero particles produce no points", "[layout][generator]")
{
    Logger::instance().set_level(spdlog::level::warn);

    REQUIRE(LayoutGenerator::generate(LayoutDescriptor::of_kind(LayoutKind::Circle), 0, SCREEN).empty());
    REQUIRE(LayoutGenerator::generate(LayoutDescriptor::custom({{0.5f, 0.5f}}), 0, SCREEN).empty());
}

TEST_CASE("Deterministic layouts are idempotent", "[layout][generator]")
{
    auto kind = GENERATE(
        LayoutKind::Circle,
        LayoutKind::Grid,
        LayoutKind::Helix,
        LayoutKind::Spiral,
        LayoutKind::Wave);

    auto descriptor = LayoutDescriptor::of_kind(kind);
    auto first = LayoutGenerator::generate(descriptor, 137, SCREEN);
    auto second = LayoutGenerator::generate(descriptor, 137, SCREEN);

    REQUIRE(first == second);
}

TEST_CASE("Circle of four on a 100x100 screen", "[layout][generator][circle]")
{
    auto points = LayoutGenerator::generate(LayoutDescriptor::of_kind(LayoutKind::Circle), 4, {100.0f, 100.0f});

    REQUIRE(points.size() == 4);
    require_point(points[0], 85.0f, 50.0f);
    require_point(points[1], 50.0f, 85.0f);
    require_point(points[2], 15.0f, 50.0f);
    require_point(points[3], 50.0f, 15.0f);
}

TEST_CASE("Circle honours radius_factor", "[layout][generator][circle]")
{
    auto points = LayoutGenerator::circle(CircleParams{.radius_factor = 0.5f}, 2, {200.0f, 100.0f});

    // min(200, 100) * 0.5 = 50 around (100, 50)
    require_point(points[0], 150.0f, 50.0f);
    require_point(points[1], 50.0f, 50.0f);
}

TEST_CASE("Grid fills rows of cell centers", "[layout][generator][grid]")
{
    auto points = LayoutGenerator::grid(GridParams{.padding = 0.0f}, 4, {100.0f, 100.0f});

    REQUIRE(points.size() == 4);
    require_point(points[0], 25.0f, 25.0f);
    require_point(points[1], 75.0f, 25.0f);
    require_point(points[2], 25.0f, 75.0f);
    require_point(points[3], 75.0f, 75.0f);

    SECTION("partial last row stays inside the padded rectangle")
    {
        auto grid = LayoutGenerator::grid(GridParams{}, 10, SCREEN);
        for (const auto& p : grid)
        {
            REQUIRE(p.x > LayoutDefaults::grid_padding);
            REQUIRE(p.x < SCREEN.width - LayoutDefaults::grid_padding);
            REQUIRE(p.y > LayoutDefaults::grid_padding);
            REQUIRE(p.y < SCREEN.height - LayoutDefaults::grid_padding);
        }
    }
}

TEST_CASE("Helix strands mirror each other", "[layout][generator][helix]")
{
    auto points = LayoutGenerator::helix(HelixParams{}, 100, SCREEN);
    const float center_x = SCREEN.width / 2.0f;

    SECTION("points run top to bottom")
    {
        for (size_t i = 0; i < points.size(); ++i)
        {
            REQUIRE(points[i].y == Approx(static_cast<float>(i) * SCREEN.height / 100.0f));
        }
    }

    SECTION("even indices sit right of the sine, odd ones left")
    {
        // Both phases are below pi, so the sine is positive
        REQUIRE(points[4].x > center_x);
        REQUIRE(points[5].x < center_x);
    }
}

TEST_CASE("Spiral starts at the center and stays within max radius", "[layout][generator][spiral]")
{
    auto points = LayoutGenerator::spiral(SpiralParams{}, 200, SCREEN);
    const glm::vec2 center{SCREEN.width / 2.0f, SCREEN.height / 2.0f};
    const float max_radius = std::min(SCREEN.width, SCREEN.height) * LayoutDefaults::spiral_max_radius_factor;

    require_point(points.front(), center.x, center.y);
    for (const auto& p : points)
    {
        REQUIRE(glm::length(p - center) <= max_radius + 1e-3f);
    }
}

TEST_CASE("Wave spans the width around the vertical center", "[layout][generator][wave]")
{
    auto points = LayoutGenerator::wave(WaveParams{}, 50, SCREEN);
    const float amplitude = SCREEN.height * LayoutDefaults::wave_amplitude;

    require_point(points.front(), 0.0f, SCREEN.height / 2.0f);
    for (size_t i = 0; i < points.size(); ++i)
    {
        REQUIRE(points[i].x == Approx(static_cast<float>(i) * SCREEN.width / 50.0f));
        REQUIRE(std::abs(points[i].y - SCREEN.height / 2.0f) <= amplitude + 1e-3f);
    }
}

TEST_CASE("Random layout stays inside its padding", "[layout][generator][random]")
{
    auto points = LayoutGenerator::random(RandomParams{.padding = 50.0f}, 1000, SCREEN);

    for (const auto& p : points)
    {
        REQUIRE(p.x >= 50.0f);
        REQUIRE(p.x <= SCREEN.width - 50.0f);
        REQUIRE(p.y >= 50.0f);
        REQUIRE(p.y <= SCREEN.height - 50.0f);
    }

    SECTION("an empty padded range collapses onto its start")
    {
        auto tiny = LayoutGenerator::random(RandomParams{}, 3, {10.0f, 10.0f});
        for (const auto& p : tiny)
        {
            require_point(p, LayoutDefaults::random_padding, LayoutDefaults::random_padding);
        }
    }
}

TEST_CASE("Custom coordinates with exactly N points round-trip", "[layout][generator][custom]")
{
    std::vector<glm::vec2> coordinates = {{0.0f, 0.0f}, {0.25f, 0.5f}, {1.0f, 1.0f}, {0.5f, 0.75f}};
    auto points = LayoutGenerator::generate(LayoutDescriptor::custom(coordinates), 4, SCREEN);

    REQUIRE(points.size() == 4);
    for (size_t i = 0; i < coordinates.size(); ++i)
    {
        require_point(points[i], coordinates[i].x * SCREEN.width, coordinates[i].y * SCREEN.height);
    }
}

TEST_CASE("Custom coordinates are subsampled when there are more than N", "[layout][generator][custom]")
{
    std::vector<glm::vec2> coordinates;
    for (int i = 0; i < 10; ++i)
    {
        coordinates.emplace_back(static_cast<float>(i) / 10.0f, 0.5f);
    }

    auto points = LayoutGenerator::custom(coordinates, 4, {100.0f, 100.0f});

    // floor(i * 10 / 4) = 0, 2, 5, 7
    REQUIRE(points.size() == 4);
    require_point(points[0], 0.0f, 50.0f);
    require_point(points[1], 20.0f, 50.0f);
    require_point(points[2], 50.0f, 50.0f);
    require_point(points[3], 70.0f, 50.0f);
}

TEST_CASE("Custom coordinates are interpolated when there are fewer than N", "[layout][generator][custom]")
{
    std::vector<glm::vec2> coordinates = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}};
    auto points = LayoutGenerator::custom(coordinates, 5, {100.0f, 100.0f});

    REQUIRE(points.size() == 5);

    SECTION("both endpoints are hit exactly")
    {
        REQUIRE(points.front() == glm::vec2(0.0f, 0.0f));
        REQUIRE(points.back() == glm::vec2(100.0f, 100.0f));
    }

    SECTION("interior points lie on the polyline")
    {
        require_point(points[1], 50.0f, 0.0f);
        require_point(points[2], 100.0f, 0.0f);
        require_point(points[3], 100.0f, 50.0f);
    }
}

TEST_CASE("Degenerate custom inputs", "[layout][generator][custom]")
{
    Logger::instance().set_level(spdlog::level::err);

    SECTION("a single coordinate is repeated")
    {
        auto points = LayoutGenerator::custom({{0.5f, 0.25f}}, 6, {100.0f, 100.0f});
        REQUIRE(points.size() == 6);
        for (const auto& p : points)
        {
            require_point(p, 50.0f, 25.0f);
        }
    }

    SECTION("one particle takes the first coordinate")
    {
        auto points = LayoutGenerator::custom({{0.1f, 0.2f}, {0.9f, 0.9f}}, 1, {100.0f, 100.0f});
        REQUIRE(points.size() == 1);
        require_point(points[0], 10.0f, 20.0f);
    }

    SECTION("no coordinates fall back to random within the padded bounds")
    {
        auto points = LayoutGenerator::generate(LayoutDescriptor::custom({}), 50, SCREEN);
        REQUIRE(points.size() == 50);
        for (const auto& p : points)
        {
            REQUIRE(p.x >= LayoutDefaults::random_padding);
            REQUIRE(p.x <= SCREEN.width - LayoutDefaults::random_padding);
            REQUIRE(p.y >= LayoutDefaults::random_padding);
            REQUIRE(p.y <= SCREEN.height - LayoutDefaults::random_padding);
        }
    }

    SECTION("out of range coordinates are scaled, not rejected")
    {
        auto points = LayoutGenerator::custom({{-0.5f, 1.5f}}, 1, {100.0f, 100.0f});
        require_point(points[0], -50.0f, 150.0f);
    }
}

TEST_CASE("Coordinates take precedence over the layout type", "[layout][generator][custom]")
{
    auto descriptor = LayoutDescriptor::of_kind(LayoutKind::Circle);
    descriptor.coordinates = std::vector<glm::vec2>{{0.5f, 0.5f}};

    auto points = LayoutGenerator::generate(descriptor, 3, {100.0f, 100.0f});
    for (const auto& p : points)
    {
        require_point(p, 50.0f, 50.0f);
    }
}

TEST_CASE("Generation from JSON and keywords", "[layout][generator]")
{
    Logger::instance().set_level(spdlog::level::err);

    SECTION("JSON circle matches the direct call")
    {
        auto from_json = LayoutGenerator::generate_from_json(
            R"({"version":"1.0","layout":{"type":"circle","params":{"radius_factor":0.35}}})", 4, {100.0f, 100.0f});
        require_point(from_json[0], 85.0f, 50.0f);
        require_point(from_json[3], 50.0f, 15.0f);
    }

    SECTION("malformed JSON still yields N points")
    {
        auto points = LayoutGenerator::generate_from_json("{not json", 12, SCREEN);
        REQUIRE(points.size() == 12);
    }

    SECTION("other versions are accepted")
    {
        auto points = LayoutGenerator::generate_from_json(
            R"({"version":"2.0","layout":{"type":"grid"}})", 9, SCREEN);
        REQUIRE(points == LayoutGenerator::grid(GridParams{}, 9, SCREEN));
    }

    SECTION("keywords select layouts case-insensitively")
    {
        REQUIRE(LayoutGenerator::descriptor_for_command("Circle").kind() == LayoutKind::Circle);
        REQUIRE(LayoutGenerator::descriptor_for_command("GRID").kind() == LayoutKind::Grid);
        REQUIRE(LayoutGenerator::descriptor_for_command("dna").kind() == LayoutKind::Helix);
        REQUIRE(LayoutGenerator::descriptor_for_command("helix").kind() == LayoutKind::Helix);
        REQUIRE(LayoutGenerator::descriptor_for_command("spiral").kind() == LayoutKind::Spiral);
        REQUIRE(LayoutGenerator::descriptor_for_command("wave").kind() == LayoutKind::Wave);
        REQUIRE(LayoutGenerator::descriptor_for_command("banana").kind() == LayoutKind::Random);
    }

    SECTION("keyword generation matches the descriptor")
    {
        REQUIRE(LayoutGenerator::generate_from_command("spiral", 30, SCREEN)
            == LayoutGenerator::spiral(SpiralParams{}, 30, SCREEN));
    }
}
