#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <tofu/AppConfig.hpp>
#include <tofu/Logger.hpp>

#include <filesystem>
#include <fstream>

using namespace tofu;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("AppConfig defaults", "[config]")
{
    AppConfig config;

    REQUIRE(config.window_width == 800);
    REQUIRE(config.window_height == 600);
    REQUIRE(config.window_title == "Project Tofu");
    REQUIRE(config.particle_count == 500);
    REQUIRE(config.spring_strength == Approx(0.08f));
    REQUIRE(config.damping == Approx(0.85f));
    REQUIRE(config.present_mode == PresentMode::Fifo);
    REQUIRE(config.show_panel);
}

TEST_CASE("Config JSON overrides the base", "[config]")
{
    Logger::instance().set_level(spdlog::level::warn);

    SECTION("every known key")
    {
        auto config = parse_app_config(R"({
            "window_width": 1280,
            "window_height": 720,
            "window_title": "Swarm",
            "particle_count": 2000,
            "spring_strength": 0.2,
            "damping": 0.9,
            "present_mode": "mailbox",
            "show_panel": false
        })");
        REQUIRE(config.has_value());
        REQUIRE(config->window_width == 1280);
        REQUIRE(config->window_height == 720);
        REQUIRE(config->window_title == "Swarm");
        REQUIRE(config->particle_count == 2000);
        REQUIRE(config->spring_strength == Approx(0.2f));
        REQUIRE(config->damping == Approx(0.9f));
        REQUIRE(config->present_mode == PresentMode::Mailbox);
        REQUIRE_FALSE(config->show_panel);
    }

    SECTION("missing keys keep the base values")
    {
        AppConfig base;
        base.particle_count = 42;
        auto config = parse_app_config(R"({"window_width": 640, "theme": "dark"})", base);
        REQUIRE(config.has_value());
        REQUIRE(config->window_width == 640);
        REQUIRE(config->particle_count == 42);
    }
}

TEST_CASE("Config JSON errors", "[config]")
{
    SECTION("wrong types are reported")
    {
        auto config = parse_app_config(R"({"particle_count": "many"})");
        REQUIRE_FALSE(config.has_value());
        REQUIRE_THAT(config.error(), ContainsSubstring("particle_count"));
    }

    SECTION("zero sizes are rejected")
    {
        REQUIRE_FALSE(parse_app_config(R"({"window_width": 0})").has_value());
    }

    SECTION("unknown present modes are rejected")
    {
        auto config = parse_app_config(R"({"present_mode": "turbo"})");
        REQUIRE_FALSE(config.has_value());
        REQUIRE_THAT(config.error(), ContainsSubstring("present_mode"));
    }

    SECTION("broken JSON")
    {
        REQUIRE_FALSE(parse_app_config("{").has_value());
        REQUIRE_FALSE(parse_app_config("[]").has_value());
    }
}

TEST_CASE("Config files are loaded from disk", "[config]")
{
    Logger::instance().set_level(spdlog::level::warn);
    const auto path = std::filesystem::temp_directory_path() / "tofu_config_test.json";

    {
        std::ofstream file(path);
        file << R"({"particle_count": 64, "present_mode": "immediate"})";
    }

    auto config = load_app_config(path);
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->particle_count == 64);
    REQUIRE(config->present_mode == PresentMode::Immediate);

    SECTION("missing files are an error")
    {
        auto missing = load_app_config(path);
        REQUIRE_FALSE(missing.has_value());
        REQUIRE_THAT(missing.error(), ContainsSubstring("Failed to open"));
    }
}

TEST_CASE("Present mode names", "[config]")
{
    REQUIRE(parse_present_mode("fifo") == PresentMode::Fifo);
    REQUIRE(parse_present_mode("mailbox") == PresentMode::Mailbox);
    REQUIRE(parse_present_mode("immediate") == PresentMode::Immediate);
    REQUIRE_FALSE(parse_present_mode("vsync").has_value());
    REQUIRE(to_string(PresentMode::Mailbox) == "mailbox");
}
