#include <catch2/catch_test_macros.hpp>

#include <tofu/Logger.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <source_location>
#include <string>
#include <thread>
#include <vector>

namespace
{

constexpr int LINES_PER_THREAD = 200;

std::string expected_location(const std::source_location& loc)
{
    return fmt::format("LoggerTests.cpp:{}]", loc.line());
}

} // namespace

TEST_CASE("Log lines carry their own caller location", "[logger]")
{
    Logger::instance().set_level(spdlog::level::trace);

    auto capture = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(4 * LINES_PER_THREAD);
    capture->set_formatter(Logger::make_formatter());
    Logger::instance().sinks().push_back(capture);

    SECTION("single thread")
    {
        const auto here = std::source_location::current();
        Logger::instance(here).info("single");

        auto lines = capture->last_formatted();
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].starts_with("[Tofu][LoggerTests.cpp:"));
        REQUIRE(lines[0].find(expected_location(here)) != std::string::npos);
        REQUIRE(lines[0].find("single") != std::string::npos);
    }

    SECTION("two threads logging at once")
    {
        const auto site_a = std::source_location::current();
        const auto site_b = std::source_location::current();
        REQUIRE(site_a.line() != site_b.line());

        auto log_from = [](std::source_location site, const char* tag)
        {
            for (int i = 0; i < LINES_PER_THREAD; ++i)
            {
                Logger::instance(site).info("{} {}", tag, i);
            }
        };

        {
            std::jthread a(log_from, site_a, "alpha");
            std::jthread b(log_from, site_b, "bravo");
        }

        auto lines = capture->last_formatted();
        REQUIRE(lines.size() == 2 * LINES_PER_THREAD);

        for (const auto& line : lines)
        {
            const bool alpha = line.find("alpha") != std::string::npos;
            const auto& site = alpha ? site_a : site_b;
            REQUIRE(line.find(expected_location(site)) != std::string::npos);
        }
    }

    auto& sinks = Logger::instance().sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), capture), sinks.end());
}
