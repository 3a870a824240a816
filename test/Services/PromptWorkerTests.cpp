#include <catch2/catch_test_macros.hpp>

#include <tofu/LayoutGenerator.hpp>
#include <tofu/Logger.hpp>
#include <tofu/PromptWorker.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>

using namespace tofu;
using namespace std::chrono_literals;

namespace
{

constexpr ScreenSize SCREEN{100.0f, 100.0f};

/// Translator that echoes a fixed reply and counts calls.
class CannedTranslator : public TranslationService
{
public:
    explicit CannedTranslator(std::expected<std::string, std::string> reply) : m_reply(std::move(reply)) {}

    std::expected<std::string, std::string> translate(std::string_view) override
    {
        ++calls;
        return m_reply;
    }

    std::atomic<int> calls{0};

private:
    std::expected<std::string, std::string> m_reply;
};

bool wait_until_finished(const PromptWorker& worker)
{
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!worker.finished())
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // anonymous namespace

TEST_CASE("PromptWorker turns prompts into layouts", "[worker]")
{
    Logger::instance().set_level(spdlog::level::warn);
    LayoutMailbox mailbox;

    SECTION("natural language goes through the translator")
    {
        std::istringstream input("circle\n");
        auto translator = std::make_shared<KeywordTranslator>();
        PromptWorker worker(PromptWorker::from_stream(input), translator, mailbox, 4, SCREEN);

        REQUIRE(wait_until_finished(worker));
        REQUIRE(worker.processed_count() == 1);

        auto update = mailbox.take();
        REQUIRE(update.has_value());
        REQUIRE(update->descriptor.kind() == LayoutKind::Circle);
        REQUIRE(update->targets == LayoutGenerator::circle(CircleParams{}, 4, SCREEN));
        REQUIRE(update->screen.width == SCREEN.width);
    }

    SECTION("JSON lines skip the translator")
    {
        std::istringstream input(R"({"version":"1.0","layout":{"type":"custom","coordinates":[[0.5,0.5]]}})" "\n");
        auto translator = std::make_shared<CannedTranslator>(std::unexpected(std::string("unused")));
        PromptWorker worker(PromptWorker::from_stream(input), translator, mailbox, 3, SCREEN);

        REQUIRE(wait_until_finished(worker));
        REQUIRE(translator->calls.load() == 0);

        auto update = mailbox.take();
        REQUIRE(update.has_value());
        REQUIRE(update->targets.size() == 3);
        REQUIRE(update->targets[2] == TargetPoint(50.0f, 50.0f));
    }

    SECTION("fenced model output is cleaned first")
    {
        std::istringstream input("a wave please\n");
        auto translator = std::make_shared<CannedTranslator>(
            std::string("```json\n{\"version\":\"1.0\",\"layout\":{\"type\":\"wave\"}}\n```"));
        PromptWorker worker(PromptWorker::from_stream(input), translator, mailbox, 5, SCREEN);

        REQUIRE(wait_until_finished(worker));
        auto update = mailbox.take();
        REQUIRE(update.has_value());
        REQUIRE(update->descriptor.kind() == LayoutKind::Wave);
    }
}

TEST_CASE("PromptWorker survives failures", "[worker]")
{
    Logger::instance().set_level(spdlog::level::off);
    LayoutMailbox mailbox;

    std::istringstream input("first\n\n   \nsecond\n");
    auto translator = std::make_shared<CannedTranslator>(std::string("not json at all"));
    PromptWorker worker(PromptWorker::from_stream(input), translator, mailbox, 5, SCREEN);

    REQUIRE(wait_until_finished(worker));
    REQUIRE(translator->calls.load() == 2);
    REQUIRE(worker.processed_count() == 0);
    REQUIRE_FALSE(mailbox.take().has_value());
}

TEST_CASE("PromptWorker falls back to random for unusable layouts", "[worker]")
{
    Logger::instance().set_level(spdlog::level::err);
    LayoutMailbox mailbox;

    SECTION("translator reply with an array root")
    {
        std::istringstream input("draw something\n");
        auto translator = std::make_shared<CannedTranslator>(std::string("[]"));
        PromptWorker worker(PromptWorker::from_stream(input), translator, mailbox, 6, SCREEN);

        REQUIRE(wait_until_finished(worker));
        REQUIRE(translator->calls.load() == 1);
        REQUIRE(worker.processed_count() == 1);

        auto update = mailbox.take();
        REQUIRE(update.has_value());
        REQUIRE(update->descriptor.kind() == LayoutKind::Random);
        REQUIRE(update->targets.size() == 6);
    }

    SECTION("truncated JSON typed on the input")
    {
        std::istringstream input(R"({"version":"1.0",)" "\n");
        auto translator = std::make_shared<CannedTranslator>(std::unexpected(std::string("unused")));
        PromptWorker worker(PromptWorker::from_stream(input), translator, mailbox, 6, SCREEN);

        REQUIRE(wait_until_finished(worker));
        REQUIRE(translator->calls.load() == 0);
        REQUIRE(worker.processed_count() == 1);

        auto update = mailbox.take();
        REQUIRE(update.has_value());
        REQUIRE(update->descriptor.kind() == LayoutKind::Random);
        REQUIRE(update->targets.size() == 6);
    }
}

TEST_CASE("PromptWorker stops on quit", "[worker]")
{
    Logger::instance().set_level(spdlog::level::warn);
    LayoutMailbox mailbox;

    std::istringstream input("grid\nquit\ncircle\n");
    PromptWorker worker(PromptWorker::from_stream(input), std::make_shared<KeywordTranslator>(), mailbox, 4, SCREEN);

    REQUIRE(wait_until_finished(worker));
    REQUIRE(worker.processed_count() == 1);

    auto update = mailbox.take();
    REQUIRE(update.has_value());
    REQUIRE(update->descriptor.kind() == LayoutKind::Grid);
}

TEST_CASE("PromptWorker follows the target space", "[worker]")
{
    Logger::instance().set_level(spdlog::level::warn);
    LayoutMailbox mailbox;

    // Blocks until released so the space can change before the prompt is handled
    std::atomic<bool> release{false};
    bool delivered = false;
    PromptWorker::LineSource source = [&](std::stop_token stop) -> std::optional<std::string> {
        while (!release && !stop.stop_requested())
        {
            std::this_thread::sleep_for(1ms);
        }
        if (delivered || stop.stop_requested())
        {
            return std::nullopt;
        }
        delivered = true;
        return std::string("grid");
    };

    PromptWorker worker(std::move(source), std::make_shared<KeywordTranslator>(), mailbox, 4, SCREEN);
    worker.set_target_space(9, ScreenSize{300.0f, 300.0f});
    release = true;

    REQUIRE(wait_until_finished(worker));
    auto update = mailbox.take();
    REQUIRE(update.has_value());
    REQUIRE(update->targets.size() == 9);
    REQUIRE(update->screen.width == 300.0f);
}

TEST_CASE("PromptWorker stops when the mailbox closes", "[worker]")
{
    Logger::instance().set_level(spdlog::level::warn);
    LayoutMailbox mailbox;

    PromptWorker::LineSource endless = [](std::stop_token stop) -> std::optional<std::string> {
        if (stop.stop_requested())
        {
            return std::nullopt;
        }
        std::this_thread::sleep_for(1ms);
        return std::string("circle");
    };

    PromptWorker worker(std::move(endless), std::make_shared<KeywordTranslator>(), mailbox, 4, SCREEN);
    mailbox.close();

    REQUIRE(wait_until_finished(worker));
}
