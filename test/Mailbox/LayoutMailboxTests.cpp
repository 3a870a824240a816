#include <catch2/catch_test_macros.hpp>

#include <tofu/LayoutMailbox.hpp>
#include <tofu/Logger.hpp>

#include <atomic>
#include <thread>

using namespace tofu;

namespace
{

LayoutUpdate make_update(float value, size_t count)
{
    return LayoutUpdate{
        .descriptor = LayoutDescriptor::of_kind(LayoutKind::Random),
        .targets = std::vector<TargetPoint>(count, TargetPoint(value, value)),
        .screen = {100.0f, 100.0f}
    };
}

} // anonymous namespace

TEST_CASE("Mailbox hands over one update", "[mailbox]")
{
    Logger::instance().set_level(spdlog::level::warn);
    LayoutMailbox mailbox;

    REQUIRE_FALSE(mailbox.take().has_value());

    REQUIRE(mailbox.post(make_update(1.0f, 3)));
    auto update = mailbox.take();
    REQUIRE(update.has_value());
    REQUIRE(update->targets.size() == 3);
    REQUIRE(update->targets[0].x == 1.0f);

    SECTION("taking empties the slot")
    {
        REQUIRE_FALSE(mailbox.take().has_value());
    }
}

TEST_CASE("Mailbox keeps only the latest update", "[mailbox]")
{
    LayoutMailbox mailbox;

    REQUIRE(mailbox.post(make_update(1.0f, 2)));
    REQUIRE(mailbox.post(make_update(2.0f, 2)));
    REQUIRE(mailbox.post(make_update(3.0f, 2)));

    REQUIRE(mailbox.dropped_count() == 2);
    auto update = mailbox.take();
    REQUIRE(update.has_value());
    REQUIRE(update->targets[0].x == 3.0f);
}

TEST_CASE("Closed mailbox refuses posts", "[mailbox]")
{
    LayoutMailbox mailbox;
    mailbox.close();

    REQUIRE(mailbox.closed());
    REQUIRE_FALSE(mailbox.post(make_update(1.0f, 1)));
    REQUIRE_FALSE(mailbox.take().has_value());
}

TEST_CASE("Updates cross threads whole", "[mailbox][threads]")
{
    constexpr size_t COUNT = 2048;
    constexpr int POSTS = 500;
    LayoutMailbox mailbox;
    std::atomic<bool> done{false};

    std::thread producer([&] {
        for (int i = 1; i <= POSTS; ++i)
        {
            mailbox.post(make_update(static_cast<float>(i), COUNT));
        }
        done = true;
    });

    float last_seen = 0.0f;
    bool consistent = true;
    auto check = [&](const LayoutUpdate& update) {
        if (update.targets.size() != COUNT)
        {
            consistent = false;
            return;
        }
        const float value = update.targets.front().x;
        for (const auto& t : update.targets)
        {
            consistent = consistent && t.x == value && t.y == value;
        }
        // Latest wins, so values never go backwards
        consistent = consistent && value > last_seen;
        last_seen = value;
    };

    while (!done)
    {
        if (auto update = mailbox.take())
        {
            check(*update);
        }
    }
    producer.join();
    if (auto update = mailbox.take())
    {
        check(*update);
    }

    REQUIRE(consistent);
    REQUIRE(last_seen == static_cast<float>(POSTS));
}
