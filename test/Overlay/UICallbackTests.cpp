#include <catch2/catch_test_macros.hpp>

#include <tofu/UICallback.hpp>

#include <vector>

using namespace tofu;

TEST_CASE("UICallback reports its widget kind", "[overlay][callbacks]")
{
    float value = 0.5f;
    int clicks = 0;

    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Spring", ContinuousCallback{
        .setter = [&value](float v) { value = v; },
        .getter = [&value]() { return value; },
        .min = 0.0f,
        .max = 1.0f,
        .logarithmic = false
    });
    callbacks.emplace_back("circle", ActionCallback{.on_click = [&clicks]() { ++clicks; }});

    SECTION("sliders")
    {
        REQUIRE(callbacks[0].get_callback_type() == CallbackType::Continuous);
        REQUIRE(callbacks[0].as_action() == nullptr);

        const auto* slider = callbacks[0].as_continuous();
        REQUIRE(slider != nullptr);
        slider->setter(0.25f);
        REQUIRE(slider->getter() == 0.25f);
    }

    SECTION("buttons")
    {
        REQUIRE(callbacks[1].get_callback_type() == CallbackType::Action);
        REQUIRE(callbacks[1].as_continuous() == nullptr);

        const auto* button = callbacks[1].as_action();
        REQUIRE(button != nullptr);
        button->on_click();
        REQUIRE(clicks == 1);
    }
}
