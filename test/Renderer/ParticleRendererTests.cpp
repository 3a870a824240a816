#include <catch2/catch_test_macros.hpp>

#include <tofu/Logger.hpp>
#include <tofu/ParticleRenderer.hpp>
#include <tofu/ParticleStore.hpp>
#include <tofu/VulkanContext.hpp>
#include <tofu/Window.hpp>

using namespace tofu;

TEST_CASE("ParticleRenderer ignores empty resizes", "[renderer][vulkan]")
{
    Logger::instance().set_level(spdlog::level::warn);
    REQUIRE(Window::initialize_glfw().has_value());
    VulkanContext ctx("Renderer Test");

    auto window = Window::create(320, 240, "Renderer Test");
    REQUIRE(window.has_value());

    SurfaceConfig config{
        .preferred_format = vk::Format::eB8G8R8A8Srgb,
        .present_mode = vk::PresentModeKHR::eFifo,
        .extent = window->framebuffer_extent()
    };
    auto renderer = ParticleRenderer::create(ctx, *window, config, 16);
    REQUIRE(renderer.has_value());

    const auto before = (*renderer)->surface().extent();

    SECTION("zero width")
    {
        REQUIRE((*renderer)->resize(vk::Extent2D(0, 600)).has_value());
        REQUIRE((*renderer)->surface().extent() == before);
    }

    SECTION("zero height")
    {
        REQUIRE((*renderer)->resize(vk::Extent2D(600, 0)).has_value());
        REQUIRE((*renderer)->surface().extent() == before);
    }

    SECTION("frames still render afterwards")
    {
        REQUIRE((*renderer)->resize(vk::Extent2D(0, 0)).has_value());

        auto store = ParticleStore::create(16, ScreenSize{320.0f, 240.0f}, 1u);
        auto frame = (*renderer)->render(store, 0.0f);
        if (!frame)
        {
            // Headless or tiling compositors may hand out an out-of-date swapchain first
            REQUIRE(frame_action(frame.error()) != FrameAction::Terminate);
        }
    }
}
