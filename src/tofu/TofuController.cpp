#include <tofu/TofuController.hpp>
#include <tofu/LayoutGenerator.hpp>
#include <tofu/Logger.hpp>
#include <array>
#include <chrono>
#include <format>
#include <string_view>

namespace tofu {

namespace {

vk::PresentModeKHR to_vk_present_mode(PresentMode mode) {
    switch (mode) {
        case PresentMode::Mailbox: return vk::PresentModeKHR::eMailbox;
        case PresentMode::Immediate: return vk::PresentModeKHR::eImmediate;
        case PresentMode::Fifo: break;
    }
    return vk::PresentModeKHR::eFifo;
}

ScreenSize to_screen_size(vk::Extent2D extent) {
    return ScreenSize{static_cast<float>(extent.width), static_cast<float>(extent.height)};
}

constexpr std::array<std::string_view, 6> PANEL_LAYOUTS = {"circle", "grid", "helix", "spiral", "wave", "random"};

} // anonymous namespace

std::expected<std::unique_ptr<TofuController>, std::string> TofuController::create(const AppConfig& config) {
    auto controller = std::unique_ptr<TofuController>(new TofuController(config));

    if (auto result = controller->initialize(); !result) {
        return std::unexpected(result.error());
    }

    return controller;
}

TofuController::TofuController(const AppConfig& config)
    : m_config(config)
{}

TofuController::~TofuController() {
    cleanup();
}

std::expected<void, std::string> TofuController::initialize() {
    Logger::instance().info("Initializing Tofu ({} particles)...", m_config.particle_count);

    // GLFW first: the instance needs its surface extensions
    if (auto result = Window::initialize_glfw(); !result) {
        return std::unexpected(result.error());
    }

    try {
        m_context = std::make_unique<VulkanContext>(m_config.window_title);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to create Vulkan context: {}", e.what()));
    }

    auto window_result = Window::create(
        static_cast<int>(m_config.window_width),
        static_cast<int>(m_config.window_height),
        m_config.window_title
    );
    if (!window_result) {
        return std::unexpected(std::format("Failed to create window: {}", window_result.error()));
    }
    m_window = std::make_unique<Window>(std::move(window_result.value()));

    auto extent = m_window->framebuffer_extent();
    SurfaceConfig surface_config{
        .preferred_format = vk::Format::eB8G8R8A8Srgb,
        .present_mode = to_vk_present_mode(m_config.present_mode),
        .extent = extent
    };

    auto renderer_result = ParticleRenderer::create(*m_context, *m_window, surface_config, m_config.particle_count);
    if (!renderer_result) {
        return std::unexpected(std::format("Failed to create renderer: {}", renderer_result.error()));
    }
    m_renderer = std::move(renderer_result.value());

    if (m_config.show_panel) {
        auto panel_result = ControlPanel::create(*m_context, *m_window, m_renderer->surface());
        if (!panel_result) {
            return std::unexpected(std::format("Failed to create control panel: {}", panel_result.error()));
        }
        m_panel = std::move(panel_result.value());
        m_panel->set_callbacks(panel_callbacks());
    }

    m_screen = to_screen_size(m_renderer->surface().extent());
    m_store = ParticleStore::create(m_config.particle_count, m_screen);
    m_store->set_spring(m_config.spring_strength, m_config.damping);

    Logger::instance().info("Tofu initialized ({}x{})", m_screen.width, m_screen.height);
    return {};
}

void TofuController::apply_layout(const LayoutDescriptor& descriptor) {
    auto targets = LayoutGenerator::generate(descriptor, m_store->size(), m_screen);
    apply_update(LayoutUpdate{descriptor, std::move(targets), m_screen});
}

void TofuController::start_prompt_worker(
    PromptWorker::LineSource source,
    std::shared_ptr<TranslationService> translator
) {
    m_worker = std::make_unique<PromptWorker>(
        std::move(source),
        std::move(translator),
        m_mailbox,
        m_store->size(),
        m_screen
    );
    Logger::instance().info("Listening for prompts on standard input");
}

void TofuController::apply_update(LayoutUpdate update) {
    // Generated for a screen size that has since changed
    if (update.screen.width != m_screen.width || update.screen.height != m_screen.height) {
        update.targets = LayoutGenerator::generate(update.descriptor, m_store->size(), m_screen);
    }

    m_store->set_targets(update.targets);
    Logger::instance().info("Applied {} layout ({} targets)", to_string(update.descriptor.kind()), update.targets.size());
    m_current_layout = std::move(update.descriptor);
}

std::expected<void, std::string> TofuController::handle_resize() {
    auto extent = m_window->framebuffer_extent();
    if (!is_presentable(extent)) {
        return {};
    }

    if (auto result = m_renderer->resize(extent); !result) {
        return std::unexpected(std::format("Failed to resize surface: {}", result.error()));
    }
    if (m_panel) {
        m_panel->on_surface_changed(m_renderer->surface().min_image_count());
    }

    auto screen = to_screen_size(m_renderer->surface().extent());
    if (screen.width == m_screen.width && screen.height == m_screen.height) {
        return {};
    }
    m_screen = screen;

    // The store's spawn bounds are fixed, so a new size means a new swarm
    const float spring_strength = m_store->spring_strength();
    const float damping = m_store->damping();
    m_store = ParticleStore::create(m_config.particle_count, m_screen);
    m_store->set_spring(spring_strength, damping);

    if (m_worker) {
        m_worker->set_target_space(m_store->size(), m_screen);
    }
    if (m_current_layout) {
        apply_layout(*m_current_layout);
    }

    Logger::instance().debug("Screen is now {}x{}", m_screen.width, m_screen.height);
    return {};
}

std::expected<void, std::string> TofuController::handle_frame_error(FrameError error) {
    switch (frame_action(error)) {
        case FrameAction::Reconfigure: {
            if (auto result = m_renderer->handle_surface_lost(); !result) {
                return std::unexpected(std::format("Could not recover the surface: {}", result.error()));
            }
            if (m_panel) {
                m_panel->on_surface_changed(m_renderer->surface().min_image_count());
            }
            return {};
        }
        case FrameAction::Terminate:
            Logger::instance().critical("Rendering failed ({}), shutting down", to_string(error));
            return std::unexpected(std::format("Rendering failed: {}", to_string(error)));
        case FrameAction::Skip:
            Logger::instance().warn("Skipped frame: {}", to_string(error));
            return {};
    }
    return {};
}

std::vector<UICallback> TofuController::panel_callbacks() {
    std::vector<UICallback> callbacks;

    callbacks.emplace_back("Spring", ContinuousCallback{
        .setter = [this](float v) { m_store->set_spring(v, m_store->damping()); },
        .getter = [this]() { return m_store->spring_strength(); },
        .min = 0.01f,
        .max = 1.0f,
        .logarithmic = true
    });
    callbacks.emplace_back("Damping", ContinuousCallback{
        .setter = [this](float v) { m_store->set_spring(m_store->spring_strength(), v); },
        .getter = [this]() { return m_store->damping(); },
        .min = 0.0f,
        .max = 0.99f,
        .logarithmic = false
    });

    for (auto name : PANEL_LAYOUTS) {
        callbacks.emplace_back(std::string(name), ActionCallback{
            .on_click = [this, name]() { apply_layout(LayoutGenerator::descriptor_for_command(name)); }
        });
    }
    return callbacks;
}

std::expected<void, std::string> TofuController::run() {
    const auto start = std::chrono::steady_clock::now();

    while (!m_window->should_close()) {
        glfwPollEvents();

        if (m_window->take_resized()) {
            if (auto result = handle_resize(); !result) {
                return result;
            }
        }

        // Minimized: nothing to present to
        if (!is_presentable(m_window->framebuffer_extent())) {
            glfwWaitEventsTimeout(0.1);
            continue;
        }

        if (auto update = m_mailbox.take()) {
            apply_update(std::move(*update));
        }

        m_store->tick();

        const float time = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();

        if (m_panel) {
            m_panel->build(ControlPanel::Status{
                .particle_count = m_store->size(),
                .dropped_layouts = m_mailbox.dropped_count(),
                .layout = m_current_layout ? std::string(to_string(m_current_layout->kind())) : std::string{}
            });
        }

        if (auto frame = m_renderer->render(*m_store, time, m_panel.get()); !frame) {
            if (auto result = handle_frame_error(frame.error()); !result) {
                return result;
            }
        }
    }

    Logger::instance().info("Window closed");
    return {};
}

void TofuController::cleanup() {
    // Stop the producer before anything it could post into goes away
    m_mailbox.close();
    if (m_worker) {
        m_worker->request_stop();
        m_worker.reset();
    }

    m_panel.reset();
    m_renderer.reset();
    m_window.reset();
    m_context.reset();

    glfwTerminate();
    Logger::instance().info("Shutdown complete");
}

} // namespace tofu
