#pragma once

#include "AppConfig.hpp"
#include "FrameError.hpp"
#include "LayoutMailbox.hpp"
#include "ParticleRenderer.hpp"
#include "ParticleStore.hpp"
#include "PromptWorker.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include "overlays/ControlPanel.hpp"
#include <expected>
#include <memory>
#include <optional>

namespace tofu {

/**
 * @brief Owns the window, the GPU side and the swarm, and runs the redraw loop
 *
 * Each iteration: poll events, follow window resizes, apply the newest layout
 * from the mailbox, tick the particle store, build the control panel and
 * render. Layouts arrive either from the prompt worker through the mailbox or
 * directly from the control panel and apply_layout().
 */
class TofuController {
public:
    /**
     * @brief Open the window and create every GPU resource
     *
     * @param config Window, particle and presentation settings
     * @return Controller instance or error message
     */
    static std::expected<std::unique_ptr<TofuController>, std::string> create(const AppConfig& config);

    ~TofuController();

    TofuController(const TofuController&) = delete;
    TofuController& operator=(const TofuController&) = delete;

    /// Generate targets for a descriptor at the current screen size and apply them.
    void apply_layout(const LayoutDescriptor& descriptor);

    /**
     * @brief Start reading prompts in the background
     *
     * Layouts the worker produces are picked up at the start of the next frame.
     */
    void start_prompt_worker(PromptWorker::LineSource source, std::shared_ptr<TranslationService> translator);

    /**
     * @brief Run until the window closes
     *
     * @return Error if rendering can no longer continue (device out of memory,
     *         unrecoverable surface loss)
     */
    std::expected<void, std::string> run();

    [[nodiscard]] ScreenSize screen() const { return m_screen; }
    [[nodiscard]] LayoutMailbox& mailbox() { return m_mailbox; }

private:
    explicit TofuController(const AppConfig& config);

    std::expected<void, std::string> initialize();

    /// Follow a framebuffer size change: surface, store and worker target space.
    std::expected<void, std::string> handle_resize();

    void apply_update(LayoutUpdate update);

    std::expected<void, std::string> handle_frame_error(FrameError error);

    [[nodiscard]] std::vector<UICallback> panel_callbacks();

    void cleanup();

    AppConfig m_config;

    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<Window> m_window;
    std::unique_ptr<ParticleRenderer> m_renderer;
    std::unique_ptr<ControlPanel> m_panel;

    std::optional<ParticleStore> m_store;
    ScreenSize m_screen;
    std::optional<LayoutDescriptor> m_current_layout;

    // The worker posts into the mailbox, so it is declared after it and goes first
    LayoutMailbox m_mailbox;
    std::unique_ptr<PromptWorker> m_worker;
};

} // namespace tofu
