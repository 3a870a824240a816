#pragma once

#include "../Overlay.hpp"
#include "../UICallback.hpp"
#include "../VulkanContext.hpp"
#include "../Window.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace tofu {

class Surface;

/**
 * @brief Dear ImGui control panel drawn through the overlay seam
 *
 * Shows particle count, frame rate, dropped layouts and the last applied
 * layout, then one widget per registered UICallback.
 *
 * Call build() once per frame before rendering; draw() records the result.
 */
class ControlPanel : public Overlay {
public:
    struct Status {
        uint32_t particle_count = 0;
        uint64_t dropped_layouts = 0;
        std::string layout;
    };

    /**
     * @brief Initialize ImGui for the window and the surface's overlay pass
     *
     * Only one panel may exist at a time; ImGui keeps global state.
     */
    static std::expected<std::unique_ptr<ControlPanel>, std::string> create(
        const VulkanContext& context,
        const Window& window,
        const Surface& surface
    );

    ~ControlPanel() override;

    ControlPanel(const ControlPanel&) = delete;
    ControlPanel& operator=(const ControlPanel&) = delete;
    ControlPanel(ControlPanel&&) = delete;
    ControlPanel& operator=(ControlPanel&&) = delete;

    void set_callbacks(std::vector<UICallback> callbacks) { m_callbacks = std::move(callbacks); }

    /// Start a new ImGui frame and lay out the panel.
    void build(const Status& status);

    /// Let the ImGui backend know the swapchain changed.
    void on_surface_changed(uint32_t min_image_count);

    void draw(const FrameContext& frame) override;

private:
    explicit ControlPanel(vk::Device device);

    std::expected<void, std::string> initialize(const VulkanContext& context, const Window& window, const Surface& surface);
    void render_callbacks();

    vk::Device m_device;
    vk::DescriptorPool m_descriptor_pool;
    std::vector<UICallback> m_callbacks;
    bool m_imgui_initialized = false;
};

} // namespace tofu
