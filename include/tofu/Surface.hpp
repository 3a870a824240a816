#pragma once

#include <tofu/Common.hpp>
#include <tofu/VulkanContext.hpp>
#include <tofu/Window.hpp>
#include <vector>

namespace tofu {

/// Requested presentation setup; unsupported choices fall back to what the surface offers.
struct SurfaceConfig {
    vk::Format preferred_format = vk::Format::eB8G8R8A8Srgb;
    vk::PresentModeKHR present_mode = vk::PresentModeKHR::eFifo;
    vk::Extent2D extent;
};

/// Outcome of an acquire; `image_index` is only meaningful for eSuccess and eSuboptimalKHR.
struct AcquiredImage {
    vk::Result result;
    uint32_t image_index;
};

/**
 * @brief Presentation surface for a window
 *
 * Owns the VkSurfaceKHR, the swapchain with one image view and framebuffer per
 * image, and two compatible render passes over the swapchain format:
 * - scene pass: clears to black, leaves the image as a color attachment
 * - overlay pass: loads the scene, transitions the image for presentation
 *
 * Both passes share the framebuffers.
 */
class Surface {
public:
    static std::expected<Surface, std::string> create(
        const VulkanContext& context,
        const Window& window,
        const SurfaceConfig& config
    );

    ~Surface();

    // Non-copyable, movable
    Surface(const Surface&) = delete;
    Surface& operator=(const Surface&) = delete;
    Surface(Surface&&) noexcept;
    Surface& operator=(Surface&&) noexcept;

    /**
     * @brief Rebuild the swapchain for a new size
     *
     * Waits for the device to go idle first. Image views and framebuffers are
     * recreated; the render passes are kept.
     */
    std::expected<void, std::string> configure(vk::Extent2D extent);

    /// Destroy and recreate the VkSurfaceKHR itself, then reconfigure.
    std::expected<void, std::string> recreate_surface();

    /**
     * @brief Acquire the next presentable image
     *
     * Out-of-date and surface-lost results are returned, not thrown or asserted.
     */
    [[nodiscard]] AcquiredImage acquire(vk::Semaphore signal_semaphore, uint64_t timeout) const;

    /// Queue an image for presentation after `wait_semaphore` is signaled.
    [[nodiscard]] vk::Result present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index) const;

    [[nodiscard]] vk::Format format() const { return m_surface_format.format; }
    [[nodiscard]] vk::PresentModeKHR present_mode() const { return m_present_mode; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(m_images.size()); }
    [[nodiscard]] uint32_t min_image_count() const { return m_min_image_count; }
    [[nodiscard]] vk::RenderPass scene_pass() const { return m_scene_pass; }
    [[nodiscard]] vk::RenderPass overlay_pass() const { return m_overlay_pass; }
    [[nodiscard]] vk::Framebuffer framebuffer(uint32_t index) const { return m_framebuffers[index]; }
    [[nodiscard]] vk::ImageView image_view(uint32_t index) const { return m_image_views[index]; }

private:
    Surface(const VulkanContext& context, const Window& window, const SurfaceConfig& config);

    std::expected<void, std::string> create_surface();
    std::expected<void, std::string> choose_formats();
    std::expected<void, std::string> create_swapchain(vk::Extent2D requested);
    std::expected<void, std::string> create_render_passes();
    std::expected<void, std::string> create_framebuffers();

    void cleanup_swapchain();
    void cleanup();

    vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities, vk::Extent2D requested) const;

    const VulkanContext* m_context;
    const Window* m_window;
    vk::Device m_device;
    SurfaceConfig m_config;

    vk::SurfaceKHR m_surface;
    vk::SurfaceFormatKHR m_surface_format;
    vk::PresentModeKHR m_present_mode;
    vk::SwapchainKHR m_swapchain;
    vk::Extent2D m_extent;
    uint32_t m_min_image_count;

    std::vector<vk::Image> m_images;
    std::vector<vk::ImageView> m_image_views;
    std::vector<vk::Framebuffer> m_framebuffers;
    vk::RenderPass m_scene_pass;
    vk::RenderPass m_overlay_pass;
};

} // namespace tofu
