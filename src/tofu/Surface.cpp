#include <tofu/Surface.hpp>
#include <tofu/Logger.hpp>
#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace tofu {

std::expected<Surface, std::string> Surface::create(
    const VulkanContext& context,
    const Window& window,
    const SurfaceConfig& config
) {
    Surface surface(context, window, config);

    if (auto result = surface.create_surface(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = surface.choose_formats(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = surface.create_render_passes(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = surface.create_swapchain(config.extent); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = surface.create_framebuffers(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Surface ready: {} images, {} {}, {}x{}",
        surface.image_count(), vk::to_string(surface.format()), vk::to_string(surface.present_mode()),
        surface.m_extent.width, surface.m_extent.height);
    return surface;
}

Surface::Surface(const VulkanContext& context, const Window& window, const SurfaceConfig& config)
    : m_context(&context)
    , m_window(&window)
    , m_device(context.device())
    , m_config(config)
    , m_present_mode(vk::PresentModeKHR::eFifo)
    , m_min_image_count(0)
{}

Surface::~Surface() {
    cleanup();
}

Surface::Surface(Surface&& other) noexcept
    : m_context(other.m_context)
    , m_window(other.m_window)
    , m_device(other.m_device)
    , m_config(other.m_config)
    , m_surface(std::exchange(other.m_surface, nullptr))
    , m_surface_format(other.m_surface_format)
    , m_present_mode(other.m_present_mode)
    , m_swapchain(std::exchange(other.m_swapchain, nullptr))
    , m_extent(other.m_extent)
    , m_min_image_count(other.m_min_image_count)
    , m_images(std::move(other.m_images))
    , m_image_views(std::move(other.m_image_views))
    , m_framebuffers(std::move(other.m_framebuffers))
    , m_scene_pass(std::exchange(other.m_scene_pass, nullptr))
    , m_overlay_pass(std::exchange(other.m_overlay_pass, nullptr))
{
    other.m_device = nullptr;
}

Surface& Surface::operator=(Surface&& other) noexcept {
    if (this != &other) {
        cleanup();

        m_context = other.m_context;
        m_window = other.m_window;
        m_device = std::exchange(other.m_device, nullptr);
        m_config = other.m_config;
        m_surface = std::exchange(other.m_surface, nullptr);
        m_surface_format = other.m_surface_format;
        m_present_mode = other.m_present_mode;
        m_swapchain = std::exchange(other.m_swapchain, nullptr);
        m_extent = other.m_extent;
        m_min_image_count = other.m_min_image_count;
        m_images = std::move(other.m_images);
        m_image_views = std::move(other.m_image_views);
        m_framebuffers = std::move(other.m_framebuffers);
        m_scene_pass = std::exchange(other.m_scene_pass, nullptr);
        m_overlay_pass = std::exchange(other.m_overlay_pass, nullptr);
    }
    return *this;
}

std::expected<void, std::string> Surface::create_surface() {
    VkSurfaceKHR surface_c;
    VkResult result = glfwCreateWindowSurface(
        static_cast<VkInstance>(m_context->instance()),
        m_window->handle(),
        nullptr,
        &surface_c
    );
    if (result != VK_SUCCESS) {
        return std::unexpected(std::format("Failed to create window surface: {}",
            vk::to_string(static_cast<vk::Result>(result))));
    }
    m_surface = vk::SurfaceKHR(surface_c);

    auto support_res = m_context->physical_device().getSurfaceSupportKHR(m_context->graphics_family(), m_surface);
    CHECK_VK_RESULT(support_res, "Could not query surface support {}");
    if (!support_res.value) {
        return std::unexpected("Graphics queue family cannot present to this surface");
    }
    return {};
}

std::expected<void, std::string> Surface::choose_formats() {
    auto physical_device = m_context->physical_device();

    auto formats_res = physical_device.getSurfaceFormatsKHR(m_surface);
    CHECK_VK_RESULT(formats_res, "Could not query surface formats {}");
    auto modes_res = physical_device.getSurfacePresentModesKHR(m_surface);
    CHECK_VK_RESULT(modes_res, "Could not query present modes {}");

    if (formats_res.value.empty()) {
        return std::unexpected("Surface reports no formats");
    }

    m_surface_format = formats_res.value[0];
    for (const auto& format : formats_res.value) {
        if (format.format == m_config.preferred_format &&
            format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear) {
            m_surface_format = format;
            break;
        }
    }
    if (m_surface_format.format != m_config.preferred_format) {
        Logger::instance().warn("Preferred format {} unavailable, using {}",
            vk::to_string(m_config.preferred_format), vk::to_string(m_surface_format.format));
    }

    // FIFO is the only mode every implementation must support
    m_present_mode = vk::PresentModeKHR::eFifo;
    if (std::ranges::find(modes_res.value, m_config.present_mode) != modes_res.value.end()) {
        m_present_mode = m_config.present_mode;
    } else {
        Logger::instance().warn("Present mode {} unavailable, using FIFO", vk::to_string(m_config.present_mode));
    }
    return {};
}

std::expected<void, std::string> Surface::create_swapchain(vk::Extent2D requested) {
    auto capabilities_res = m_context->physical_device().getSurfaceCapabilitiesKHR(m_surface);
    CHECK_VK_RESULT(capabilities_res, "Could not query surface capabilities {}");
    const auto& capabilities = capabilities_res.value;

    m_extent = choose_extent(capabilities, requested);

    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0 && image_count > capabilities.maxImageCount) {
        image_count = capabilities.maxImageCount;
    }
    m_min_image_count = capabilities.minImageCount;

    auto old_swapchain = m_swapchain;
    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(m_surface)
        .setMinImageCount(image_count)
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(m_present_mode)
        .setClipped(true)
        .setOldSwapchain(old_swapchain);

    auto swapchain_res = m_device.createSwapchainKHR(swapchain_info);
    if (old_swapchain) {
        m_device.destroySwapchainKHR(old_swapchain);
        m_swapchain = nullptr;
    }
    CHECK_VK_RESULT(swapchain_res, "Could not create swapchain {}");
    m_swapchain = swapchain_res.value;

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain);
    CHECK_VK_RESULT(images_res, "Could not get swapchain images {}");
    m_images = std::move(images_res.value);

    m_image_views.clear();
    for (const auto& image : m_images) {
        auto view_info = vk::ImageViewCreateInfo()
            .setImage(image)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(m_surface_format.format)
            .setSubresourceRange(vk::ImageSubresourceRange()
                .setAspectMask(vk::ImageAspectFlagBits::eColor)
                .setBaseMipLevel(0)
                .setLevelCount(1)
                .setBaseArrayLayer(0)
                .setLayerCount(1));
        auto view_res = m_device.createImageView(view_info);
        CHECK_VK_RESULT(view_res, "Could not create image view {}");
        m_image_views.push_back(view_res.value);
    }

    return {};
}

std::expected<void, std::string> Surface::create_render_passes() {
    auto color_ref = vk::AttachmentReference()
        .setAttachment(0)
        .setLayout(vk::ImageLayout::eColorAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref);

    auto dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setDstStageMask(vk::PipelineStageFlagBits::eColorAttachmentOutput)
        .setSrcAccessMask(vk::AccessFlagBits::eColorAttachmentWrite)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentRead | vk::AccessFlagBits::eColorAttachmentWrite);

    // Scene: clear, draw particles, keep the image as an attachment
    auto scene_attachment = vk::AttachmentDescription()
        .setFormat(m_surface_format.format)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(vk::AttachmentStoreOp::eStore)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(vk::ImageLayout::eColorAttachmentOptimal);

    auto scene_info = vk::RenderPassCreateInfo()
        .setAttachments(scene_attachment)
        .setSubpasses(subpass)
        .setDependencies(dependency);

    auto scene_res = m_device.createRenderPass(scene_info);
    CHECK_VK_RESULT(scene_res, "Could not create scene render pass {}");
    m_scene_pass = scene_res.value;

    // Overlay: draw on top of the scene, hand the image to presentation
    auto overlay_attachment = scene_attachment;
    overlay_attachment
        .setLoadOp(vk::AttachmentLoadOp::eLoad)
        .setInitialLayout(vk::ImageLayout::eColorAttachmentOptimal)
        .setFinalLayout(vk::ImageLayout::ePresentSrcKHR);

    auto overlay_info = vk::RenderPassCreateInfo()
        .setAttachments(overlay_attachment)
        .setSubpasses(subpass)
        .setDependencies(dependency);

    auto overlay_res = m_device.createRenderPass(overlay_info);
    CHECK_VK_RESULT(overlay_res, "Could not create overlay render pass {}");
    m_overlay_pass = overlay_res.value;

    return {};
}

std::expected<void, std::string> Surface::create_framebuffers() {
    m_framebuffers.clear();
    for (const auto& view : m_image_views) {
        auto framebuffer_info = vk::FramebufferCreateInfo()
            .setRenderPass(m_scene_pass)
            .setAttachments(view)
            .setWidth(m_extent.width)
            .setHeight(m_extent.height)
            .setLayers(1);
        auto framebuffer_res = m_device.createFramebuffer(framebuffer_info);
        CHECK_VK_RESULT(framebuffer_res, "Could not create framebuffer {}");
        m_framebuffers.push_back(framebuffer_res.value);
    }
    return {};
}

std::expected<void, std::string> Surface::configure(vk::Extent2D extent) {
    if (auto wait_res = m_device.waitIdle(); wait_res != vk::Result::eSuccess) {
        Logger::instance().warn("waitIdle before reconfigure returned {}", vk::to_string(wait_res));
    }

    for (auto& framebuffer : m_framebuffers) {
        m_device.destroyFramebuffer(framebuffer);
    }
    m_framebuffers.clear();
    for (auto& view : m_image_views) {
        m_device.destroyImageView(view);
    }
    m_image_views.clear();

    // The old swapchain is retired inside create_swapchain
    if (auto result = create_swapchain(extent); !result) {
        return result;
    }
    if (auto result = create_framebuffers(); !result) {
        return result;
    }

    Logger::instance().info("Surface reconfigured: {}x{}", m_extent.width, m_extent.height);
    return {};
}

std::expected<void, std::string> Surface::recreate_surface() {
    if (auto wait_res = m_device.waitIdle(); wait_res != vk::Result::eSuccess) {
        Logger::instance().warn("waitIdle before surface recreation returned {}", vk::to_string(wait_res));
    }

    cleanup_swapchain();
    if (m_surface) {
        m_context->instance().destroySurfaceKHR(m_surface);
        m_surface = nullptr;
    }

    if (auto result = create_surface(); !result) {
        return result;
    }
    Logger::instance().warn("Surface was lost and has been recreated");
    return configure(m_window->framebuffer_extent());
}

AcquiredImage Surface::acquire(vk::Semaphore signal_semaphore, uint64_t timeout) const {
    // Raw call: the Vulkan-Hpp wrapper treats out-of-date as a fatal error
    uint32_t image_index = 0;
    VkResult result = VULKAN_HPP_DEFAULT_DISPATCHER.vkAcquireNextImageKHR(
        static_cast<VkDevice>(m_device),
        static_cast<VkSwapchainKHR>(m_swapchain),
        timeout,
        static_cast<VkSemaphore>(signal_semaphore),
        VK_NULL_HANDLE,
        &image_index
    );
    return {static_cast<vk::Result>(result), image_index};
}

vk::Result Surface::present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index) const {
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_swapchain)
        .setImageIndices(image_index);

    VkResult result = VULKAN_HPP_DEFAULT_DISPATCHER.vkQueuePresentKHR(
        static_cast<VkQueue>(queue),
        reinterpret_cast<const VkPresentInfoKHR*>(&present_info)
    );
    return static_cast<vk::Result>(result);
}

void Surface::cleanup_swapchain() {
    for (auto& framebuffer : m_framebuffers) {
        m_device.destroyFramebuffer(framebuffer);
    }
    m_framebuffers.clear();

    for (auto& view : m_image_views) {
        m_device.destroyImageView(view);
    }
    m_image_views.clear();
    m_images.clear();

    if (m_swapchain) {
        m_device.destroySwapchainKHR(m_swapchain);
        m_swapchain = nullptr;
    }
}

void Surface::cleanup() {
    if (!m_device) {
        return;
    }

    cleanup_swapchain();

    if (m_overlay_pass) {
        m_device.destroyRenderPass(m_overlay_pass);
        m_overlay_pass = nullptr;
    }
    if (m_scene_pass) {
        m_device.destroyRenderPass(m_scene_pass);
        m_scene_pass = nullptr;
    }
    if (m_surface) {
        m_context->instance().destroySurfaceKHR(m_surface);
        m_surface = nullptr;
    }
    Logger::instance().trace("Destroyed surface");
}

vk::Extent2D Surface::choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities, vk::Extent2D requested) const {
    if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }

    // Window manager lets us choose; clamp to the valid range
    return vk::Extent2D{
        std::clamp(requested.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(requested.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height)
    };
}

} // namespace tofu
