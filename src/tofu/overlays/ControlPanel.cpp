#include <tofu/overlays/ControlPanel.hpp>
#include <tofu/Logger.hpp>
#include <tofu/Surface.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <algorithm>
#include <array>
#include <format>

namespace tofu {

namespace {

void check_imgui_vk_result(VkResult result) {
    if (result != VK_SUCCESS) {
        Logger::instance().error("ImGui Vulkan backend: {}", vk::to_string(static_cast<vk::Result>(result)));
    }
}

} // anonymous namespace

std::expected<std::unique_ptr<ControlPanel>, std::string> ControlPanel::create(
    const VulkanContext& context,
    const Window& window,
    const Surface& surface
) {
    auto panel = std::unique_ptr<ControlPanel>(new ControlPanel(context.device()));
    if (auto result = panel->initialize(context, window, surface); !result) {
        return std::unexpected(result.error());
    }
    Logger::instance().info("Control panel ready");
    return panel;
}

ControlPanel::ControlPanel(vk::Device device)
    : m_device(device)
{}

ControlPanel::~ControlPanel() {
    if (m_device) {
        if (auto wait_res = m_device.waitIdle(); wait_res != vk::Result::eSuccess) {
            Logger::instance().warn("waitIdle before ImGui shutdown returned {}", vk::to_string(wait_res));
        }
    }
    if (m_imgui_initialized) {
        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
    }
    if (m_descriptor_pool) {
        m_device.destroyDescriptorPool(m_descriptor_pool);
    }
}

std::expected<void, std::string> ControlPanel::initialize(
    const VulkanContext& context,
    const Window& window,
    const Surface& surface
) {
    // The font atlas is the only texture
    std::array pool_sizes = {
        vk::DescriptorPoolSize(vk::DescriptorType::eCombinedImageSampler, 16),
    };
    auto pool_info = vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(16)
        .setPoolSizes(pool_sizes);

    auto pool_res = m_device.createDescriptorPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create ImGui descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForVulkan(window.handle(), true)) {
        ImGui::DestroyContext();
        return std::unexpected("Failed to initialize ImGui GLFW backend");
    }

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.Instance = static_cast<VkInstance>(context.instance());
    init_info.PhysicalDevice = static_cast<VkPhysicalDevice>(context.physical_device());
    init_info.Device = static_cast<VkDevice>(context.device());
    init_info.QueueFamily = context.graphics_family();
    init_info.Queue = static_cast<VkQueue>(context.graphics_queue());
    init_info.DescriptorPool = static_cast<VkDescriptorPool>(m_descriptor_pool);
    init_info.MinImageCount = std::max(surface.min_image_count(), 2u);
    init_info.ImageCount = surface.image_count();
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.RenderPass = static_cast<VkRenderPass>(surface.overlay_pass());
    init_info.Allocator = nullptr;
    init_info.CheckVkResultFn = check_imgui_vk_result;

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        return std::unexpected("Failed to initialize ImGui Vulkan backend");
    }
    m_imgui_initialized = true;

    if (!ImGui_ImplVulkan_CreateFontsTexture()) {
        return std::unexpected("Failed to upload ImGui font texture");
    }
    return {};
}

void ControlPanel::on_surface_changed(uint32_t min_image_count) {
    ImGui_ImplVulkan_SetMinImageCount(std::max(min_image_count, 2u));
}

void ControlPanel::build(const Status& status) {
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_FirstUseEver);
    ImGui::Begin("Tofu");

    ImGui::Text("Particles: %u", status.particle_count);
    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);
    ImGui::Text("Layout: %s", status.layout.empty() ? "(initial)" : status.layout.c_str());
    if (status.dropped_layouts > 0) {
        ImGui::TextDisabled("Dropped layouts: %llu", static_cast<unsigned long long>(status.dropped_layouts));
    }

    ImGui::Separator();
    render_callbacks();

    ImGui::End();
    ImGui::Render();
}

void ControlPanel::render_callbacks() {
    bool previous_was_button = false;
    for (const auto& callback : m_callbacks) {
        const bool is_button = callback.get_callback_type() == CallbackType::Action;
        if (is_button && previous_was_button) {
            ImGui::SameLine();
        }
        previous_was_button = is_button;

        switch (callback.get_callback_type()) {
            case CallbackType::Continuous: {
                if (auto* cb = callback.as_continuous()) {
                    float value = cb->getter();
                    int flags = cb->logarithmic ? ImGuiSliderFlags_Logarithmic : 0;
                    if (ImGui::SliderFloat(callback.field_name.c_str(), &value, cb->min, cb->max, "%.3f", flags)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Action: {
                if (auto* cb = callback.as_action()) {
                    if (ImGui::Button(callback.field_name.c_str())) {
                        cb->on_click();
                    }
                }
                break;
            }
        }
    }
}

void ControlPanel::draw(const FrameContext& frame) {
    auto begin_info = vk::RenderPassBeginInfo()
        .setRenderPass(frame.render_pass)
        .setFramebuffer(frame.framebuffer)
        .setRenderArea(vk::Rect2D({0, 0}, {frame.width, frame.height}));

    frame.command_buffer.beginRenderPass(begin_info, vk::SubpassContents::eInline);
    if (auto* draw_data = ImGui::GetDrawData()) {
        ImGui_ImplVulkan_RenderDrawData(draw_data, static_cast<VkCommandBuffer>(frame.command_buffer));
    }
    frame.command_buffer.endRenderPass();
}

} // namespace tofu
