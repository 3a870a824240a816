#include <tofu/ParticleRenderer.hpp>
#include <tofu/Logger.hpp>
#include <tofu/VertexLayout.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <utility>

namespace tofu {

namespace {

/// Two triangles covering [-1, 1]^2; scaled by the particle size in the vertex shader.
const std::array<glm::vec2, ParticleRenderer::QUAD_VERTEX_COUNT> QUAD_CORNERS = {
    glm::vec2(-1.0f, -1.0f), glm::vec2(1.0f, -1.0f), glm::vec2(1.0f, 1.0f),
    glm::vec2(-1.0f, -1.0f), glm::vec2(1.0f, 1.0f), glm::vec2(-1.0f, 1.0f),
};

constexpr uint32_t FRAME_UNIFORMS_BINDING = 0;

} // anonymous namespace

std::expected<std::unique_ptr<ParticleRenderer>, std::string> ParticleRenderer::create(
    const VulkanContext& context,
    const Window& window,
    const SurfaceConfig& config,
    uint32_t particle_count
) {
    if (particle_count == 0) {
        return std::unexpected("Particle count must be positive");
    }

    auto surface = Surface::create(context, window, config);
    if (!surface) {
        return std::unexpected(std::format("Failed to create surface: {}", surface.error()));
    }

    auto renderer = std::unique_ptr<ParticleRenderer>(
        new ParticleRenderer(context, window, std::move(*surface), particle_count)
    );

    if (auto result = renderer->initialize(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Created ParticleRenderer for {} particles", particle_count);
    return renderer;
}

ParticleRenderer::ParticleRenderer(
    const VulkanContext& context,
    const Window& window,
    Surface surface,
    uint32_t particle_count
)
    : m_context(&context)
    , m_window(&window)
    , m_device(context.device())
    , m_surface(std::move(surface))
    , m_particle_count(particle_count)
{}

ParticleRenderer::~ParticleRenderer() {
    cleanup();
}

std::expected<void, std::string> ParticleRenderer::initialize() {
    if (auto result = load_shaders(); !result) {
        return result;
    }
    if (auto result = create_descriptors(); !result) {
        return result;
    }
    if (auto result = create_pipeline(); !result) {
        return result;
    }
    if (auto result = create_buffers(); !result) {
        return result;
    }
    if (auto result = create_commands(); !result) {
        return result;
    }
    return create_image_sync();
}

std::expected<void, std::string> ParticleRenderer::load_shaders() {
    auto vert_result = Shader::create(m_device, "particle/particle.vert.slang", "main");
    if (!vert_result) {
        return std::unexpected(std::format("Failed to load vertex shader: {}", vert_result.error()));
    }
    m_vertex_shader = std::make_unique<Shader>(std::move(*vert_result));

    auto frag_result = Shader::create(m_device, "particle/particle.frag.slang", "main");
    if (!frag_result) {
        return std::unexpected(std::format("Failed to load fragment shader: {}", frag_result.error()));
    }
    m_fragment_shader = std::make_unique<Shader>(std::move(*frag_result));

    const auto* vertex = std::get_if<VertexDetails>(&m_vertex_shader->details());
    const auto* fragment = std::get_if<FragmentDetails>(&m_fragment_shader->details());
    if (!vertex || !fragment) {
        return std::unexpected("Particle shaders must be a vertex and a fragment entry point");
    }

    // The instance buffer is the particle array itself, so the shader has to read it as laid out
    if (auto result = check_vertex_inputs(vertex->inputs, particle_vertex_layout()); !result) {
        return std::unexpected(result.error());
    }
    if (!vertex->matches(*fragment)) {
        return std::unexpected("Vertex outputs do not match fragment inputs");
    }
    return {};
}

std::expected<void, std::string> ParticleRenderer::create_descriptors() {
    auto bindings = merge_descriptor_bindings({m_vertex_shader.get(), m_fragment_shader.get()});
    if (!bindings) {
        return std::unexpected(bindings.error());
    }

    bool has_uniforms = std::ranges::any_of(*bindings, [](const vk::DescriptorSetLayoutBinding& b) {
        return b.binding == FRAME_UNIFORMS_BINDING && b.descriptorType == vk::DescriptorType::eUniformBuffer;
    });
    if (bindings->size() != 1 || !has_uniforms) {
        return std::unexpected(std::format(
            "Particle shaders must declare exactly one uniform buffer at binding {}, found {} bindings",
            FRAME_UNIFORMS_BINDING, bindings->size()));
    }

    auto layout_info = vk::DescriptorSetLayoutCreateInfo().setBindings(*bindings);
    auto layout_res = m_device.createDescriptorSetLayout(layout_info);
    CHECK_VK_RESULT(layout_res, "Failed to create descriptor set layout: {}");
    m_descriptor_layout = layout_res.value;

    auto pool_size = vk::DescriptorPoolSize(vk::DescriptorType::eUniformBuffer, MAX_FRAMES_IN_FLIGHT);
    auto pool_info = vk::DescriptorPoolCreateInfo()
        .setMaxSets(MAX_FRAMES_IN_FLIGHT)
        .setPoolSizes(pool_size);
    auto pool_res = m_device.createDescriptorPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    std::array<vk::DescriptorSetLayout, MAX_FRAMES_IN_FLIGHT> layouts;
    layouts.fill(m_descriptor_layout);
    auto alloc_info = vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(m_descriptor_pool)
        .setSetLayouts(layouts);
    auto sets_res = m_device.allocateDescriptorSets(alloc_info);
    CHECK_VK_RESULT(sets_res, "Failed to allocate descriptor sets: {}");
    std::ranges::copy(sets_res.value, m_descriptor_sets.begin());

    return {};
}

std::expected<void, std::string> ParticleRenderer::create_pipeline() {
    auto pipeline_layout_info = vk::PipelineLayoutCreateInfo().setSetLayouts(m_descriptor_layout);
    auto layout_res = m_device.createPipelineLayout(pipeline_layout_info);
    CHECK_VK_RESULT(layout_res, "Failed to create pipeline layout: {}");
    m_pipeline_layout = layout_res.value;

    std::array shader_stages = {
        m_vertex_shader->stage_create_info(),
        m_fragment_shader->stage_create_info(),
    };

    auto vertex_layout = particle_vertex_layout();
    auto vertex_input_info = vk::PipelineVertexInputStateCreateInfo()
        .setVertexBindingDescriptions(vertex_layout.bindings)
        .setVertexAttributeDescriptions(vertex_layout.attributes);

    auto input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(vk::PrimitiveTopology::eTriangleList)
        .setPrimitiveRestartEnable(false);

    // Viewport and scissor are dynamic so a resize does not rebuild the pipeline
    auto viewport_state = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(1)
        .setScissorCount(1);

    auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
        .setDepthClampEnable(false)
        .setRasterizerDiscardEnable(false)
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise)
        .setDepthBiasEnable(false);

    auto multisampling = vk::PipelineMultisampleStateCreateInfo()
        .setSampleShadingEnable(false)
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    auto color_blend_attachment = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(vk::ColorComponentFlagBits::eR |
                           vk::ColorComponentFlagBits::eG |
                           vk::ColorComponentFlagBits::eB |
                           vk::ColorComponentFlagBits::eA)
        .setBlendEnable(true)
        .setSrcColorBlendFactor(vk::BlendFactor::eSrcAlpha)
        .setDstColorBlendFactor(vk::BlendFactor::eOneMinusSrcAlpha)
        .setColorBlendOp(vk::BlendOp::eAdd)
        .setSrcAlphaBlendFactor(vk::BlendFactor::eOne)
        .setDstAlphaBlendFactor(vk::BlendFactor::eZero)
        .setAlphaBlendOp(vk::BlendOp::eAdd);

    auto color_blending = vk::PipelineColorBlendStateCreateInfo()
        .setLogicOpEnable(false)
        .setAttachments(color_blend_attachment);

    std::array dynamic_states = {vk::DynamicState::eViewport, vk::DynamicState::eScissor};
    auto dynamic_state = vk::PipelineDynamicStateCreateInfo().setDynamicStates(dynamic_states);

    auto pipeline_info = vk::GraphicsPipelineCreateInfo()
        .setStages(shader_stages)
        .setPVertexInputState(&vertex_input_info)
        .setPInputAssemblyState(&input_assembly)
        .setPViewportState(&viewport_state)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPColorBlendState(&color_blending)
        .setPDynamicState(&dynamic_state)
        .setLayout(m_pipeline_layout)
        .setRenderPass(m_surface.scene_pass())
        .setSubpass(0);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, pipeline_info);
    CHECK_VK_RESULT(pipeline_res, "Failed to create graphics pipeline: {}");
    m_pipeline = pipeline_res.value;

    Logger::instance().debug("Created particle pipeline");
    return {};
}

std::expected<ParticleRenderer::HostBuffer, std::string> ParticleRenderer::create_host_buffer(
    vk::DeviceSize size,
    vk::BufferUsageFlags usage
) {
    HostBuffer host_buffer;
    host_buffer.size = size;

    auto buffer_info = vk::BufferCreateInfo()
        .setSize(size)
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive);
    auto buffer_res = m_device.createBuffer(buffer_info);
    CHECK_VK_RESULT(buffer_res, "Failed to create buffer: {}");
    host_buffer.buffer = buffer_res.value;

    auto requirements = m_device.getBufferMemoryRequirements(host_buffer.buffer);
    auto memory_type = m_context->find_memory_type(
        requirements.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
    );
    if (!memory_type) {
        destroy_host_buffer(host_buffer);
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(requirements.size)
        .setMemoryTypeIndex(*memory_type);
    auto memory_res = m_device.allocateMemory(alloc_info);
    if (memory_res.result != vk::Result::eSuccess) {
        destroy_host_buffer(host_buffer);
        return std::unexpected(std::format("Failed to allocate buffer memory: {}", vk::to_string(memory_res.result)));
    }
    host_buffer.memory = memory_res.value;

    if (auto bind_res = m_device.bindBufferMemory(host_buffer.buffer, host_buffer.memory, 0);
        bind_res != vk::Result::eSuccess) {
        destroy_host_buffer(host_buffer);
        return std::unexpected(std::format("Failed to bind buffer memory: {}", vk::to_string(bind_res)));
    }

    // Persistently mapped; coherent memory needs no flush
    auto map_res = m_device.mapMemory(host_buffer.memory, 0, size);
    if (map_res.result != vk::Result::eSuccess) {
        destroy_host_buffer(host_buffer);
        return std::unexpected(std::format("Failed to map buffer memory: {}", vk::to_string(map_res.result)));
    }
    host_buffer.mapped = map_res.value;

    return host_buffer;
}

void ParticleRenderer::destroy_host_buffer(HostBuffer& host_buffer) {
    if (host_buffer.mapped) {
        m_device.unmapMemory(host_buffer.memory);
        host_buffer.mapped = nullptr;
    }
    if (host_buffer.buffer) {
        m_device.destroyBuffer(host_buffer.buffer);
        host_buffer.buffer = nullptr;
    }
    if (host_buffer.memory) {
        m_device.freeMemory(host_buffer.memory);
        host_buffer.memory = nullptr;
    }
}

std::expected<void, std::string> ParticleRenderer::create_buffers() {
    auto quad = create_host_buffer(sizeof(QUAD_CORNERS), vk::BufferUsageFlagBits::eVertexBuffer);
    if (!quad) {
        return std::unexpected(std::format("Quad buffer: {}", quad.error()));
    }
    m_quad_buffer = *quad;
    std::memcpy(m_quad_buffer.mapped, QUAD_CORNERS.data(), sizeof(QUAD_CORNERS));

    const vk::DeviceSize instance_size = static_cast<vk::DeviceSize>(m_particle_count) * sizeof(Particle);

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i) {
        auto instances = create_host_buffer(instance_size, vk::BufferUsageFlagBits::eVertexBuffer);
        if (!instances) {
            return std::unexpected(std::format("Instance buffer: {}", instances.error()));
        }
        m_instance_buffers[i] = *instances;

        auto uniforms = create_host_buffer(sizeof(FrameUniforms), vk::BufferUsageFlagBits::eUniformBuffer);
        if (!uniforms) {
            return std::unexpected(std::format("Uniform buffer: {}", uniforms.error()));
        }
        m_uniform_buffers[i] = *uniforms;

        auto buffer_info = vk::DescriptorBufferInfo()
            .setBuffer(m_uniform_buffers[i].buffer)
            .setOffset(0)
            .setRange(sizeof(FrameUniforms));

        auto write = vk::WriteDescriptorSet()
            .setDstSet(m_descriptor_sets[i])
            .setDstBinding(FRAME_UNIFORMS_BINDING)
            .setDstArrayElement(0)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setBufferInfo(buffer_info);

        m_device.updateDescriptorSets(write, {});
    }

    Logger::instance().debug("Allocated {} x {} bytes of instance data", MAX_FRAMES_IN_FLIGHT, instance_size);
    return {};
}

std::expected<void, std::string> ParticleRenderer::create_commands() {
    auto pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context->graphics_family())
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer);
    auto pool_res = m_device.createCommandPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create command pool: {}");
    m_command_pool = pool_res.value;

    auto alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(m_command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(MAX_FRAMES_IN_FLIGHT);
    auto buffers_res = m_device.allocateCommandBuffers(alloc_info);
    CHECK_VK_RESULT(buffers_res, "Failed to allocate command buffers: {}");
    m_command_buffers = std::move(buffers_res.value);

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i) {
        auto semaphore_res = m_device.createSemaphore({});
        CHECK_VK_RESULT(semaphore_res, "Failed to create image-available semaphore: {}");
        m_image_available[i] = semaphore_res.value;

        // Signaled so the first wait on each slot returns immediately
        auto fence_res = m_device.createFence(vk::FenceCreateInfo().setFlags(vk::FenceCreateFlagBits::eSignaled));
        CHECK_VK_RESULT(fence_res, "Failed to create in-flight fence: {}");
        m_in_flight_fences[i] = fence_res.value;
    }
    return {};
}

std::expected<void, std::string> ParticleRenderer::create_image_sync() {
    for (auto& semaphore : m_render_finished) {
        m_device.destroySemaphore(semaphore);
    }
    m_render_finished.clear();

    const uint32_t image_count = m_surface.image_count();
    for (uint32_t i = 0; i < image_count; ++i) {
        auto semaphore_res = m_device.createSemaphore({});
        CHECK_VK_RESULT(semaphore_res, "Failed to create render-finished semaphore: {}");
        m_render_finished.push_back(semaphore_res.value);
    }
    m_images_in_flight.assign(image_count, nullptr);
    return {};
}

std::expected<void, FrameError> ParticleRenderer::render(const ParticleStore& store, float time, Overlay* overlay) {
    if (m_needs_reconfigure) {
        if (auto result = resize(m_window->framebuffer_extent()); !result) {
            Logger::instance().warn("Deferred reconfigure failed: {}", result.error());
            return std::unexpected(FrameError::SurfaceLost);
        }
    }

    const uint32_t frame = m_current_frame;
    auto fence = m_in_flight_fences[frame];

    auto wait_res = m_device.waitForFences(fence, true, FRAME_TIMEOUT_NS);
    if (auto error = classify_frame_result(wait_res)) {
        Logger::instance().debug("Waiting for frame {} returned {}", frame, vk::to_string(wait_res));
        return std::unexpected(*error);
    }

    // (a) instance data, (b) uniforms; this slot's previous frame has finished reading both
    auto bytes = store.as_bytes();
    const auto upload_size = std::min<vk::DeviceSize>(bytes.size(), m_instance_buffers[frame].size);
    std::memcpy(m_instance_buffers[frame].mapped, bytes.data(), upload_size);
    const uint32_t instance_count = static_cast<uint32_t>(upload_size / sizeof(Particle));

    auto extent = m_surface.extent();
    FrameUniforms uniforms{
        .screen_size = glm::vec2(static_cast<float>(extent.width), static_cast<float>(extent.height)),
        .elapsed_time = time,
        .padding = 0.0f
    };
    std::memcpy(m_uniform_buffers[frame].mapped, &uniforms, sizeof(uniforms));

    // (c) acquire
    auto acquired = m_surface.acquire(m_image_available[frame], FRAME_TIMEOUT_NS);
    if (auto error = classify_frame_result(acquired.result)) {
        m_surface_lost = acquired.result == vk::Result::eErrorSurfaceLostKHR;
        Logger::instance().debug("Acquire returned {}", vk::to_string(acquired.result));
        return std::unexpected(*error);
    }
    if (acquired.result == vk::Result::eSuboptimalKHR) {
        m_needs_reconfigure = true;
    }
    const uint32_t image_index = acquired.image_index;

    if (auto image_fence = m_images_in_flight[image_index]; image_fence && image_fence != fence) {
        auto image_wait = m_device.waitForFences(image_fence, true, FRAME_TIMEOUT_NS);
        if (auto error = classify_frame_result(image_wait)) {
            // The acquire semaphore is already pending; the slot must start clean next time
            reset_frame_sync(frame);
            return std::unexpected(*error);
        }
    }
    m_images_in_flight[image_index] = fence;

    if (auto reset_res = m_device.resetFences(fence); reset_res != vk::Result::eSuccess) {
        return std::unexpected(classify_frame_result(reset_res).value_or(FrameError::Other));
    }

    // (d) record
    auto cmd = m_command_buffers[frame];
    if (auto recorded = record(cmd, frame, image_index, instance_count, time, overlay); !recorded) {
        // Nothing was submitted: the fence stays unsignaled and the acquire semaphore pending
        m_images_in_flight[image_index] = nullptr;
        reset_frame_sync(frame);
        return recorded;
    }

    // (e) submit and present
    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(m_image_available[frame])
        .setWaitDstStageMask(wait_stage)
        .setCommandBuffers(cmd)
        .setSignalSemaphores(m_render_finished[image_index]);

    auto submit_res = m_context->graphics_queue().submit(submit_info, fence);
    if (auto error = classify_frame_result(submit_res)) {
        Logger::instance().error("Queue submit failed: {}", vk::to_string(submit_res));
        m_images_in_flight[image_index] = nullptr;
        reset_frame_sync(frame);
        return std::unexpected(*error);
    }

    m_current_frame = (m_current_frame + 1) % MAX_FRAMES_IN_FLIGHT;

    auto present_res = m_surface.present(m_context->graphics_queue(), m_render_finished[image_index], image_index);
    if (present_res == vk::Result::eSuboptimalKHR) {
        m_needs_reconfigure = true;
    }
    if (auto error = classify_frame_result(present_res)) {
        m_surface_lost = present_res == vk::Result::eErrorSurfaceLostKHR;
        Logger::instance().debug("Present returned {}", vk::to_string(present_res));
        return std::unexpected(*error);
    }
    return {};
}

std::expected<void, FrameError> ParticleRenderer::record(
    vk::CommandBuffer cmd,
    uint32_t frame,
    uint32_t image_index,
    uint32_t instance_count,
    float time,
    Overlay* overlay
) {
    auto extent = m_surface.extent();

    if (auto reset_res = cmd.reset(); reset_res != vk::Result::eSuccess) {
        Logger::instance().error("Failed to reset command buffer: {}", vk::to_string(reset_res));
        return std::unexpected(classify_frame_result(reset_res).value_or(FrameError::Other));
    }
    if (auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        begin_res != vk::Result::eSuccess) {
        Logger::instance().error("Failed to begin command buffer: {}", vk::to_string(begin_res));
        return std::unexpected(classify_frame_result(begin_res).value_or(FrameError::Other));
    }

    vk::ClearValue clear_color{vk::ClearColorValue(std::array<float, 4>{0.0f, 0.0f, 0.0f, 1.0f})};
    auto scene_begin = vk::RenderPassBeginInfo()
        .setRenderPass(m_surface.scene_pass())
        .setFramebuffer(m_surface.framebuffer(image_index))
        .setRenderArea(vk::Rect2D({0, 0}, extent))
        .setClearValues(clear_color);

    cmd.beginRenderPass(scene_begin, vk::SubpassContents::eInline);

    cmd.setViewport(0, vk::Viewport(0.0f, 0.0f, static_cast<float>(extent.width), static_cast<float>(extent.height), 0.0f, 1.0f));
    cmd.setScissor(0, vk::Rect2D({0, 0}, extent));

    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, m_pipeline);
    cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics, m_pipeline_layout, 0, m_descriptor_sets[frame], {});

    std::array<vk::Buffer, 2> vertex_buffers = {m_quad_buffer.buffer, m_instance_buffers[frame].buffer};
    std::array<vk::DeviceSize, 2> offsets = {0, 0};
    cmd.bindVertexBuffers(0, vertex_buffers, offsets);

    cmd.draw(QUAD_VERTEX_COUNT, instance_count, 0, 0);
    cmd.endRenderPass();

    if (overlay) {
        FrameContext context{
            .device = m_device,
            .queue = m_context->graphics_queue(),
            .command_buffer = cmd,
            .target_view = m_surface.image_view(image_index),
            .framebuffer = m_surface.framebuffer(image_index),
            .render_pass = m_surface.overlay_pass(),
            .width = extent.width,
            .height = extent.height,
            .time = time,
        };
        overlay->draw(context);
    } else {
        // Still needed for the transition to the presentation layout
        auto overlay_begin = vk::RenderPassBeginInfo()
            .setRenderPass(m_surface.overlay_pass())
            .setFramebuffer(m_surface.framebuffer(image_index))
            .setRenderArea(vk::Rect2D({0, 0}, extent));
        cmd.beginRenderPass(overlay_begin, vk::SubpassContents::eInline);
        cmd.endRenderPass();
    }

    if (auto end_res = cmd.end(); end_res != vk::Result::eSuccess) {
        Logger::instance().error("Failed to end command buffer: {}", vk::to_string(end_res));
        return std::unexpected(classify_frame_result(end_res).value_or(FrameError::Other));
    }
    return {};
}

void ParticleRenderer::reset_frame_sync(uint32_t frame) {
    if (auto wait_res = m_device.waitIdle(); wait_res != vk::Result::eSuccess) {
        Logger::instance().warn("waitIdle while resetting frame {} returned {}", frame, vk::to_string(wait_res));
    }

    m_device.destroyFence(m_in_flight_fences[frame]);
    auto fence_res = m_device.createFence(vk::FenceCreateInfo().setFlags(vk::FenceCreateFlagBits::eSignaled));
    m_in_flight_fences[frame] = fence_res.value;

    m_device.destroySemaphore(m_image_available[frame]);
    auto semaphore_res = m_device.createSemaphore({});
    m_image_available[frame] = semaphore_res.value;

    if (fence_res.result != vk::Result::eSuccess || semaphore_res.result != vk::Result::eSuccess) {
        Logger::instance().critical("Could not recreate synchronization for frame {}", frame);
    }
}

std::expected<void, std::string> ParticleRenderer::resize(vk::Extent2D extent) {
    if (!is_presentable(extent)) {
        Logger::instance().trace("Ignoring resize to {}x{}", extent.width, extent.height);
        return {};
    }

    if (auto result = m_surface.configure(extent); !result) {
        return result;
    }
    m_needs_reconfigure = false;
    return create_image_sync();
}

std::expected<void, std::string> ParticleRenderer::handle_surface_lost() {
    if (m_surface_lost) {
        m_surface_lost = false;
        if (auto result = m_surface.recreate_surface(); !result) {
            return result;
        }
        m_needs_reconfigure = false;
        return create_image_sync();
    }
    return resize(m_window->framebuffer_extent());
}

void ParticleRenderer::cleanup() {
    if (!m_device) {
        return;
    }

    if (auto wait_res = m_device.waitIdle(); wait_res != vk::Result::eSuccess) {
        Logger::instance().warn("waitIdle during renderer cleanup returned {}", vk::to_string(wait_res));
    }

    for (auto& semaphore : m_render_finished) {
        m_device.destroySemaphore(semaphore);
    }
    m_render_finished.clear();
    m_images_in_flight.clear();

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; ++i) {
        if (m_in_flight_fences[i]) {
            m_device.destroyFence(m_in_flight_fences[i]);
            m_in_flight_fences[i] = nullptr;
        }
        if (m_image_available[i]) {
            m_device.destroySemaphore(m_image_available[i]);
            m_image_available[i] = nullptr;
        }
        destroy_host_buffer(m_instance_buffers[i]);
        destroy_host_buffer(m_uniform_buffers[i]);
    }
    destroy_host_buffer(m_quad_buffer);

    if (m_command_pool) {
        // Frees the command buffers as well
        m_device.destroyCommandPool(m_command_pool);
        m_command_pool = nullptr;
        m_command_buffers.clear();
    }
    if (m_descriptor_pool) {
        m_device.destroyDescriptorPool(m_descriptor_pool);
        m_descriptor_pool = nullptr;
    }
    if (m_pipeline) {
        m_device.destroyPipeline(m_pipeline);
        m_pipeline = nullptr;
    }
    if (m_pipeline_layout) {
        m_device.destroyPipelineLayout(m_pipeline_layout);
        m_pipeline_layout = nullptr;
    }
    if (m_descriptor_layout) {
        m_device.destroyDescriptorSetLayout(m_descriptor_layout);
        m_descriptor_layout = nullptr;
    }
    m_fragment_shader.reset();
    m_vertex_shader.reset();
}

} // namespace tofu
