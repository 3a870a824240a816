#pragma once

#include <tofu/FrameError.hpp>
#include <tofu/Overlay.hpp>
#include <tofu/ParticleStore.hpp>
#include <tofu/Shader.hpp>
#include <tofu/Surface.hpp>
#include <tofu/VulkanContext.hpp>
#include <tofu/Window.hpp>
#include <array>
#include <expected>
#include <memory>

namespace tofu {

/**
 * @brief Draws the particle swarm as instanced, alpha-blended quad sprites
 *
 * Owns the presentation surface and everything needed for one draw per frame:
 * - a static 6-vertex unit quad (binding 0)
 * - per frame in flight: an instance buffer holding the particle array verbatim
 *   (binding 1, stride 64) and a FrameUniforms buffer (set 0, binding 0)
 * - the pipeline, built from Slang reflection and checked against the
 *   Particle record layout
 *
 * Buffers live in host-coherent memory and are written only after the frame
 * slot's fence has been waited on.
 */
class ParticleRenderer {
public:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;
    static constexpr uint32_t QUAD_VERTEX_COUNT = 6;
    static constexpr uint64_t FRAME_TIMEOUT_NS = 1'000'000'000;

    /**
     * @brief Create the renderer for a window
     *
     * @param context Vulkan context (must outlive the renderer)
     * @param window Window to present to (must outlive the renderer)
     * @param config Preferred surface format, present mode and size
     * @param particle_count Instances drawn per frame
     * @return Renderer or a description of what failed
     */
    static std::expected<std::unique_ptr<ParticleRenderer>, std::string> create(
        const VulkanContext& context,
        const Window& window,
        const SurfaceConfig& config,
        uint32_t particle_count
    );

    ~ParticleRenderer();

    ParticleRenderer(const ParticleRenderer&) = delete;
    ParticleRenderer& operator=(const ParticleRenderer&) = delete;
    ParticleRenderer(ParticleRenderer&&) = delete;
    ParticleRenderer& operator=(ParticleRenderer&&) = delete;

    /**
     * @brief Upload the store, draw it and present
     *
     * Order: instance upload, uniform upload, acquire, record (clear + one
     * instanced draw, then the overlay), submit, present.
     *
     * @param store Particles to draw
     * @param time Seconds since start, passed to the shaders
     * @param overlay Drawn after the particles when not null
     */
    std::expected<void, FrameError> render(const ParticleStore& store, float time, Overlay* overlay = nullptr);

    /// Reconfigure the surface; ignored while either dimension is zero.
    std::expected<void, std::string> resize(vk::Extent2D extent);

    /**
     * @brief Recover after a frame failed with FrameError::SurfaceLost
     *
     * Recreates the VkSurfaceKHR if the surface itself was lost, otherwise
     * reconfigures the swapchain for the window's current size.
     */
    std::expected<void, std::string> handle_surface_lost();

    [[nodiscard]] const Surface& surface() const { return m_surface; }
    [[nodiscard]] uint32_t particle_count() const { return m_particle_count; }

private:
    struct HostBuffer {
        vk::Buffer buffer;
        vk::DeviceMemory memory;
        void* mapped = nullptr;
        vk::DeviceSize size = 0;
    };

    ParticleRenderer(const VulkanContext& context, const Window& window, Surface surface, uint32_t particle_count);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> load_shaders();
    std::expected<void, std::string> create_descriptors();
    std::expected<void, std::string> create_pipeline();
    std::expected<void, std::string> create_buffers();
    std::expected<void, std::string> create_commands();
    std::expected<void, std::string> create_image_sync();

    std::expected<HostBuffer, std::string> create_host_buffer(vk::DeviceSize size, vk::BufferUsageFlags usage);
    void destroy_host_buffer(HostBuffer& buffer);

    std::expected<void, FrameError> record(
        vk::CommandBuffer cmd,
        uint32_t frame,
        uint32_t image_index,
        uint32_t instance_count,
        float time,
        Overlay* overlay
    );

    /// Replace the frame's fence and acquire semaphore after a failed submit.
    void reset_frame_sync(uint32_t frame);

    void cleanup();

    const VulkanContext* m_context;
    const Window* m_window;
    vk::Device m_device;
    Surface m_surface;
    uint32_t m_particle_count;

    std::unique_ptr<Shader> m_vertex_shader;
    std::unique_ptr<Shader> m_fragment_shader;
    vk::DescriptorSetLayout m_descriptor_layout;
    vk::PipelineLayout m_pipeline_layout;
    vk::Pipeline m_pipeline;
    vk::DescriptorPool m_descriptor_pool;
    std::array<vk::DescriptorSet, MAX_FRAMES_IN_FLIGHT> m_descriptor_sets{};

    HostBuffer m_quad_buffer;
    std::array<HostBuffer, MAX_FRAMES_IN_FLIGHT> m_instance_buffers{};
    std::array<HostBuffer, MAX_FRAMES_IN_FLIGHT> m_uniform_buffers{};

    vk::CommandPool m_command_pool;
    std::vector<vk::CommandBuffer> m_command_buffers;  // One per frame in flight
    std::array<vk::Semaphore, MAX_FRAMES_IN_FLIGHT> m_image_available{};
    std::array<vk::Fence, MAX_FRAMES_IN_FLIGHT> m_in_flight_fences{};
    std::vector<vk::Semaphore> m_render_finished;  // One per swapchain image
    std::vector<vk::Fence> m_images_in_flight;     // Fence last used with each image

    uint32_t m_current_frame = 0;
    bool m_needs_reconfigure = false;
    bool m_surface_lost = false;
};

} // namespace tofu
