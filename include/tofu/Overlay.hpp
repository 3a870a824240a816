#pragma once

#include <tofu/Common.hpp>
#include <cstdint>

namespace tofu {

/**
 * @brief Everything an overlay needs to draw on top of the current frame
 *
 * `command_buffer` is in the recording state, outside any render pass. The
 * target image holds the finished particle pass in color-attachment layout;
 * `render_pass` loads it and leaves it ready for presentation.
 */
struct FrameContext {
    vk::Device device;
    vk::Queue queue;
    vk::CommandBuffer command_buffer;
    vk::ImageView target_view;
    vk::Framebuffer framebuffer;
    vk::RenderPass render_pass;
    uint32_t width;
    uint32_t height;
    float time;
};

/**
 * @brief Hook for drawing UI after the particles
 *
 * The renderer calls draw() once per frame, in the same command buffer as the
 * particle pass. An implementation must begin and end `render_pass` itself.
 */
class Overlay {
public:
    virtual ~Overlay() = default;

    virtual void draw(const FrameContext& frame) = 0;
};

} // namespace tofu
