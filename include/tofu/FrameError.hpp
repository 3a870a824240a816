#pragma once

#include <vulkan/vulkan.hpp>
#include <optional>
#include <string_view>

namespace tofu {

/// Why a frame could not be produced.
enum class FrameError {
    SurfaceLost,   ///< Swapchain out of date or surface lost; reconfigure and skip the frame
    OutOfMemory,   ///< Host or device memory exhausted; fatal
    Timeout,       ///< Acquire timed out or no image was ready
    Other          ///< Anything else; log and skip the frame
};

[[nodiscard]] std::string_view to_string(FrameError error);

/// What the render loop does after a failed frame.
enum class FrameAction {
    Reconfigure,   ///< Rebuild the swapchain (and surface if lost), skip the frame
    Terminate,     ///< Stop rendering and exit with a failure
    Skip           ///< Log and carry on with the next frame
};

[[nodiscard]] FrameAction frame_action(FrameError error);

/// A swapchain can only be built for a non-empty extent; minimized windows report 0x0.
[[nodiscard]] bool is_presentable(vk::Extent2D extent);

/**
 * @brief Classify a Vulkan result from acquire, submit or present
 *
 * eSuccess and eSuboptimalKHR are not failures and yield nothing; a suboptimal
 * swapchain is reconfigured by the renderer after the frame.
 */
[[nodiscard]] std::optional<FrameError> classify_frame_result(vk::Result result);

} // namespace tofu
