#include <tofu/FrameError.hpp>

namespace tofu {

std::string_view to_string(FrameError error) {
    switch (error) {
        case FrameError::SurfaceLost: return "surface lost";
        case FrameError::OutOfMemory: return "out of memory";
        case FrameError::Timeout: return "timeout";
        case FrameError::Other: break;
    }
    return "other";
}

FrameAction frame_action(FrameError error) {
    switch (error) {
        case FrameError::SurfaceLost: return FrameAction::Reconfigure;
        case FrameError::OutOfMemory: return FrameAction::Terminate;
        case FrameError::Timeout:
        case FrameError::Other: break;
    }
    return FrameAction::Skip;
}

bool is_presentable(vk::Extent2D extent) {
    return extent.width > 0 && extent.height > 0;
}

std::optional<FrameError> classify_frame_result(vk::Result result) {
    switch (result) {
        case vk::Result::eSuccess:
        case vk::Result::eSuboptimalKHR:
            return std::nullopt;
        case vk::Result::eErrorOutOfDateKHR:
        case vk::Result::eErrorSurfaceLostKHR:
            return FrameError::SurfaceLost;
        case vk::Result::eErrorOutOfHostMemory:
        case vk::Result::eErrorOutOfDeviceMemory:
            return FrameError::OutOfMemory;
        case vk::Result::eTimeout:
        case vk::Result::eNotReady:
            return FrameError::Timeout;
        default:
            return FrameError::Other;
    }
}

} // namespace tofu
