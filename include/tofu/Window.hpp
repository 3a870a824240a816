#pragma once

#include <tofu/Common.hpp>
#include <string_view>

namespace tofu {

/**
 * @brief GLFW window without a client API
 *
 * Only owns the native window. Presentation (surface, swapchain) lives in
 * Surface so it can be torn down and rebuilt independently.
 */
class Window {
public:
    /**
     * @brief Open a resizable window
     *
     * @param width Initial width in screen coordinates
     * @param height Initial height in screen coordinates
     * @param title Window title
     * @return Window instance or error message
     */
    static std::expected<Window, std::string> create(int width, int height, std::string_view title);

    /**
     * @brief Initialize GLFW once per process
     *
     * Must run before VulkanContext is created so the instance gets the
     * surface extensions GLFW requires.
     */
    static std::expected<void, std::string> initialize_glfw();

    ~Window();

    // Non-copyable, movable
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) noexcept;
    Window& operator=(Window&&) noexcept;

    [[nodiscard]] bool should_close() const;

    /// Current framebuffer size in pixels; zero while minimized.
    [[nodiscard]] vk::Extent2D framebuffer_extent() const;

    /**
     * @brief Consume the resize flag set by the framebuffer-size callback
     *
     * @return true once after every resize
     */
    [[nodiscard]] bool take_resized();

    [[nodiscard]] GLFWwindow* handle() const { return m_handle; }

private:
    explicit Window(GLFWwindow* handle);

    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);

    GLFWwindow* m_handle;
    bool m_resized;
};

} // namespace tofu
