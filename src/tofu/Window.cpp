#include <tofu/Window.hpp>
#include <tofu/Logger.hpp>
#include <string>
#include <utility>

namespace tofu {

namespace {

void glfw_error_callback(int code, const char* description) {
    Logger::instance().error("GLFW error {}: {}", code, description);
}

} // anonymous namespace

std::expected<void, std::string> Window::initialize_glfw() {
    static bool initialized = false;
    if (initialized) {
        return {};
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        return std::unexpected("Failed to initialize GLFW");
    }
    if (!glfwVulkanSupported()) {
        return std::unexpected("GLFW reports no Vulkan support");
    }
    initialized = true;
    Logger::instance().debug("GLFW {} initialized", glfwGetVersionString());
    return {};
}

std::expected<Window, std::string> Window::create(int width, int height, std::string_view title) {
    if (auto result = initialize_glfw(); !result) {
        return std::unexpected(result.error());
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    std::string title_str(title);
    GLFWwindow* handle = glfwCreateWindow(width, height, title_str.c_str(), nullptr, nullptr);
    if (!handle) {
        return std::unexpected("Failed to create GLFW window");
    }

    Logger::instance().info("Opened window '{}' ({}x{})", title, width, height);
    return Window(handle);
}

Window::Window(GLFWwindow* handle)
    : m_handle(handle)
    , m_resized(false)
{
    // The user pointer is rebound whenever the window object moves
    glfwSetWindowUserPointer(m_handle, this);
    glfwSetFramebufferSizeCallback(m_handle, framebuffer_size_callback);
}

Window::~Window() {
    if (m_handle) {
        glfwDestroyWindow(m_handle);
    }
}

Window::Window(Window&& other) noexcept
    : m_handle(std::exchange(other.m_handle, nullptr))
    , m_resized(other.m_resized)
{
    if (m_handle) {
        glfwSetWindowUserPointer(m_handle, this);
    }
}

Window& Window::operator=(Window&& other) noexcept {
    if (this != &other) {
        if (m_handle) {
            glfwDestroyWindow(m_handle);
        }
        m_handle = std::exchange(other.m_handle, nullptr);
        m_resized = other.m_resized;
        if (m_handle) {
            glfwSetWindowUserPointer(m_handle, this);
        }
    }
    return *this;
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_handle);
}

vk::Extent2D Window::framebuffer_extent() const {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_handle, &width, &height);
    return vk::Extent2D{static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}

bool Window::take_resized() {
    return std::exchange(m_resized, false);
}

void Window::framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    if (!self) return;

    self->m_resized = true;
    Logger::instance().trace("Framebuffer resized to {}x{}", width, height);
}

} // namespace tofu
