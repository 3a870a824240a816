// VulkanContext.cpp

#include <tofu/VulkanContext.hpp>
#include <tofu/Logger.hpp>
#include <array>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <tuple>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace tofu {

namespace {

#ifdef NDEBUG
constexpr bool ENABLE_VALIDATION = false;
#else
constexpr bool ENABLE_VALIDATION = true;
#endif

constexpr std::array VALIDATION_LAYERS = {
    "VK_LAYER_KHRONOS_validation"
};

VKAPI_ATTR vk::Bool32 VKAPI_CALL debug_callback(
    vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
    [[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
    const vk::DebugUtilsMessengerCallbackDataEXT* callback_data,
    [[maybe_unused]] void* user_data)
{
    auto& logger = Logger::instance();
    switch (severity) {
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose:
            logger.trace("[VulkanDebug] {}", callback_data->pMessage);
            break;
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo:
            logger.debug("[VulkanDebug] {}", callback_data->pMessage);
            break;
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning:
            logger.warn("[VulkanDebug] {}", callback_data->pMessage);
            break;
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eError:
            logger.error("[VulkanDebug] {}", callback_data->pMessage);
            break;
        default:
            logger.info("[VulkanDebug] {}", callback_data->pMessage);
            break;
    }

    return vk::False;
}

bool check_validation_layer_support()
{
    auto available_res = vk::enumerateInstanceLayerProperties();
    if (available_res.result != vk::Result::eSuccess) {
        Logger::instance().warn("Could not query instance layers: {}", vk::to_string(available_res.result));
        return false;
    }
    for (const char* layer_name : VALIDATION_LAYERS) {
        bool found = false;
        for (const auto& layer : available_res.value) {
            if (std::strcmp(layer_name, layer.layerName) == 0) {
                found = true;
                break;
            }
        }
        if (!found) {
            Logger::instance().warn("Validation layer {} not available", layer_name);
            return false;
        }
    }
    return true;
}

vk::DebugUtilsMessengerCreateInfoEXT make_debug_messenger_create_info()
{
    return vk::DebugUtilsMessengerCreateInfoEXT()
        .setMessageSeverity(
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
        .setMessageType(
            vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
            vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
            vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
        .setPfnUserCallback(debug_callback);
}

vk::Instance create_instance(std::string_view title, bool& validation_enabled)
{
    static vk::detail::DynamicLoader dl;
    auto vkGetInstanceProcAddr = dl.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

    std::string app_name(title);
    auto app_info = vk::ApplicationInfo()
        .setPApplicationName(app_name.c_str())
        .setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
        .setPEngineName("Tofu")
        .setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
        .setApiVersion(VK_API_VERSION_1_3);

    // Surface extensions come from GLFW; none when GLFW is not initialized
    uint32_t glfw_extension_count = 0;
    const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_extension_count);

    std::vector<const char*> extensions;
    if (glfw_extensions) {
        extensions.assign(glfw_extensions, glfw_extensions + glfw_extension_count);
    }

    validation_enabled = false;
    if constexpr (ENABLE_VALIDATION) {
        validation_enabled = check_validation_layer_support();
        if (validation_enabled) {
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        }
    }

    Logger::instance().debug("Instance extensions:");
    for (const auto* ext : extensions) {
        Logger::instance().debug("  {}", ext);
    }

    auto create_info = vk::InstanceCreateInfo()
        .setPApplicationInfo(&app_info)
        .setPEnabledExtensionNames(extensions);

    auto debug_create_info = make_debug_messenger_create_info();
    if (validation_enabled) {
        create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
        create_info.setPNext(&debug_create_info);
        Logger::instance().info("Validation layers enabled");
    }

    auto instance_res = vk::createInstance(create_info);
    if (instance_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to create instance: {}", vk::to_string(instance_res.result))};
    }
    VULKAN_HPP_DEFAULT_DISPATCHER.init(instance_res.value);
    Logger::instance().debug("Created Vulkan instance");
    return instance_res.value;
}

vk::DebugUtilsMessengerEXT create_debug_messenger(vk::Instance instance, bool validation_enabled)
{
    if (!validation_enabled) {
        return nullptr;
    }

    auto messenger_res = instance.createDebugUtilsMessengerEXT(make_debug_messenger_create_info());
    if (messenger_res.result != vk::Result::eSuccess) {
        Logger::instance().warn("Failed to create debug messenger: {}", vk::to_string(messenger_res.result));
        return nullptr;
    }
    Logger::instance().debug("Created debug messenger");
    return messenger_res.value;
}

/// False when GLFW is not initialized or has no Vulkan surface support (headless tests).
bool can_present()
{
    uint32_t count = 0;
    return glfwGetRequiredInstanceExtensions(&count) != nullptr;
}

std::optional<uint32_t> find_graphics_family(vk::Instance instance, vk::PhysicalDevice physical_device)
{
    auto queue_families = physical_device.getQueueFamilyProperties();
    const bool headless = !can_present();

    for (uint32_t i = 0; i < queue_families.size(); i++) {
        if (!(queue_families[i].queueFlags & vk::QueueFlagBits::eGraphics)) {
            continue;
        }
        if (headless ||
            glfwGetPhysicalDevicePresentationSupport(
                static_cast<VkInstance>(instance), static_cast<VkPhysicalDevice>(physical_device), i)) {
            return i;
        }
    }
    return std::nullopt;
}

std::pair<vk::PhysicalDevice, uint32_t> select_physical_device(vk::Instance instance)
{
    auto devices_res = instance.enumeratePhysicalDevices();
    if (devices_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to enumerate physical devices: {}", vk::to_string(devices_res.result))};
    }

    // Discrete GPUs first, then integrated, then anything with a usable queue
    for (auto wanted : {vk::PhysicalDeviceType::eDiscreteGpu, vk::PhysicalDeviceType::eIntegratedGpu}) {
        for (const auto& dev : devices_res.value) {
            auto props = dev.getProperties();
            if (props.deviceType != wanted) {
                continue;
            }
            if (auto family = find_graphics_family(instance, dev)) {
                Logger::instance().info("Selected GPU: {} ({})", props.deviceName.data(), vk::to_string(props.deviceType));
                return {dev, *family};
            }
        }
    }
    for (const auto& dev : devices_res.value) {
        if (auto family = find_graphics_family(instance, dev)) {
            Logger::instance().info("Selected device: {}", dev.getProperties().deviceName.data());
            return {dev, *family};
        }
    }

    throw std::runtime_error{"No suitable physical device found"};
}

vk::Device create_logical_device(vk::PhysicalDevice physical_device, uint32_t graphics_family)
{
    float queue_priority = 1.0f;
    auto queue_create_info = vk::DeviceQueueCreateInfo()
        .setQueueFamilyIndex(graphics_family)
        .setQueueCount(1)
        .setPQueuePriorities(&queue_priority);

    std::array extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    auto create_info = vk::DeviceCreateInfo()
        .setQueueCreateInfos(queue_create_info)
        .setPEnabledExtensionNames(extensions);

    auto device_res = physical_device.createDevice(create_info);
    if (device_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{std::format("Failed to create device: {}", vk::to_string(device_res.result))};
    }
    Logger::instance().debug("Created logical device");
    return device_res.value;
}

} // anonymous namespace

VulkanContext::VulkanContext(std::string_view title)
{
    bool validation_enabled = false;
    m_instance = create_instance(title, validation_enabled);
    m_debug_messenger = create_debug_messenger(m_instance, validation_enabled);
    std::tie(m_physical_device, m_graphics_family) = select_physical_device(m_instance);
    m_device = create_logical_device(m_physical_device, m_graphics_family);
    VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
    m_graphics_queue = m_device.getQueue(m_graphics_family, 0);

    Logger::instance().info("VulkanContext initialized (VK_HEADER_VERSION {}, graphics family {})",
        VK_HEADER_VERSION, m_graphics_family);
}

VulkanContext::~VulkanContext()
{
    if (m_device) {
        m_device.destroy();
        Logger::instance().trace("Destroyed logical device");
    }

    if (m_debug_messenger) {
        m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
        Logger::instance().trace("Destroyed debug messenger");
    }

    if (m_instance) {
        m_instance.destroy();
        Logger::instance().trace("Destroyed instance");
    }
}

std::expected<uint32_t, std::string> VulkanContext::find_memory_type(
    uint32_t type_bits,
    vk::MemoryPropertyFlags properties) const
{
    auto mem_props = m_physical_device.getMemoryProperties();
    for (uint32_t i = 0; i < mem_props.memoryTypeCount; i++) {
        if ((type_bits & (1u << i)) &&
            (mem_props.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }
    return std::unexpected(std::format("No memory type with properties {}", vk::to_string(properties)));
}

} // namespace tofu
