#ifndef TOFU_VULKANCONTEXT_HPP
#define TOFU_VULKANCONTEXT_HPP

#include "Common.hpp"
#include <string_view>

namespace tofu {

/**
 * @brief Instance, device and the single graphics queue the renderer uses
 *
 * The graphics queue family is also required to support presentation, so one
 * queue serves submit and present.
 */
class VulkanContext
{
public:
	explicit VulkanContext(std::string_view title);
	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] uint32_t graphics_family() const { return m_graphics_family; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }

	/**
	 * @brief Find a memory type index matching a requirement mask and property flags
	 *
	 * @return Memory type index, or an error if none qualifies
	 */
	[[nodiscard]] std::expected<uint32_t, std::string> find_memory_type(
		uint32_t type_bits,
		vk::MemoryPropertyFlags properties) const;

private:
	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	uint32_t m_graphics_family;
	vk::Device m_device;
	vk::Queue m_graphics_queue;
};

} // namespace tofu

#endif // TOFU_VULKANCONTEXT_HPP
