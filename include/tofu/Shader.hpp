#ifndef TOFU_SHADER_HPP
#define TOFU_SHADER_HPP
#include <expected>
#include <slang.h>
#include <string_view>
#include <variant>
#include <vector>

#include "Common.hpp"
#include "VertexLayout.hpp"

namespace tofu {

struct DescriptorInfo
{
	std::string name;
	std::size_t size; // Size per descriptor
	uint32_t binding;
	uint32_t set;
	uint32_t descriptor_count; // 1 if not array
	vk::DescriptorType type;
	vk::ShaderStageFlags stages;
};

struct FragmentDetails;

struct VertexDetails
{
	std::vector<StageVariable> inputs;
	std::vector<StageVariable> outputs;

	explicit VertexDetails(slang::IComponentType* linked);
	[[nodiscard]] bool matches(const FragmentDetails& next) const;
};

struct FragmentDetails
{
	std::vector<StageVariable> inputs;
	std::vector<StageVariable> outputs; // Color attachments

	explicit FragmentDetails(slang::IComponentType* linked);
};

using ShaderDetails = std::variant<VertexDetails, FragmentDetails>;

/**
 * @brief A Slang entry point compiled to SPIR-V with its reflection data
 *
 * Modules are looked up on SHADER_DIR. Only vertex and fragment entry points
 * are supported.
 */
class Shader
{
public:
	static std::expected<Shader, std::string> create(vk::Device device, std::string_view name,
													 std::string_view entry_point = "main");

	[[nodiscard]] const std::vector<DescriptorInfo>& descriptor_infos() const { return m_descriptor_infos; }
	[[nodiscard]] vk::ShaderModule module() const { return m_module; }
	[[nodiscard]] vk::ShaderStageFlagBits stage() const { return m_stage; }
	[[nodiscard]] const ShaderDetails& details() const { return m_details; }
	[[nodiscard]] vk::PipelineShaderStageCreateInfo stage_create_info() const;

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;
	Shader(Shader&& other) noexcept;
	Shader& operator=(Shader&& other) noexcept;
	~Shader();

private:
	Shader(vk::Device device, vk::ShaderModule module, vk::ShaderStageFlagBits stage, ShaderDetails details,
		   std::vector<DescriptorInfo> descriptor_infos, std::string entry_point);

	vk::Device m_device;
	vk::ShaderModule m_module;
	vk::ShaderStageFlagBits m_stage;
	ShaderDetails m_details;
	std::vector<DescriptorInfo> m_descriptor_infos;
	std::string m_entry_point;
};

/**
 * @brief Merge the descriptor bindings of several stages into one set layout
 *
 * Bindings that appear in more than one stage get the union of their stage
 * flags; conflicting descriptor types are an error.
 */
std::expected<std::vector<vk::DescriptorSetLayoutBinding>, std::string> merge_descriptor_bindings(
	std::initializer_list<const Shader*> shaders);

} // namespace tofu

#endif // TOFU_SHADER_HPP
