#include <tofu/Logger.hpp>
#include <tofu/Shader.hpp>
#include <map>
#include <optional>
#include <slang-com-ptr.h>
#include <utility>

namespace tofu {

// ============================================================================
// Slang Session
// ============================================================================
// One global session and one SPIR-V session, created on first use and kept
// for the lifetime of the process.
// ============================================================================

namespace
{

Slang::ComPtr<slang::ISession> create_spirv_session(slang::IGlobalSession* global)
{
	slang::TargetDesc target_desc = {};
	target_desc.format			  = SLANG_SPIRV;
	target_desc.profile			  = global->findProfile("spirv_1_5");

	const char* search_paths[] = {SHADER_DIR};

	slang::SessionDesc session_desc = {};
	session_desc.targets			= &target_desc;
	session_desc.targetCount		= 1;
	session_desc.searchPaths		= search_paths;
	session_desc.searchPathCount	= 1;

	Slang::ComPtr<slang::ISession> session;
	global->createSession(session_desc, session.writeRef());
	Logger::instance().debug("Created SPIR-V session, shader dir: {}", SHADER_DIR);
	return session;
}

slang::ISession* session()
{
	static Slang::ComPtr<slang::IGlobalSession> global = []
	{
		Slang::ComPtr<slang::IGlobalSession> created;
		SlangGlobalSessionDesc desc = {};
		createGlobalSession(&desc, created.writeRef());
		return created;
	}();
	static Slang::ComPtr<slang::ISession> spirv = create_spirv_session(global);
	return spirv.get();
}

std::optional<std::string> diagnostics_text(slang::IBlob* diagnostics)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
	{
		return std::nullopt;
	}
	return std::string{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
}

/// Load module + entry point and link them into one program.
std::expected<Slang::ComPtr<slang::IComponentType>, std::string> compile_program(std::string_view name,
																				 std::string_view entry_point)
{
	Slang::ComPtr<slang::IBlob> diagnostics;
	std::string module_name{name};

	Slang::ComPtr<slang::IModule> module(session()->loadModule(module_name.c_str(), diagnostics.writeRef()));
	if (!module)
	{
		auto text = diagnostics_text(diagnostics.get());
		return std::unexpected{std::format("Failed to load shader module '{}': {}", name, text.value_or("no diagnostics"))};
	}
	if (auto warnings = diagnostics_text(diagnostics.get()))
	{
		Logger::instance().warn("Shader module '{}': {}", name, *warnings);
	}

	std::string entry_name{entry_point};
	Slang::ComPtr<slang::IEntryPoint> entry;
	module->findEntryPointByName(entry_name.c_str(), entry.writeRef());
	if (!entry)
	{
		return std::unexpected{std::format("Entry point '{}' not found in '{}'", entry_point, name)};
	}

	slang::IComponentType* components[] = {module, entry};
	Slang::ComPtr<slang::IComponentType> composite;
	session()->createCompositeComponentType(components, 2, composite.writeRef(), diagnostics.writeRef());
	if (!composite)
	{
		return std::unexpected{diagnostics_text(diagnostics.get()).value_or("Failed to compose shader program")};
	}

	Slang::ComPtr<slang::IComponentType> linked;
	composite->link(linked.writeRef(), diagnostics.writeRef());
	if (!linked)
	{
		return std::unexpected{diagnostics_text(diagnostics.get()).value_or("Failed to link shader program")};
	}

	Logger::instance().trace("Linked shader program '{}':'{}'", name, entry_point);
	return linked;
}

std::expected<vk::ShaderModule, std::string> create_module(vk::Device device, slang::IComponentType* linked)
{
	Slang::ComPtr<slang::IBlob> code;
	Slang::ComPtr<slang::IBlob> diagnostics;

	linked->getEntryPointCode(0, 0, code.writeRef(), diagnostics.writeRef());
	if (!code)
	{
		return std::unexpected{diagnostics_text(diagnostics.get()).value_or("Failed to generate SPIR-V")};
	}

	auto create_info = vk::ShaderModuleCreateInfo()
						   .setCodeSize(code->getBufferSize())
						   .setPCode(static_cast<const uint32_t*>(code->getBufferPointer()));

	auto module_res = device.createShaderModule(create_info);
	CHECK_VK_RESULT(module_res, "Failed to create shader module {}");

	Logger::instance().debug("Created shader module ({} bytes of SPIR-V)", code->getBufferSize());
	return module_res.value;
}

} // anonymous namespace

// ============================================================================
// Reflection
// ============================================================================

namespace
{

/// Slang scalar/vector type to Vulkan format; float, int and uint with 1-4 components.
vk::Format to_vk_format(slang::TypeReflection* type)
{
	auto scalar = type->getScalarType();
	auto count	= type->getElementCount();
	if (count == 0)
		count = 1;
	if (count > 4)
		return vk::Format::eUndefined;

	using ST = slang::TypeReflection::ScalarType;
	switch (scalar)
	{
		case ST::Float32:
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Sfloat, vk::Format::eR32G32Sfloat,
											  vk::Format::eR32G32B32Sfloat, vk::Format::eR32G32B32A32Sfloat};
			return formats[count - 1];
		}
		case ST::Int32:
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Sint, vk::Format::eR32G32Sint,
											  vk::Format::eR32G32B32Sint, vk::Format::eR32G32B32A32Sint};
			return formats[count - 1];
		}
		case ST::UInt32:
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Uint, vk::Format::eR32G32Uint,
											  vk::Format::eR32G32B32Uint, vk::Format::eR32G32B32A32Uint};
			return formats[count - 1];
		}
		default: return vk::Format::eUndefined;
	}
}

vk::DescriptorType to_vk_descriptor_type(slang::BindingType binding_type)
{
	using enum slang::BindingType;

	auto base_type =
		static_cast<slang::BindingType>(static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(BaseMask));
	bool is_mutable = (static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(MutableFlag)) != 0;

	switch (base_type)
	{
		case Sampler: return vk::DescriptorType::eSampler;
		case Texture: return is_mutable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
		case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
		case RawBuffer: return vk::DescriptorType::eStorageBuffer;
		case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
		default:
			Logger::instance().warn("Unhandled binding type {}, assuming uniform buffer",
									static_cast<uint32_t>(binding_type));
			return vk::DescriptorType::eUniformBuffer;
	}
}

std::size_t extract_size(slang::TypeLayoutReflection* type_layout)
{
	if (auto size = type_layout->getSize(); size > 0)
	{
		return size;
	}
	auto* element_type = type_layout->getElementTypeLayout();
	if (element_type && element_type != type_layout)
	{
		return extract_size(element_type);
	}
	return 0;
}

std::vector<DescriptorInfo> extract_descriptors(slang::IComponentType* linked, vk::ShaderStageFlagBits stage)
{
	slang::ProgramLayout* layout = linked->getLayout();
	std::vector<DescriptorInfo> descriptors;

	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto* param		  = layout->getParameterByIndex(i);
		auto* type_layout = param->getTypeLayout();

		for (unsigned r = 0; r < type_layout->getBindingRangeCount(); r++)
		{
			auto binding_type = type_layout->getBindingRangeType(r);
			if (binding_type == slang::BindingType::VaryingInput || binding_type == slang::BindingType::VaryingOutput ||
				binding_type == slang::BindingType::PushConstant)
			{
				continue;
			}

			auto* leaf = type_layout->getBindingRangeLeafTypeLayout(r);
			DescriptorInfo info{
				.name			  = param->getName(),
				.size			  = leaf ? extract_size(leaf) : 0,
				.binding		  = static_cast<uint32_t>(param->getBindingIndex() + r),
				.set			  = static_cast<uint32_t>(param->getBindingSpace()),
				.descriptor_count = static_cast<uint32_t>(type_layout->getBindingRangeBindingCount(r)),
				.type			  = to_vk_descriptor_type(binding_type),
				.stages			  = stage,
			};
			Logger::instance().trace("  Descriptor '{}': set={} binding={} type={} size={}", info.name, info.set,
									 info.binding, vk::to_string(info.type), info.size);
			descriptors.push_back(std::move(info));
		}
	}
	return descriptors;
}

slang::EntryPointReflection* entry_point_of(slang::IComponentType* linked)
{
	auto* layout = linked->getLayout();
	return layout->getEntryPointCount() == 0 ? nullptr : layout->getEntryPointByIndex(0);
}

slang::TypeLayoutReflection* unwrap_to_struct(slang::TypeLayoutReflection* type)
{
	if (!type)
		return nullptr;
	if (type->getKind() == slang::TypeReflection::Kind::Struct)
		return type;
	if (auto* element = type->getElementTypeLayout(); element && element != type)
		return unwrap_to_struct(element);
	return nullptr;
}

/// Struct fields as stage variables; system values (SV_*) map to builtins and are skipped.
std::vector<StageVariable> extract_variables(slang::TypeLayoutReflection* struct_type)
{
	std::vector<StageVariable> vars;
	for (unsigned f = 0; f < struct_type->getFieldCount(); f++)
	{
		auto* field = struct_type->getFieldByIndex(f);
		if (auto* semantic = field->getSemanticName(); semantic && std::string_view(semantic).starts_with("SV_"))
		{
			continue;
		}
		vars.push_back({.name	  = field->getName(),
						.location = static_cast<uint32_t>(field->getBindingIndex()),
						.format	  = to_vk_format(field->getTypeLayout()->getType())});
	}
	return vars;
}

std::vector<StageVariable> extract_inputs(slang::EntryPointReflection* entry)
{
	std::vector<StageVariable> inputs;
	for (unsigned p = 0; p < entry->getParameterCount(); p++)
	{
		if (auto* struct_type = unwrap_to_struct(entry->getParameterByIndex(p)->getTypeLayout()))
		{
			inputs.append_range(extract_variables(struct_type));
		}
	}
	return inputs;
}

std::vector<StageVariable> extract_outputs(slang::EntryPointReflection* entry)
{
	if (auto* result = entry->getResultVarLayout())
	{
		if (auto* struct_type = unwrap_to_struct(result->getTypeLayout()))
		{
			return extract_variables(struct_type);
		}
	}
	return {};
}

} // anonymous namespace

VertexDetails::VertexDetails(slang::IComponentType* linked)
{
	if (auto* entry = entry_point_of(linked))
	{
		inputs	= extract_inputs(entry);
		outputs = extract_outputs(entry);
	}
	Logger::instance().debug("VertexDetails: {} inputs, {} outputs", inputs.size(), outputs.size());
}

bool VertexDetails::matches(const FragmentDetails& next) const
{
	bool valid = true;

	std::map<uint32_t, const StageVariable*> produced;
	for (const auto& var : outputs)
	{
		produced[var.location] = &var;
	}

	for (const auto& input : next.inputs)
	{
		auto it = produced.find(input.location);
		if (it == produced.end())
		{
			Logger::instance().error("Fragment input '{}' at location {} has no matching vertex output", input.name,
									 input.location);
			valid = false;
			continue;
		}
		if (it->second->format != input.format)
		{
			Logger::instance().error("Location {}: vertex outputs {} but fragment expects {}", input.location,
									 vk::to_string(it->second->format), vk::to_string(input.format));
			valid = false;
		}
	}
	return valid;
}

FragmentDetails::FragmentDetails(slang::IComponentType* linked)
{
	if (auto* entry = entry_point_of(linked))
	{
		inputs	= extract_inputs(entry);
		outputs = extract_outputs(entry);
	}
	Logger::instance().debug("FragmentDetails: {} inputs, {} outputs", inputs.size(), outputs.size());
}

// ============================================================================
// Shader
// ============================================================================

std::expected<Shader, std::string> Shader::create(vk::Device device, std::string_view name,
												  std::string_view entry_point)
{
	Logger::instance().info("Creating shader '{}':'{}'", name, entry_point);

	auto linked = compile_program(name, entry_point);
	if (!linked)
	{
		Logger::instance().error("{}", linked.error());
		return std::unexpected{linked.error()};
	}

	auto* entry = entry_point_of(linked->get());
	if (!entry)
	{
		return std::unexpected{std::format("Shader '{}' has no entry point after linking", name)};
	}

	vk::ShaderStageFlagBits stage;
	std::optional<ShaderDetails> details;
	switch (entry->getStage())
	{
		case SLANG_STAGE_VERTEX:
			stage = vk::ShaderStageFlagBits::eVertex;
			details.emplace(std::in_place_type<VertexDetails>, linked->get());
			break;
		case SLANG_STAGE_FRAGMENT:
			stage = vk::ShaderStageFlagBits::eFragment;
			details.emplace(std::in_place_type<FragmentDetails>, linked->get());
			break;
		default:
			return std::unexpected{
				std::format("Shader '{}' has unsupported stage {}", name, static_cast<int>(entry->getStage()))};
	}

	auto module = create_module(device, linked->get());
	if (!module)
	{
		return std::unexpected{module.error()};
	}

	auto descriptors = extract_descriptors(linked->get(), stage);
	Logger::instance().info("Shader '{}' ready ({}, {} descriptors)", name, vk::to_string(stage), descriptors.size());

	return Shader{device, *module, stage, std::move(*details), std::move(descriptors), std::string{entry_point}};
}

vk::PipelineShaderStageCreateInfo Shader::stage_create_info() const
{
	return vk::PipelineShaderStageCreateInfo{}.setStage(m_stage).setModule(m_module).setPName(m_entry_point.c_str());
}

Shader::~Shader()
{
	if (m_module)
	{
		m_device.destroyShaderModule(m_module);
		Logger::instance().trace("Destroyed shader module");
	}
}

Shader::Shader(Shader&& other) noexcept
	: m_device(other.m_device)
	, m_module(std::exchange(other.m_module, nullptr))
	, m_stage(other.m_stage)
	, m_details(std::move(other.m_details))
	, m_descriptor_infos(std::move(other.m_descriptor_infos))
	, m_entry_point(std::move(other.m_entry_point))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
	if (this != &other)
	{
		if (m_module)
		{
			m_device.destroyShaderModule(m_module);
		}
		m_device		   = other.m_device;
		m_module		   = std::exchange(other.m_module, nullptr);
		m_stage			   = other.m_stage;
		m_details		   = std::move(other.m_details);
		m_descriptor_infos = std::move(other.m_descriptor_infos);
		m_entry_point	   = std::move(other.m_entry_point);
	}
	return *this;
}

Shader::Shader(vk::Device device, vk::ShaderModule module, vk::ShaderStageFlagBits stage, ShaderDetails details,
			   std::vector<DescriptorInfo> descriptor_infos, std::string entry_point)
	: m_device(device)
	, m_module(module)
	, m_stage(stage)
	, m_details(std::move(details))
	, m_descriptor_infos(std::move(descriptor_infos))
	, m_entry_point(std::move(entry_point))
{
}

std::expected<std::vector<vk::DescriptorSetLayoutBinding>, std::string> merge_descriptor_bindings(
	std::initializer_list<const Shader*> shaders)
{
	std::map<uint32_t, vk::DescriptorSetLayoutBinding> merged;

	for (const auto* shader : shaders)
	{
		for (const auto& info : shader->descriptor_infos())
		{
			if (info.set != 0)
			{
				return std::unexpected{std::format("Descriptor '{}' uses set {}, only set 0 is supported", info.name,
												   info.set)};
			}

			auto [it, inserted] = merged.try_emplace(info.binding, vk::DescriptorSetLayoutBinding()
																	   .setBinding(info.binding)
																	   .setDescriptorType(info.type)
																	   .setDescriptorCount(info.descriptor_count)
																	   .setStageFlags(info.stages));
			if (inserted)
			{
				continue;
			}
			if (it->second.descriptorType != info.type)
			{
				return std::unexpected{std::format("Binding {} is {} in one stage and {} in another", info.binding,
												   vk::to_string(it->second.descriptorType), vk::to_string(info.type))};
			}
			it->second.stageFlags |= info.stages;
		}
	}

	std::vector<vk::DescriptorSetLayoutBinding> bindings;
	for (const auto& [binding, layout_binding] : merged)
	{
		bindings.push_back(layout_binding);
	}
	return bindings;
}

} // namespace tofu
