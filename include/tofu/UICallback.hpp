#ifndef TOFU_UICALLBACK_HPP
#define TOFU_UICALLBACK_HPP

#include <functional>
#include <string>
#include <variant>

#include "Common.hpp"

namespace tofu
{

/**
 * @brief Slider for a float value
 */
struct ContinuousCallback
{
	std::function<void(float)> setter;
	std::function<float()> getter;
	float min;
	float max;
	bool logarithmic = false;
};

/**
 * @brief Button that runs an action when clicked
 */
struct ActionCallback
{
	std::function<void()> on_click;
};

enum class CallbackType
{
	Continuous,
	Action
};

/**
 * @brief One control on the panel, described independently of ImGui
 *
 * Owners of tunable state return vectors of these; ControlPanel turns each
 * into the matching widget.
 */
struct UICallback
{
	std::string field_name;
	std::variant<ContinuousCallback, ActionCallback> callback;

	UICallback(std::string name, ContinuousCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	UICallback(std::string name, ActionCallback cb)
		: field_name(std::move(name)), callback(std::move(cb)) {}

	[[nodiscard]] CallbackType get_callback_type() const
	{
		return std::visit(
			overloaded{
				[](const ContinuousCallback&) { return CallbackType::Continuous; },
				[](const ActionCallback&) { return CallbackType::Action; },
			},
			callback);
	}

	[[nodiscard]] const ContinuousCallback* as_continuous() const {
		return std::get_if<ContinuousCallback>(&callback);
	}

	[[nodiscard]] const ActionCallback* as_action() const {
		return std::get_if<ActionCallback>(&callback);
	}
};

} // namespace tofu

#endif // TOFU_UICALLBACK_HPP
