#ifndef TOFU_LOGGER_HPP
#define TOFU_LOGGER_HPP
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <spdlog/logger.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#ifndef LOG_FILE
#define LOG_FILE "tofu.log"
#endif

/// `%*` in the pattern: the file:line recorded by the last Logger::instance() call on this thread.
class CallerFlag : public spdlog::custom_flag_formatter
{
public:
	static std::string& location()
	{
		thread_local std::string caller;
		return caller;
	}

	void format(const spdlog::details::log_msg&, const std::tm&, spdlog::memory_buf_t& dest) override
	{
		const auto& caller = location();
		dest.append(caller.data(), caller.data() + caller.size());
	}

	std::unique_ptr<custom_flag_formatter> clone() const override { return std::make_unique<CallerFlag>(); }
};

class Logger : public spdlog::logger
{
	std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink;
	std::shared_ptr<spdlog::sinks::basic_file_sink_mt>	 file_sink;
	Logger()
		: logger("Tofu")
		, console_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>())
		, file_sink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(LOG_FILE, true))
	{
#ifndef NDEBUG
		console_sink->set_level(spdlog::level::trace);
		file_sink->set_level(spdlog::level::trace);
		set_level(spdlog::level::trace);
#else
		console_sink->set_level(spdlog::level::warn);
		file_sink->set_level(spdlog::level::trace);
		set_level(spdlog::level::info);
#endif
		sinks().push_back(console_sink);
		sinks().push_back(file_sink);
		set_formatter(make_formatter());
	}

public:
	static std::unique_ptr<spdlog::formatter> make_formatter()
	{
		auto formatter = std::make_unique<spdlog::pattern_formatter>();
		formatter->add_flag<CallerFlag>('*').set_pattern("[Tofu]%*[%^%5l%$] %v");
		return formatter;
	}

	/// Records the caller's file:line for the calling thread only, so lines logged
	/// from the prompt worker and the render loop never borrow each other's location.
	static Logger& instance(std::source_location loc = std::source_location::current())
	{
		static Logger logger;
		std::filesystem::path path = loc.file_name();
		auto location = fmt::format("[{}:{}]", std::string{path.filename()}, loc.line());
		CallerFlag::location() = fmt::format("{:<30}", location);
		return logger;
	}
};

#endif // TOFU_LOGGER_HPP
