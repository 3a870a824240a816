#include <tofu/AppConfig.hpp>
#include <tofu/Logger.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <format>
#include <fstream>
#include <sstream>

namespace tofu {

namespace {

std::expected<void, std::string> read_uint(const rapidjson::Document& document, const char* name, uint32_t& out) {
    if (!document.HasMember(name)) {
        return {};
    }
    const auto& value = document[name];
    if (!value.IsUint() || value.GetUint() == 0) {
        return std::unexpected(std::format("Config member '{}' must be a positive integer", name));
    }
    out = value.GetUint();
    return {};
}

std::expected<void, std::string> read_float(const rapidjson::Document& document, const char* name, float& out) {
    if (!document.HasMember(name)) {
        return {};
    }
    const auto& value = document[name];
    if (!value.IsNumber()) {
        return std::unexpected(std::format("Config member '{}' must be a number", name));
    }
    out = static_cast<float>(value.GetDouble());
    return {};
}

} // anonymous namespace

std::optional<PresentMode> parse_present_mode(std::string_view name) {
    if (name == "fifo") return PresentMode::Fifo;
    if (name == "mailbox") return PresentMode::Mailbox;
    if (name == "immediate") return PresentMode::Immediate;
    return std::nullopt;
}

std::string_view to_string(PresentMode mode) {
    switch (mode) {
        case PresentMode::Fifo: return "fifo";
        case PresentMode::Mailbox: return "mailbox";
        case PresentMode::Immediate: return "immediate";
    }
    return "fifo";
}

std::expected<AppConfig, std::string> parse_app_config(std::string_view json, AppConfig base) {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
        return std::unexpected(std::format("Failed to parse config JSON at offset {}: {}",
            document.GetErrorOffset(), rapidjson::GetParseError_En(document.GetParseError())));
    }
    if (!document.IsObject()) {
        return std::unexpected("Config JSON must contain an object at the root");
    }

    AppConfig config = std::move(base);

    if (auto r = read_uint(document, "window_width", config.window_width); !r) return std::unexpected(r.error());
    if (auto r = read_uint(document, "window_height", config.window_height); !r) return std::unexpected(r.error());
    if (auto r = read_uint(document, "particle_count", config.particle_count); !r) return std::unexpected(r.error());
    if (auto r = read_float(document, "spring_strength", config.spring_strength); !r) return std::unexpected(r.error());
    if (auto r = read_float(document, "damping", config.damping); !r) return std::unexpected(r.error());

    if (document.HasMember("window_title")) {
        if (!document["window_title"].IsString()) {
            return std::unexpected("Config member 'window_title' must be a string");
        }
        config.window_title = document["window_title"].GetString();
    }

    if (document.HasMember("present_mode")) {
        const auto& value = document["present_mode"];
        auto mode = value.IsString() ? parse_present_mode(value.GetString()) : std::nullopt;
        if (!mode) {
            return std::unexpected("Config member 'present_mode' must be one of fifo, mailbox, immediate");
        }
        config.present_mode = *mode;
    }

    if (document.HasMember("show_panel")) {
        if (!document["show_panel"].IsBool()) {
            return std::unexpected("Config member 'show_panel' must be a boolean");
        }
        config.show_panel = document["show_panel"].GetBool();
    }

    return config;
}

std::expected<AppConfig, std::string> load_app_config(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(std::format("Failed to open config file: {}", path.string()));
    }
    std::stringstream contents;
    contents << stream.rdbuf();

    auto config = parse_app_config(contents.str());
    if (!config) {
        return std::unexpected(std::format("{}: {}", path.string(), config.error()));
    }
    Logger::instance().info("Loaded config from {}", path.string());
    return config;
}

} // namespace tofu
