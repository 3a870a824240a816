#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tofu {

enum class PresentMode {
    Fifo,       ///< vsync, always available
    Mailbox,    ///< low-latency vsync, falls back to FIFO
    Immediate   ///< no vsync, falls back to FIFO
};

[[nodiscard]] std::optional<PresentMode> parse_present_mode(std::string_view name);
[[nodiscard]] std::string_view to_string(PresentMode mode);

/**
 * @brief Application settings
 *
 * Defaults are overridden by an optional JSON config file, which in turn is
 * overridden by command line options.
 *
 * Config file keys: "window_width", "window_height", "window_title",
 * "particle_count", "spring_strength", "damping", "present_mode", "show_panel".
 */
struct AppConfig {
    uint32_t window_width = 800;
    uint32_t window_height = 600;
    std::string window_title = "Project Tofu";
    uint32_t particle_count = 500;
    float spring_strength = 0.08f;
    float damping = 0.85f;
    PresentMode present_mode = PresentMode::Fifo;
    bool show_panel = true;
    bool trace = false;
};

/**
 * @brief Apply a JSON config document on top of a base config
 *
 * Unknown keys are ignored; a known key with the wrong type is an error.
 */
[[nodiscard]] std::expected<AppConfig, std::string> parse_app_config(std::string_view json, AppConfig base = {});

/// Read and apply a JSON config file on top of the defaults.
[[nodiscard]] std::expected<AppConfig, std::string> load_app_config(const std::filesystem::path& path);

} // namespace tofu
