// Project Tofu
// A particle swarm that reshapes itself into formations described in JSON.
//
//   tofu                 interactive: one prompt per line on stdin
//   tofu make a circle   one-shot: the words form a single prompt

#include <tofu/AppConfig.hpp>
#include <tofu/LayoutDescriptor.hpp>
#include <tofu/Logger.hpp>
#include <tofu/PromptWorker.hpp>
#include <tofu/Services.hpp>
#include <tofu/TofuController.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <expected>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CommandLine {
    tofu::AppConfig config;
    std::vector<std::string> prompt_words;
};

CommandLine parse_command_line(int argc, char** argv) {
    std::string config_path;
    uint32_t particles = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string present_mode;
    bool no_panel = false;
    bool trace = false;
    std::vector<std::string> prompt_words;

    CLI::App app("Project Tofu - particle formations from prompts");
    app.add_option("-c,--config", config_path, "JSON config file")->check(CLI::ExistingFile);
    auto* particles_option = app.add_option("-n,--particles", particles, "Number of particles")
        ->check(CLI::PositiveNumber);
    auto* width_option = app.add_option("--width", width, "Window width")->check(CLI::PositiveNumber);
    auto* height_option = app.add_option("--height", height, "Window height")->check(CLI::PositiveNumber);
    app.add_option("--present-mode", present_mode, "fifo, mailbox or immediate")
        ->check(CLI::IsMember({"fifo", "mailbox", "immediate"}));
    app.add_flag("--no-panel", no_panel, "Hide the control panel");
    app.add_flag("--trace", trace, "Log everything");
    app.add_option("prompt", prompt_words, "One-shot prompt; omit to read prompts from stdin");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        std::exit(app.exit(e));
    } catch (const CLI::CallForVersion& e) {
        std::exit(app.exit(e));
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    CommandLine command_line;
    if (!config_path.empty()) {
        auto loaded = tofu::load_app_config(config_path);
        if (!loaded) {
            throw std::runtime_error(loaded.error());
        }
        command_line.config = std::move(*loaded);
    }

    auto& config = command_line.config;
    if (particles_option->count() > 0) config.particle_count = particles;
    if (width_option->count() > 0) config.window_width = width;
    if (height_option->count() > 0) config.window_height = height;
    if (!present_mode.empty()) {
        config.present_mode = tofu::parse_present_mode(present_mode).value_or(tofu::PresentMode::Fifo);
    }
    if (no_panel) config.show_panel = false;
    if (trace) config.trace = true;

    command_line.prompt_words = std::move(prompt_words);
    return command_line;
}

std::string join(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += word;
    }
    return joined;
}

/// Prompt to descriptor. Only the translator can fail; an unusable descriptor becomes random.
std::expected<tofu::LayoutDescriptor, std::string> translate_prompt(
    tofu::TranslationService& translator,
    const std::string& prompt
) {
    auto raw = translator.translate(prompt);
    if (!raw) {
        return std::unexpected(std::format("Translation failed: {}", raw.error()));
    }
    auto json = tofu::clean_model_output(*raw);
    if (!json) {
        return std::unexpected(json.error());
    }
    return tofu::parse_layout_descriptor_or_random(*json);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        CommandLine command_line = parse_command_line(argc, argv);
        const auto& config = command_line.config;

        if (config.trace) {
            Logger::instance().set_level(spdlog::level::trace);
            for (auto& sink : Logger::instance().sinks()) {
                sink->set_level(spdlog::level::trace);
            }
        }
        Logger::instance().info("Starting Project Tofu...");

        auto translator = std::make_shared<tofu::KeywordTranslator>();

        // One-shot prompts are resolved before the window opens
        std::optional<tofu::LayoutDescriptor> initial_layout;
        if (!command_line.prompt_words.empty()) {
            auto prompt = join(command_line.prompt_words);
            Logger::instance().info("Prompt: \"{}\"", prompt);

            auto descriptor = translate_prompt(*translator, prompt);
            if (!descriptor) {
                Logger::instance().error("{}", descriptor.error());
                return EXIT_FAILURE;
            }
            initial_layout = std::move(*descriptor);
        }

        auto controller_result = tofu::TofuController::create(config);
        if (!controller_result) {
            Logger::instance().error("Failed to start: {}", controller_result.error());
            return EXIT_FAILURE;
        }
        auto& controller = *controller_result;

        if (initial_layout) {
            controller->apply_layout(*initial_layout);
        } else {
            controller->start_prompt_worker(tofu::PromptWorker::from_stdin(), translator);
            std::cout << "Type a layout (circle, grid, dna, spiral, wave) or protocol JSON; 'quit' to stop reading."
                      << std::endl;
        }

        if (auto result = controller->run(); !result) {
            Logger::instance().critical("Runtime error: {}", result.error());
            return EXIT_FAILURE;
        }

        Logger::instance().info("Exited cleanly");
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
