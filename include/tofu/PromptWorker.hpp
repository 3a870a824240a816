#pragma once

#include "LayoutMailbox.hpp"
#include "Services.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace tofu {

/**
 * @brief Background thread turning typed prompts into layouts
 *
 * Each input line is either protocol JSON (starts with '{') and used as is, or
 * a natural language prompt handed to the translation service. The resulting
 * JSON is cleaned, turned into targets for the current particle count and
 * screen, and posted to the mailbox for the render thread.
 *
 * Failures are logged and the worker keeps reading. It finishes when the input
 * ends, a line reads "quit" or "exit", the mailbox is closed, or a stop is
 * requested. The destructor requests a stop and joins.
 */
class PromptWorker {
public:
    /// Yields the next input line, or nothing once input has ended or a stop was requested.
    using LineSource = std::function<std::optional<std::string>(std::stop_token)>;

    /// Blocking reads from an arbitrary stream.
    [[nodiscard]] static LineSource from_stream(std::istream& input);

    /// Reads the process's standard input without blocking past a stop request.
    [[nodiscard]] static LineSource from_stdin();

    PromptWorker(
        LineSource source,
        std::shared_ptr<TranslationService> translator,
        LayoutMailbox& mailbox,
        uint32_t particle_count,
        ScreenSize screen
    );
    ~PromptWorker();

    PromptWorker(const PromptWorker&) = delete;
    PromptWorker& operator=(const PromptWorker&) = delete;

    /// Particle count and screen used for layouts generated from now on.
    void set_target_space(uint32_t particle_count, ScreenSize screen);

    void request_stop() { m_thread.request_stop(); }

    [[nodiscard]] bool finished() const { return m_finished.load(); }

    /// Number of prompts that produced a posted layout.
    [[nodiscard]] uint64_t processed_count() const { return m_processed.load(); }

private:
    void run(std::stop_token stop);
    void handle_line(std::string_view line);

    LineSource m_source;
    std::shared_ptr<TranslationService> m_translator;
    LayoutMailbox* m_mailbox;

    mutable std::mutex m_space_mutex;
    uint32_t m_particle_count;
    ScreenSize m_screen;

    std::atomic<bool> m_finished{false};
    std::atomic<uint64_t> m_processed{0};

    // Declared last so it starts after every member it reads is initialized
    std::jthread m_thread;
};

} // namespace tofu
