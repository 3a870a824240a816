#include <tofu/PromptWorker.hpp>
#include <tofu/LayoutGenerator.hpp>
#include <tofu/Logger.hpp>
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace tofu {

namespace {

constexpr int STDIN_POLL_TIMEOUT_MS = 100;

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

PromptWorker::LineSource PromptWorker::from_stream(std::istream& input) {
    return [&input](std::stop_token stop) -> std::optional<std::string> {
        std::string line;
        if (stop.stop_requested() || !std::getline(input, line)) {
            return std::nullopt;
        }
        return line;
    };
}

PromptWorker::LineSource PromptWorker::from_stdin() {
    // Reads the file descriptor directly; going through std::cin would hide
    // buffered lines from poll().
    auto pending = std::make_shared<std::string>();
    auto at_eof = std::make_shared<bool>(false);

    return [pending, at_eof](std::stop_token stop) -> std::optional<std::string> {
        while (!stop.stop_requested()) {
            if (auto newline = pending->find('\n'); newline != std::string::npos) {
                std::string line = pending->substr(0, newline);
                pending->erase(0, newline + 1);
                return line;
            }
            if (*at_eof) {
                if (pending->empty()) {
                    return std::nullopt;
                }
                std::string line = std::move(*pending);
                pending->clear();
                return line;
            }

            pollfd fd{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0};
            int ready = ::poll(&fd, 1, STDIN_POLL_TIMEOUT_MS);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                Logger::instance().error("Polling stdin failed: {}", std::strerror(errno));
                return std::nullopt;
            }
            if (ready == 0) {
                continue;
            }

            std::array<char, 4096> chunk{};
            ssize_t count = ::read(STDIN_FILENO, chunk.data(), chunk.size());
            if (count < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                Logger::instance().error("Reading stdin failed: {}", std::strerror(errno));
                return std::nullopt;
            }
            if (count == 0) {
                *at_eof = true;
                continue;
            }
            pending->append(chunk.data(), static_cast<size_t>(count));
        }
        return std::nullopt;
    };
}

PromptWorker::PromptWorker(
    LineSource source,
    std::shared_ptr<TranslationService> translator,
    LayoutMailbox& mailbox,
    uint32_t particle_count,
    ScreenSize screen
)
    : m_source(std::move(source))
    , m_translator(std::move(translator))
    , m_mailbox(&mailbox)
    , m_particle_count(particle_count)
    , m_screen(screen)
    , m_thread([this](std::stop_token stop) { run(stop); })
{}

PromptWorker::~PromptWorker() {
    m_thread.request_stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void PromptWorker::set_target_space(uint32_t particle_count, ScreenSize screen) {
    std::scoped_lock lock(m_space_mutex);
    m_particle_count = particle_count;
    m_screen = screen;
}

void PromptWorker::run(std::stop_token stop) {
    Logger::instance().info("Prompt worker started");

    while (!stop.stop_requested() && !m_mailbox->closed()) {
        auto line = m_source(stop);
        if (!line) {
            break;
        }

        auto prompt = trim(*line);
        if (prompt.empty()) {
            continue;
        }
        if (prompt == "quit" || prompt == "exit") {
            Logger::instance().info("Prompt worker asked to quit");
            break;
        }
        handle_line(prompt);
    }

    m_finished = true;
    Logger::instance().info("Prompt worker finished after {} layouts", m_processed.load());
}

void PromptWorker::handle_line(std::string_view line) {
    std::string json;
    if (line.front() == '{') {
        // Typed JSON is used as is; parse_layout_descriptor reports anything malformed
        json = line;
    } else {
        Logger::instance().info("Generating \"{}\"", line);
        auto translated = m_translator->translate(line);
        if (!translated) {
            Logger::instance().error("Generation failed: {}", translated.error());
            return;
        }
        auto cleaned = clean_model_output(*translated);
        if (!cleaned) {
            Logger::instance().error("Generation failed: {}", cleaned.error());
            return;
        }
        json = std::move(*cleaned);
    }

    auto descriptor = parse_layout_descriptor_or_random(json);

    uint32_t particle_count;
    ScreenSize screen;
    {
        std::scoped_lock lock(m_space_mutex);
        particle_count = m_particle_count;
        screen = m_screen;
    }

    LayoutUpdate update{
        .descriptor = std::move(descriptor),
        .targets = {},
        .screen = screen
    };
    update.targets = LayoutGenerator::generate(update.descriptor, particle_count, screen);

    if (m_mailbox->post(std::move(update))) {
        ++m_processed;
        Logger::instance().info("Layout ready");
    }
}

} // namespace tofu
