#include <tofu/LayoutGenerator.hpp>
#include <tofu/Logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <random>
#include <string>

namespace tofu {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;

std::mt19937& rng() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

/// Uniform sample in [lo, hi); an empty range collapses to lo.
float sample_range(float lo, float hi) {
    if (!(hi > lo)) {
        return lo;
    }
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(rng());
}

} // anonymous namespace

std::vector<TargetPoint> LayoutGenerator::generate(
    const LayoutDescriptor& descriptor,
    uint32_t particle_count,
    ScreenSize screen
) {
    if (descriptor.version != PROTOCOL_VERSION) {
        Logger::instance().warn("Layout protocol version '{}' differs from {}, continuing",
            descriptor.version, PROTOCOL_VERSION);
    }

    if (particle_count == 0) {
        return {};
    }

    if (descriptor.coordinates) {
        return custom(*descriptor.coordinates, particle_count, screen);
    }

    switch (descriptor.kind()) {
        case LayoutKind::Circle:
            return circle(std::get<CircleParams>(descriptor.params), particle_count, screen);
        case LayoutKind::Grid:
            return grid(std::get<GridParams>(descriptor.params), particle_count, screen);
        case LayoutKind::Helix:
            return helix(std::get<HelixParams>(descriptor.params), particle_count, screen);
        case LayoutKind::Spiral:
            return spiral(std::get<SpiralParams>(descriptor.params), particle_count, screen);
        case LayoutKind::Wave:
            return wave(std::get<WaveParams>(descriptor.params), particle_count, screen);
        case LayoutKind::Random:
            return random(std::get<RandomParams>(descriptor.params), particle_count, screen);
        case LayoutKind::Custom:
            Logger::instance().warn("Custom layout without coordinates, using random");
            break;
        case LayoutKind::Unknown:
            Logger::instance().warn("Unknown layout type '{}', using random",
                std::get<UnknownParams>(descriptor.params).type_name);
            break;
    }
    return random(RandomParams{}, particle_count, screen);
}

std::vector<TargetPoint> LayoutGenerator::generate_from_json(
    std::string_view json,
    uint32_t particle_count,
    ScreenSize screen
) {
    return generate(parse_layout_descriptor_or_random(json), particle_count, screen);
}

std::vector<TargetPoint> LayoutGenerator::generate_from_command(
    std::string_view command,
    uint32_t particle_count,
    ScreenSize screen
) {
    return generate(descriptor_for_command(command), particle_count, screen);
}

LayoutDescriptor LayoutGenerator::descriptor_for_command(std::string_view command) {
    std::string word(command);
    std::transform(word.begin(), word.end(), word.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (word == "circle") return LayoutDescriptor::of_kind(LayoutKind::Circle);
    if (word == "grid") return LayoutDescriptor::of_kind(LayoutKind::Grid);
    if (word == "dna" || word == "helix") return LayoutDescriptor::of_kind(LayoutKind::Helix);
    if (word == "spiral") return LayoutDescriptor::of_kind(LayoutKind::Spiral);
    if (word == "wave") return LayoutDescriptor::of_kind(LayoutKind::Wave);
    return LayoutDescriptor::of_kind(LayoutKind::Random);
}

std::vector<TargetPoint> LayoutGenerator::circle(const CircleParams& params, uint32_t count, ScreenSize screen) {
    const float radius_factor = params.radius_factor.value_or(LayoutDefaults::circle_radius_factor);
    const glm::vec2 center{screen.width / 2.0f, screen.height / 2.0f};
    const float radius = std::min(screen.width, screen.height) * radius_factor;

    std::vector<TargetPoint> points;
    points.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const float angle = TWO_PI * static_cast<float>(i) / static_cast<float>(count);
        points.emplace_back(center.x + radius * std::cos(angle),
                            center.y + radius * std::sin(angle));
    }
    return points;
}

std::vector<TargetPoint> LayoutGenerator::grid(const GridParams& params, uint32_t count, ScreenSize screen) {
    const float padding = params.padding.value_or(LayoutDefaults::grid_padding);
    const auto cols = static_cast<uint32_t>(std::ceil(std::sqrt(static_cast<float>(count))));
    const uint32_t rows = (count + cols - 1) / cols;

    const float cell_w = (screen.width - 2.0f * padding) / static_cast<float>(cols);
    const float cell_h = (screen.height - 2.0f * padding) / static_cast<float>(rows);

    std::vector<TargetPoint> points;
    points.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const uint32_t col = i % cols;
        const uint32_t row = i / cols;
        points.emplace_back(padding + (static_cast<float>(col) + 0.5f) * cell_w,
                            padding + (static_cast<float>(row) + 0.5f) * cell_h);
    }
    return points;
}

std::vector<TargetPoint> LayoutGenerator::helix(const HelixParams& params, uint32_t count, ScreenSize screen) {
    const float amplitude = screen.width * params.amplitude.value_or(LayoutDefaults::helix_amplitude);
    const float frequency = params.frequency.value_or(LayoutDefaults::helix_frequency);
    const float center_x = screen.width / 2.0f;
    const float spacing = screen.height / static_cast<float>(count);

    std::vector<TargetPoint> points;
    points.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const float phase = static_cast<float>(i) * frequency * TWO_PI;
        const float offset = amplitude * std::sin(phase);
        // Even indices form one strand, odd indices the mirrored one
        const float x = (i % 2 == 0) ? center_x + offset : center_x - offset;
        points.emplace_back(x, static_cast<float>(i) * spacing);
    }
    return points;
}

std::vector<TargetPoint> LayoutGenerator::spiral(const SpiralParams& params, uint32_t count, ScreenSize screen) {
    const float max_radius = std::min(screen.width, screen.height)
        * params.max_radius_factor.value_or(LayoutDefaults::spiral_max_radius_factor);
    const float rotations = params.rotations.value_or(LayoutDefaults::spiral_rotations);
    const glm::vec2 center{screen.width / 2.0f, screen.height / 2.0f};

    std::vector<TargetPoint> points;
    points.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(count);
        const float angle = t * rotations * TWO_PI;
        const float radius = max_radius * t;
        points.emplace_back(center.x + radius * std::cos(angle),
                            center.y + radius * std::sin(angle));
    }
    return points;
}

std::vector<TargetPoint> LayoutGenerator::wave(const WaveParams& params, uint32_t count, ScreenSize screen) {
    const float amplitude = screen.height * params.amplitude.value_or(LayoutDefaults::wave_amplitude);
    const float frequency = params.frequency.value_or(LayoutDefaults::wave_frequency);
    const float center_y = screen.height / 2.0f;
    const float spacing = screen.width / static_cast<float>(count);

    std::vector<TargetPoint> points;
    points.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const float phase = static_cast<float>(i) * frequency * TWO_PI;
        points.emplace_back(static_cast<float>(i) * spacing,
                            center_y + amplitude * std::sin(phase));
    }
    return points;
}

std::vector<TargetPoint> LayoutGenerator::random(const RandomParams& params, uint32_t count, ScreenSize screen) {
    const float padding = params.padding.value_or(LayoutDefaults::random_padding);

    std::vector<TargetPoint> points;
    points.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        points.emplace_back(sample_range(padding, screen.width - padding),
                            sample_range(padding, screen.height - padding));
    }
    return points;
}

std::vector<TargetPoint> LayoutGenerator::custom(
    const std::vector<glm::vec2>& coordinates,
    uint32_t count,
    ScreenSize screen
) {
    if (count == 0) {
        return {};
    }
    if (coordinates.empty()) {
        Logger::instance().warn("Custom layout has no coordinates, using random");
        return random(RandomParams{}, count, screen);
    }

    const glm::vec2 scale{screen.width, screen.height};
    std::vector<glm::vec2> scaled;
    scaled.reserve(coordinates.size());
    for (const auto& c : coordinates) {
        scaled.push_back(c * scale);
    }

    const auto m = scaled.size();
    std::vector<TargetPoint> points;
    points.reserve(count);

    if (count == 1) {
        points.push_back(scaled.front());
        return points;
    }

    if (m >= count) {
        // Subsample with an even stride
        for (uint32_t i = 0; i < count; ++i) {
            const auto index = static_cast<size_t>(i) * m / count;
            points.push_back(scaled[index]);
        }
        return points;
    }

    if (m == 1) {
        points.assign(count, scaled.front());
        return points;
    }

    // Interpolate along the polyline so both endpoints are hit exactly
    const auto last = static_cast<float>(m - 1);
    for (uint32_t i = 0; i < count; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(count - 1);
        const float position = t * last;
        const auto lower = std::min(static_cast<size_t>(position), m - 1);
        const auto upper = std::min(lower + 1, m - 1);
        const float fraction = position - static_cast<float>(lower);
        points.push_back(glm::mix(scaled[lower], scaled[upper], fraction));
    }
    // Guard the end against float rounding
    points.back() = scaled.back();
    return points;
}

} // namespace tofu
