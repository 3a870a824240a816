#include <tofu/ParticleStore.hpp>
#include <tofu/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace tofu {

namespace {

float sample_range(std::mt19937& rng, float lo, float hi) {
    if (!(hi > lo)) {
        return lo;
    }
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(rng);
}

} // anonymous namespace

ParticleStore::ParticleStore(std::vector<Particle> particles, ScreenSize bounds)
    : m_particles(std::move(particles))
    , m_velocities(m_particles.size(), Velocity(0.0f))
    , m_bounds(bounds)
{}

ParticleStore ParticleStore::create(uint32_t particle_count, ScreenSize bounds, std::optional<uint32_t> seed) {
    std::mt19937 rng(seed.value_or(std::random_device{}()));
    std::uniform_int_distribution<size_t> color_dist(0, PALETTE.size() - 1);

    std::vector<Particle> particles;
    particles.reserve(particle_count);
    for (uint32_t i = 0; i < particle_count; ++i) {
        Particle p{};
        p.position = {
            sample_range(rng, SPAWN_PADDING, bounds.width - SPAWN_PADDING),
            sample_range(rng, SPAWN_PADDING, bounds.height - SPAWN_PADDING)
        };
        p.target = p.position;
        p.color = PALETTE[color_dist(rng)];
        p.size = sample_range(rng, MIN_SIZE, MAX_SIZE);
        particles.push_back(p);
    }

    Logger::instance().debug("Spawned {} particles in {}x{}", particle_count, bounds.width, bounds.height);
    return ParticleStore(std::move(particles), bounds);
}

void ParticleStore::set_targets(std::span<const TargetPoint> targets) {
    const size_t count = std::min(targets.size(), m_particles.size());
    for (size_t i = 0; i < count; ++i) {
        m_particles[i].target = targets[i];
    }
    if (targets.size() != m_particles.size()) {
        Logger::instance().debug("Received {} targets for {} particles", targets.size(), m_particles.size());
    }
}

void ParticleStore::tick() {
    for (size_t i = 0; i < m_particles.size(); ++i) {
        auto& particle = m_particles[i];
        auto& velocity = m_velocities[i];

        const glm::vec2 force = (particle.target - particle.position) * m_spring_strength;
        velocity = velocity * m_damping + force;
        particle.position += velocity;
    }
}

void ParticleStore::set_spring(float spring_strength, float damping) {
    m_spring_strength = std::clamp(spring_strength, std::numeric_limits<float>::min(), 1.0f);
    m_damping = std::clamp(damping, 0.0f, std::nextafter(1.0f, 0.0f));
}

} // namespace tofu
