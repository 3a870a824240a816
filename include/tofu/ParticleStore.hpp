#pragma once

#include "ParticleData.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace tofu {

/**
 * @brief CPU-side particle swarm with spring-damper physics
 *
 * Owns N particle records plus N velocities. The particle array is laid out
 * exactly as the renderer's per-instance vertex buffer expects, so as_bytes()
 * can be uploaded without any per-field copy.
 *
 * The particle count is fixed for the store's lifetime; on resize the
 * application creates a new store for the new bounds.
 */
class ParticleStore {
public:
    static constexpr float DEFAULT_SPRING_STRENGTH = 0.08f;
    static constexpr float DEFAULT_DAMPING = 0.85f;
    static constexpr float SPAWN_PADDING = 20.0f;
    static constexpr float MIN_SIZE = 3.0f;
    static constexpr float MAX_SIZE = 5.0f;

    /// Neon green, cyan, mint, lime
    static constexpr std::array<glm::vec4, 4> PALETTE = {
        glm::vec4(0.0f, 1.0f, 0.0f, 1.0f),
        glm::vec4(0.0f, 1.0f, 1.0f, 1.0f),
        glm::vec4(0.0f, 1.0f, 0.53f, 1.0f),
        glm::vec4(0.53f, 1.0f, 0.0f, 1.0f),
    };

    /**
     * @brief Spawn N particles at random inside the screen
     *
     * Positions are uniform inside the bounds inset by SPAWN_PADDING, each
     * particle's target starts at its own position and velocities start at zero.
     *
     * @param particle_count Number of particles
     * @param bounds Screen size in pixels
     * @param seed Fixed seed for reproducible spawning; random when empty
     */
    [[nodiscard]] static ParticleStore create(
        uint32_t particle_count,
        ScreenSize bounds,
        std::optional<uint32_t> seed = std::nullopt
    );

    /**
     * @brief Redirect particles towards new targets
     *
     * Index i receives targets[i]. If fewer targets than particles are given, the
     * trailing particles keep their current target; extra targets are ignored.
     */
    void set_targets(std::span<const TargetPoint> targets);

    /// Advance the simulation by one step.
    void tick();

    /**
     * @brief Update the spring constants
     *
     * Strength is clamped into (0, 1] and damping into [0, 1).
     */
    void set_spring(float spring_strength, float damping);

    /// Raw view of the particle array, 64 bytes per particle.
    [[nodiscard]] std::span<const std::byte> as_bytes() const {
        return std::as_bytes(std::span<const Particle>(m_particles));
    }

    [[nodiscard]] std::span<const Particle> particles() const { return m_particles; }
    [[nodiscard]] std::span<const Velocity> velocities() const { return m_velocities; }
    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(m_particles.size()); }
    [[nodiscard]] ScreenSize bounds() const { return m_bounds; }
    [[nodiscard]] float spring_strength() const { return m_spring_strength; }
    [[nodiscard]] float damping() const { return m_damping; }

private:
    ParticleStore(std::vector<Particle> particles, ScreenSize bounds);

    std::vector<Particle> m_particles;
    std::vector<Velocity> m_velocities;
    ScreenSize m_bounds;
    float m_spring_strength = DEFAULT_SPRING_STRENGTH;
    float m_damping = DEFAULT_DAMPING;
};

} // namespace tofu
