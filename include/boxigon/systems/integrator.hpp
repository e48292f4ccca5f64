/**
 * @file integrator.hpp
 * @brief Semi-implicit Euler integration split into a force and a movement system
 *
 * The ForceSystem runs before the constraint solver and advances velocities
 * from gravity, queued forces, thrusters and damping. The MovementSystem runs
 * after the solver and advances poses from the solved velocities.
 *
 * Required components:
 * - BodyInfo, Position, AngularPosition, Velocity, AngularVelocity, MassData, Sleep
 *
 * Optional components:
 * - ForceAccumulator, Thruster
 */

#ifndef BOXIGON_INTEGRATOR_HPP
#define BOXIGON_INTEGRATOR_HPP

#include <cmath>

#include <entt/entt.hpp>
#include "boxigon/systems/i_system.hpp"

namespace Systems {

/**
 * @struct IntegratorConfig
 * @brief Configuration parameters shared by the force and movement systems
 */
struct IntegratorConfig {
    // Velocity damping rates (1/s); 0 disables
    double linearDamping = 0.0;
    double angularDamping = 0.0;

    // Largest translation of one body in one step (m)
    double maxTranslation = 2.0;

    // Largest rotation of one body in one step (rad)
    double maxRotation = 0.5 * M_PI;
};

/**
 * @class ForceSystem
 * @brief Velocity half of the integrator
 *
 * Only awake dynamic bodies are affected. Accumulated forces are consumed
 * (cleared) on every body, including ones that were skipped.
 */
class ForceSystem : public ConfigurableSystem<IntegratorConfig> {
public:
    ForceSystem() = default;
    ~ForceSystem() override = default;

    void update(entt::registry& registry) override;
};

/**
 * @class MovementSystem
 * @brief Position half of the integrator
 *
 * Integrates the center of mass and the angle of awake dynamic and kinematic
 * bodies, then re-derives the body origin from the center of mass.
 */
class MovementSystem : public ConfigurableSystem<IntegratorConfig> {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    void update(entt::registry& registry) override;
};

} // namespace Systems

#endif
