/**
 * @file world_config.hpp
 * @brief Aggregate of every tunable of a World
 */

#pragma once

#include "boxigon/math/vector_math.hpp"
#include "boxigon/systems/integrator.hpp"
#include "boxigon/systems/rigid/broadphase.hpp"
#include "boxigon/systems/rigid/contact_solver.hpp"
#include "boxigon/systems/rigid/joint_solver.hpp"
#include "boxigon/systems/rigid/narrowphase.hpp"
#include "boxigon/systems/rigid/position_solver.hpp"
#include "boxigon/systems/sleep.hpp"

namespace Boxigon {

/**
 * @struct WorldConfig
 * @brief Per-system configuration structs plus world gravity
 */
struct WorldConfig {
    Vector gravity{0.0, -9.8};

    RigidBodyCollision::BroadphaseConfig broadphase;
    RigidBodyCollision::NarrowphaseConfig narrowphase;
    RigidBodyCollision::ContactSolverConfig contactSolver;
    RigidBodyCollision::JointSolverConfig jointSolver;
    RigidBodyCollision::PositionSolverConfig positionSolver;
    Systems::IntegratorConfig integrator;
    Systems::SleepConfig sleep;
};

} // namespace Boxigon
