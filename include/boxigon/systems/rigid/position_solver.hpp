/**
 * @file position_solver.hpp
 * @brief Position-based penetration correction for rigid body collisions
 *
 * Runs after integration. The separation of every contact point is
 * recomputed from its body-local anchors, and penetration beyond the slop
 * is removed a fraction at a time by moving the bodies directly. Velocities
 * are not touched, so no energy is injected.
 */

#pragma once

#include <vector>

#include "boxigon/systems/rigid/collision_data.hpp"
#include "boxigon/systems/rigid/solver_body.hpp"

namespace RigidBodyCollision {

/**
 * @struct PositionSolverConfig
 * @brief Configuration parameters specific to the position solver
 */
struct PositionSolverConfig {
    // Passes over all contact points
    int iterations = 3;

    // Fraction of the penetration removed per pass
    double baumgarte = 0.2;

    // Penetration tolerated without correction (m)
    double linearSlop = 0.005;

    // Largest correction applied to one point in one pass (m)
    double maxCorrection = 0.2;
};

/**
 * @brief Resolves remaining penetrations through position adjustments
 */
class PositionSolver {
public:
    /**
     * @brief Applies positional impulses to the solver bodies
     *
     * @param manifolds Manifolds whose points are corrected
     * @param bodies Solver bodies with poses refreshed after integration
     * @param config Position solver configuration
     * @return Deepest penetration seen in the last pass (<= 0)
     */
    static double solve(const std::vector<const Manifold*>& manifolds,
                        SolverBodySet& bodies,
                        const PositionSolverConfig& config);
};

} // namespace RigidBodyCollision
