/**
 * @file contact_solver.hpp
 * @brief Sequential impulse solver for contact constraints
 *
 * Each contact point carries a normal row (non-penetration, restitution,
 * speculative approach) and a tangent row (Coulomb friction). Rows are
 * relaxed one at a time (projected Gauss-Seidel) for a fixed number of
 * iterations with accumulated impulse clamping:
 * - normal impulse >= 0
 * - |tangent impulse| <= friction * normal impulse
 */

#pragma once

#include <vector>

#include "boxigon/core/system_config.hpp"
#include "boxigon/systems/rigid/collision_data.hpp"
#include "boxigon/systems/rigid/solver_body.hpp"

namespace RigidBodyCollision {

/**
 * @struct ContactSolverConfig
 * @brief Configuration parameters specific to the contact solver
 */
struct ContactSolverConfig {
    // Number of velocity solver iterations (joints and contacts)
    int velocityIterations = 10;

    // Reuse last step's impulses as the initial guess
    bool warmStarting = true;

    // Approach speeds below this do not bounce (m/s)
    double restitutionThreshold = 1.0;
};

/**
 * @class ContactSolver
 * @brief Holds the prepared contact rows of one step
 */
class ContactSolver {
public:
    /**
     * @brief Builds constraint rows for the given manifolds
     *
     * @param manifolds Manifolds to solve; impulses are read and later stored back
     * @param bodies Solver bodies; must already contain both bodies of every manifold
     * @param sysConfig Shared configuration (time step)
     * @param config Contact solver configuration
     */
    void prepare(const std::vector<Manifold*>& manifolds,
                 SolverBodySet& bodies,
                 const SystemConfig& sysConfig,
                 const ContactSolverConfig& config);

    /** @brief Applies the carried-over impulses */
    void warmStart(SolverBodySet& bodies) const;

    /** @brief One relaxation pass over every contact row */
    void solveVelocities(SolverBodySet& bodies);

    /** @brief Writes accumulated impulses back into the manifolds */
    void storeImpulses() const;

private:
    struct PointConstraint {
        Vector rA;
        Vector rB;
        Vector normal;
        Vector tangent;
        double normalMass = 0.0;
        double tangentMass = 0.0;
        double targetVelocity = 0.0;  ///< Desired normal relative velocity
        double normalImpulse = 0.0;
        double tangentImpulse = 0.0;
    };

    struct ManifoldConstraint {
        Manifold* manifold = nullptr;
        std::size_t indexA = 0;
        std::size_t indexB = 0;
        double friction = 0.0;
        std::vector<PointConstraint> points;
    };

    std::vector<ManifoldConstraint> constraints;
};

} // namespace RigidBodyCollision
