/**
 * @file joint_solver.hpp
 * @brief Impulse solver for user joints (distance, pin, weld) and joint breaking
 *
 * Joints are solved in the same sequential impulse loop as contacts, before
 * the contact rows of every iteration. Rigid joints remove drift with a
 * Baumgarte velocity bias; distance joints with a frequency behave as a
 * damped spring (soft constraint). After the iterations any joint whose
 * accumulated impulse exceeds its break threshold, whose error has grown
 * beyond maxJointError or whose impulse is no longer finite is broken.
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>

#include "boxigon/core/defs.hpp"
#include "boxigon/core/system_config.hpp"
#include "boxigon/systems/rigid/solver_body.hpp"

namespace RigidBodyCollision {

/**
 * @struct JointSolverConfig
 * @brief Configuration parameters specific to the joint solver
 */
struct JointSolverConfig {
    // Fraction of the position error removed per step by rigid joints
    double jointBaumgarte = 0.2;

    // Joints stretched further than this (m) are treated as impossible and break
    double maxJointError = 10.0;
};

/**
 * @brief A joint owned by the World
 */
struct Joint {
    Boxigon::JointId id = 0;
    Boxigon::JointSpec spec;
    entt::entity eA = entt::null;
    entt::entity eB = entt::null;   ///< entt::null when anchored to the world
    double length = 0.0;            ///< Distance joints: rest length
    double referenceAngle = 0.0;    ///< Weld joints: angleB - angleA at creation

    // Accumulated impulses (warm start)
    Vector linearImpulse;           ///< Pin and weld
    double angularImpulse = 0.0;    ///< Weld
    double axialImpulse = 0.0;      ///< Distance

    /** @brief Magnitude compared against the break threshold */
    double impulseMagnitude() const;
};

/**
 * @class JointSolver
 * @brief Holds the prepared joint rows of one step
 */
class JointSolver {
public:
    /**
     * @param joints Joints to solve; impulses are stored back into them
     * @param bodies Solver bodies; must contain both bodies of every joint
     */
    void prepare(const std::vector<Joint*>& joints,
                 SolverBodySet& bodies,
                 const SystemConfig& sysConfig,
                 const JointSolverConfig& config,
                 bool warmStarting);

    void warmStart(SolverBodySet& bodies) const;

    void solveVelocities(SolverBodySet& bodies);

    /** @brief Writes accumulated impulses back into the joints */
    void storeImpulses() const;

    /**
     * @brief Joints that must break after this step's iterations, in id order
     */
    std::vector<Boxigon::JointId> findBroken() const;

private:
    struct JointConstraint {
        Joint* joint = nullptr;
        std::size_t indexA = 0;
        std::size_t indexB = 0;
        Vector rA;
        Vector rB;

        // Distance
        Vector axis;
        double axialMass = 0.0;
        double gamma = 0.0;
        double bias = 0.0;
        double axialImpulse = 0.0;

        // Point (pin and weld): 2x2 effective mass inputs and bias
        double k11 = 0.0;
        double k12 = 0.0;
        double k22 = 0.0;
        Vector linearBias;
        Vector linearImpulse;

        // Angle (weld)
        double angularMass = 0.0;
        double angularBias = 0.0;
        double angularImpulse = 0.0;

        double error = 0.0;  ///< Positional error at preparation
    };

    std::vector<JointConstraint> constraints;
    double maxJointError = 10.0;
};

} // namespace RigidBodyCollision
