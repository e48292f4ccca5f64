/**
 * @file contact_solver.cpp
 * @brief Projected Gauss-Seidel contact solver
 *
 * Target normal velocity of a point:
 * - separated points (speculative contacts) may close the gap in one step: -separation / dt
 * - approaching faster than the restitution threshold bounces: -e * vn_pre
 * - otherwise the normal velocity is driven to zero
 * Positional error is left to the position solver, so no velocity bias is
 * added for penetration.
 */

#include <algorithm>
#include <cmath>
#include <vector>

#include "boxigon/systems/rigid/contact_solver.hpp"
#include "boxigon/core/profile.hpp"

namespace RigidBodyCollision
{

/**
 * @brief Effective mass of a row along @p dir: 1 / (mA + mB + iA (rA x d)^2 + iB (rB x d)^2)
 */
static double effectiveMass(const SolverBody& a, const SolverBody& b,
                            const Vector& rA, const Vector& rB, const Vector& dir)
{
    double const rnA = rA.cross(dir);
    double const rnB = rB.cross(dir);
    double const k = a.invMass + b.invMass + a.invI * rnA * rnA + b.invI * rnB * rnB;
    return k > 0.0 ? 1.0 / k : 0.0;
}

/**
 * @brief Velocity of B's contact point relative to A's
 */
static Vector relativeVelocity(const SolverBody& a, const SolverBody& b,
                               const Vector& rA, const Vector& rB)
{
    return b.v + crossSV(b.w, rB) - a.v - crossSV(a.w, rA);
}

void ContactSolver::prepare(const std::vector<Manifold*>& manifolds,
                            SolverBodySet& bodies,
                            const SystemConfig& sysConfig,
                            const ContactSolverConfig& config)
{
    constraints.clear();
    constraints.reserve(manifolds.size());

    double const dt = sysConfig.timeStep;
    double const invDt = dt > 0.0 ? 1.0 / dt : 0.0;

    for (Manifold* manifold : manifolds) {
        ManifoldConstraint mc;
        mc.manifold = manifold;
        mc.indexA = bodies.indexOf(manifold->eA);
        mc.indexB = bodies.indexOf(manifold->eB);
        mc.friction = manifold->friction;

        const SolverBody& a = bodies[mc.indexA];
        const SolverBody& b = bodies[mc.indexB];

        for (const auto& cp : manifold->points) {
            PointConstraint pc;
            pc.rA = cp.position - a.center;
            pc.rB = cp.position - b.center;
            pc.normal = cp.normal;
            pc.tangent = crossVS(cp.normal, 1.0);
            pc.normalMass = effectiveMass(a, b, pc.rA, pc.rB, pc.normal);
            pc.tangentMass = effectiveMass(a, b, pc.rA, pc.rB, pc.tangent);

            if (config.warmStarting) {
                pc.normalImpulse = cp.normalImpulse;
                pc.tangentImpulse = cp.tangentImpulse;
            }

            double const vnPre = relativeVelocity(a, b, pc.rA, pc.rB).dotProduct(pc.normal);
            double target = cp.separation > 0.0 ? -cp.separation * invDt : 0.0;
            if (manifold->restitution > 0.0 && vnPre < -config.restitutionThreshold) {
                target = std::max(target, -manifold->restitution * vnPre);
            }
            pc.targetVelocity = target;

            mc.points.push_back(pc);
        }
        constraints.push_back(std::move(mc));
    }
}

void ContactSolver::warmStart(SolverBodySet& bodies) const
{
    for (const auto& mc : constraints) {
        SolverBody& a = bodies[mc.indexA];
        SolverBody& b = bodies[mc.indexB];
        for (const auto& pc : mc.points) {
            Vector const P = pc.normal * pc.normalImpulse + pc.tangent * pc.tangentImpulse;
            applyImpulse(a, b, pc.rA, pc.rB, P);
        }
    }
}

void ContactSolver::solveVelocities(SolverBodySet& bodies)
{
    for (auto& mc : constraints) {
        SolverBody& a = bodies[mc.indexA];
        SolverBody& b = bodies[mc.indexB];

        for (auto& pc : mc.points) {
            // Normal row
            double const vn = relativeVelocity(a, b, pc.rA, pc.rB).dotProduct(pc.normal);
            double lambda = -pc.normalMass * (vn - pc.targetVelocity);
            double const newNormal = std::max(pc.normalImpulse + lambda, 0.0);
            lambda = newNormal - pc.normalImpulse;
            pc.normalImpulse = newNormal;
            applyImpulse(a, b, pc.rA, pc.rB, pc.normal * lambda);

            // Tangent row, bounded by the friction cone
            double const vt = relativeVelocity(a, b, pc.rA, pc.rB).dotProduct(pc.tangent);
            double const maxFriction = mc.friction * pc.normalImpulse;
            double delta = -pc.tangentMass * vt;
            double const newTangent = std::clamp(pc.tangentImpulse + delta, -maxFriction, maxFriction);
            delta = newTangent - pc.tangentImpulse;
            pc.tangentImpulse = newTangent;
            applyImpulse(a, b, pc.rA, pc.rB, pc.tangent * delta);
        }
    }
}

void ContactSolver::storeImpulses() const
{
    for (const auto& mc : constraints) {
        for (std::size_t i = 0; i < mc.points.size(); ++i) {
            mc.manifold->points[i].normalImpulse = mc.points[i].normalImpulse;
            mc.manifold->points[i].tangentImpulse = mc.points[i].tangentImpulse;
        }
    }
}

} // namespace RigidBodyCollision
