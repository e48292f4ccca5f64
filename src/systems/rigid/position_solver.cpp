/**
 * @file position_solver.cpp
 * @brief Baumgarte-style positional correction of contact penetration
 */

#include <algorithm>
#include <cmath>
#include <vector>

#include "boxigon/systems/rigid/position_solver.hpp"
#include "boxigon/core/profile.hpp"

namespace RigidBodyCollision {

double PositionSolver::solve(const std::vector<const Manifold*>& manifolds,
                             SolverBodySet& bodies,
                             const PositionSolverConfig& config)
{
    BOXIGON_PROFILE_SCOPE("PositionSolver");

    // Resolve body indices once
    struct Entry {
        const Manifold* manifold;
        std::size_t indexA;
        std::size_t indexB;
    };
    std::vector<Entry> entries;
    entries.reserve(manifolds.size());
    for (const Manifold* m : manifolds) {
        entries.push_back({m, bodies.indexOf(m->eA), bodies.indexOf(m->eB)});
    }

    double minSeparation = 0.0;
    for (int iter = 0; iter < config.iterations; ++iter) {
        minSeparation = 0.0;

        for (const auto& entry : entries) {
            SolverBody& a = bodies[entry.indexA];
            SolverBody& b = bodies[entry.indexB];
            if (a.invMass + a.invI + b.invMass + b.invI <= 0.0) {
                continue;
            }

            for (const auto& cp : entry.manifold->points) {
                Transform const xfA = a.transform();
                Transform const xfB = b.transform();
                Vector const pA = xfA.apply(cp.localAnchorA);
                Vector const pB = xfB.apply(cp.localAnchorB);
                Vector const n = xfA.rotate(cp.localNormal);
                double const separation = (pB - pA).dotProduct(n);
                Vector const p = (pA + pB) * 0.5;

                minSeparation = std::min(minSeparation, separation);

                double const C = std::clamp(config.baumgarte * (separation + config.linearSlop),
                                            -config.maxCorrection, 0.0);
                if (C >= 0.0) {
                    continue;
                }

                Vector const rA = p - a.center;
                Vector const rB = p - b.center;
                double const rnA = rA.cross(n);
                double const rnB = rB.cross(n);
                double const K = a.invMass + b.invMass + a.invI * rnA * rnA + b.invI * rnB * rnB;
                if (K <= 0.0) {
                    continue;
                }

                Vector const P = n * (-C / K);

                a.center -= P * a.invMass;
                a.angle -= a.invI * rA.cross(P);
                b.center += P * b.invMass;
                b.angle += b.invI * rB.cross(P);
                a.moved = a.moved || a.movable;
                b.moved = b.moved || b.movable;
            }
        }
    }
    return minSeparation;
}

} // namespace RigidBodyCollision
