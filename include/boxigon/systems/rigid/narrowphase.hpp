/**
 * @file narrowphase.hpp
 * @brief Detailed collision detection producing contact manifolds
 *
 * Shape pairs are dispatched on their kinds:
 * - circle vs circle: closed form along the center line
 * - polygon vs circle: nearest face by edge separation, Voronoi test for vertex contacts
 * - polygon vs polygon: separating axis test, reference face selection and
 *   incident edge clipping (up to two points)
 *
 * Every point carries a ContactId built from (shape id, feature index) of
 * both shapes so that impulses can be matched across steps.
 */

#pragma once

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "boxigon/components/basic.hpp"
#include "boxigon/systems/rigid/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @struct NarrowphaseConfig
 * @brief Configuration parameters specific to the narrow phase
 */
struct NarrowphaseConfig {
    // Points are reported while their separation is at most this (speculative contacts)
    double contactMargin = 0.02;

    // Allowed penetration; a tenth of it is the tolerance for reference face ties
    double linearSlop = 0.005;

    // Worker tasks used for detection (1 = run on the calling thread)
    int threads = 1;

    // Below this many pairs per task detection stays on the calling thread
    std::size_t minPairsPerTask = 64;
};

/**
 * @brief Collides two attached shapes
 *
 * @return 0 to 2 points with normals pointing from shape A to shape B
 */
std::vector<ContactPoint> collideShapes(const Components::AttachedShape& a,
                                        const Transform& xfA,
                                        const Components::AttachedShape& b,
                                        const Transform& xfB,
                                        const NarrowphaseConfig& config);

/**
 * @brief Smallest separation between two shapes (negative when overlapping),
 *        or a value above @p limit when they are further apart than that
 */
double shapeSeparation(const Components::AttachedShape& a,
                       const Transform& xfA,
                       const Components::AttachedShape& b,
                       const Transform& xfB,
                       double limit);

/**
 * @class Narrowphase
 * @brief Builds manifolds for candidate body pairs
 */
class Narrowphase {
public:
    /**
     * @brief Runs detection for every pair
     *
     * @param registry ECS registry containing body components
     * @param pairs Candidate pairs, sorted by ids
     * @param config Narrow phase configuration
     * @return Manifolds with at least one point, in the order of @p pairs.
     *         Impulses are zero; the contact manager carries them over.
     */
    static std::vector<Manifold> detect(const entt::registry& registry,
                                        const std::vector<CandidatePair>& pairs,
                                        const NarrowphaseConfig& config);
};

} // namespace RigidBodyCollision
