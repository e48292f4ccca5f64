/**
 * @file collision_data.hpp
 * @brief Data passed between broad-phase, narrow-phase, the manifold store and the solvers
 */

#pragma once

#include <cstdint>
#include <tuple>
#include <vector>

#include <entt/entt.hpp>

#include "boxigon/core/types.hpp"
#include "boxigon/math/vector_math.hpp"

namespace RigidBodyCollision {

using Boxigon::BodyId;
using Boxigon::ShapeId;

/**
 * @brief Ordered body pair, always with a < b
 */
struct BodyPair {
    BodyId a = Boxigon::NullBody;
    BodyId b = Boxigon::NullBody;

    bool operator<(const BodyPair& o) const {
        return std::tie(a, b) < std::tie(o.a, o.b);
    }
    bool operator==(const BodyPair& o) const { return a == o.a && b == o.b; }
    bool operator!=(const BodyPair& o) const { return !(*this == o); }
};

// CandidatePair produced by the broad phase, sorted by ids
struct CandidatePair {
    BodyPair ids;
    entt::entity eA;
    entt::entity eB;
};

/**
 * @brief Feature flags folded into ContactId feature indices
 *
 * A feature is an edge index (face), a vertex index, or a reference-face side
 * produced by clipping. Circles use feature 0.
 */
namespace Feature {
    constexpr std::uint32_t Face   = 0x000;
    constexpr std::uint32_t Vertex = 0x100;
    constexpr std::uint32_t Clip   = 0x200;
}

/**
 * @brief Identifies a contact point across steps for warm starting
 */
struct ContactId {
    ShapeId shapeA = 0;
    std::uint32_t featureA = 0;
    ShapeId shapeB = 0;
    std::uint32_t featureB = 0;

    bool operator==(const ContactId& o) const {
        return shapeA == o.shapeA && featureA == o.featureA &&
               shapeB == o.shapeB && featureB == o.featureB;
    }
    bool operator!=(const ContactId& o) const { return !(*this == o); }
};

/**
 * @brief One point of a manifold
 *
 * The normal points from body A (lower id) to body B. The anchors and the
 * local normal let the position solver recompute the separation after the
 * bodies have moved.
 */
struct ContactPoint {
    Vector position;          ///< World point midway between the two surfaces
    Vector normal;            ///< World normal, A to B
    double separation = 0.0;  ///< Negative when penetrating
    Vector localAnchorA;      ///< Surface point on A in A's body space
    Vector localAnchorB;      ///< Surface point on B in B's body space
    Vector localNormal;       ///< Normal in A's body space
    double normalImpulse = 0.0;
    double tangentImpulse = 0.0;
    ContactId id;
};

/**
 * @brief Contact manifold of one body pair (at most two points)
 */
struct Manifold {
    BodyPair pair;
    entt::entity eA = entt::null;
    entt::entity eB = entt::null;
    std::vector<ContactPoint> points;
    double friction = 0.0;
    double restitution = 0.0;
};

} // namespace RigidBodyCollision
