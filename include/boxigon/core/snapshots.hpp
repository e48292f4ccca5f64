/**
 * @file snapshots.hpp
 * @brief Value copies of World state handed to collaborators
 */

#pragma once

#include <cstdint>
#include <vector>

#include "boxigon/core/defs.hpp"
#include "boxigon/core/types.hpp"
#include "boxigon/math/shape.hpp"
#include "boxigon/math/vector_math.hpp"
#include "boxigon/systems/rigid/collision_data.hpp"

namespace Boxigon {

struct ShapeInfo {
    ShapeId id = 0;
    ShapeSpec spec;    ///< Validated (welded, counter-clockwise) geometry
    AABB worldBox;
};

/**
 * @struct BodyState
 * @brief Read-only copy of one body
 */
struct BodyState {
    BodyId id = NullBody;
    BodyKind kind = BodyKind::Dynamic;
    Vector position;          ///< Body origin
    double angle = 0.0;
    Vector linearVelocity;    ///< Of the center of mass
    double angularVelocity = 0.0;
    Vector worldCenter;
    Vector localCenter;
    double mass = 0.0;
    double invMass = 0.0;
    double inertia = 0.0;     ///< About the center of mass
    double invInertia = 0.0;
    double density = 0.0;
    double restitution = 0.0;
    double friction = 0.0;
    bool asleep = false;
    double sleepTime = 0.0;
    std::uint64_t island = 0;
    bool hasThruster = false;
    std::vector<ShapeInfo> shapes;
};

/**
 * @struct ContactInfo
 * @brief Copy of a stored manifold
 */
struct ContactInfo {
    BodyId a = NullBody;   ///< Lower id; normals point from a to b
    BodyId b = NullBody;
    double friction = 0.0;
    double restitution = 0.0;
    std::vector<RigidBodyCollision::ContactPoint> points;
};

struct JointState {
    JointId id = 0;
    JointSpec spec;
    double length = 0.0;            ///< Distance joints: rest length in use
    Vector worldAnchorA;
    Vector worldAnchorB;
    double impulse = 0.0;           ///< Accumulated impulse magnitude of the last step
};

/**
 * @struct RaycastHit
 * @brief One shape crossed by a ray
 */
struct RaycastHit {
    BodyId body = NullBody;
    ShapeId shape = 0;
    Vector point;
    Vector normal;            ///< Surface normal facing the ray origin
    double distance = 0.0;
};

} // namespace Boxigon
