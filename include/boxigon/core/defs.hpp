/**
 * @file defs.hpp
 * @brief Creation parameters for bodies and joints
 */

#pragma once

#include <limits>
#include <optional>

#include "boxigon/core/types.hpp"
#include "boxigon/math/vector_math.hpp"

namespace Boxigon {

/**
 * @struct BodyDef
 * @brief Parameters of World::createBody
 *
 * All values must be finite; density must be non-negative, restitution in
 * [0, 1] and friction non-negative.
 */
struct BodyDef {
    BodyKind kind = BodyKind::Dynamic;
    Vector position;               ///< Body origin in world space
    double angle = 0.0;            ///< Radians
    Vector linearVelocity;         ///< Velocity of the center of mass
    double angularVelocity = 0.0;
    double density = 1.0;          ///< kg/m^2, used for every attached shape
    double restitution = 0.1;
    double friction = 0.5;
    bool awake = true;             ///< Dynamic bodies may start asleep
};

enum class JointType {
    Distance,  ///< Keeps two anchors at a fixed (or sprung) distance
    Pin,       ///< Keeps two anchors coincident (revolute)
    Weld       ///< Keeps two anchors coincident and the relative angle fixed
};

const char* toString(JointType type);

/**
 * @struct JointSpec
 * @brief Parameters of World::addJoint
 */
struct JointSpec {
    JointType type = JointType::Distance;
    BodyId bodyA = NullBody;
    std::optional<BodyId> bodyB;   ///< Empty: the joint is anchored to the world
    Vector localAnchorA;           ///< Anchor in A's body space
    Vector anchorB;                ///< Anchor in B's body space, or a world point without B

    double length = -1.0;          ///< Distance joints; negative uses the current anchor distance
    double frequencyHz = 0.0;      ///< Distance joints; 0 is rigid, otherwise a spring
    double dampingRatio = 0.0;     ///< Spring damping ratio (distance joints)

    bool collideConnected = false; ///< Whether the two bodies still collide with each other

    /// Accumulated impulse above which the joint breaks
    double breakImpulse = std::numeric_limits<double>::infinity();
};

} // namespace Boxigon
