/**
 * @file scene.hpp
 * @brief Flat records describing a complete World, and their text format
 *
 * A Scene holds exactly the state needed to make the next step of a
 * reconstructed World identical to the next step of the original: bodies,
 * joints, the manifold cache with accumulated impulses, queued intents,
 * events waiting for the next step and the id counters.
 *
 * The text format is line oriented. Every line starts with a record keyword
 * followed by whitespace separated fields; floating point values are written
 * in hexadecimal so that they survive the round trip bit for bit:
 *
 * @code
 * boxigon-scene 1
 * counters <nextBody> <nextShape> <nextJoint> <nextIsland> <step>
 * body <id> <kind> <px> <py> <angle> <vx> <vy> <w> <density> <restitution> <friction> <asleep> <sleepTime> <island>
 * thruster <fx> <fy> <px> <py>
 * circle <shapeId> <radius> <cx> <cy>
 * polygon <shapeId> <n> <x0> <y0> ... 
 * joint <id> <type> <bodyA> <bodyB> ...
 * manifold <a> <b> <friction> <restitution> <points>
 * point ...
 * intent ...
 * wake <body>
 * ended <a> <b>
 * end
 * @endcode
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "boxigon/core/defs.hpp"
#include "boxigon/core/types.hpp"
#include "boxigon/math/shape.hpp"
#include "boxigon/systems/rigid/collision_data.hpp"

namespace Boxigon {

/**
 * @brief External action queued for the start of the next step
 */
struct Intent {
    enum class Type {
        Force,
        Impulse,
        Explosion
    };

    Type type = Type::Force;
    BodyId body = NullBody;          ///< Force and impulse
    Vector vector;                   ///< Force or impulse
    std::optional<Vector> point;     ///< World application point; center of mass when empty
    Vector center;                   ///< Explosion
    double radius = 0.0;             ///< Explosion
    double magnitude = 0.0;          ///< Explosion impulse at the center
};

const char* toString(Intent::Type type);

struct ShapeRecord {
    ShapeId id = 0;
    ShapeSpec spec;
};

struct ThrusterRecord {
    Vector localForce;
    Vector localPoint;
};

struct BodyRecord {
    BodyId id = NullBody;
    BodyKind kind = BodyKind::Dynamic;
    Vector position;
    double angle = 0.0;
    Vector linearVelocity;
    double angularVelocity = 0.0;
    double density = 1.0;
    double restitution = 0.0;
    double friction = 0.0;
    std::vector<ShapeRecord> shapes;
    bool asleep = false;
    double sleepTime = 0.0;
    std::uint64_t island = 0;
    std::optional<ThrusterRecord> thruster;
};

struct JointRecord {
    JointId id = 0;
    JointSpec spec;
    double length = 0.0;
    double referenceAngle = 0.0;
    Vector linearImpulse;
    double angularImpulse = 0.0;
    double axialImpulse = 0.0;
};

struct ManifoldRecord {
    BodyId a = NullBody;
    BodyId b = NullBody;
    double friction = 0.0;
    double restitution = 0.0;
    std::vector<RigidBodyCollision::ContactPoint> points;
};

/**
 * @struct Scene
 * @brief Complete, self-contained World state
 */
struct Scene {
    std::vector<BodyRecord> bodies;        ///< Sorted by id
    std::vector<JointRecord> joints;       ///< Sorted by id
    std::vector<ManifoldRecord> manifolds; ///< Sorted by pair
    std::vector<Intent> intents;           ///< In call order
    std::vector<BodyId> pendingWakes;      ///< Sorted
    std::vector<std::pair<BodyId, BodyId>> pendingEnded;  ///< Sorted

    BodyId nextBody = 1;
    ShapeId nextShape = 1;
    JointId nextJoint = 1;
    std::uint64_t nextIsland = 1;
    std::uint64_t stepCount = 0;
};

/**
 * @brief Writes @p scene in the text format
 */
void writeScene(std::ostream& os, const Scene& scene);

/**
 * @brief Parses the text format
 * @throws SceneFormatError on malformed input, with the offending line
 */
Scene readScene(std::istream& is);

std::string serializeScene(const Scene& scene);
Scene parseScene(const std::string& text);

/**
 * @throws SceneFormatError when the file cannot be opened or parsed
 */
void saveScene(const std::string& path, const Scene& scene);
Scene loadScene(const std::string& path);

} // namespace Boxigon
