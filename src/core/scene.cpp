/**
 * @file scene.cpp
 * @brief Text reader and writer of Scene records
 */

#include "boxigon/core/scene.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <ios>
#include <sstream>

#include "boxigon/core/errors.hpp"

namespace Boxigon {

namespace {

constexpr const char* SceneMagic = "boxigon-scene";
constexpr int SceneVersion = 1;

/**
 * @brief Token cursor over one line of the text format
 */
class LineReader {
public:
    LineReader(const std::string& text, std::size_t lineNumber)
        : stream(text), line(lineNumber) {}

    std::string word() {
        std::string token;
        if (!(stream >> token)) {
            fail("unexpected end of line");
        }
        return token;
    }

    double real() {
        std::string const token = word();
        char* end = nullptr;
        double const value = std::strtod(token.c_str(), &end);
        // Subnormal values set ERANGE but still round-trip exactly
        if (end == token.c_str() || *end != '\0') {
            fail("bad number '" + token + "'");
        }
        return value;
    }

    std::uint64_t integer() {
        std::string const token = word();
        char* end = nullptr;
        errno = 0;
        unsigned long long const value = std::strtoull(token.c_str(), &end, 10);
        if (end == token.c_str() || *end != '\0' || errno == ERANGE || token[0] == '-') {
            fail("bad integer '" + token + "'");
        }
        return value;
    }

    std::uint32_t id() {
        std::uint64_t const value = integer();
        if (value > 0xffffffffULL) {
            fail("id out of range");
        }
        return static_cast<std::uint32_t>(value);
    }

    bool flag() {
        std::uint64_t const value = integer();
        if (value > 1) {
            fail("expected 0 or 1");
        }
        return value == 1;
    }

    Vector vec() {
        double const x = real();
        double const y = real();
        return Vector(x, y);
    }

    void finish() {
        std::string extra;
        if (stream >> extra) {
            fail("unexpected trailing field '" + extra + "'");
        }
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw SceneFormatError(line, message);
    }

    std::size_t number() const { return line; }

private:
    std::istringstream stream;
    std::size_t line;
};

BodyKind parseKind(LineReader& in) {
    std::string const token = in.word();
    for (BodyKind kind : {BodyKind::Static, BodyKind::Kinematic, BodyKind::Dynamic}) {
        if (token == toString(kind)) {
            return kind;
        }
    }
    in.fail("unknown body kind '" + token + "'");
}

JointType parseJointType(LineReader& in) {
    std::string const token = in.word();
    for (JointType type : {JointType::Distance, JointType::Pin, JointType::Weld}) {
        if (token == toString(type)) {
            return type;
        }
    }
    in.fail("unknown joint type '" + token + "'");
}

Intent::Type parseIntentType(LineReader& in) {
    std::string const token = in.word();
    for (Intent::Type type : {Intent::Type::Force, Intent::Type::Impulse, Intent::Type::Explosion}) {
        if (token == toString(type)) {
            return type;
        }
    }
    in.fail("unknown intent '" + token + "'");
}

void writeVec(std::ostream& os, const Vector& v) {
    os << ' ' << v.x << ' ' << v.y;
}

} // namespace

const char* toString(Intent::Type type) {
    switch (type) {
        case Intent::Type::Force:     return "force";
        case Intent::Type::Impulse:   return "impulse";
        case Intent::Type::Explosion: return "explosion";
    }
    return "unknown";
}

void writeScene(std::ostream& os, const Scene& scene) {
    std::ios_base::fmtflags const flags = os.flags();
    os << std::hexfloat;

    os << SceneMagic << ' ' << SceneVersion << '\n';
    os << "counters " << scene.nextBody << ' ' << scene.nextShape << ' ' << scene.nextJoint
       << ' ' << scene.nextIsland << ' ' << scene.stepCount << '\n';

    for (const auto& body : scene.bodies) {
        os << "body " << body.id << ' ' << toString(body.kind);
        writeVec(os, body.position);
        os << ' ' << body.angle;
        writeVec(os, body.linearVelocity);
        os << ' ' << body.angularVelocity
           << ' ' << body.density << ' ' << body.restitution << ' ' << body.friction
           << ' ' << (body.asleep ? 1 : 0) << ' ' << body.sleepTime << ' ' << body.island << '\n';

        if (body.thruster) {
            os << "thruster";
            writeVec(os, body.thruster->localForce);
            writeVec(os, body.thruster->localPoint);
            os << '\n';
        }

        for (const auto& shape : body.shapes) {
            if (shape.spec.kind == ShapeKind::Circle) {
                os << "circle " << shape.id << ' ' << shape.spec.radius;
                writeVec(os, shape.spec.center);
            } else {
                os << "polygon " << shape.id << ' ' << shape.spec.vertices.size();
                for (const auto& v : shape.spec.vertices) {
                    writeVec(os, v);
                }
            }
            os << '\n';
        }
    }

    for (const auto& joint : scene.joints) {
        const JointSpec& spec = joint.spec;
        os << "joint " << joint.id << ' ' << toString(spec.type) << ' ' << spec.bodyA
           << ' ' << spec.bodyB.value_or(NullBody);
        writeVec(os, spec.localAnchorA);
        writeVec(os, spec.anchorB);
        os << ' ' << spec.length << ' ' << spec.frequencyHz << ' ' << spec.dampingRatio
           << ' ' << (spec.collideConnected ? 1 : 0) << ' ' << spec.breakImpulse
           << ' ' << joint.length << ' ' << joint.referenceAngle;
        writeVec(os, joint.linearImpulse);
        os << ' ' << joint.angularImpulse << ' ' << joint.axialImpulse << '\n';
    }

    for (const auto& manifold : scene.manifolds) {
        os << "manifold " << manifold.a << ' ' << manifold.b << ' ' << manifold.friction
           << ' ' << manifold.restitution << '\n';
        for (const auto& p : manifold.points) {
            os << "point";
            writeVec(os, p.position);
            writeVec(os, p.normal);
            os << ' ' << p.separation;
            writeVec(os, p.localAnchorA);
            writeVec(os, p.localAnchorB);
            writeVec(os, p.localNormal);
            os << ' ' << p.normalImpulse << ' ' << p.tangentImpulse
               << ' ' << p.id.shapeA << ' ' << p.id.featureA
               << ' ' << p.id.shapeB << ' ' << p.id.featureB << '\n';
        }
    }

    for (const auto& intent : scene.intents) {
        os << "intent " << toString(intent.type) << ' ' << intent.body;
        writeVec(os, intent.vector);
        os << ' ' << (intent.point ? 1 : 0);
        writeVec(os, intent.point.value_or(Vector()));
        writeVec(os, intent.center);
        os << ' ' << intent.radius << ' ' << intent.magnitude << '\n';
    }

    for (BodyId id : scene.pendingWakes) {
        os << "wake " << id << '\n';
    }
    for (const auto& [a, b] : scene.pendingEnded) {
        os << "ended " << a << ' ' << b << '\n';
    }

    os << "end\n";
    os.flags(flags);
}

Scene readScene(std::istream& is) {
    Scene scene;
    std::string text;
    std::size_t lineNumber = 0;
    bool sawHeader = false;
    bool sawEnd = false;

    while (std::getline(is, text)) {
        ++lineNumber;
        if (text.empty() || text[0] == '#') {
            continue;
        }
        if (sawEnd) {
            throw SceneFormatError(lineNumber, "content after 'end'");
        }

        LineReader in(text, lineNumber);
        std::string const record = in.word();

        if (!sawHeader) {
            if (record != SceneMagic) {
                in.fail("missing scene header");
            }
            if (in.integer() != SceneVersion) {
                in.fail("unsupported scene version");
            }
            in.finish();
            sawHeader = true;
            continue;
        }

        if (record == "counters") {
            scene.nextBody = in.id();
            scene.nextShape = in.id();
            scene.nextJoint = in.id();
            scene.nextIsland = in.integer();
            scene.stepCount = in.integer();
        } else if (record == "body") {
            BodyRecord body;
            body.id = in.id();
            body.kind = parseKind(in);
            body.position = in.vec();
            body.angle = in.real();
            body.linearVelocity = in.vec();
            body.angularVelocity = in.real();
            body.density = in.real();
            body.restitution = in.real();
            body.friction = in.real();
            body.asleep = in.flag();
            body.sleepTime = in.real();
            body.island = in.integer();
            scene.bodies.push_back(std::move(body));
        } else if (record == "thruster" || record == "circle" || record == "polygon") {
            if (scene.bodies.empty()) {
                in.fail("'" + record + "' before any body");
            }
            BodyRecord& body = scene.bodies.back();
            if (record == "thruster") {
                ThrusterRecord thruster;
                thruster.localForce = in.vec();
                thruster.localPoint = in.vec();
                body.thruster = thruster;
            } else if (record == "circle") {
                ShapeRecord shape;
                shape.id = in.id();
                double const radius = in.real();
                shape.spec = ShapeSpec::circle(radius, in.vec());
                body.shapes.push_back(std::move(shape));
            } else {
                ShapeRecord shape;
                shape.id = in.id();
                std::uint64_t const count = in.integer();
                if (count > 1024) {
                    in.fail("polygon has too many vertices");
                }
                std::vector<Vector> vertices;
                for (std::uint64_t i = 0; i < count; ++i) {
                    vertices.push_back(in.vec());
                }
                shape.spec = ShapeSpec::polygon(std::move(vertices));
                body.shapes.push_back(std::move(shape));
            }
        } else if (record == "joint") {
            JointRecord joint;
            joint.id = in.id();
            joint.spec.type = parseJointType(in);
            joint.spec.bodyA = in.id();
            BodyId const bodyB = in.id();
            if (bodyB != NullBody) {
                joint.spec.bodyB = bodyB;
            }
            joint.spec.localAnchorA = in.vec();
            joint.spec.anchorB = in.vec();
            joint.spec.length = in.real();
            joint.spec.frequencyHz = in.real();
            joint.spec.dampingRatio = in.real();
            joint.spec.collideConnected = in.flag();
            joint.spec.breakImpulse = in.real();
            joint.length = in.real();
            joint.referenceAngle = in.real();
            joint.linearImpulse = in.vec();
            joint.angularImpulse = in.real();
            joint.axialImpulse = in.real();
            scene.joints.push_back(std::move(joint));
        } else if (record == "manifold") {
            ManifoldRecord manifold;
            manifold.a = in.id();
            manifold.b = in.id();
            manifold.friction = in.real();
            manifold.restitution = in.real();
            scene.manifolds.push_back(std::move(manifold));
        } else if (record == "point") {
            if (scene.manifolds.empty()) {
                in.fail("'point' before any manifold");
            }
            RigidBodyCollision::ContactPoint p;
            p.position = in.vec();
            p.normal = in.vec();
            p.separation = in.real();
            p.localAnchorA = in.vec();
            p.localAnchorB = in.vec();
            p.localNormal = in.vec();
            p.normalImpulse = in.real();
            p.tangentImpulse = in.real();
            p.id.shapeA = in.id();
            p.id.featureA = in.id();
            p.id.shapeB = in.id();
            p.id.featureB = in.id();
            scene.manifolds.back().points.push_back(p);
        } else if (record == "intent") {
            Intent intent;
            intent.type = parseIntentType(in);
            intent.body = in.id();
            intent.vector = in.vec();
            bool const hasPoint = in.flag();
            Vector const point = in.vec();
            if (hasPoint) {
                intent.point = point;
            }
            intent.center = in.vec();
            intent.radius = in.real();
            intent.magnitude = in.real();
            scene.intents.push_back(intent);
        } else if (record == "wake") {
            scene.pendingWakes.push_back(in.id());
        } else if (record == "ended") {
            BodyId const a = in.id();
            BodyId const b = in.id();
            scene.pendingEnded.emplace_back(a, b);
        } else if (record == "end") {
            sawEnd = true;
        } else {
            in.fail("unknown record '" + record + "'");
        }
        in.finish();
    }

    if (!sawHeader) {
        throw SceneFormatError(lineNumber, "empty scene");
    }
    if (!sawEnd) {
        throw SceneFormatError(lineNumber, "missing 'end'");
    }
    return scene;
}

std::string serializeScene(const Scene& scene) {
    std::ostringstream os;
    writeScene(os, scene);
    return os.str();
}

Scene parseScene(const std::string& text) {
    std::istringstream is(text);
    return readScene(is);
}

void saveScene(const std::string& path, const Scene& scene) {
    std::ofstream file(path);
    if (!file) {
        throw SceneFormatError(0, "cannot open '" + path + "' for writing");
    }
    writeScene(file, scene);
    if (!file) {
        throw SceneFormatError(0, "failed writing '" + path + "'");
    }
}

Scene loadScene(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw SceneFormatError(0, "cannot open '" + path + "'");
    }
    return readScene(file);
}

} // namespace Boxigon
