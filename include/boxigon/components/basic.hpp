#ifndef BOXIGON_COMPONENTS_BASIC_HPP
#define BOXIGON_COMPONENTS_BASIC_HPP

#include <cstdint>
#include <vector>

#include "boxigon/core/types.hpp"
#include "boxigon/math/shape.hpp"
#include "boxigon/math/vector_math.hpp"

namespace Components {

    // Identity and simulation role of a body entity
    struct BodyInfo {
        Boxigon::BodyId id = Boxigon::NullBody;
        Boxigon::BodyKind kind = Boxigon::BodyKind::Dynamic;
    };

    // Body origin in world space. Distinct from Velocity so the registry
    // stores them separately.
    struct Position : ::Vector {
        using ::Vector::Vector;
        Position() = default;
        Position(const ::Vector& v) : ::Vector(v) {}
    };

    // Linear velocity of the center of mass
    using Velocity = ::Vector;

    // Angular components
    struct AngularPosition {
        double angle = 0.0; // radians
    };

    struct AngularVelocity {
        double omega = 0.0; // radians per second
    };

    // Zero inverses mean infinite mass (static and kinematic bodies)
    struct MassData {
        double mass = 0.0;
        double invMass = 0.0;
        double inertia = 0.0;     // about the center of mass
        double invInertia = 0.0;
        ::Vector localCenter;     // center of mass in body space
    };

    struct Density {
        double value = 1.0;
    };

    struct Material {
        double restitution = 0.0;
        double friction = 0.5;
    };

    struct AttachedShape {
        Boxigon::ShapeId id;
        Boxigon::Shape shape;
    };

    // Shapes owned by the body, in attachment order
    struct ShapeList {
        std::vector<AttachedShape> shapes;
    };

    struct Sleep {
        double sleepTime = 0.0; // seconds spent below the sleep tolerances
        bool asleep = false;
    };

    // Forces queued for the coming step; cleared by the force system
    struct ForceAccumulator {
        ::Vector force;
        double torque = 0.0;
    };

    // Body-fixed force applied every step while the body is awake
    struct Thruster {
        ::Vector localForce;
        ::Vector localPoint;
    };

    // Island of the last island pass (non-owning back-link)
    struct IslandRef {
        std::uint64_t index = 0;
    };

    inline ::Transform makeTransform(const Position& p, const AngularPosition& a) {
        return ::Transform(p, a.angle);
    }

    // Center of mass in world space
    inline ::Vector worldCenter(const ::Transform& xf, const MassData& md) {
        return xf.apply(md.localCenter);
    }

} // namespace Components

#endif
