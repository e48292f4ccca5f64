/**
 * @file force.cpp
 * @brief Gravity, queued forces, thrusters and damping
 */

#include "boxigon/systems/integrator.hpp"
#include "boxigon/components/basic.hpp"
#include "boxigon/core/profile.hpp"

namespace Systems {

void ForceSystem::update(entt::registry& registry) {
    BOXIGON_PROFILE_SCOPE("ForceSystem");

    double const dt = sysConfig.timeStep;
    Vector const gravity = sysConfig.gravity;

    auto view = registry.view<Components::BodyInfo,
                              Components::Velocity,
                              Components::AngularVelocity,
                              Components::MassData,
                              Components::Sleep>();

    for (auto [entity, info, vel, angVel, md, sleep] : view.each()) {
        if (info.kind != Boxigon::BodyKind::Dynamic || sleep.asleep) {
            continue;
        }

        Vector force;
        double torque = 0.0;

        if (const auto* acc = registry.try_get<Components::ForceAccumulator>(entity)) {
            force += acc->force;
            torque += acc->torque;
        }

        // Thrusters turn with the body
        if (const auto* thruster = registry.try_get<Components::Thruster>(entity)) {
            const auto& pos = registry.get<Components::Position>(entity);
            const auto& angle = registry.get<Components::AngularPosition>(entity);
            Transform const xf = Components::makeTransform(pos, angle);
            Vector const f = xf.rotate(thruster->localForce);
            Vector const r = xf.rotate(thruster->localPoint - md.localCenter);
            force += f;
            torque += r.cross(f);
        }

        vel += (gravity + force * md.invMass) * dt;
        angVel.omega += md.invInertia * torque * dt;

        // Pade approximation of exp(-c dt), stable for any damping
        if (specificConfig.linearDamping > 0.0) {
            vel *= 1.0 / (1.0 + dt * specificConfig.linearDamping);
        }
        if (specificConfig.angularDamping > 0.0) {
            angVel.omega *= 1.0 / (1.0 + dt * specificConfig.angularDamping);
        }
    }

    for (auto [entity, acc] : registry.view<Components::ForceAccumulator>().each()) {
        acc.force = Vector();
        acc.torque = 0.0;
    }
}

} // namespace Systems
