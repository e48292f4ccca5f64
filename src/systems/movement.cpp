/**
 * @file movement.cpp
 * @brief Pose update from the solved velocities
 */

#include <cmath>

#include "boxigon/systems/integrator.hpp"
#include "boxigon/components/basic.hpp"
#include "boxigon/core/profile.hpp"

namespace Systems {

void MovementSystem::update(entt::registry& registry) {
    BOXIGON_PROFILE_SCOPE("MovementSystem");

    double const dt = sysConfig.timeStep;

    auto view = registry.view<Components::BodyInfo,
                              Components::Position,
                              Components::AngularPosition,
                              Components::Velocity,
                              Components::AngularVelocity,
                              Components::MassData,
                              Components::Sleep>();

    for (auto [entity, info, pos, angPos, vel, angVel, md, sleep] : view.each()) {
        if (info.kind == Boxigon::BodyKind::Static || sleep.asleep) {
            continue;
        }

        // Clamp extreme velocities; the clamped value is kept
        Vector translation = vel * dt;
        double const tl = translation.length();
        if (tl > specificConfig.maxTranslation) {
            vel *= specificConfig.maxTranslation / tl;
            translation = vel * dt;
        }
        double rotation = angVel.omega * dt;
        if (std::fabs(rotation) > specificConfig.maxRotation) {
            angVel.omega *= specificConfig.maxRotation / std::fabs(rotation);
            rotation = angVel.omega * dt;
        }

        Vector const center = Components::worldCenter(Components::makeTransform(pos, angPos), md) + translation;
        angPos.angle += rotation;

        Transform xf(Vector(), angPos.angle);
        pos = Components::Position(center - xf.rotate(md.localCenter));
    }
}

} // namespace Systems
