#include "boxigon/systems/rigid/solver_body.hpp"
#include "boxigon/components/basic.hpp"

namespace RigidBodyCollision {

SolverBodySet::SolverBodySet() {
    clear();
}

void SolverBodySet::clear() {
    bodies.clear();
    lookup.clear();
    bodies.emplace_back();  // Ground
}

std::size_t SolverBodySet::add(const entt::registry& registry, entt::entity entity, bool movable) {
    auto it = lookup.find(entity);
    if (it != lookup.end()) {
        return it->second;
    }

    const auto& info = registry.get<Components::BodyInfo>(entity);
    const auto& pos = registry.get<Components::Position>(entity);
    const auto& angle = registry.get<Components::AngularPosition>(entity);
    const auto& md = registry.get<Components::MassData>(entity);

    SolverBody body;
    body.id = info.id;
    body.entity = entity;
    body.angle = angle.angle;
    body.localCenter = md.localCenter;
    body.center = Components::worldCenter(Components::makeTransform(pos, angle), md);
    body.movable = movable;
    if (info.kind != Boxigon::BodyKind::Static) {
        body.v = registry.get<Components::Velocity>(entity);
        body.w = registry.get<Components::AngularVelocity>(entity).omega;
    }
    if (movable) {
        body.invMass = md.invMass;
        body.invI = md.invInertia;
    }

    std::size_t const index = bodies.size();
    bodies.push_back(body);
    lookup.emplace(entity, index);
    return index;
}

std::size_t SolverBodySet::indexOf(entt::entity entity) const {
    auto it = lookup.find(entity);
    return it == lookup.end() ? Ground : it->second;
}

void SolverBodySet::writeVelocities(entt::registry& registry) const {
    for (const auto& body : bodies) {
        if (!body.movable) {
            continue;
        }
        registry.get<Components::Velocity>(body.entity) = body.v;
        registry.get<Components::AngularVelocity>(body.entity).omega = body.w;
    }
}

void SolverBodySet::readPoses(const entt::registry& registry) {
    for (auto& body : bodies) {
        if (body.entity == entt::null) {
            continue;
        }
        const auto& pos = registry.get<Components::Position>(body.entity);
        const auto& angle = registry.get<Components::AngularPosition>(body.entity);
        body.angle = angle.angle;
        body.center = Components::makeTransform(pos, angle).apply(body.localCenter);
        body.moved = false;
    }
}

void SolverBodySet::writePoses(entt::registry& registry) const {
    for (const auto& body : bodies) {
        if (!body.movable || !body.moved) {
            continue;
        }
        Transform const xf = body.transform();
        registry.get<Components::Position>(body.entity) = Components::Position(xf.p);
        registry.get<Components::AngularPosition>(body.entity).angle = body.angle;
    }
}

} // namespace RigidBodyCollision
