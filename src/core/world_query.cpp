/**
 * @file world_query.cpp
 * @brief Spatial queries and value snapshots
 */

#include "boxigon/core/world.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

#include "boxigon/components/basic.hpp"
#include "boxigon/core/errors.hpp"
#include "boxigon/core/profile.hpp"
#include "boxigon/systems/rigid/narrowphase.hpp"

namespace Boxigon {

const RigidBodyCollision::Broadphase& World::queryIndex() const {
    if (broadphaseDirty) {
        SystemConfig sys;
        sys.timeStep = lastTimeStep;
        sys.gravity = config.gravity;
        broadphase.rebuild(registry, sys, config.broadphase);
        broadphaseDirty = false;
    }
    return broadphase;
}

std::vector<BodyId> World::queryPoint(const Vector& point) const {
    if (!point.isFinite()) {
        throw InvalidParametersError("query point must be finite");
    }

    const auto& index = queryIndex();
    std::vector<BodyId> result;
    for (std::size_t i : index.queryAABB(AABB(point, point))) {
        const auto& proxy = index.proxies()[i];
        Transform const xf = Components::makeTransform(registry.get<Components::Position>(proxy.entity),
                                                       registry.get<Components::AngularPosition>(proxy.entity));
        for (const auto& attached : registry.get<Components::ShapeList>(proxy.entity).shapes) {
            if (attached.shape.containsPoint(xf, point)) {
                result.push_back(proxy.id);
                break;
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<RaycastHit> World::queryRaycast(const Vector& origin,
                                            const Vector& direction,
                                            double maxDistance) const {
    if (!origin.isFinite() || !direction.isFinite()) {
        throw InvalidParametersError("ray origin and direction must be finite");
    }
    if (direction.lengthSquared() < EPSILON * EPSILON) {
        throw InvalidParametersError("ray direction must not be zero");
    }
    if (!std::isfinite(maxDistance) || maxDistance < 0.0) {
        throw InvalidParametersError("ray length must be finite and non-negative");
    }

    BOXIGON_PROFILE_SCOPE("World::queryRaycast");

    Vector const dir = direction.normalized();
    const auto& index = queryIndex();

    std::vector<RaycastHit> hits;
    for (std::size_t i : index.queryRay(origin, dir, maxDistance)) {
        const auto& proxy = index.proxies()[i];
        Transform const xf = Components::makeTransform(registry.get<Components::Position>(proxy.entity),
                                                       registry.get<Components::AngularPosition>(proxy.entity));
        for (const auto& attached : registry.get<Components::ShapeList>(proxy.entity).shapes) {
            auto hit = attached.shape.raycast(xf, origin, dir, maxDistance);
            if (!hit) {
                continue;
            }
            RaycastHit h;
            h.body = proxy.id;
            h.shape = attached.id;
            h.distance = hit->distance;
            h.normal = hit->normal;
            h.point = origin + dir * hit->distance;
            hits.push_back(h);
        }
    }

    std::sort(hits.begin(), hits.end(), [](const RaycastHit& l, const RaycastHit& r) {
        return std::tie(l.distance, l.body, l.shape) < std::tie(r.distance, r.body, r.shape);
    });
    return hits;
}

std::vector<BodyId> World::queryShape(const ShapeSpec& spec, const Vector& position, double angle) const {
    if (!position.isFinite() || !std::isfinite(angle)) {
        throw InvalidParametersError("query pose must be finite");
    }
    Components::AttachedShape query{0, Shape::create(spec)};
    Transform const xfQuery(position, angle);

    const auto& index = queryIndex();
    std::vector<BodyId> result;
    for (std::size_t i : index.queryAABB(query.shape.computeAABB(xfQuery))) {
        const auto& proxy = index.proxies()[i];
        Transform const xf = Components::makeTransform(registry.get<Components::Position>(proxy.entity),
                                                       registry.get<Components::AngularPosition>(proxy.entity));
        for (const auto& attached : registry.get<Components::ShapeList>(proxy.entity).shapes) {
            if (RigidBodyCollision::shapeSeparation(query, xfQuery, attached, xf, 0.0) <= 0.0) {
                result.push_back(proxy.id);
                break;
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<BodyId> World::queryAABB(const Vector& lower, const Vector& upper) const {
    if (!lower.isFinite() || !upper.isFinite() || lower.x > upper.x || lower.y > upper.y) {
        throw InvalidParametersError("query box must be finite with lower <= upper");
    }

    const auto& index = queryIndex();
    std::vector<BodyId> result;
    for (std::size_t i : index.queryAABB(AABB(lower, upper))) {
        result.push_back(index.proxies()[i].id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::pair<BodyId, BodyId>> World::candidatePairs() const {
    std::vector<std::pair<BodyId, BodyId>> result;
    for (const auto& pair : queryIndex().candidatePairs()) {
        result.emplace_back(pair.ids.a, pair.ids.b);
    }
    return result;
}

BodyState World::makeState(entt::entity entity) const {
    const auto& info = registry.get<Components::BodyInfo>(entity);
    const auto& pos = registry.get<Components::Position>(entity);
    const auto& angle = registry.get<Components::AngularPosition>(entity);
    const auto& md = registry.get<Components::MassData>(entity);
    const auto& material = registry.get<Components::Material>(entity);
    const auto& sleep = registry.get<Components::Sleep>(entity);
    Transform const xf = Components::makeTransform(pos, angle);

    BodyState state;
    state.id = info.id;
    state.kind = info.kind;
    state.position = pos;
    state.angle = angle.angle;
    state.linearVelocity = registry.get<Components::Velocity>(entity);
    state.angularVelocity = registry.get<Components::AngularVelocity>(entity).omega;
    state.worldCenter = Components::worldCenter(xf, md);
    state.localCenter = md.localCenter;
    state.mass = md.mass;
    state.invMass = md.invMass;
    state.inertia = md.inertia;
    state.invInertia = md.invInertia;
    state.density = registry.get<Components::Density>(entity).value;
    state.restitution = material.restitution;
    state.friction = material.friction;
    state.asleep = sleep.asleep;
    state.sleepTime = sleep.sleepTime;
    state.island = registry.get<Components::IslandRef>(entity).index;
    state.hasThruster = registry.all_of<Components::Thruster>(entity);
    for (const auto& attached : registry.get<Components::ShapeList>(entity).shapes) {
        state.shapes.push_back(ShapeInfo{attached.id, attached.shape.spec(), attached.shape.computeAABB(xf)});
    }
    return state;
}

BodyState World::getBody(BodyId body) const {
    return makeState(entityOf(body));
}

std::vector<BodyState> World::bodies() const {
    std::vector<BodyState> states;
    states.reserve(bodyIndex.size());
    for (const auto& [id, entity] : bodyIndex) {
        states.push_back(makeState(entity));
    }
    return states;
}

JointState World::makeJointState(const RigidBodyCollision::Joint& joint) const {
    JointState state;
    state.id = joint.id;
    state.spec = joint.spec;
    state.length = joint.length;
    state.impulse = joint.impulseMagnitude();

    Transform const xfA = Components::makeTransform(registry.get<Components::Position>(joint.eA),
                                                    registry.get<Components::AngularPosition>(joint.eA));
    state.worldAnchorA = xfA.apply(joint.spec.localAnchorA);
    if (joint.eB == entt::null) {
        state.worldAnchorB = joint.spec.anchorB;
    } else {
        Transform const xfB = Components::makeTransform(registry.get<Components::Position>(joint.eB),
                                                        registry.get<Components::AngularPosition>(joint.eB));
        state.worldAnchorB = xfB.apply(joint.spec.anchorB);
    }
    return state;
}

JointState World::getJoint(JointId joint) const {
    auto it = jointMap.find(joint);
    if (it == jointMap.end()) {
        throw UnknownJointError(joint);
    }
    return makeJointState(it->second);
}

std::vector<JointState> World::joints() const {
    std::vector<JointState> states;
    states.reserve(jointMap.size());
    for (const auto& [id, joint] : jointMap) {
        states.push_back(makeJointState(joint));
    }
    return states;
}

std::vector<ContactInfo> World::contacts() const {
    std::vector<ContactInfo> result;
    for (const auto& [pair, manifold] : contactManager.getManifolds()) {
        ContactInfo info;
        info.a = pair.a;
        info.b = pair.b;
        info.friction = manifold.friction;
        info.restitution = manifold.restitution;
        info.points = manifold.points;
        result.push_back(std::move(info));
    }
    return result;
}

} // namespace Boxigon
