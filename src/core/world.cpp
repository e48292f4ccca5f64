/**
 * @file world.cpp
 * @brief World construction and the mutation API
 */

#include "boxigon/core/world.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "boxigon/components/basic.hpp"
#include "boxigon/core/debug.hpp"
#include "boxigon/core/errors.hpp"

namespace Boxigon {

namespace {

bool finite(double v) {
    return std::isfinite(v);
}

void requireFinite(const Vector& v, const char* what) {
    if (!v.isFinite()) {
        throw InvalidParametersError(std::string(what) + " must be finite");
    }
}

void requireFinite(double v, const char* what) {
    if (!finite(v)) {
        throw InvalidParametersError(std::string(what) + " must be finite");
    }
}

} // namespace

World::World(const WorldConfig& worldConfig)
    : config(worldConfig)
{
    setConfig(worldConfig);
}

void World::setConfig(const WorldConfig& newConfig) {
    config = newConfig;
    forceSystem.setSpecificConfig(config.integrator);
    movementSystem.setSpecificConfig(config.integrator);
    sleepSystem.setSpecificConfig(config.sleep);
    broadphaseDirty = true;
}

entt::entity World::entityOf(BodyId body) const {
    auto it = bodyIndex.find(body);
    if (it == bodyIndex.end()) {
        throw UnknownBodyError(body);
    }
    return it->second;
}

void World::validateBodyId(BodyId body) const {
    if (bodyIndex.find(body) == bodyIndex.end()) {
        throw UnknownBodyError(body);
    }
}

bool World::hasBody(BodyId body) const {
    return bodyIndex.find(body) != bodyIndex.end();
}

bool World::hasJoint(JointId joint) const {
    return jointMap.find(joint) != jointMap.end();
}

BodyId World::createBody(const BodyDef& def) {
    requireFinite(def.position, "position");
    requireFinite(def.angle, "angle");
    requireFinite(def.linearVelocity, "linear velocity");
    requireFinite(def.angularVelocity, "angular velocity");
    if (!finite(def.density) || def.density < 0.0) {
        throw InvalidParametersError("density must be finite and non-negative");
    }
    if (!finite(def.restitution) || def.restitution < 0.0 || def.restitution > 1.0) {
        throw InvalidParametersError("restitution must lie in [0, 1]");
    }
    if (!finite(def.friction) || def.friction < 0.0) {
        throw InvalidParametersError("friction must be finite and non-negative");
    }

    BodyId const id = nextBody++;
    entt::entity const entity = registry.create();

    bool const isStatic = def.kind == BodyKind::Static;
    registry.emplace<Components::BodyInfo>(entity, Components::BodyInfo{id, def.kind});
    registry.emplace<Components::Position>(entity, def.position);
    registry.emplace<Components::AngularPosition>(entity, Components::AngularPosition{def.angle});
    registry.emplace<Components::Velocity>(entity, isStatic ? Vector() : def.linearVelocity);
    registry.emplace<Components::AngularVelocity>(entity,
        Components::AngularVelocity{isStatic ? 0.0 : def.angularVelocity});
    registry.emplace<Components::MassData>(entity);
    registry.emplace<Components::Density>(entity, Components::Density{def.density});
    registry.emplace<Components::Material>(entity, Components::Material{def.restitution, def.friction});
    registry.emplace<Components::ShapeList>(entity);
    registry.emplace<Components::ForceAccumulator>(entity);
    Components::Sleep sleep;
    sleep.asleep = def.kind == BodyKind::Dynamic && !def.awake;
    registry.emplace<Components::Sleep>(entity, sleep);

    // A body created asleep is an island of its own
    Components::IslandRef island;
    if (sleep.asleep) {
        island.index = sleepSystem.nextIslandIndex();
        sleepSystem.setNextIslandIndex(island.index + 1);
    }
    registry.emplace<Components::IslandRef>(entity, island);

    bodyIndex.emplace(id, entity);
    updateMassData(entity);
    broadphaseDirty = true;

    BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_VERBOSE,
        "[World] created " << toString(def.kind) << " body " << id << "\n");
    return id;
}

void World::updateMassData(entt::entity entity) {
    const auto& info = registry.get<Components::BodyInfo>(entity);
    const auto& shapes = registry.get<Components::ShapeList>(entity);
    double const density = registry.get<Components::Density>(entity).value;
    auto& md = registry.get<Components::MassData>(entity);

    Vector const oldCenter = md.localCenter;
    md = Components::MassData();

    if (info.kind != BodyKind::Dynamic) {
        return;
    }

    // Accumulate about the body origin, then shift to the center of mass
    double mass = 0.0;
    double inertia = 0.0;
    Vector center;
    for (const auto& attached : shapes.shapes) {
        const Shape& shape = attached.shape;
        double const m = density * shape.area();
        mass += m;
        center += shape.centroid() * m;
        inertia += m * (shape.unitInertia() + shape.centroid().lengthSquared());
    }

    if (mass > 0.0) {
        center = center / mass;
        md.mass = mass;
        md.invMass = 1.0 / mass;
        md.localCenter = center;
        md.inertia = inertia - mass * center.lengthSquared();
        md.invInertia = md.inertia > 0.0 ? 1.0 / md.inertia : 0.0;
        if (md.inertia <= 0.0) {
            md.inertia = 0.0;
        }
    } else {
        // Shapeless (or massless) dynamic bodies still respond to forces
        md.mass = 1.0;
        md.invMass = 1.0;
    }

    // Keep the velocity of the material points when the center of mass moves
    if (md.localCenter != oldCenter) {
        const auto& pos = registry.get<Components::Position>(entity);
        const auto& angle = registry.get<Components::AngularPosition>(entity);
        Transform const xf = Components::makeTransform(pos, angle);
        double const omega = registry.get<Components::AngularVelocity>(entity).omega;
        registry.get<Components::Velocity>(entity) += crossSV(omega, xf.rotate(md.localCenter - oldCenter));
    }
}

ShapeId World::attachShape(BodyId body, const ShapeSpec& spec) {
    entt::entity const entity = entityOf(body);
    Shape shape = Shape::create(spec);

    ShapeId const id = nextShape++;
    registry.get<Components::ShapeList>(entity).shapes.push_back(Components::AttachedShape{id, std::move(shape)});
    // Attaching does not wake the body itself: bodies created asleep keep sleeping
    updateMassData(entity);
    wakeContacts(entity);
    broadphaseDirty = true;
    return id;
}

void World::detachShape(BodyId body, ShapeId shape) {
    entt::entity const entity = entityOf(body);
    auto& shapes = registry.get<Components::ShapeList>(entity).shapes;
    auto it = std::find_if(shapes.begin(), shapes.end(),
                           [shape](const Components::AttachedShape& s) { return s.id == shape; });
    if (it == shapes.end()) {
        std::ostringstream msg;
        msg << "body " << body << " has no shape " << shape;
        throw InvalidParametersError(msg.str());
    }

    wakeContacts(entity);
    shapes.erase(it);
    updateMassData(entity);
    wakeBody(entity);
    broadphaseDirty = true;
}

void World::destroyBody(BodyId body) {
    entt::entity const entity = entityOf(body);

    // Joints go with the body; their other ends wake up
    for (auto it = jointMap.begin(); it != jointMap.end(); ) {
        const auto& joint = it->second;
        bool const onA = joint.spec.bodyA == body;
        bool const onB = joint.spec.bodyB && *joint.spec.bodyB == body;
        if (onA || onB) {
            entt::entity const other = onA ? joint.eB : joint.eA;
            if (other != entt::null) {
                wakeBody(other);
            }
            it = jointMap.erase(it);
        } else {
            ++it;
        }
    }

    wakeContacts(entity);
    for (const auto& pair : contactManager.removeBody(body)) {
        BodyId const other = pair.a == body ? pair.b : pair.a;
        wakeBody(entityOf(other));
        pendingEnded.insert(pair);
    }

    intents.erase(std::remove_if(intents.begin(), intents.end(),
                                 [body](const Intent& intent) {
                                     return intent.type != Intent::Type::Explosion && intent.body == body;
                                 }),
                  intents.end());
    pendingWakes.erase(body);

    registry.destroy(entity);
    bodyIndex.erase(body);
    broadphaseDirty = true;

    BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_VERBOSE, "[World] destroyed body " << body << "\n");
}

void World::applyForce(BodyId body, const Vector& force, std::optional<Vector> point) {
    validateBodyId(body);
    requireFinite(force, "force");
    if (point) {
        requireFinite(*point, "application point");
    }

    Intent intent;
    intent.type = Intent::Type::Force;
    intent.body = body;
    intent.vector = force;
    intent.point = point;
    intents.push_back(intent);
}

void World::applyImpulse(BodyId body, const Vector& impulse, std::optional<Vector> point) {
    validateBodyId(body);
    requireFinite(impulse, "impulse");
    if (point) {
        requireFinite(*point, "application point");
    }

    Intent intent;
    intent.type = Intent::Type::Impulse;
    intent.body = body;
    intent.vector = impulse;
    intent.point = point;
    intents.push_back(intent);
}

void World::applyExplosion(const Vector& center, double radius, double impulse) {
    requireFinite(center, "explosion center");
    requireFinite(impulse, "explosion impulse");
    if (!finite(radius) || radius <= 0.0) {
        throw InvalidParametersError("explosion radius must be finite and positive");
    }

    Intent intent;
    intent.type = Intent::Type::Explosion;
    intent.center = center;
    intent.radius = radius;
    intent.magnitude = impulse;
    intents.push_back(intent);
}

void World::setThruster(BodyId body, const Vector& localForce, const Vector& localPoint) {
    entt::entity const entity = entityOf(body);
    requireFinite(localForce, "thruster force");
    requireFinite(localPoint, "thruster point");

    registry.emplace_or_replace<Components::Thruster>(entity, Components::Thruster{localForce, localPoint});
    wakeBody(entity);
}

void World::clearThruster(BodyId body) {
    entt::entity const entity = entityOf(body);
    registry.remove<Components::Thruster>(entity);
}

void World::setLinearVelocity(BodyId body, const Vector& velocity) {
    entt::entity const entity = entityOf(body);
    requireFinite(velocity, "velocity");
    if (registry.get<Components::BodyInfo>(entity).kind == BodyKind::Static) {
        return;
    }
    registry.get<Components::Velocity>(entity) = velocity;
    if (velocity.lengthSquared() > 0.0) {
        wakeBody(entity);
        wakeContacts(entity);
    }
}

void World::setAngularVelocity(BodyId body, double omega) {
    entt::entity const entity = entityOf(body);
    requireFinite(omega, "angular velocity");
    if (registry.get<Components::BodyInfo>(entity).kind == BodyKind::Static) {
        return;
    }
    registry.get<Components::AngularVelocity>(entity).omega = omega;
    if (omega != 0.0) {
        wakeBody(entity);
        wakeContacts(entity);
    }
}

void World::setTransform(BodyId body, const Vector& position, double angle) {
    entt::entity const entity = entityOf(body);
    requireFinite(position, "position");
    requireFinite(angle, "angle");

    // Sleepers resting on the old pose lose their support, sleepers under the
    // new one are hit by it
    wakeContacts(entity);
    registry.get<Components::Position>(entity) = Components::Position(position);
    registry.get<Components::AngularPosition>(entity).angle = angle;
    wakeBody(entity);
    wakeContacts(entity);
    broadphaseDirty = true;
}

JointId World::addJoint(const JointSpec& spec) {
    entt::entity const eA = entityOf(spec.bodyA);
    entt::entity eB = entt::null;
    if (spec.bodyB) {
        eB = entityOf(*spec.bodyB);
        if (*spec.bodyB == spec.bodyA) {
            throw InvalidParametersError("a joint needs two different bodies");
        }
    }

    requireFinite(spec.localAnchorA, "local anchor A");
    requireFinite(spec.anchorB, "anchor B");
    requireFinite(spec.length, "joint length");
    if (!finite(spec.frequencyHz) || spec.frequencyHz < 0.0) {
        throw InvalidParametersError("joint frequency must be finite and non-negative");
    }
    if (!finite(spec.dampingRatio) || spec.dampingRatio < 0.0) {
        throw InvalidParametersError("joint damping ratio must be finite and non-negative");
    }
    if (std::isnan(spec.breakImpulse) || spec.breakImpulse <= 0.0) {
        throw InvalidParametersError("break impulse must be positive");
    }

    bool const dynamicA = registry.get<Components::BodyInfo>(eA).kind == BodyKind::Dynamic;
    bool const dynamicB = eB != entt::null && registry.get<Components::BodyInfo>(eB).kind == BodyKind::Dynamic;
    if (!dynamicA && !dynamicB) {
        throw InvalidParametersError("a joint needs at least one dynamic body");
    }

    RigidBodyCollision::Joint joint;
    joint.id = nextJoint++;
    joint.spec = spec;
    joint.eA = eA;
    joint.eB = eB;

    Transform const xfA = Components::makeTransform(registry.get<Components::Position>(eA),
                                                    registry.get<Components::AngularPosition>(eA));
    Vector const worldA = xfA.apply(spec.localAnchorA);
    Vector worldB = spec.anchorB;
    double angleB = 0.0;
    if (eB != entt::null) {
        Transform const xfB = Components::makeTransform(registry.get<Components::Position>(eB),
                                                        registry.get<Components::AngularPosition>(eB));
        worldB = xfB.apply(spec.anchorB);
        angleB = registry.get<Components::AngularPosition>(eB).angle;
    }
    joint.length = spec.length >= 0.0 ? spec.length : (worldB - worldA).length();
    joint.referenceAngle = angleB - registry.get<Components::AngularPosition>(eA).angle;

    wakeBody(eA);
    if (eB != entt::null) {
        wakeBody(eB);
    }

    JointId const id = joint.id;
    jointMap.emplace(id, joint);

    BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_VERBOSE,
        "[World] added " << toString(spec.type) << " joint " << id << "\n");
    return id;
}

void World::removeJoint(JointId joint) {
    auto it = jointMap.find(joint);
    if (it == jointMap.end()) {
        throw UnknownJointError(joint);
    }
    wakeBody(it->second.eA);
    if (it->second.eB != entt::null) {
        wakeBody(it->second.eB);
    }
    jointMap.erase(it);
}

void World::wakeBody(entt::entity entity, bool resetTimer) {
    const auto& info = registry.get<Components::BodyInfo>(entity);
    if (info.kind != BodyKind::Dynamic) {
        return;
    }

    auto& sleep = registry.get<Components::Sleep>(entity);
    if (!sleep.asleep) {
        if (resetTimer) {
            sleep.sleepTime = 0.0;
        }
        return;
    }

    // Bodies sleep island by island, so the island index names the whole group
    std::uint64_t const island = registry.get<Components::IslandRef>(entity).index;
    auto view = registry.view<Components::BodyInfo, Components::Sleep, Components::IslandRef>();
    for (auto [other, otherInfo, otherSleep, ref] : view.each()) {
        if (!otherSleep.asleep) {
            continue;
        }
        if (other != entity && (island == 0 || ref.index != island)) {
            continue;
        }
        otherSleep.asleep = false;
        otherSleep.sleepTime = 0.0;
        pendingWakes.insert(otherInfo.id);
    }
}

std::optional<AABB> World::bodyBounds(entt::entity entity) const {
    const auto& shapes = registry.get<Components::ShapeList>(entity).shapes;
    if (shapes.empty()) {
        return std::nullopt;
    }

    Transform const xf = Components::makeTransform(registry.get<Components::Position>(entity),
                                                   registry.get<Components::AngularPosition>(entity));
    AABB box = shapes.front().shape.computeAABB(xf);
    for (const auto& attached : shapes) {
        box.merge(attached.shape.computeAABB(xf));
    }
    return box;
}

void World::wakeContacts(entt::entity entity) {
    if (registry.get<Components::BodyInfo>(entity).kind == BodyKind::Dynamic) {
        return;
    }

    BodyId const id = registry.get<Components::BodyInfo>(entity).id;
    for (const auto& [pair, manifold] : contactManager.getManifolds()) {
        if (pair.a == id) {
            wakeBody(manifold.eB, false);
        } else if (pair.b == id) {
            wakeBody(manifold.eA, false);
        }
    }

    std::optional<AABB> const bounds = bodyBounds(entity);
    if (!bounds) {
        return;
    }
    AABB const reach = bounds->fattened(config.narrowphase.contactMargin);

    // Candidates are collected first: waking one body wakes its whole island
    std::vector<entt::entity> touched;
    auto view = registry.view<Components::BodyInfo, Components::Sleep>();
    for (auto [other, info, sleep] : view.each()) {
        if (other == entity || info.kind != BodyKind::Dynamic || !sleep.asleep) {
            continue;
        }
        std::optional<AABB> const box = bodyBounds(other);
        if (box && box->overlaps(reach)) {
            touched.push_back(other);
        }
    }
    for (entt::entity other : touched) {
        wakeBody(other, false);
    }
}

bool World::isAwakeDynamic(entt::entity entity) const {
    return registry.get<Components::BodyInfo>(entity).kind == BodyKind::Dynamic &&
           !registry.get<Components::Sleep>(entity).asleep;
}

bool World::isActive(entt::entity entity) const {
    const auto& info = registry.get<Components::BodyInfo>(entity);
    switch (info.kind) {
        case BodyKind::Dynamic:
            return !registry.get<Components::Sleep>(entity).asleep;
        case BodyKind::Kinematic:
            return registry.get<Components::Velocity>(entity).lengthSquared() > 0.0 ||
                   registry.get<Components::AngularVelocity>(entity).omega != 0.0;
        case BodyKind::Static:
            return false;
    }
    return false;
}

} // namespace Boxigon
