/**
 * @file world_scene.cpp
 * @brief Scene snapshot and World reconstruction
 */

#include "boxigon/core/world.hpp"

#include <cmath>
#include <set>
#include <string>

#include "boxigon/components/basic.hpp"
#include "boxigon/core/errors.hpp"

namespace Boxigon {

Scene World::snapshot() const {
    Scene scene;

    for (const auto& [id, entity] : bodyIndex) {
        BodyRecord record;
        record.id = id;
        record.kind = registry.get<Components::BodyInfo>(entity).kind;
        record.position = registry.get<Components::Position>(entity);
        record.angle = registry.get<Components::AngularPosition>(entity).angle;
        record.linearVelocity = registry.get<Components::Velocity>(entity);
        record.angularVelocity = registry.get<Components::AngularVelocity>(entity).omega;
        record.density = registry.get<Components::Density>(entity).value;
        const auto& material = registry.get<Components::Material>(entity);
        record.restitution = material.restitution;
        record.friction = material.friction;
        for (const auto& attached : registry.get<Components::ShapeList>(entity).shapes) {
            record.shapes.push_back(ShapeRecord{attached.id, attached.shape.spec()});
        }
        const auto& sleep = registry.get<Components::Sleep>(entity);
        record.asleep = sleep.asleep;
        record.sleepTime = sleep.sleepTime;
        record.island = registry.get<Components::IslandRef>(entity).index;
        if (const auto* thruster = registry.try_get<Components::Thruster>(entity)) {
            record.thruster = ThrusterRecord{thruster->localForce, thruster->localPoint};
        }
        scene.bodies.push_back(std::move(record));
    }

    for (const auto& [id, joint] : jointMap) {
        JointRecord record;
        record.id = id;
        record.spec = joint.spec;
        record.length = joint.length;
        record.referenceAngle = joint.referenceAngle;
        record.linearImpulse = joint.linearImpulse;
        record.angularImpulse = joint.angularImpulse;
        record.axialImpulse = joint.axialImpulse;
        scene.joints.push_back(record);
    }

    for (const auto& [pair, manifold] : contactManager.getManifolds()) {
        ManifoldRecord record;
        record.a = pair.a;
        record.b = pair.b;
        record.friction = manifold.friction;
        record.restitution = manifold.restitution;
        record.points = manifold.points;
        scene.manifolds.push_back(std::move(record));
    }

    scene.intents = intents;
    scene.pendingWakes.assign(pendingWakes.begin(), pendingWakes.end());
    for (const auto& pair : pendingEnded) {
        scene.pendingEnded.emplace_back(pair.a, pair.b);
    }

    scene.nextBody = nextBody;
    scene.nextShape = nextShape;
    scene.nextJoint = nextJoint;
    scene.nextIsland = sleepSystem.nextIslandIndex();
    scene.stepCount = stepStats.step;
    return scene;
}

World World::fromScene(const Scene& scene, const WorldConfig& config) {
    return World(scene, config);
}

World::World(const Scene& scene, const WorldConfig& worldConfig)
    : World(worldConfig)
{
    restore(scene);
}

void World::restore(const Scene& scene) {
    auto inconsistent = [](const std::string& message) {
        return SceneFormatError(0, message);
    };

    if (scene.nextIsland == 0) {
        throw inconsistent("island counter must start at 1");
    }

    std::set<ShapeId> shapeIds;
    for (const auto& body : scene.bodies) {
        if (body.id == NullBody || body.id >= scene.nextBody) {
            throw inconsistent("body id " + std::to_string(body.id) + " outside the issued range");
        }
        if (bodyIndex.find(body.id) != bodyIndex.end()) {
            throw inconsistent("duplicate body id " + std::to_string(body.id));
        }
        if (!body.position.isFinite() || !body.linearVelocity.isFinite() ||
            !std::isfinite(body.angle) || !std::isfinite(body.angularVelocity) ||
            !std::isfinite(body.density) || body.density < 0.0 ||
            !std::isfinite(body.restitution) || body.restitution < 0.0 || body.restitution > 1.0 ||
            !std::isfinite(body.friction) || body.friction < 0.0 ||
            !std::isfinite(body.sleepTime)) {
            throw inconsistent("body " + std::to_string(body.id) + " has invalid parameters");
        }
        // Island 0 is "no island"; a sleeping body wakes by its island index
        if (body.island >= scene.nextIsland ||
            (body.asleep && body.kind == BodyKind::Dynamic && body.island == 0)) {
            throw inconsistent("body " + std::to_string(body.id) + " has island " +
                               std::to_string(body.island) + " outside the issued range");
        }

        entt::entity const entity = registry.create();
        registry.emplace<Components::BodyInfo>(entity, Components::BodyInfo{body.id, body.kind});
        registry.emplace<Components::Position>(entity, body.position);
        registry.emplace<Components::AngularPosition>(entity, Components::AngularPosition{body.angle});
        registry.emplace<Components::Velocity>(entity, body.linearVelocity);
        registry.emplace<Components::AngularVelocity>(entity, Components::AngularVelocity{body.angularVelocity});
        registry.emplace<Components::MassData>(entity);
        registry.emplace<Components::Density>(entity, Components::Density{body.density});
        registry.emplace<Components::Material>(entity, Components::Material{body.restitution, body.friction});
        registry.emplace<Components::ForceAccumulator>(entity);
        registry.emplace<Components::IslandRef>(entity, Components::IslandRef{body.island});

        Components::Sleep sleep;
        sleep.asleep = body.asleep && body.kind == BodyKind::Dynamic;
        sleep.sleepTime = body.sleepTime;
        registry.emplace<Components::Sleep>(entity, sleep);

        Components::ShapeList shapes;
        for (const auto& record : body.shapes) {
            if (record.id == 0 || record.id >= scene.nextShape || !shapeIds.insert(record.id).second) {
                throw inconsistent("bad shape id " + std::to_string(record.id));
            }
            try {
                shapes.shapes.push_back(Components::AttachedShape{record.id, Shape::create(record.spec)});
            } catch (const InvalidGeometryError& e) {
                throw inconsistent(std::string("shape ") + std::to_string(record.id) + ": " + e.what());
            }
        }
        registry.emplace<Components::ShapeList>(entity, std::move(shapes));

        if (body.thruster) {
            registry.emplace<Components::Thruster>(entity,
                Components::Thruster{body.thruster->localForce, body.thruster->localPoint});
        }

        bodyIndex.emplace(body.id, entity);

        // Mass data is derived; the stored velocity is already the center-of-mass velocity
        updateMassData(entity);
        registry.get<Components::Velocity>(entity) = body.linearVelocity;
    }

    for (const auto& record : scene.joints) {
        if (record.id == 0 || record.id >= scene.nextJoint || jointMap.count(record.id) != 0) {
            throw inconsistent("bad joint id " + std::to_string(record.id));
        }
        auto itA = bodyIndex.find(record.spec.bodyA);
        if (itA == bodyIndex.end()) {
            throw inconsistent("joint " + std::to_string(record.id) + " references a missing body");
        }
        const JointSpec& spec = record.spec;
        if (!spec.localAnchorA.isFinite() || !spec.anchorB.isFinite() || !std::isfinite(spec.length) ||
            !std::isfinite(spec.frequencyHz) || spec.frequencyHz < 0.0 ||
            !std::isfinite(spec.dampingRatio) || spec.dampingRatio < 0.0 ||
            std::isnan(spec.breakImpulse) || spec.breakImpulse <= 0.0 ||
            !std::isfinite(record.length) || record.length < 0.0 ||
            !std::isfinite(record.referenceAngle) || !record.linearImpulse.isFinite() ||
            !std::isfinite(record.angularImpulse) || !std::isfinite(record.axialImpulse)) {
            throw inconsistent("joint " + std::to_string(record.id) + " has invalid parameters");
        }

        RigidBodyCollision::Joint joint;
        joint.id = record.id;
        joint.spec = record.spec;
        joint.eA = itA->second;
        if (record.spec.bodyB) {
            auto itB = bodyIndex.find(*record.spec.bodyB);
            if (itB == bodyIndex.end() || *record.spec.bodyB == record.spec.bodyA) {
                throw inconsistent("joint " + std::to_string(record.id) + " references a missing body");
            }
            joint.eB = itB->second;
        }
        joint.length = record.length;
        joint.referenceAngle = record.referenceAngle;
        joint.linearImpulse = record.linearImpulse;
        joint.angularImpulse = record.angularImpulse;
        joint.axialImpulse = record.axialImpulse;
        jointMap.emplace(joint.id, joint);
    }

    for (const auto& record : scene.manifolds) {
        auto itA = bodyIndex.find(record.a);
        auto itB = bodyIndex.find(record.b);
        if (record.a >= record.b || itA == bodyIndex.end() || itB == bodyIndex.end()) {
            throw inconsistent("manifold references an invalid body pair");
        }
        if (record.points.empty() || record.points.size() > 2) {
            throw inconsistent("manifold must hold one or two points");
        }
        RigidBodyCollision::Manifold manifold;
        manifold.pair = RigidBodyCollision::BodyPair{record.a, record.b};
        manifold.eA = itA->second;
        manifold.eB = itB->second;
        manifold.friction = record.friction;
        manifold.restitution = record.restitution;
        manifold.points = record.points;
        contactManager.restore(manifold);
    }

    for (const auto& intent : scene.intents) {
        if (intent.type != Intent::Type::Explosion && bodyIndex.find(intent.body) == bodyIndex.end()) {
            throw inconsistent("intent targets missing body " + std::to_string(intent.body));
        }
        intents.push_back(intent);
    }

    for (BodyId id : scene.pendingWakes) {
        if (bodyIndex.find(id) == bodyIndex.end()) {
            throw inconsistent("pending wake of missing body " + std::to_string(id));
        }
        pendingWakes.insert(id);
    }
    for (const auto& [a, b] : scene.pendingEnded) {
        // The bodies may be gone already, but their ids were issued
        if (a == NullBody || a >= b || b >= scene.nextBody) {
            throw inconsistent("ended pair " + std::to_string(a) + " " + std::to_string(b) + " is invalid");
        }
        pendingEnded.insert(RigidBodyCollision::BodyPair{a, b});
    }

    nextBody = scene.nextBody;
    nextShape = scene.nextShape;
    nextJoint = scene.nextJoint;
    sleepSystem.setNextIslandIndex(scene.nextIsland);
    stepStats.step = scene.stepCount;
    broadphaseDirty = true;
}

} // namespace Boxigon
