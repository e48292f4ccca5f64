/**
 * @file world_step.cpp
 * @brief The fixed-order simulation step
 *
 * 1. Drain queued intents
 * 2. Broad phase, pair filtering
 * 3. Narrow phase and manifold store update
 * 4. Wake islands touched by active bodies
 * 5. Forces (velocity half of the integrator)
 * 6. Joint and contact velocity iterations, joint breaking
 * 7. Movement (position half of the integrator)
 * 8. Position correction
 * 9. Islands and sleep
 * 10. Events and statistics
 */

#include "boxigon/core/world.hpp"

#include <algorithm>
#include <cmath>

#include "boxigon/components/basic.hpp"
#include "boxigon/core/debug.hpp"
#include "boxigon/core/errors.hpp"
#include "boxigon/core/profile.hpp"
#include "boxigon/systems/rigid/narrowphase.hpp"
#include "boxigon/systems/rigid/position_solver.hpp"
#include "boxigon/systems/rigid/solver_body.hpp"

namespace Boxigon {

using RigidBodyCollision::BodyPair;
using RigidBodyCollision::CandidatePair;
using RigidBodyCollision::Manifold;

void World::step(double dt) {
    if (!std::isfinite(dt) || dt <= 0.0) {
        throw InvalidTimestepError(dt);
    }

    BOXIGON_PROFILE_SCOPE("World::step");

    SystemConfig sys;
    sys.timeStep = dt;
    sys.gravity = config.gravity;
    forceSystem.setSystemConfig(sys);
    movementSystem.setSystemConfig(sys);
    sleepSystem.setSystemConfig(sys);
    lastTimeStep = dt;

    StepStats stats;
    stats.step = stepStats.step + 1;

    {
        BOXIGON_PROFILE_SCOPE("Intents");
        drainIntents();
    }

    broadphase.rebuild(registry, sys, config.broadphase);
    stats.candidatePairs = broadphase.candidatePairs().size();

    // Pairs connected by a joint that does not collide its bodies
    std::set<BodyPair> jointedPairs;
    for (const auto& [id, joint] : jointMap) {
        if (!joint.spec.bodyB || joint.spec.collideConnected) {
            continue;
        }
        BodyId const a = std::min(joint.spec.bodyA, *joint.spec.bodyB);
        BodyId const b = std::max(joint.spec.bodyA, *joint.spec.bodyB);
        jointedPairs.insert(BodyPair{a, b});
    }

    std::vector<CandidatePair> tested;
    std::set<BodyPair> frozen;
    {
        BOXIGON_PROFILE_SCOPE("PairFilter");
        for (const auto& pair : broadphase.candidatePairs()) {
            BodyKind const kindA = registry.get<Components::BodyInfo>(pair.eA).kind;
            BodyKind const kindB = registry.get<Components::BodyInfo>(pair.eB).kind;
            if (kindA != BodyKind::Dynamic && kindB != BodyKind::Dynamic) {
                continue;
            }
            if (jointedPairs.count(pair.ids) != 0) {
                continue;
            }
            if (isActive(pair.eA) || isActive(pair.eB)) {
                tested.push_back(pair);
            } else {
                frozen.insert(pair.ids);
            }
        }
    }
    stats.testedPairs = tested.size();

    std::vector<Manifold> fresh = RigidBodyCollision::Narrowphase::detect(registry, tested, config.narrowphase);
    RigidBodyCollision::ContactTransitions transitions = contactManager.update(std::move(fresh), frozen);

    // A sleeper that lost a contact may have lost its support
    for (const auto& pair : transitions.ended) {
        for (BodyId id : {pair.a, pair.b}) {
            auto it = bodyIndex.find(id);
            if (it != bodyIndex.end()) {
                wakeBody(it->second, false);
            }
        }
    }

    wakeTouchedIslands();

    forceSystem.update(registry);

    std::vector<const Manifold*> solved;
    double minSeparation = 0.0;
    std::vector<JointId> broken = solveConstraints(solved, minSeparation);

    // Broken joints leave the simulation; their bodies wake up
    std::map<JointId, std::pair<BodyId, BodyId>> brokenBodies;
    for (JointId id : broken) {
        auto it = jointMap.find(id);
        const auto& joint = it->second;
        brokenBodies.emplace(id, std::make_pair(joint.spec.bodyA, joint.spec.bodyB.value_or(NullBody)));
        wakeBody(joint.eA);
        if (joint.eB != entt::null) {
            wakeBody(joint.eB);
        }
        jointMap.erase(it);
    }

    {
        BOXIGON_PROFILE_SCOPE("Islands");
        std::vector<Systems::SleepSystem::Connection> edges;
        for (const auto& [pair, manifold] : contactManager.getManifolds()) {
            edges.emplace_back(manifold.eA, manifold.eB);
        }
        for (const auto& [id, joint] : jointMap) {
            edges.emplace_back(joint.eA, joint.eB);
        }
        sleepSystem.setConnections(std::move(edges));
        sleepSystem.update(registry);
    }

    emitEvents(transitions, broken, brokenBodies);

    stats.bodies = bodyIndex.size();
    for (const auto& [id, entity] : bodyIndex) {
        const auto& info = registry.get<Components::BodyInfo>(entity);
        if (info.kind != BodyKind::Dynamic) {
            continue;
        }
        if (registry.get<Components::Sleep>(entity).asleep) {
            ++stats.sleepingBodies;
        } else {
            ++stats.awakeBodies;
        }
    }
    stats.manifolds = contactManager.getManifolds().size();
    stats.contactPoints = contactManager.pointCount();
    stats.islands = sleepSystem.islandCount();
    stats.joints = jointMap.size();
    stats.brokenJoints = broken.size();
    stats.minSeparation = minSeparation;
    stepStats = stats;

    broadphaseDirty = true;
}

void World::drainIntents() {
    std::vector<Intent> queued;
    queued.swap(intents);
    for (const auto& intent : queued) {
        applyIntent(intent);
    }
}

void World::applyIntent(const Intent& intent) {
    auto applyImpulseAt = [this](entt::entity entity, const Vector& impulse, const Vector& r) {
        const auto& md = registry.get<Components::MassData>(entity);
        registry.get<Components::Velocity>(entity) += impulse * md.invMass;
        registry.get<Components::AngularVelocity>(entity).omega += md.invInertia * r.cross(impulse);
    };

    auto centerOf = [this](entt::entity entity) {
        Transform const xf = Components::makeTransform(registry.get<Components::Position>(entity),
                                                       registry.get<Components::AngularPosition>(entity));
        return Components::worldCenter(xf, registry.get<Components::MassData>(entity));
    };

    if (intent.type == Intent::Type::Explosion) {
        for (const auto& [id, entity] : bodyIndex) {
            if (registry.get<Components::BodyInfo>(entity).kind != BodyKind::Dynamic) {
                continue;
            }
            Vector const c = centerOf(entity);
            Vector const offset = c - intent.center;
            double const d = offset.length();
            if (d >= intent.radius) {
                continue;
            }
            // A body sitting on the center is pushed straight up
            Vector const dir = d > EPSILON ? offset / d : Vector(0.0, 1.0);
            wakeBody(entity);
            applyImpulseAt(entity, dir * (intent.magnitude * (1.0 - d / intent.radius)), Vector());
        }
        return;
    }

    auto it = bodyIndex.find(intent.body);
    if (it == bodyIndex.end()) {
        return;
    }
    entt::entity const entity = it->second;
    if (registry.get<Components::BodyInfo>(entity).kind != BodyKind::Dynamic) {
        return;
    }

    wakeBody(entity);
    Vector const c = centerOf(entity);
    Vector const r = intent.point ? *intent.point - c : Vector();

    if (intent.type == Intent::Type::Force) {
        auto& acc = registry.get<Components::ForceAccumulator>(entity);
        acc.force += intent.vector;
        acc.torque += r.cross(intent.vector);
    } else {
        applyImpulseAt(entity, intent.vector, r);
    }
}

void World::wakeTouchedIslands() {
    BOXIGON_PROFILE_SCOPE("Wake");

    for (const auto& [pair, manifold] : contactManager.getManifolds()) {
        bool const activeA = isActive(manifold.eA);
        bool const activeB = isActive(manifold.eB);
        if (activeA && !isAwakeDynamic(manifold.eB)) {
            wakeBody(manifold.eB, false);
        } else if (activeB && !isAwakeDynamic(manifold.eA)) {
            wakeBody(manifold.eA, false);
        }
    }
    for (const auto& [id, joint] : jointMap) {
        if (joint.eB == entt::null) {
            continue;
        }
        if (isActive(joint.eA)) {
            wakeBody(joint.eB, false);
        } else if (isActive(joint.eB)) {
            wakeBody(joint.eA, false);
        }
    }
}

std::vector<JointId> World::solveConstraints(std::vector<const Manifold*>& solved, double& minSeparation) {
    BOXIGON_PROFILE_SCOPE("Solver");

    RigidBodyCollision::SolverBodySet bodies;

    std::vector<RigidBodyCollision::Joint*> activeJoints;
    for (auto& [id, joint] : jointMap) {
        bool const movableA = isAwakeDynamic(joint.eA);
        bool const movableB = joint.eB != entt::null && isAwakeDynamic(joint.eB);
        if (!movableA && !movableB) {
            continue;
        }
        bodies.add(registry, joint.eA, movableA);
        if (joint.eB != entt::null) {
            bodies.add(registry, joint.eB, movableB);
        }
        activeJoints.push_back(&joint);
    }

    std::vector<Manifold*> activeManifolds;
    for (auto& [pair, manifold] : contactManager.getManifolds()) {
        bool const movableA = isAwakeDynamic(manifold.eA);
        bool const movableB = isAwakeDynamic(manifold.eB);
        if (!movableA && !movableB) {
            continue;
        }
        bodies.add(registry, manifold.eA, movableA);
        bodies.add(registry, manifold.eB, movableB);
        activeManifolds.push_back(&manifold);
    }

    SystemConfig const& sys = forceSystem.getSystemConfig();
    bool const warmStarting = config.contactSolver.warmStarting;

    jointSolver.prepare(activeJoints, bodies, sys, config.jointSolver, warmStarting);
    contactSolver.prepare(activeManifolds, bodies, sys, config.contactSolver);

    if (warmStarting) {
        jointSolver.warmStart(bodies);
        contactSolver.warmStart(bodies);
    }

    for (int i = 0; i < config.contactSolver.velocityIterations; ++i) {
        jointSolver.solveVelocities(bodies);
        contactSolver.solveVelocities(bodies);
    }

    contactSolver.storeImpulses();
    jointSolver.storeImpulses();
    std::vector<JointId> broken = jointSolver.findBroken();

    bodies.writeVelocities(registry);

    movementSystem.update(registry);

    solved.assign(activeManifolds.begin(), activeManifolds.end());
    bodies.readPoses(registry);
    minSeparation = RigidBodyCollision::PositionSolver::solve(solved, bodies, config.positionSolver);
    bodies.writePoses(registry);

    std::sort(broken.begin(), broken.end());
    return broken;
}

void World::emitEvents(const RigidBodyCollision::ContactTransitions& transitions,
                       const std::vector<JointId>& brokenJoints,
                       const std::map<JointId, std::pair<BodyId, BodyId>>& brokenBodies)
{
    BOXIGON_PROFILE_SCOPE("Events");

    eventLog.clear();

    std::set<BodyId> woke;
    woke.swap(pendingWakes);
    for (BodyId id : woke) {
        // Bodies destroyed or put back to sleep before delivery are not reported
        auto it = bodyIndex.find(id);
        if (it == bodyIndex.end() || registry.get<Components::Sleep>(it->second).asleep) {
            continue;
        }
        eventLog.push_back(WorldEvent{EventType::BodyWoke, id, NullBody, 0});
    }

    for (const auto& pair : transitions.began) {
        eventLog.push_back(WorldEvent{EventType::CollisionBegan, pair.a, pair.b, 0});
    }

    std::set<BodyPair> ended;
    ended.swap(pendingEnded);
    ended.insert(transitions.ended.begin(), transitions.ended.end());
    for (const auto& pair : ended) {
        eventLog.push_back(WorldEvent{EventType::CollisionEnded, pair.a, pair.b, 0});
    }

    for (JointId id : brokenJoints) {
        const auto& bodies = brokenBodies.at(id);
        eventLog.push_back(WorldEvent{EventType::JointBroken, bodies.first, bodies.second, id});
    }

    for (BodyId id : sleepSystem.sleptBodies()) {
        eventLog.push_back(WorldEvent{EventType::BodySlept, id, NullBody, 0});
    }

    for (const auto& ev : eventLog) {
        switch (ev.type) {
            case EventType::BodyWoke:
                dispatcher.trigger(BodyWoke{ev.bodyA});
                break;
            case EventType::CollisionBegan:
                dispatcher.trigger(CollisionBegan{ev.bodyA, ev.bodyB});
                break;
            case EventType::CollisionEnded:
                dispatcher.trigger(CollisionEnded{ev.bodyA, ev.bodyB});
                break;
            case EventType::JointBroken:
                dispatcher.trigger(JointBroken{ev.joint, ev.bodyA, ev.bodyB});
                break;
            case EventType::BodySlept:
                dispatcher.trigger(BodySlept{ev.bodyA});
                break;
        }
    }

    BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_BASIC,
        "[World] step " << stepStats.step + 1 << ": " << eventLog.size() << " events\n");
}

} // namespace Boxigon
