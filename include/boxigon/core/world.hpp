/**
 * @file world.hpp
 * @brief The physics World: owns bodies, joints, the manifold store and the systems
 *
 * Typical use:
 *
 * @code
 * Boxigon::World world;
 * Boxigon::BodyDef ground;
 * ground.kind = Boxigon::BodyKind::Static;
 * auto floor = world.createBody(ground);
 * world.attachShape(floor, Boxigon::ShapeSpec::box(20.0, 0.5));
 *
 * Boxigon::BodyDef crate;
 * crate.position = Vector(0.0, 3.0);
 * auto box = world.attachShape(world.createBody(crate), Boxigon::ShapeSpec::box(0.5, 0.5));
 *
 * world.onEvent<Boxigon::CollisionBegan>().connect<&onCollision>();
 * for (int i = 0; i < 600; ++i) {
 *     world.step(1.0 / 60.0);
 * }
 * @endcode
 *
 * Every mutation validates its arguments before changing anything; an
 * exception leaves the World untouched. Forces, impulses and explosions are
 * queued and applied, in call order, at the start of the next step.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "boxigon/core/defs.hpp"
#include "boxigon/core/events.hpp"
#include "boxigon/core/scene.hpp"
#include "boxigon/core/snapshots.hpp"
#include "boxigon/core/stats.hpp"
#include "boxigon/core/world_config.hpp"
#include "boxigon/math/shape.hpp"
#include "boxigon/systems/integrator.hpp"
#include "boxigon/systems/rigid/broadphase.hpp"
#include "boxigon/systems/rigid/contact_manager.hpp"
#include "boxigon/systems/rigid/contact_solver.hpp"
#include "boxigon/systems/rigid/joint_solver.hpp"
#include "boxigon/systems/sleep.hpp"

namespace Boxigon {

class World {
public:
    explicit World(const WorldConfig& config = WorldConfig());

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // --- Bodies and shapes ---------------------------------------------

    /**
     * @throws InvalidParametersError on non-finite values, negative density or
     *         friction, or restitution outside [0, 1]
     */
    BodyId createBody(const BodyDef& def);

    /**
     * @brief Validates and attaches a shape; mass properties are recomputed
     * @throws UnknownBodyError, InvalidGeometryError
     */
    ShapeId attachShape(BodyId body, const ShapeSpec& spec);

    /**
     * @throws UnknownBodyError, InvalidParametersError when the body has no such shape
     */
    void detachShape(BodyId body, ShapeId shape);

    /**
     * @brief Removes a body with its joints, contacts and queued intents
     *
     * Contacts of the body are reported as CollisionEnded with the next
     * step's events; touching and jointed neighbours are woken.
     *
     * @throws UnknownBodyError
     */
    void destroyBody(BodyId body);

    bool hasBody(BodyId body) const;

    // --- Intents (applied at the start of the next step) -----------------

    /**
     * @param point World application point; the center of mass when empty
     * @throws UnknownBodyError, InvalidParametersError
     */
    void applyForce(BodyId body, const Vector& force, std::optional<Vector> point = std::nullopt);

    void applyImpulse(BodyId body, const Vector& impulse, std::optional<Vector> point = std::nullopt);

    /**
     * @brief Radial impulse on every dynamic body whose center lies within
     *        @p radius, falling off linearly from @p impulse at the center
     * @throws InvalidParametersError for a non-positive radius or non-finite values
     */
    void applyExplosion(const Vector& center, double radius, double impulse);

    // --- Direct state changes ----------------------------------------------

    /** @brief Body-fixed force applied every step while the body is awake */
    void setThruster(BodyId body, const Vector& localForce, const Vector& localPoint);
    void clearThruster(BodyId body);

    void setLinearVelocity(BodyId body, const Vector& velocity);
    void setAngularVelocity(BodyId body, double omega);

    /** @brief Teleports the body origin */
    void setTransform(BodyId body, const Vector& position, double angle);

    // --- Joints ----------------------------------------------------------

    /**
     * @throws UnknownBodyError, InvalidParametersError
     */
    JointId addJoint(const JointSpec& spec);

    /** @throws UnknownJointError */
    void removeJoint(JointId joint);

    bool hasJoint(JointId joint) const;

    // --- Simulation ----------------------------------------------------------

    /**
     * @brief Advances the simulation by @p dt seconds
     *
     * A rejected time step leaves the World untouched, queued intents
     * included. Other exceptions, such as std::bad_alloc or a failure to
     * start a narrow-phase task, can leave the step half applied.
     *
     * @throws InvalidTimestepError when dt is not finite or not positive
     */
    void step(double dt);

    // --- Queries ---------------------------------------------------------------

    /** @brief Bodies with a shape containing @p point, sorted by id */
    std::vector<BodyId> queryPoint(const Vector& point) const;

    /**
     * @brief Shapes crossed by the ray, nearest first (ties by body then shape id)
     * @throws InvalidParametersError for a zero direction or a negative or
     *         non-finite distance
     */
    std::vector<RaycastHit> queryRaycast(const Vector& origin,
                                         const Vector& direction,
                                         double maxDistance) const;

    /**
     * @brief Bodies overlapping a test shape placed at (position, angle), sorted by id
     * @throws InvalidGeometryError, InvalidParametersError
     */
    std::vector<BodyId> queryShape(const ShapeSpec& spec, const Vector& position, double angle) const;

    /** @brief Bodies whose tight AABB overlaps the box, sorted by id */
    std::vector<BodyId> queryAABB(const Vector& lower, const Vector& upper) const;

    /** @brief Broad-phase candidate pairs for the current poses */
    std::vector<std::pair<BodyId, BodyId>> candidatePairs() const;

    // --- Snapshots -----------------------------------------------------------

    /** @throws UnknownBodyError */
    BodyState getBody(BodyId body) const;

    /** @brief Every body, sorted by id */
    std::vector<BodyState> bodies() const;

    /** @throws UnknownJointError */
    JointState getJoint(JointId joint) const;
    std::vector<JointState> joints() const;

    /** @brief Stored manifolds, sorted by pair */
    std::vector<ContactInfo> contacts() const;

    /** @brief Events of the last step, in delivery order */
    const std::vector<WorldEvent>& events() const { return eventLog; }

    /**
     * @brief Subscription point for one event type
     *
     * @code
     * world.onEvent<Boxigon::JointBroken>().connect<&Listener::onBroken>(listener);
     * @endcode
     */
    template<typename Event>
    auto onEvent() {
        return dispatcher.sink<Event>();
    }

    const StepStats& stats() const { return stepStats; }
    const WorldConfig& getConfig() const { return config; }

    /** @brief Replaces the configuration; applies from the next step */
    void setConfig(const WorldConfig& newConfig);

    // --- Scenes ------------------------------------------------------------------

    Scene snapshot() const;

    /**
     * @brief Rebuilds a World whose next step matches the snapshotted one
     * @throws SceneFormatError when the scene is inconsistent
     */
    static World fromScene(const Scene& scene, const WorldConfig& config = WorldConfig());

private:
    World(const Scene& scene, const WorldConfig& config);
    void restore(const Scene& scene);

    entt::entity entityOf(BodyId body) const;
    void validateBodyId(BodyId body) const;

    void updateMassData(entt::entity entity);
    void wakeBody(entt::entity entity, bool resetTimer = true);
    bool isActive(entt::entity entity) const;
    bool isAwakeDynamic(entt::entity entity) const;

    /** @brief Union of the body's shape AABBs at its current pose, if it has shapes */
    std::optional<AABB> bodyBounds(entt::entity entity) const;

    /**
     * @brief Wakes the sleeping bodies that touch, or may touch, a static or
     *        kinematic body whose pose or geometry is about to change
     */
    void wakeContacts(entt::entity entity);

    void drainIntents();
    void applyIntent(const Intent& intent);
    void wakeTouchedIslands();
    std::vector<JointId> solveConstraints(std::vector<const RigidBodyCollision::Manifold*>& solved,
                                          double& minSeparation);
    void emitEvents(const RigidBodyCollision::ContactTransitions& transitions,
                    const std::vector<JointId>& brokenJoints,
                    const std::map<JointId, std::pair<BodyId, BodyId>>& brokenBodies);

    const RigidBodyCollision::Broadphase& queryIndex() const;
    BodyState makeState(entt::entity entity) const;
    JointState makeJointState(const RigidBodyCollision::Joint& joint) const;

    WorldConfig config;
    entt::registry registry;
    entt::dispatcher dispatcher;

    std::map<BodyId, entt::entity> bodyIndex;
    std::map<JointId, RigidBodyCollision::Joint> jointMap;

    RigidBodyCollision::ContactManager contactManager;
    RigidBodyCollision::ContactSolver contactSolver;
    RigidBodyCollision::JointSolver jointSolver;
    Systems::ForceSystem forceSystem;
    Systems::MovementSystem movementSystem;
    Systems::SleepSystem sleepSystem;

    mutable RigidBodyCollision::Broadphase broadphase;
    mutable bool broadphaseDirty = true;

    std::vector<Intent> intents;
    std::set<BodyId> pendingWakes;
    std::set<RigidBodyCollision::BodyPair> pendingEnded;
    std::vector<WorldEvent> eventLog;
    StepStats stepStats;

    BodyId nextBody = 1;
    ShapeId nextShape = 1;
    JointId nextJoint = 1;
    double lastTimeStep = 1.0 / 60.0;
};

} // namespace Boxigon
