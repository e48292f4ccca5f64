#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "boxigon/core/errors.hpp"
#include "boxigon/core/world.hpp"

using Boxigon::BodyDef;
using Boxigon::BodyId;
using Boxigon::BodyKind;
using Boxigon::EventType;
using Boxigon::ShapeSpec;
using Boxigon::World;

namespace {

constexpr double Dt = 1.0 / 60.0;

Boxigon::WorldConfig zeroGravity() {
    Boxigon::WorldConfig config;
    config.gravity = Vector(0.0, 0.0);
    return config;
}

struct CollisionListener {
    int began = 0;
    int ended = 0;
    void onBegan(const Boxigon::CollisionBegan&) { ++began; }
    void onEnded(const Boxigon::CollisionEnded&) { ++ended; }
};

int countEvents(const World& world, EventType type) {
    int n = 0;
    for (const auto& e : world.events()) {
        if (e.type == type) {
            ++n;
        }
    }
    return n;
}

} // namespace

class WorldTest : public ::testing::Test {
protected:
    World world;

    BodyId addBody(const ShapeSpec& shape,
                   const Vector& position,
                   BodyKind kind = BodyKind::Dynamic,
                   double density = 1.0) {
        BodyDef def;
        def.kind = kind;
        def.position = position;
        def.density = density;
        BodyId const id = world.createBody(def);
        world.attachShape(id, shape);
        return id;
    }

    void run(int steps) {
        for (int i = 0; i < steps; ++i) {
            world.step(Dt);
        }
    }
};

class ZeroGravityWorldTest : public WorldTest {
protected:
    void SetUp() override { world.setConfig(zeroGravity()); }
};

//------------------------------------------------------------------------------
// Validation
//------------------------------------------------------------------------------

TEST_F(WorldTest, InvalidBodyLeavesWorldUntouched) {
    double const nan = std::numeric_limits<double>::quiet_NaN();

    BodyDef def;
    def.position = Vector(nan, 0.0);
    EXPECT_THROW(world.createBody(def), Boxigon::InvalidParametersError);

    def.position = Vector();
    def.restitution = 1.5;
    EXPECT_THROW(world.createBody(def), Boxigon::InvalidParametersError);

    def.restitution = 0.0;
    def.density = -1.0;
    EXPECT_THROW(world.createBody(def), Boxigon::InvalidParametersError);

    def.density = 1.0;
    def.friction = std::numeric_limits<double>::infinity();
    EXPECT_THROW(world.createBody(def), Boxigon::InvalidParametersError);

    EXPECT_TRUE(world.bodies().empty());

    // Ids are only consumed by successful calls
    def.friction = 0.5;
    BodyId const id = world.createBody(def);
    EXPECT_EQ(id, 1u);

    EXPECT_THROW(world.attachShape(id, ShapeSpec::circle(-1.0)), Boxigon::InvalidGeometryError);
    EXPECT_THROW(world.attachShape(id, ShapeSpec::polygon({Vector(0, 0), Vector(1, 0)})),
                 Boxigon::InvalidGeometryError);
    EXPECT_TRUE(world.getBody(id).shapes.empty());
    EXPECT_EQ(world.attachShape(id, ShapeSpec::circle(1.0)), 1u);

    EXPECT_THROW(world.attachShape(77, ShapeSpec::circle(1.0)), Boxigon::UnknownBodyError);
    EXPECT_THROW(world.detachShape(id, 99), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.destroyBody(77), Boxigon::UnknownBodyError);
    EXPECT_THROW(world.getBody(77), Boxigon::UnknownBodyError);
}

TEST_F(WorldTest, RejectsBadTimesteps) {
    addBody(ShapeSpec::circle(0.5), Vector(0.0, 3.0));

    EXPECT_THROW(world.step(0.0), Boxigon::InvalidTimestepError);
    EXPECT_THROW(world.step(-Dt), Boxigon::InvalidTimestepError);
    EXPECT_THROW(world.step(std::numeric_limits<double>::quiet_NaN()), Boxigon::InvalidTimestepError);
    EXPECT_THROW(world.step(std::numeric_limits<double>::infinity()), Boxigon::InvalidTimestepError);

    EXPECT_EQ(world.stats().step, 0u);
    EXPECT_EQ(world.bodies()[0].position, Vector(0.0, 3.0));

    try {
        world.step(-1.0);
        FAIL() << "expected InvalidTimestepError";
    } catch (const Boxigon::PhysicsError& e) {
        EXPECT_EQ(e.code(), Boxigon::ErrorCode::InvalidTimestep);
    }
}

TEST_F(WorldTest, RejectedStepKeepsQueuedIntents) {
    Boxigon::WorldConfig config = world.getConfig();
    config.gravity = Vector();
    world.setConfig(config);

    BodyId const id = addBody(ShapeSpec::circle(0.5), Vector(0.0, 3.0));
    world.applyImpulse(id, Vector(2.0, 0.0));

    EXPECT_THROW(world.step(-Dt), Boxigon::InvalidTimestepError);
    EXPECT_EQ(world.getBody(id).linearVelocity, Vector());

    // The impulse is applied once, by the first step that runs
    world.step(Dt);
    double const mass = world.getBody(id).mass;
    EXPECT_NEAR(world.getBody(id).linearVelocity.x, 2.0 / mass, 1e-12);

    world.step(Dt);
    EXPECT_NEAR(world.getBody(id).linearVelocity.x, 2.0 / mass, 1e-12);
}

TEST_F(WorldTest, RejectsBadIntentsAndQueries) {
    BodyId const id = addBody(ShapeSpec::circle(0.5), Vector());
    double const nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(world.applyForce(id, Vector(nan, 0.0)), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.applyImpulse(42, Vector(1.0, 0.0)), Boxigon::UnknownBodyError);
    EXPECT_THROW(world.applyExplosion(Vector(), 0.0, 1.0), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.setLinearVelocity(id, Vector(0.0, nan)), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.queryPoint(Vector(nan, nan)), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.queryAABB(Vector(1.0, 1.0), Vector(0.0, 0.0)), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.queryRaycast(Vector(), Vector(), 10.0), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.queryRaycast(Vector(), Vector(1.0, 0.0), -1.0), Boxigon::InvalidParametersError);
    EXPECT_THROW(world.queryShape(ShapeSpec::circle(0.0), Vector(), 0.0), Boxigon::InvalidGeometryError);
}

//------------------------------------------------------------------------------
// Mass properties
//------------------------------------------------------------------------------

TEST_F(WorldTest, BoxMassData) {
    BodyId const id = addBody(ShapeSpec::box(0.5, 0.5), Vector(1.0, 2.0), BodyKind::Dynamic, 2.0);
    auto const state = world.getBody(id);
    EXPECT_NEAR(state.mass, 2.0, 1e-12);
    EXPECT_NEAR(state.invMass, 0.5, 1e-12);
    EXPECT_NEAR(state.inertia, 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(state.worldCenter.x, 1.0, 1e-12);
    EXPECT_NEAR(state.worldCenter.y, 2.0, 1e-12);
}

TEST_F(WorldTest, CompoundBodyCenterOfMass) {
    BodyId const id = addBody(ShapeSpec::box(0.5, 0.5), Vector());
    Boxigon::ShapeId const second = world.attachShape(id, ShapeSpec::box(0.5, 0.5, Vector(2.0, 0.0)));

    auto state = world.getBody(id);
    EXPECT_NEAR(state.mass, 2.0, 1e-12);
    EXPECT_NEAR(state.localCenter.x, 1.0, 1e-12);
    EXPECT_NEAR(state.localCenter.y, 0.0, 1e-12);
    // Parallel axis: 2 * (1/6) + 2 * 1^2
    EXPECT_NEAR(state.inertia, 2.0 / 6.0 + 2.0, 1e-12);
    ASSERT_EQ(state.shapes.size(), 2u);

    world.detachShape(id, second);
    state = world.getBody(id);
    EXPECT_NEAR(state.mass, 1.0, 1e-12);
    EXPECT_NEAR(state.localCenter.x, 0.0, 1e-12);
    EXPECT_NEAR(state.inertia, 1.0 / 6.0, 1e-12);
}

TEST_F(WorldTest, ShapelessAndStaticBodies) {
    BodyDef def;
    BodyId const bare = world.createBody(def);
    auto const bareState = world.getBody(bare);
    EXPECT_DOUBLE_EQ(bareState.mass, 1.0);
    EXPECT_DOUBLE_EQ(bareState.invMass, 1.0);
    EXPECT_DOUBLE_EQ(bareState.inertia, 0.0);
    EXPECT_DOUBLE_EQ(bareState.invInertia, 0.0);

    BodyId const wall = addBody(ShapeSpec::box(1.0, 1.0), Vector(5.0, 0.0), BodyKind::Static);
    auto const wallState = world.getBody(wall);
    EXPECT_DOUBLE_EQ(wallState.mass, 0.0);
    EXPECT_DOUBLE_EQ(wallState.invMass, 0.0);
    EXPECT_DOUBLE_EQ(wallState.invInertia, 0.0);

    // Shapeless bodies still fall
    run(10);
    EXPECT_LT(world.getBody(bare).position.y, 0.0);
    EXPECT_EQ(world.getBody(wall).position, Vector(5.0, 0.0));
}

//------------------------------------------------------------------------------
// Queries
//------------------------------------------------------------------------------

class QueryTest : public ZeroGravityWorldTest {
protected:
    void SetUp() override {
        ZeroGravityWorldTest::SetUp();
        ball = addBody(ShapeSpec::circle(1.0), Vector(0.0, 0.0));
        crate = addBody(ShapeSpec::box(0.5, 0.5), Vector(5.0, 0.0), BodyKind::Static);
    }

    BodyId ball = Boxigon::NullBody;
    BodyId crate = Boxigon::NullBody;
};

TEST_F(QueryTest, PointQuery) {
    EXPECT_EQ(world.queryPoint(Vector(0.5, 0.0)), std::vector<BodyId>{ball});
    EXPECT_EQ(world.queryPoint(Vector(5.4, 0.4)), std::vector<BodyId>{crate});
    EXPECT_TRUE(world.queryPoint(Vector(3.0, 0.0)).empty());
    // Inside the ball's AABB but outside the circle
    EXPECT_TRUE(world.queryPoint(Vector(0.9, 0.9)).empty());
}

TEST_F(QueryTest, AABBQuery) {
    EXPECT_EQ(world.queryAABB(Vector(-2.0, -2.0), Vector(6.0, 2.0)), (std::vector<BodyId>{ball, crate}));
    EXPECT_EQ(world.queryAABB(Vector(4.4, -0.1), Vector(4.6, 0.1)), std::vector<BodyId>{crate});
    EXPECT_TRUE(world.queryAABB(Vector(2.0, 2.0), Vector(3.0, 3.0)).empty());
}

TEST_F(QueryTest, RaycastHitsInOrder) {
    auto const hits = world.queryRaycast(Vector(-5.0, 0.0), Vector(2.0, 0.0), 20.0);
    ASSERT_EQ(hits.size(), 2u);

    EXPECT_EQ(hits[0].body, ball);
    EXPECT_NEAR(hits[0].distance, 4.0, 1e-9);
    EXPECT_NEAR(hits[0].normal.x, -1.0, 1e-9);
    EXPECT_NEAR(hits[0].point.x, -1.0, 1e-9);

    EXPECT_EQ(hits[1].body, crate);
    EXPECT_NEAR(hits[1].distance, 9.5, 1e-9);
    EXPECT_NEAR(hits[1].normal.x, -1.0, 1e-9);
    EXPECT_NEAR(hits[1].normal.y, 0.0, 1e-9);

    EXPECT_TRUE(world.queryRaycast(Vector(-5.0, 0.0), Vector(1.0, 0.0), 3.0).empty());
    EXPECT_TRUE(world.queryRaycast(Vector(-5.0, 3.0), Vector(1.0, 0.0), 20.0).empty());
}

TEST_F(QueryTest, ShapeQuery) {
    EXPECT_EQ(world.queryShape(ShapeSpec::circle(0.6), Vector(1.5, 0.0), 0.0), std::vector<BodyId>{ball});
    EXPECT_TRUE(world.queryShape(ShapeSpec::circle(0.6), Vector(3.0, 0.0), 0.0).empty());
    EXPECT_EQ(world.queryShape(ShapeSpec::box(1.0, 0.1), Vector(4.0, 0.0), 0.0), std::vector<BodyId>{crate});
}

TEST_F(QueryTest, QueriesFollowMovedBodies) {
    world.setTransform(ball, Vector(10.0, 10.0), 0.0);
    EXPECT_TRUE(world.queryPoint(Vector(0.0, 0.0)).empty());
    EXPECT_EQ(world.queryPoint(Vector(10.0, 10.0)), std::vector<BodyId>{ball});
}

//------------------------------------------------------------------------------
// Intents
//------------------------------------------------------------------------------

TEST_F(ZeroGravityWorldTest, ImpulseAndForceAreQueued) {
    BodyId const id = addBody(ShapeSpec::box(0.5, 0.5), Vector());

    world.applyImpulse(id, Vector(2.0, 0.0));
    world.applyForce(id, Vector(0.0, 60.0));
    EXPECT_EQ(world.getBody(id).linearVelocity, Vector());

    world.step(Dt);
    auto const state = world.getBody(id);
    EXPECT_NEAR(state.linearVelocity.x, 2.0, 1e-12);
    EXPECT_NEAR(state.linearVelocity.y, 1.0, 1e-12);
    EXPECT_NEAR(state.angularVelocity, 0.0, 1e-12);

    // Forces last one step only
    world.step(Dt);
    EXPECT_NEAR(world.getBody(id).linearVelocity.y, 1.0, 1e-12);
}

TEST_F(ZeroGravityWorldTest, OffCenterImpulseSpins) {
    BodyId const id = addBody(ShapeSpec::box(0.5, 0.5), Vector());
    world.applyImpulse(id, Vector(0.0, 1.0), Vector(0.5, 0.0));
    world.step(Dt);

    auto const state = world.getBody(id);
    EXPECT_NEAR(state.linearVelocity.y, 1.0, 1e-12);
    // r x J / I = 0.5 / (1/6)
    EXPECT_NEAR(state.angularVelocity, 3.0, 1e-9);
}

TEST_F(ZeroGravityWorldTest, ExplosionFallsOffWithDistance) {
    BodyId const near = addBody(ShapeSpec::box(0.5, 0.5), Vector(1.0, 0.0));
    BodyId const far = addBody(ShapeSpec::box(0.5, 0.5), Vector(10.0, 0.0));
    BodyId const wall = addBody(ShapeSpec::box(0.5, 0.5), Vector(-1.0, 0.0), BodyKind::Static);

    world.applyExplosion(Vector(), 4.0, 4.0);
    world.step(Dt);

    EXPECT_NEAR(world.getBody(near).linearVelocity.x, 3.0, 1e-9);
    EXPECT_NEAR(world.getBody(near).linearVelocity.y, 0.0, 1e-9);
    EXPECT_EQ(world.getBody(far).linearVelocity, Vector());
    EXPECT_EQ(world.getBody(wall).position, Vector(-1.0, 0.0));
}

TEST_F(ZeroGravityWorldTest, IntentsOnStaticBodiesAreIgnored) {
    BodyId const wall = addBody(ShapeSpec::box(0.5, 0.5), Vector(), BodyKind::Static);
    world.applyImpulse(wall, Vector(5.0, 0.0));
    world.applyForce(wall, Vector(5.0, 0.0));
    world.step(Dt);
    EXPECT_EQ(world.getBody(wall).linearVelocity, Vector());
    EXPECT_EQ(world.getBody(wall).position, Vector());
}

TEST_F(ZeroGravityWorldTest, ThrusterPushesAlongBodyAxis) {
    BodyId const id = addBody(ShapeSpec::box(0.5, 0.5), Vector());
    world.setThruster(id, Vector(1.0, 0.0), Vector());
    EXPECT_TRUE(world.getBody(id).hasThruster);

    run(60);
    EXPECT_NEAR(world.getBody(id).linearVelocity.x, 1.0, 1e-9);

    world.clearThruster(id);
    run(10);
    EXPECT_NEAR(world.getBody(id).linearVelocity.x, 1.0, 1e-9);
    EXPECT_FALSE(world.getBody(id).hasThruster);
}

TEST_F(ZeroGravityWorldTest, KinematicBodyFollowsItsVelocity) {
    BodyDef def;
    def.kind = BodyKind::Kinematic;
    def.linearVelocity = Vector(1.0, 0.0);
    def.angularVelocity = 0.5;
    BodyId const id = world.createBody(def);
    world.attachShape(id, ShapeSpec::box(1.0, 0.2));
    world.applyImpulse(id, Vector(0.0, 100.0));

    run(60);
    auto const state = world.getBody(id);
    EXPECT_NEAR(state.position.x, 1.0, 1e-9);
    EXPECT_NEAR(state.position.y, 0.0, 1e-9);
    EXPECT_NEAR(state.angle, 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(state.mass, 0.0);
}

//------------------------------------------------------------------------------
// Events
//------------------------------------------------------------------------------

TEST_F(WorldTest, CollisionEventsAreReportedOnce) {
    BodyId const ground = addBody(ShapeSpec::box(10.0, 0.5), Vector(0.0, -0.5), BodyKind::Static);
    // Low enough that the landing stays below the restitution threshold
    BodyId const ball = addBody(ShapeSpec::circle(0.5), Vector(0.0, 0.55));

    CollisionListener listener;
    world.onEvent<Boxigon::CollisionBegan>().connect<&CollisionListener::onBegan>(listener);
    world.onEvent<Boxigon::CollisionEnded>().connect<&CollisionListener::onEnded>(listener);

    int beganInLog = 0;
    for (int i = 0; i < 120; ++i) {
        world.step(Dt);
        for (const auto& e : world.events()) {
            if (e.type == EventType::CollisionBegan) {
                ++beganInLog;
                EXPECT_EQ(e.bodyA, ground);
                EXPECT_EQ(e.bodyB, ball);
            }
        }
    }
    EXPECT_EQ(beganInLog, 1);
    EXPECT_EQ(listener.began, 1);
    EXPECT_EQ(listener.ended, 0);
    ASSERT_EQ(world.contacts().size(), 1u);
    EXPECT_EQ(world.contacts()[0].a, ground);
    EXPECT_EQ(world.contacts()[0].b, ball);

    world.destroyBody(ball);
    EXPECT_TRUE(world.contacts().empty());
    world.step(Dt);
    EXPECT_EQ(countEvents(world, EventType::CollisionEnded), 1);
    EXPECT_EQ(listener.ended, 1);

    // The event log only covers the last step
    world.step(Dt);
    EXPECT_TRUE(world.events().empty());
}

TEST_F(WorldTest, EventsArriveInPhaseOrder) {
    addBody(ShapeSpec::box(10.0, 0.5), Vector(0.0, -0.5), BodyKind::Static);
    BodyId const crate = addBody(ShapeSpec::box(0.5, 0.5), Vector(0.0, 0.5));
    BodyId const other = addBody(ShapeSpec::box(0.5, 0.5), Vector(3.0, 0.5));

    bool checked = false;
    for (int i = 0; i < 300 && !world.getBody(crate).asleep; ++i) {
        world.step(Dt);
    }
    ASSERT_TRUE(world.getBody(crate).asleep);

    // Wake the crate and make the other body start a contact in the same step
    world.applyImpulse(crate, Vector(0.0, 0.1));
    world.setTransform(other, Vector(0.0, 1.5), 0.0);
    world.step(Dt);

    const auto& events = world.events();
    for (std::size_t i = 1; i < events.size(); ++i) {
        EXPECT_LE(static_cast<int>(events[i - 1].type), static_cast<int>(events[i].type));
        checked = true;
    }
    EXPECT_TRUE(checked);
}

//------------------------------------------------------------------------------
// Determinism
//------------------------------------------------------------------------------

namespace {

void buildStack(World& world) {
    BodyDef def;
    def.kind = BodyKind::Static;
    BodyId const ground = world.createBody(def);
    world.attachShape(ground, ShapeSpec::box(20.0, 0.5, Vector(0.0, -0.5)));

    for (int row = 0; row < 5; ++row) {
        for (int col = 0; col <= row; ++col) {
            BodyDef body;
            body.position = Vector(col - row * 0.5, 0.5 + (4 - row) * 1.05);
            body.angle = 0.01 * col;
            BodyId const id = world.createBody(body);
            world.attachShape(id, (row + col) % 2 == 0 ? ShapeSpec::box(0.45, 0.45)
                                                       : ShapeSpec::regularPolygon(6, 0.5));
        }
    }
}

} // namespace

TEST(WorldDeterminismTest, IdenticalWorldsStayIdentical) {
    World first;
    World second;
    buildStack(first);
    buildStack(second);

    for (int i = 0; i < 180; ++i) {
        first.step(Dt);
        second.step(Dt);
    }

    auto const a = first.bodies();
    auto const b = second.bodies();
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].position, b[i].position) << "body " << a[i].id;
        EXPECT_EQ(a[i].angle, b[i].angle) << "body " << a[i].id;
        EXPECT_EQ(a[i].linearVelocity, b[i].linearVelocity) << "body " << a[i].id;
        EXPECT_EQ(a[i].asleep, b[i].asleep) << "body " << a[i].id;
    }
    EXPECT_EQ(first.events().size(), second.events().size());
}

TEST(WorldDeterminismTest, ThreadCountDoesNotChangeResults) {
    Boxigon::WorldConfig threaded;
    threaded.narrowphase.threads = 4;
    threaded.narrowphase.minPairsPerTask = 1;

    World serial;
    World parallel(threaded);
    buildStack(serial);
    buildStack(parallel);

    for (int i = 0; i < 120; ++i) {
        serial.step(Dt);
        parallel.step(Dt);
    }

    auto const a = serial.bodies();
    auto const b = parallel.bodies();
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].position, b[i].position) << "body " << a[i].id;
        EXPECT_EQ(a[i].angle, b[i].angle) << "body " << a[i].id;
    }
}
