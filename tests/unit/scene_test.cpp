#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <string>

#include "boxigon/core/errors.hpp"
#include "boxigon/core/scene.hpp"
#include "boxigon/core/world.hpp"

using Boxigon::BodyDef;
using Boxigon::BodyId;
using Boxigon::BodyKind;
using Boxigon::JointSpec;
using Boxigon::JointType;
using Boxigon::Scene;
using Boxigon::SceneFormatError;
using Boxigon::ShapeSpec;
using Boxigon::World;

namespace {

constexpr double Dt = 1.0 / 60.0;

BodyId addBody(World& world, const ShapeSpec& shape, const Vector& position,
               BodyKind kind = BodyKind::Dynamic) {
    BodyDef def;
    def.kind = kind;
    def.position = position;
    BodyId const id = world.createBody(def);
    world.attachShape(id, shape);
    return id;
}

// A little of everything: contacts, joints, a thruster, sleeping bodies and queued intents
void buildWorld(World& world) {
    addBody(world, ShapeSpec::box(15.0, 0.5), Vector(0.0, -0.5), BodyKind::Static);

    for (int i = 0; i < 4; ++i) {
        addBody(world, ShapeSpec::box(0.5, 0.5), Vector(-4.0, 0.5 + i * 1.0));
    }
    addBody(world, ShapeSpec::regularPolygon(5, 0.6), Vector(-2.0, 1.0));
    addBody(world, ShapeSpec::circle(0.4), Vector(-1.0, 3.0));

    BodyId const bob = addBody(world, ShapeSpec::circle(0.3), Vector(3.0, 6.0));
    JointSpec pendulum;
    pendulum.type = JointType::Distance;
    pendulum.bodyA = bob;
    pendulum.anchorB = Vector(1.0, 6.0);
    world.addJoint(pendulum);

    BodyId const left = addBody(world, ShapeSpec::box(0.5, 0.25), Vector(5.0, 2.0));
    BodyId const right = addBody(world, ShapeSpec::box(0.5, 0.25), Vector(6.0, 2.0));
    JointSpec weld;
    weld.type = JointType::Weld;
    weld.bodyA = left;
    weld.bodyB = right;
    weld.localAnchorA = Vector(0.5, 0.0);
    weld.anchorB = Vector(-0.5, 0.0);
    world.addJoint(weld);

    BodyId const sled = addBody(world, ShapeSpec::box(0.6, 0.3), Vector(8.0, 0.3));
    world.attachShape(sled, ShapeSpec::polygon({Vector(0.6, -0.3), Vector(1.0, -0.3), Vector(0.6, 0.3)}));
    world.setThruster(sled, Vector(3.0, 0.0), Vector(0.0, 0.0));

    BodyDef sleeper;
    sleeper.position = Vector(10.0, 0.5);
    sleeper.awake = false;
    world.attachShape(world.createBody(sleeper), ShapeSpec::box(0.5, 0.5));
}

void expectSameState(const World& a, const World& b) {
    auto const bodiesA = a.bodies();
    auto const bodiesB = b.bodies();
    ASSERT_EQ(bodiesA.size(), bodiesB.size());
    for (std::size_t i = 0; i < bodiesA.size(); ++i) {
        EXPECT_EQ(bodiesA[i].id, bodiesB[i].id);
        EXPECT_EQ(bodiesA[i].position, bodiesB[i].position) << "body " << bodiesA[i].id;
        EXPECT_EQ(bodiesA[i].angle, bodiesB[i].angle) << "body " << bodiesA[i].id;
        EXPECT_EQ(bodiesA[i].linearVelocity, bodiesB[i].linearVelocity) << "body " << bodiesA[i].id;
        EXPECT_EQ(bodiesA[i].angularVelocity, bodiesB[i].angularVelocity) << "body " << bodiesA[i].id;
        EXPECT_EQ(bodiesA[i].asleep, bodiesB[i].asleep) << "body " << bodiesA[i].id;
    }

    auto const jointsA = a.joints();
    auto const jointsB = b.joints();
    ASSERT_EQ(jointsA.size(), jointsB.size());
    for (std::size_t i = 0; i < jointsA.size(); ++i) {
        EXPECT_EQ(jointsA[i].id, jointsB[i].id);
        EXPECT_EQ(jointsA[i].impulse, jointsB[i].impulse);
    }

    EXPECT_EQ(a.contacts().size(), b.contacts().size());
}

std::string expectParseError(const std::string& text) {
    try {
        Boxigon::parseScene(text);
    } catch (const SceneFormatError& e) {
        EXPECT_EQ(e.code(), Boxigon::ErrorCode::SceneFormat);
        return e.what();
    }
    ADD_FAILURE() << "no error for:\n" << text;
    return std::string();
}

} // namespace

TEST(SceneTest, TextRoundTripIsExact) {
    World world;
    buildWorld(world);
    for (int i = 0; i < 50; ++i) {
        world.step(Dt);
    }
    world.applyImpulse(2, Vector(0.3, 1.0), Vector(-4.2, 1.6));
    world.applyExplosion(Vector(5.5, 1.0), 3.0, 2.0);

    std::string const text = Boxigon::serializeScene(world.snapshot());
    Scene const parsed = Boxigon::parseScene(text);
    EXPECT_EQ(Boxigon::serializeScene(parsed), text);

    EXPECT_EQ(parsed.bodies.size(), world.bodies().size());
    EXPECT_EQ(parsed.joints.size(), 2u);
    EXPECT_EQ(parsed.intents.size(), 2u);
    EXPECT_EQ(parsed.stepCount, 50u);
    EXPECT_FALSE(parsed.manifolds.empty());
}

TEST(SceneTest, RestoredWorldContinuesIdentically) {
    World original;
    buildWorld(original);
    for (int i = 0; i < 50; ++i) {
        original.step(Dt);
    }
    original.applyImpulse(3, Vector(0.0, 2.0));
    original.applyForce(7, Vector(5.0, 0.0));

    World restored = World::fromScene(Boxigon::parseScene(Boxigon::serializeScene(original.snapshot())));
    expectSameState(original, restored);
    EXPECT_EQ(restored.stats().step, 50u);

    for (int i = 0; i < 50; ++i) {
        original.step(Dt);
        restored.step(Dt);
        ASSERT_EQ(original.events().size(), restored.events().size()) << "step " << i;
    }
    expectSameState(original, restored);

    // Ids continue from the same counters
    BodyDef def;
    EXPECT_EQ(original.createBody(def), restored.createBody(def));
}

TEST(SceneTest, SaveAndLoadFile) {
    World world;
    buildWorld(world);
    for (int i = 0; i < 10; ++i) {
        world.step(Dt);
    }

    std::string const path = ::testing::TempDir() + "boxigon_scene_test.txt";
    Boxigon::saveScene(path, world.snapshot());
    Scene const loaded = Boxigon::loadScene(path);
    std::remove(path.c_str());

    EXPECT_EQ(Boxigon::serializeScene(loaded), Boxigon::serializeScene(world.snapshot()));
    EXPECT_THROW(Boxigon::loadScene(path), SceneFormatError);
}

TEST(SceneTest, MalformedTextIsRejected) {
    EXPECT_NE(expectParseError("").find("empty scene"), std::string::npos);
    EXPECT_NE(expectParseError("hello 1\nend\n").find("line 1"), std::string::npos);
    EXPECT_NE(expectParseError("boxigon-scene 2\nend\n").find("version"), std::string::npos);

    std::string const unknown = expectParseError("boxigon-scene 1\nbogus 1 2\nend\n");
    EXPECT_NE(unknown.find("line 2"), std::string::npos);
    EXPECT_NE(unknown.find("bogus"), std::string::npos);

    EXPECT_NE(expectParseError("boxigon-scene 1\ncounters 1 1 1 1 0\n").find("missing 'end'"),
              std::string::npos);
    EXPECT_NE(expectParseError("boxigon-scene 1\nend\ncounters 1 1 1 1 0\n").find("line 3"),
              std::string::npos);
    EXPECT_NE(expectParseError("boxigon-scene 1\ncounters 1 1 x 1 0\nend\n").find("bad integer"),
              std::string::npos);
    EXPECT_NE(expectParseError("boxigon-scene 1\ncounters 1 1 1 1 0 9\nend\n").find("line 2"),
              std::string::npos);
    EXPECT_NE(expectParseError("boxigon-scene 1\ncircle 1 0x1p+0 0 0\nend\n").find("before any body"),
              std::string::npos);

    // Comments and blank lines are allowed
    Scene const empty = Boxigon::parseScene("# saved by hand\nboxigon-scene 1\n\nend\n");
    EXPECT_TRUE(empty.bodies.empty());
}

TEST(SceneTest, InconsistentSceneIsRejected) {
    Scene scene;
    Boxigon::BodyRecord body;
    body.id = 5;
    scene.bodies.push_back(body);
    scene.nextBody = 2;
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene.nextBody = 6;
    Boxigon::ManifoldRecord manifold;
    manifold.a = 5;
    manifold.b = 9;
    scene.manifolds.push_back(manifold);
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene.manifolds.clear();
    Boxigon::ShapeRecord shape;
    shape.id = 1;
    shape.spec = ShapeSpec::circle(-2.0);
    scene.bodies[0].shapes.push_back(shape);
    scene.nextShape = 2;
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene.bodies[0].shapes.clear();
    World const world = World::fromScene(scene);
    EXPECT_TRUE(world.hasBody(5));
}

TEST(SceneTest, SleepingBodyNeedsAnIsland) {
    Scene scene;
    Boxigon::BodyRecord body;
    body.id = 1;
    body.asleep = true;
    scene.bodies.push_back(body);
    scene.nextBody = 2;
    scene.nextIsland = 4;
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    // Islands are issued below the counter
    scene.bodies[0].island = 4;
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene.bodies[0].island = 3;
    World const world = World::fromScene(scene);
    EXPECT_TRUE(world.getBody(1).asleep);
    EXPECT_EQ(world.getBody(1).island, 3u);
}

TEST(SceneTest, InvalidEndedPairIsRejected) {
    Scene scene;
    Boxigon::BodyRecord body;
    body.id = 1;
    scene.bodies.push_back(body);
    scene.nextBody = 4;

    scene.pendingEnded.emplace_back(3, 1);
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene.pendingEnded = {{1, 7}};
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene.pendingEnded = {{Boxigon::NullBody, 1}};
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    // Body 3 was destroyed after the pair ended; the event is still owed
    scene.pendingEnded = {{1, 3}};
    World world = World::fromScene(scene);
    world.step(Dt);
    ASSERT_EQ(world.events().size(), 1u);
    EXPECT_EQ(world.events()[0].type, Boxigon::EventType::CollisionEnded);
    EXPECT_EQ(world.events()[0].bodyB, 3u);
}

TEST(SceneTest, InvalidJointRecordIsRejected) {
    World original;
    BodyId const bob = addBody(original, ShapeSpec::circle(0.3), Vector(3.0, 6.0));
    JointSpec spec;
    spec.type = JointType::Distance;
    spec.bodyA = bob;
    spec.anchorB = Vector(1.0, 6.0);
    original.addJoint(spec);

    Scene const good = original.snapshot();
    ASSERT_EQ(good.joints.size(), 1u);
    EXPECT_NO_THROW(World::fromScene(good));

    Scene scene = good;
    scene.joints[0].angularImpulse = std::nan("");
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene = good;
    scene.joints[0].length = -1.0;
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene = good;
    scene.joints[0].spec.dampingRatio = -0.5;
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);

    scene = good;
    scene.joints[0].spec.anchorB = Vector(HUGE_VAL, 0.0);
    EXPECT_THROW(World::fromScene(scene), SceneFormatError);
}
