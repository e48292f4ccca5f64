#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "boxigon/core/errors.hpp"
#include "boxigon/core/world.hpp"

using Boxigon::BodyDef;
using Boxigon::BodyId;
using Boxigon::BodyKind;
using Boxigon::JointId;
using Boxigon::JointSpec;
using Boxigon::JointType;
using Boxigon::ShapeSpec;
using Boxigon::World;

namespace {

constexpr double Dt = 1.0 / 60.0;

struct BrokenListener {
    std::vector<Boxigon::JointBroken> received;
    void onBroken(const Boxigon::JointBroken& e) { received.push_back(e); }
};

} // namespace

class JointTest : public ::testing::Test {
protected:
    World world;

    BodyId addBox(const Vector& position, BodyKind kind = BodyKind::Dynamic) {
        BodyDef def;
        def.kind = kind;
        def.position = position;
        BodyId const id = world.createBody(def);
        world.attachShape(id, ShapeSpec::box(0.5, 0.5));
        return id;
    }

    void run(int steps) {
        for (int i = 0; i < steps; ++i) {
            world.step(Dt);
        }
    }
};

TEST_F(JointTest, DistanceJointKeepsPendulumLength) {
    BodyId const bob = addBox(Vector(2.0, 5.0));

    JointSpec spec;
    spec.type = JointType::Distance;
    spec.bodyA = bob;
    spec.anchorB = Vector(0.0, 5.0);
    JointId const joint = world.addJoint(spec);

    EXPECT_NEAR(world.getJoint(joint).length, 2.0, 1e-12);

    for (int s = 0; s < 180; ++s) {
        world.step(Dt);
        auto const state = world.getJoint(joint);
        EXPECT_NEAR((state.worldAnchorA - state.worldAnchorB).length(), 2.0, 0.05) << "step " << s;
    }

    // The bob swung down through the bottom of the arc
    EXPECT_TRUE(world.hasJoint(joint));
}

TEST_F(JointTest, PinJointKeepsAnchorsTogether) {
    BodyId const post = addBox(Vector(0.0, 5.0), BodyKind::Static);
    BodyId const arm = addBox(Vector(1.5, 5.0));

    JointSpec spec;
    spec.type = JointType::Pin;
    spec.bodyA = arm;
    spec.bodyB = post;
    spec.localAnchorA = Vector(-1.5, 0.0);
    spec.anchorB = Vector(0.0, 0.0);
    JointId const joint = world.addJoint(spec);

    for (int s = 0; s < 120; ++s) {
        world.step(Dt);
        auto const state = world.getJoint(joint);
        EXPECT_LT((state.worldAnchorA - state.worldAnchorB).length(), 0.05) << "step " << s;
    }
    // Free to rotate about the pin
    EXPECT_GT(std::fabs(world.getBody(arm).angle), 0.3);
}

TEST_F(JointTest, WeldJointHoldsCantilever) {
    BodyId const wall = addBox(Vector(0.0, 5.0), BodyKind::Static);
    BodyId const beam = addBox(Vector(1.0, 5.0));

    JointSpec spec;
    spec.type = JointType::Weld;
    spec.bodyA = beam;
    spec.bodyB = wall;
    spec.localAnchorA = Vector(-0.5, 0.0);
    spec.anchorB = Vector(0.5, 0.0);
    world.addJoint(spec);

    run(120);

    auto const state = world.getBody(beam);
    EXPECT_NEAR(state.position.x, 1.0, 0.05);
    EXPECT_NEAR(state.position.y, 5.0, 0.05);
    EXPECT_NEAR(state.angle, 0.0, 0.05);
}

TEST_F(JointTest, JointBreaksAboveThreshold) {
    BodyId const weight = addBox(Vector(0.0, 3.0));

    JointSpec spec;
    spec.type = JointType::Distance;
    spec.bodyA = weight;
    spec.anchorB = Vector(0.0, 5.0);
    spec.breakImpulse = 0.05;   // Less than m g dt for a 1 kg box
    JointId const joint = world.addJoint(spec);

    BrokenListener listener;
    world.onEvent<Boxigon::JointBroken>().connect<&BrokenListener::onBroken>(listener);

    world.step(Dt);

    EXPECT_FALSE(world.hasJoint(joint));
    EXPECT_THROW(world.getJoint(joint), Boxigon::UnknownJointError);
    EXPECT_EQ(world.stats().brokenJoints, 1u);

    ASSERT_EQ(listener.received.size(), 1u);
    EXPECT_EQ(listener.received[0].joint, joint);
    EXPECT_EQ(listener.received[0].a, weight);
    EXPECT_EQ(listener.received[0].b, Boxigon::NullBody);

    int brokenEvents = 0;
    for (const auto& e : world.events()) {
        if (e.type == Boxigon::EventType::JointBroken) {
            ++brokenEvents;
            EXPECT_EQ(e.joint, joint);
        }
    }
    EXPECT_EQ(brokenEvents, 1);

    // Reported once only
    run(10);
    EXPECT_EQ(listener.received.size(), 1u);

    // The weight now falls freely
    EXPECT_LT(world.getBody(weight).position.y, 2.9);
}

TEST_F(JointTest, StrongJointCarriesTheLoad) {
    BodyId const weight = addBox(Vector(0.0, 3.0));

    JointSpec spec;
    spec.type = JointType::Distance;
    spec.bodyA = weight;
    spec.anchorB = Vector(0.0, 5.0);
    spec.breakImpulse = 10.0;
    JointId const joint = world.addJoint(spec);

    run(120);

    ASSERT_TRUE(world.hasJoint(joint));
    // Hanging at rest: the joint cancels gravity every step
    double const mass = world.getBody(weight).mass;
    EXPECT_NEAR(world.getJoint(joint).impulse, mass * 9.8 * Dt, 0.02);
    EXPECT_NEAR(world.getBody(weight).position.y, 3.0, 0.02);
}

TEST_F(JointTest, ConnectedBodiesDoNotCollideByDefault) {
    Boxigon::WorldConfig config;
    config.gravity = Vector(0.0, 0.0);
    world.setConfig(config);

    BodyId const a = addBox(Vector(0.0, 0.0));
    BodyId const b = addBox(Vector(0.6, 0.0));

    JointSpec spec;
    spec.type = JointType::Pin;
    spec.bodyA = a;
    spec.bodyB = b;
    spec.localAnchorA = Vector(0.3, 0.0);
    spec.anchorB = Vector(-0.3, 0.0);
    JointId const joint = world.addJoint(spec);

    world.step(Dt);
    EXPECT_TRUE(world.contacts().empty());

    world.removeJoint(joint);
    spec.collideConnected = true;
    world.addJoint(spec);

    world.step(Dt);
    EXPECT_FALSE(world.contacts().empty());
}

TEST_F(JointTest, RejectsInvalidJoints) {
    BodyId const a = addBox(Vector(0.0, 0.0));
    BodyId const ground = addBox(Vector(0.0, -2.0), BodyKind::Static);
    BodyId const wall = addBox(Vector(3.0, -2.0), BodyKind::Static);

    JointSpec spec;
    spec.bodyA = a;
    spec.bodyB = a;
    EXPECT_THROW(world.addJoint(spec), Boxigon::InvalidParametersError);

    spec.bodyA = ground;
    spec.bodyB = wall;
    EXPECT_THROW(world.addJoint(spec), Boxigon::InvalidParametersError);

    spec.bodyA = a;
    spec.bodyB = 999u;
    EXPECT_THROW(world.addJoint(spec), Boxigon::UnknownBodyError);

    spec.bodyB = ground;
    spec.frequencyHz = -1.0;
    EXPECT_THROW(world.addJoint(spec), Boxigon::InvalidParametersError);

    spec.frequencyHz = 0.0;
    spec.breakImpulse = 0.0;
    EXPECT_THROW(world.addJoint(spec), Boxigon::InvalidParametersError);

    spec.breakImpulse = std::nan("");
    EXPECT_THROW(world.addJoint(spec), Boxigon::InvalidParametersError);

    spec.breakImpulse = HUGE_VAL;
    spec.localAnchorA = Vector(std::nan(""), 0.0);
    EXPECT_THROW(world.addJoint(spec), Boxigon::InvalidParametersError);

    // Failed calls consume no ids
    spec.localAnchorA = Vector();
    EXPECT_EQ(world.addJoint(spec), 1u);

    EXPECT_THROW(world.removeJoint(42), Boxigon::UnknownJointError);
}

TEST_F(JointTest, DestroyingABodyRemovesItsJointsSilently) {
    BodyId const a = addBox(Vector(0.0, 5.0));
    BodyId const b = addBox(Vector(2.0, 5.0));

    JointSpec spec;
    spec.type = JointType::Distance;
    spec.bodyA = a;
    spec.bodyB = b;
    JointId const joint = world.addJoint(spec);

    world.step(Dt);
    world.destroyBody(a);
    EXPECT_FALSE(world.hasJoint(joint));
    EXPECT_TRUE(world.joints().empty());

    world.step(Dt);
    for (const auto& e : world.events()) {
        EXPECT_NE(e.type, Boxigon::EventType::JointBroken);
    }
}

TEST_F(JointTest, SpringJointSettlesNearRestLength) {
    BodyId const weight = addBox(Vector(0.0, 3.0));

    JointSpec spec;
    spec.type = JointType::Distance;
    spec.bodyA = weight;
    spec.anchorB = Vector(0.0, 5.0);
    spec.frequencyHz = 2.0;
    spec.dampingRatio = 0.7;
    JointId const joint = world.addJoint(spec);

    run(300);

    // Static stretch of a spring: g / omega^2
    double const omega = 2.0 * M_PI * spec.frequencyHz;
    double const stretch = 9.8 / (omega * omega);
    auto const state = world.getJoint(joint);
    EXPECT_NEAR((state.worldAnchorA - state.worldAnchorB).length(), 2.0 + stretch, 0.03);
}
