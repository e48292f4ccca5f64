/**
 * @file demolition.cpp
 * @brief Destruction sandbox: every destructive mechanic of the engine at once
 *
 * - a tower of blocks held together by breakable weld joints
 * - a heavy ball swinging on a distance joint anchored to the world
 * - a rocket sled driven by a thruster, switched off after a while
 * - an explosion at the tower base, then removal of fallen debris
 */

#include "boxigon/scenarios/demolition.hpp"
#include "boxigon/core/debug.hpp"

Boxigon::WorldConfig DemolitionScenario::getConfig() const {
    Boxigon::WorldConfig cfg;
    cfg.contactSolver.velocityIterations = 10;
    cfg.jointSolver.jointBaumgarte = 0.2;
    return cfg;
}

void DemolitionScenario::createScene(Boxigon::World& world) {
    Boxigon::BodyDef groundDef;
    groundDef.kind = Boxigon::BodyKind::Static;
    groundDef.position = Vector(0.0, -0.5);
    groundDef.friction = 0.7;
    Boxigon::BodyId const ground = world.createBody(groundDef);
    world.attachShape(ground, Boxigon::ShapeSpec::box(30.0, 0.5));

    // Tower: each block welded to the one below it
    double const hx = scenarioConfig.blockHalfWidth;
    double const hy = scenarioConfig.blockHalfHeight;
    Boxigon::BodyId below = Boxigon::NullBody;
    for (int level = 0; level < scenarioConfig.towerLevels; ++level) {
        Boxigon::BodyDef def;
        def.position = Vector(0.0, hy + level * 2.0 * hy);
        def.friction = 0.6;
        def.restitution = 0.0;
        Boxigon::BodyId const block = world.createBody(def);
        world.attachShape(block, Boxigon::ShapeSpec::box(hx, hy));

        if (below != Boxigon::NullBody) {
            Boxigon::JointSpec weld;
            weld.type = Boxigon::JointType::Weld;
            weld.bodyA = below;
            weld.bodyB = block;
            weld.localAnchorA = Vector(0.0, hy);
            weld.anchorB = Vector(0.0, -hy);
            weld.breakImpulse = scenarioConfig.weldBreakImpulse;
            world.addJoint(weld);
        }
        below = block;
    }

    // Wrecking ball, released from the side
    Vector const pivot(-8.0, scenarioConfig.chainLength + 4.0);
    Boxigon::BodyDef ballDef;
    ballDef.position = pivot + Vector(-scenarioConfig.chainLength, 0.0);
    ballDef.density = scenarioConfig.ballDensity;
    ballDef.restitution = 0.1;
    Boxigon::BodyId const ball = world.createBody(ballDef);
    world.attachShape(ball, Boxigon::ShapeSpec::circle(scenarioConfig.ballRadius));

    Boxigon::JointSpec chain;
    chain.type = Boxigon::JointType::Distance;
    chain.bodyA = ball;
    chain.anchorB = pivot;
    world.addJoint(chain);

    // Rocket sled on the ground, pushing towards the tower
    Boxigon::BodyDef sledDef;
    sledDef.position = Vector(12.0, 0.4);
    sledDef.friction = 0.2;
    rocket = world.createBody(sledDef);
    world.attachShape(rocket, Boxigon::ShapeSpec::box(0.8, 0.3));
    world.attachShape(rocket, Boxigon::ShapeSpec::polygon({Vector(-0.8, 0.3), Vector(-1.4, 0.0), Vector(-0.8, -0.3)}));
    world.setThruster(rocket, Vector(-scenarioConfig.thrust, 0.0), Vector(0.8, 0.0));
}

void DemolitionScenario::onStep(Boxigon::World& world, std::uint64_t step) {
    if (step == scenarioConfig.explosionStep) {
        BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_BASIC, "[Demolition] boom at step " << step << "\n");
        world.applyExplosion(Vector(0.0, 0.2), scenarioConfig.explosionRadius, scenarioConfig.explosionImpulse);
    }

    if (step == scenarioConfig.explosionStep / 2 && world.hasBody(rocket)) {
        world.clearThruster(rocket);
    }

    // Clear debris that left the arena
    for (const auto& body : world.bodies()) {
        if (body.kind == Boxigon::BodyKind::Dynamic && body.position.y < scenarioConfig.killHeight) {
            world.destroyBody(body.id);
        }
    }
}
