/**
 * @file pyramid.cpp
 * @brief Box pyramid resting on a floor; a stacking and sleep benchmark
 */

#include "boxigon/scenarios/pyramid.hpp"

Boxigon::WorldConfig PyramidScenario::getConfig() const {
    Boxigon::WorldConfig cfg;
    cfg.contactSolver.velocityIterations = 12;
    cfg.broadphase.cellSize = 2.0 * scenarioConfig.boxHalfSize + 0.5;
    return cfg;
}

void PyramidScenario::createScene(Boxigon::World& world) {
    Boxigon::BodyDef floorDef;
    floorDef.kind = Boxigon::BodyKind::Static;
    floorDef.position = Vector(0.0, -0.5);
    floorDef.friction = scenarioConfig.friction;
    Boxigon::BodyId const floor = world.createBody(floorDef);
    world.attachShape(floor, Boxigon::ShapeSpec::box(40.0, 0.5));

    double const h = scenarioConfig.boxHalfSize;
    double const step = 2.0 * h + scenarioConfig.spacing;

    for (int row = 0; row < scenarioConfig.baseCount; ++row) {
        int const count = scenarioConfig.baseCount - row;
        double const x0 = -0.5 * step * (count - 1);
        double const y = h + row * 2.0 * h;
        for (int i = 0; i < count; ++i) {
            Boxigon::BodyDef def;
            def.position = Vector(x0 + i * step, y);
            def.density = scenarioConfig.density;
            def.friction = scenarioConfig.friction;
            def.restitution = 0.0;
            Boxigon::BodyId const box = world.createBody(def);
            world.attachShape(box, Boxigon::ShapeSpec::box(h, h));
        }
    }
}
