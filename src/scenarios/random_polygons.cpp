/**
 * @file random_polygons.cpp
 * @brief Walled arena populated with circles and random convex polygons.
 *
 * Shapes are drawn with configurable probabilities: circles, regular polygons
 * with 3 to 8 sides, or irregular convex polygons built from sorted random
 * angles on a circle. The generator is seeded so that two runs are identical.
 */

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include "boxigon/scenarios/random_polygons.hpp"
#include "boxigon/core/errors.hpp"

/**
 * @brief Creates a static wall of half extents (halfW, halfH) centered at (cx, cy)
 */
static void makeWall(Boxigon::World& world,
                     double cx,
                     double cy,
                     double halfW,
                     double halfH,
                     double friction) {
    Boxigon::BodyDef def;
    def.kind = Boxigon::BodyKind::Static;
    def.position = Vector(cx, cy);
    def.friction = friction;
    Boxigon::BodyId const wall = world.createBody(def);
    world.attachShape(wall, Boxigon::ShapeSpec::box(halfW, halfH));
}

/**
 * @brief Random convex polygon: vertices at sorted random angles on a circle
 */
static std::vector<Vector> randomConvexPolygon(std::mt19937& gen, double radius) {
    std::uniform_int_distribution<int> countDist(4, 8);
    std::uniform_real_distribution<double> angleDist(0.0, 2.0 * M_PI);

    int const count = countDist(gen);
    std::vector<double> angles(count);
    for (double& a : angles) {
        a = angleDist(gen);
    }
    std::sort(angles.begin(), angles.end());

    std::vector<Vector> vertices;
    vertices.reserve(angles.size());
    for (double a : angles) {
        vertices.emplace_back(radius * std::cos(a), radius * std::sin(a));
    }
    return vertices;
}

Boxigon::WorldConfig RandomPolygonsScenario::getConfig() const {
    Boxigon::WorldConfig cfg;
    cfg.broadphase.cellSize = 2.0 * scenarioConfig.largeShapeMax;
    cfg.narrowphase.threads = 4;
    return cfg;
}

void RandomPolygonsScenario::createScene(Boxigon::World& world) {
    double const size = scenarioConfig.boxSize;
    double const t = scenarioConfig.wallThickness;

    makeWall(world, 0.0, -0.5 * t, 0.5 * size + t, 0.5 * t, scenarioConfig.floorFriction);
    makeWall(world, 0.0, size + 0.5 * t, 0.5 * size + t, 0.5 * t, scenarioConfig.wallFriction);
    makeWall(world, -0.5 * size - 0.5 * t, 0.5 * size, 0.5 * t, 0.5 * size, scenarioConfig.wallFriction);
    makeWall(world, 0.5 * size + 0.5 * t, 0.5 * size, 0.5 * t, 0.5 * size, scenarioConfig.wallFriction);

    std::mt19937 gen(scenarioConfig.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> posDist(-0.5 * size + scenarioConfig.largeShapeMax,
                                                   0.5 * size - scenarioConfig.largeShapeMax);
    std::uniform_real_distribution<double> heightDist(scenarioConfig.largeShapeMax,
                                                      size - scenarioConfig.largeShapeMax);
    std::uniform_real_distribution<double> velDist(-1.0, 1.0);
    std::uniform_int_distribution<int> sidesDist(3, 8);

    for (int i = 0; i < scenarioConfig.particleCount; ++i) {
        bool const small = unit(gen) < scenarioConfig.smallShapeRatio;
        double const lo = small ? scenarioConfig.smallShapeMin : scenarioConfig.largeShapeMin;
        double const hi = small ? scenarioConfig.smallShapeMax : scenarioConfig.largeShapeMax;
        double const radius = lo + (hi - lo) * unit(gen);

        Boxigon::ShapeSpec spec;
        double const pick = unit(gen);
        if (pick < scenarioConfig.circlesFraction) {
            spec = Boxigon::ShapeSpec::circle(radius);
        } else if (pick < scenarioConfig.circlesFraction + scenarioConfig.regularFraction) {
            spec = Boxigon::ShapeSpec::regularPolygon(sidesDist(gen), radius);
        } else {
            spec = Boxigon::ShapeSpec::polygon(randomConvexPolygon(gen, radius));
        }

        Boxigon::BodyDef def;
        def.position = Vector(posDist(gen), heightDist(gen));
        def.angle = 2.0 * M_PI * unit(gen);
        def.linearVelocity = Vector(velDist(gen), velDist(gen)) * scenarioConfig.initialVelocityFactor;
        def.friction = scenarioConfig.particleFriction;
        def.restitution = 0.2;
        Boxigon::BodyId const body = world.createBody(def);

        try {
            world.attachShape(body, spec);
        } catch (const Boxigon::InvalidGeometryError&) {
            // Random loops can come out as slivers; fall back to a regular shape
            world.attachShape(body, Boxigon::ShapeSpec::regularPolygon(5, radius));
        }
    }
}
