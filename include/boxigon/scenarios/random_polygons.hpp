/**
 * @file random_polygons.hpp
 * @brief Declaration of the RandomPolygonsScenario class
 */

#pragma once

#include <cstdint>

#include "boxigon/scenarios/i_scenario.hpp"

/**
 * @struct RandomPolygonsConfig
 * @brief Configuration parameters specific to the random polygons scenario
 */
struct RandomPolygonsConfig {
    // Shape type distribution
    double circlesFraction = 0.3;       // Fraction of shapes that are circles
    double regularFraction = 0.4;       // Fraction of shapes that are regular polygons
    // Random convex polygon fraction is 1.0 - circlesFraction - regularFraction

    // Size parameters
    double smallShapeRatio = 0.90;      // Ratio of small to large shapes
    double smallShapeMin = 0.2;
    double smallShapeMax = 0.4;
    double largeShapeMin = 0.6;
    double largeShapeMax = 1.0;

    double wallFriction = 0.2;
    double floorFriction = 0.6;
    double particleFriction = 0.4;

    int particleCount = 150;
    double initialVelocityFactor = 2.0; // Initial velocity scaling

    double boxSize = 20.0;              // Interior width and height of the arena
    double wallThickness = 0.5;

    std::uint32_t seed = 12345;         // Fixed so that runs are reproducible
};

/**
 * @class RandomPolygonsScenario
 *
 * Walled arena filled with circles, regular polygons and random convex polygons.
 */
class RandomPolygonsScenario : public IScenario {
public:
    RandomPolygonsScenario() = default;
    ~RandomPolygonsScenario() override = default;

    Boxigon::WorldConfig getConfig() const override;
    void createScene(Boxigon::World& world) override;

private:
    RandomPolygonsConfig scenarioConfig;
};
