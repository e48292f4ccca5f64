/**
 * @file demolition.hpp
 * @brief Welded tower, wrecking ball, rocket and a timed explosion
 */

#pragma once

#include <vector>

#include "boxigon/scenarios/i_scenario.hpp"

struct DemolitionConfig {
    // Tower of welded blocks
    int towerLevels = 8;
    double blockHalfWidth = 1.0;
    double blockHalfHeight = 0.25;
    double weldBreakImpulse = 6.0;     // Welds snap above this accumulated impulse (N s)

    // Wrecking ball on a rigid distance joint
    double ballRadius = 0.6;
    double ballDensity = 8.0;
    double chainLength = 6.0;

    // Rocket sled pushed by a thruster
    double thrust = 40.0;

    // Explosion at the tower base
    std::uint64_t explosionStep = 240;
    double explosionRadius = 4.0;
    double explosionImpulse = 30.0;

    // Debris below this height is removed
    double killHeight = -20.0;
};

class DemolitionScenario : public IScenario {
public:
    DemolitionScenario() = default;
    ~DemolitionScenario() override = default;

    Boxigon::WorldConfig getConfig() const override;
    void createScene(Boxigon::World& world) override;
    void onStep(Boxigon::World& world, std::uint64_t step) override;

private:
    DemolitionConfig scenarioConfig;
    Boxigon::BodyId rocket = Boxigon::NullBody;
};
