/**
 * @file pyramid.hpp
 * @brief Stacked box pyramid on a static floor
 */

#pragma once

#include "boxigon/scenarios/i_scenario.hpp"

struct PyramidConfig {
    int baseCount = 10;          // Boxes in the bottom row
    double boxHalfSize = 0.5;
    double spacing = 0.02;       // Horizontal gap between boxes
    double friction = 0.6;
    double density = 1.0;
};

class PyramidScenario : public IScenario {
public:
    PyramidScenario() = default;
    ~PyramidScenario() override = default;

    Boxigon::WorldConfig getConfig() const override;
    void createScene(Boxigon::World& world) override;

private:
    PyramidConfig scenarioConfig;
};
