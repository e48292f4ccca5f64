/**
 * @file galton_board.hpp
 * @brief Declaration of the GaltonBoardScenario class
 */

#pragma once

#include "boxigon/scenarios/i_scenario.hpp"

/**
 * @struct GaltonBoardConfig
 * @brief Configuration parameters specific to the Galton board scenario
 *
 * Measurements are proportioned on the ball diameter:
 * - pegs sit two ball diameters apart
 * - bins are three ball diameters wide
 */
struct GaltonBoardConfig {
    double ballDiameter = 0.2;         // Fundamental unit for proportions

    int ballCount = 60;
    double ballDensity = 2.0;
    double ballFriction = 0.05;
    double ballRestitution = 0.3;
    int ballsPerRelease = 5;           // Balls dropped together
    int releaseInterval = 20;          // Steps between releases

    int pegRows = 10;
    double pegRadius = 0.05;
    double pegRestitution = 0.3;
    double wallThickness = 0.2;
    double wallFriction = 0.05;
};

/**
 * @class GaltonBoardScenario
 * @brief Balls released in batches fall through a triangular peg grid into bins
 */
class GaltonBoardScenario : public IScenario {
public:
    GaltonBoardScenario() = default;
    ~GaltonBoardScenario() override = default;

    Boxigon::WorldConfig getConfig() const override;
    void createScene(Boxigon::World& world) override;
    void onStep(Boxigon::World& world, std::uint64_t step) override;

private:
    void makeWall(Boxigon::World& world, double cx, double cy, double hx, double hy) const;
    void makePeg(Boxigon::World& world, double cx, double cy) const;

    GaltonBoardConfig scenarioConfig;
    int released = 0;
    double dropHeight = 0.0;
};
