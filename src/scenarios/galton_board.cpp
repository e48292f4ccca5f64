/**
 * @file galton_board.cpp
 * @brief Galton board (bean machine): a triangular grid of static pegs above
 *        a row of bins, fed by balls released in small batches to keep the
 *        funnel stable.
 */

#include <algorithm>
#include <cmath>

#include "boxigon/scenarios/galton_board.hpp"
#include "boxigon/core/debug.hpp"

void GaltonBoardScenario::makePeg(Boxigon::World& world, double cx, double cy) const {
    Boxigon::BodyDef def;
    def.kind = Boxigon::BodyKind::Static;
    def.position = Vector(cx, cy);
    def.restitution = scenarioConfig.pegRestitution;
    def.friction = scenarioConfig.wallFriction;
    Boxigon::BodyId const peg = world.createBody(def);
    world.attachShape(peg, Boxigon::ShapeSpec::circle(scenarioConfig.pegRadius));
}

void GaltonBoardScenario::makeWall(Boxigon::World& world, double cx, double cy, double hx, double hy) const {
    Boxigon::BodyDef def;
    def.kind = Boxigon::BodyKind::Static;
    def.position = Vector(cx, cy);
    def.friction = scenarioConfig.wallFriction;
    Boxigon::BodyId const wall = world.createBody(def);
    world.attachShape(wall, Boxigon::ShapeSpec::box(hx, hy));
}

Boxigon::WorldConfig GaltonBoardScenario::getConfig() const {
    Boxigon::WorldConfig cfg;
    cfg.broadphase.cellSize = scenarioConfig.ballDiameter * 2.0;
    cfg.narrowphase.threads = 2;
    // Balls balanced on a peg must not fall asleep mid-board
    cfg.sleep.timeToSleep = 2.0;
    return cfg;
}

void GaltonBoardScenario::createScene(Boxigon::World& world) {
    double const d = scenarioConfig.ballDiameter;
    double const pegSpacing = 2.0 * d;
    double const rowHeight = 1.5 * d;
    double const binWidth = 3.0 * d;
    int const rows = scenarioConfig.pegRows;
    int const bins = rows + 1;

    double const boardWidth = bins * binWidth;
    double const binHeight = 8.0 * d;
    double const pegTop = binHeight + rows * rowHeight + d;
    double const boardHeight = pegTop + 10.0 * d;
    double const t = scenarioConfig.wallThickness;

    // Floor and side walls
    makeWall(world, 0.0, -0.5 * t, 0.5 * boardWidth + t, 0.5 * t);
    makeWall(world, -0.5 * boardWidth - 0.5 * t, 0.5 * boardHeight, 0.5 * t, 0.5 * boardHeight);
    makeWall(world, 0.5 * boardWidth + 0.5 * t, 0.5 * boardHeight, 0.5 * t, 0.5 * boardHeight);

    // Bin dividers
    for (int i = 1; i < bins; ++i) {
        double const x = -0.5 * boardWidth + i * binWidth;
        makeWall(world, x, 0.5 * binHeight, 0.25 * t, 0.5 * binHeight);
    }

    // Peg triangle, apex at the top center
    for (int row = 0; row < rows; ++row) {
        double const y = pegTop - row * rowHeight;
        int const count = row + 1;
        double const x0 = -0.5 * pegSpacing * (count - 1);
        for (int i = 0; i < count; ++i) {
            makePeg(world, x0 + i * pegSpacing, y);
        }
    }

    dropHeight = pegTop + 3.0 * d;
    released = 0;

    BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_BASIC,
        "[GaltonBoard] " << rows << " peg rows, " << bins << " bins, board "
        << boardWidth << " x " << boardHeight << " m\n");
}

void GaltonBoardScenario::onStep(Boxigon::World& world, std::uint64_t step) {
    if (released >= scenarioConfig.ballCount ||
        step % static_cast<std::uint64_t>(scenarioConfig.releaseInterval) != 0) {
        return;
    }

    double const d = scenarioConfig.ballDiameter;
    int const batch = std::min(scenarioConfig.ballsPerRelease, scenarioConfig.ballCount - released);
    for (int i = 0; i < batch; ++i) {
        Boxigon::BodyDef def;
        // Slight alternating offset so balls do not balance on the apex peg
        double const jitter = (i % 2 == 0 ? 1.0 : -1.0) * 0.01 * d * (1 + i);
        def.position = Vector(jitter, dropHeight + i * 1.2 * d);
        def.density = scenarioConfig.ballDensity;
        def.friction = scenarioConfig.ballFriction;
        def.restitution = scenarioConfig.ballRestitution;
        Boxigon::BodyId const ball = world.createBody(def);
        world.attachShape(ball, Boxigon::ShapeSpec::circle(0.5 * d));
        ++released;
    }
}
