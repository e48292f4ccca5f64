/**
 * @file main.cpp
 * @brief Headless sandbox runner.
 *
 * Builds a named scenario, steps it at a fixed rate and prints periodic step
 * statistics together with the events delivered through the world's
 * dispatcher.
 *
 * Usage: boxigon_demo [scenario] [steps] [--save path] [--profile] [--quiet]
 */

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "boxigon/core/errors.hpp"
#include "boxigon/core/profile.hpp"
#include "boxigon/core/scene.hpp"
#include "boxigon/core/world.hpp"
#include "boxigon/scenarios/i_scenario.hpp"

namespace {

constexpr double TimeStep = 1.0 / 60.0;
constexpr std::uint64_t StatsInterval = 60;

/**
 * @brief Prints selected events as they are delivered
 */
struct EventPrinter {
    bool quiet = false;
    std::uint64_t brokenJoints = 0;
    std::uint64_t collisions = 0;

    void onBegan(const Boxigon::CollisionBegan& e) {
        ++collisions;
        if (!quiet) {
            std::cout << "  began   " << e.a << " - " << e.b << "\n";
        }
    }

    void onBroken(const Boxigon::JointBroken& e) {
        ++brokenJoints;
        std::cout << "  broken  joint " << e.joint << " (" << e.a << ", " << e.b << ")\n";
    }
};

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [scenario] [steps] [--save path] [--profile] [--quiet]\n"
              << "scenarios:";
    for (const auto& name : Scenarios::scenarioNames()) {
        std::cerr << " " << name;
    }
    std::cerr << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string scenarioName = "pyramid";
    std::uint64_t steps = 600;
    std::string savePath;
    bool profile = false;
    bool quiet = false;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string const arg = argv[i];
        if (arg == "--save" && i + 1 < argc) {
            savePath = argv[++i];
        } else if (arg == "--profile") {
            profile = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (positional == 0) {
            scenarioName = arg;
            ++positional;
        } else if (positional == 1) {
            steps = std::strtoull(arg.c_str(), nullptr, 10);
            ++positional;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    auto scenario = Scenarios::makeScenario(scenarioName);
    if (!scenario) {
        std::cerr << "Unknown scenario '" << scenarioName << "'\n";
        printUsage(argv[0]);
        return 1;
    }

    Profiling::Profiler::setEnabled(profile);

    try {
        Boxigon::World world(scenario->getConfig());
        scenario->createScene(world);

        EventPrinter printer;
        printer.quiet = quiet;
        world.onEvent<Boxigon::CollisionBegan>().connect<&EventPrinter::onBegan>(printer);
        world.onEvent<Boxigon::JointBroken>().connect<&EventPrinter::onBroken>(printer);

        for (std::uint64_t s = 0; s < steps; ++s) {
            scenario->onStep(world, s);
            world.step(TimeStep);
            if ((s + 1) % StatsInterval == 0 || s + 1 == steps) {
                std::cout << world.stats() << "\n";
            }
        }

        std::cout << "collisions begun: " << printer.collisions
                  << ", joints broken: " << printer.brokenJoints << "\n";

        if (!savePath.empty()) {
            Boxigon::saveScene(savePath, world.snapshot());
            std::cout << "scene written to " << savePath << "\n";
        }
    } catch (const Boxigon::PhysicsError& e) {
        std::cerr << "Simulation failed: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (profile) {
        Profiling::Profiler::printStats(std::cout);
    }
    return 0;
}
