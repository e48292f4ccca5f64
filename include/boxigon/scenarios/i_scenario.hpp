#ifndef BOXIGON_I_SCENARIO_HPP
#define BOXIGON_I_SCENARIO_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "boxigon/core/world.hpp"
#include "boxigon/core/world_config.hpp"

/**
 * @brief Abstract base class for any sandbox scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning the WorldConfig it is tuned for
 *  - createScene() that builds its bodies and joints through the World API
 *  - onStep() for scripted actions (optional)
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual Boxigon::WorldConfig getConfig() const = 0;

    virtual void createScene(Boxigon::World& world) = 0;

    /**
     * @brief Called before every step with the number of completed steps
     */
    virtual void onStep(Boxigon::World& world, std::uint64_t step) {
        (void)world;
        (void)step;
    }
};

namespace Scenarios {

/**
 * @brief Builds a scenario by name ("pyramid", "galton", "demolition", "random")
 * @return nullptr for an unknown name
 */
std::unique_ptr<IScenario> makeScenario(const std::string& name);

std::vector<std::string> scenarioNames();

} // namespace Scenarios

#endif // BOXIGON_I_SCENARIO_HPP
