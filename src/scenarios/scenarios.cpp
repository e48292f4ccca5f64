#include "boxigon/scenarios/i_scenario.hpp"
#include "boxigon/scenarios/demolition.hpp"
#include "boxigon/scenarios/galton_board.hpp"
#include "boxigon/scenarios/pyramid.hpp"
#include "boxigon/scenarios/random_polygons.hpp"

namespace Scenarios {

std::unique_ptr<IScenario> makeScenario(const std::string& name) {
    if (name == "pyramid") {
        return std::make_unique<PyramidScenario>();
    }
    if (name == "galton") {
        return std::make_unique<GaltonBoardScenario>();
    }
    if (name == "demolition") {
        return std::make_unique<DemolitionScenario>();
    }
    if (name == "random") {
        return std::make_unique<RandomPolygonsScenario>();
    }
    return nullptr;
}

std::vector<std::string> scenarioNames() {
    return {"pyramid", "galton", "demolition", "random"};
}

} // namespace Scenarios
