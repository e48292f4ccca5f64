#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace Boxigon {

/**
 * @struct StepStats
 * @brief Counters describing the last completed step
 */
struct StepStats {
    std::uint64_t step = 0;            // Steps completed by the World
    std::size_t bodies = 0;
    std::size_t awakeBodies = 0;       // Awake dynamic bodies
    std::size_t sleepingBodies = 0;
    std::size_t candidatePairs = 0;    // Broad-phase output
    std::size_t testedPairs = 0;       // Pairs sent to narrow phase
    std::size_t manifolds = 0;
    std::size_t contactPoints = 0;
    std::size_t islands = 0;
    std::size_t joints = 0;
    std::size_t brokenJoints = 0;
    double minSeparation = 0.0;        // Deepest contact after the position pass
};

std::ostream& operator<<(std::ostream& os, const StepStats& stats);

} // namespace Boxigon
