#include "boxigon/core/stats.hpp"

namespace Boxigon {

std::ostream& operator<<(std::ostream& os, const StepStats& stats) {
    os << "step " << stats.step
       << " | bodies " << stats.bodies
       << " (awake " << stats.awakeBodies << ", sleeping " << stats.sleepingBodies << ")"
       << " | pairs " << stats.candidatePairs << "/" << stats.testedPairs
       << " | manifolds " << stats.manifolds << " (" << stats.contactPoints << " points)"
       << " | islands " << stats.islands
       << " | joints " << stats.joints;
    if (stats.brokenJoints > 0) {
        os << " (" << stats.brokenJoints << " broke)";
    }
    os << " | min separation " << stats.minSeparation;
    return os;
}

} // namespace Boxigon
