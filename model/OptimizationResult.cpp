#include "OptimizationResult.h"

#include <algorithm>

namespace RailPrecedence::Model {

QString optimizationPathToString(OptimizationPath path) {
    switch (path) {
        case OptimizationPath::EMPTY:     return "empty";
        case OptimizationPath::SOLVED:    return "solved";
        case OptimizationPath::HEURISTIC: return "heuristic";
        case OptimizationPath::DEGRADED:  return "degraded";
    }
    return "empty";
}

int OptimizationResult::proceedCount() const {
    return static_cast<int>(std::count_if(decisions.cbegin(), decisions.cend(),
                                          [](const Decision& d) { return d.isProceed(); }));
}

int OptimizationResult::waitCount() const {
    return static_cast<int>(std::count_if(decisions.cbegin(), decisions.cend(),
                                          [](const Decision& d) { return d.isWait(); }));
}

const Decision* OptimizationResult::decisionForTrain(const QUuid& trainId) const {
    for (const Decision& decision : decisions) {
        if (decision.trainId == trainId) {
            return &decision;
        }
    }
    return nullptr;
}

} // namespace RailPrecedence::Model
