#include "ConflictDetector.h"

namespace RailPrecedence::Engine {

bool ConflictDetector::competesForResource(const Model::Train& trainA, const Model::Train& trainB) const {
    const auto& sectionA = trainA.currentSectionId();
    const auto& sectionB = trainB.currentSectionId();

    if (!sectionA || !sectionB) {
        return false;
    }

    return *sectionA == *sectionB;
}

} // namespace RailPrecedence::Engine
