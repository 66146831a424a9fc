#pragma once

#include "../model/Train.h"

namespace RailPrecedence::Engine {

// Two trains contend for a resource only when they occupy the identical
// section. Adjacent sections sharing a station are not treated as contention.
class ConflictDetector {
public:
    bool competesForResource(const Model::Train& trainA, const Model::Train& trainB) const;
};

} // namespace RailPrecedence::Engine
