#pragma once

#include <QList>

#include "../model/Train.h"

namespace RailPrecedence::Engine {

// Deterministic fallback ordering: priority descending, then delay
// descending, then train identity.
class HeuristicOrdering {
public:
    // Indices into trains, first entry goes first
    QList<int> order(const QList<Model::Train>& trains) const;

    static bool ranksAhead(const Model::Train& a, const Model::Train& b);
};

} // namespace RailPrecedence::Engine
