#include "HeuristicOrdering.h"

#include <algorithm>

namespace RailPrecedence::Engine {

QList<int> HeuristicOrdering::order(const QList<Model::Train>& trains) const {
    QList<int> indices;
    indices.reserve(trains.size());
    for (int i = 0; i < trains.size(); ++i) {
        indices.append(i);
    }

    std::stable_sort(indices.begin(), indices.end(), [&trains](int a, int b) {
        return ranksAhead(trains.at(a), trains.at(b));
    });

    return indices;
}

bool HeuristicOrdering::ranksAhead(const Model::Train& a, const Model::Train& b) {
    if (a.priority() != b.priority()) {
        return a.priority() > b.priority();
    }
    if (a.delayMinutes() != b.delayMinutes()) {
        return a.delayMinutes() > b.delayMinutes();
    }
    return a.id() < b.id();
}

} // namespace RailPrecedence::Engine
