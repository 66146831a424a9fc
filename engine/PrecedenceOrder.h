#pragma once

#include <QList>
#include <QVector>

#include "PrecedenceSolver.h"
#include "StageResult.h"

namespace RailPrecedence::Engine {

enum class PrecedencePath {
    SOLVED,
    HEURISTIC
};

// Rank of every eligible train, indexed like the eligible-train list.
// Rank 0 goes first.
struct PrecedenceOrder {
    PrecedencePath path = PrecedencePath::HEURISTIC;
    QVector<int> ranks;

    int trainCount() const { return ranks.size(); }

    // Rank = number of trains the assignment orders strictly before the train
    static StageResult<PrecedenceOrder> fromSolution(const PrecedenceSolution& solution);

    // Rank = position in the sorted index list
    static StageResult<PrecedenceOrder> fromHeuristic(const QList<int>& sortedIndices);
};

} // namespace RailPrecedence::Engine
