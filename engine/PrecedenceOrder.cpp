#include "PrecedenceOrder.h"

namespace RailPrecedence::Engine {

StageResult<PrecedenceOrder> PrecedenceOrder::fromSolution(const PrecedenceSolution& solution) {
    const QString stage = "precedence order";
    const int n = solution.trainCount;

    if (!solution.hasAssignment()) {
        return StageResult<PrecedenceOrder>::failure(
            StageFailureKind::INCONSISTENT_ORDER, stage,
            QString("Solver status %1 carries no assignment").arg(solveStatusToString(solution.status)));
    }
    if (solution.before.size() != n * n) {
        return StageResult<PrecedenceOrder>::failure(
            StageFailureKind::INCONSISTENT_ORDER, stage,
            QString("Assignment has %1 variables, expected %2").arg(solution.before.size()).arg(n * n));
    }

    PrecedenceOrder order;
    order.path = PrecedencePath::SOLVED;
    order.ranks = QVector<int>(n, 0);

    for (int i = 0; i < n; ++i) {
        int position = 0;
        for (int j = 0; j < n; ++j) {
            if (i != j && solution.isBefore(j, i)) {
                position++;
            }
        }
        order.ranks[i] = position;
    }

    return StageResult<PrecedenceOrder>::success(order);
}

StageResult<PrecedenceOrder> PrecedenceOrder::fromHeuristic(const QList<int>& sortedIndices) {
    const int n = sortedIndices.size();

    PrecedenceOrder order;
    order.path = PrecedencePath::HEURISTIC;
    order.ranks = QVector<int>(n, -1);

    for (int position = 0; position < n; ++position) {
        const int index = sortedIndices.at(position);
        if (index < 0 || index >= n || order.ranks.at(index) != -1) {
            return StageResult<PrecedenceOrder>::failure(
                StageFailureKind::INCONSISTENT_ORDER, "precedence order",
                QString("Heuristic ordering is not a permutation (index %1)").arg(index));
        }
        order.ranks[index] = position;
    }

    return StageResult<PrecedenceOrder>::success(order);
}

} // namespace RailPrecedence::Engine
