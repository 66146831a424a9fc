#include "DecisionExtractor.h"

#include <algorithm>

namespace RailPrecedence::Engine {

StageResult<QList<Model::Decision>> DecisionExtractor::extract(const QList<Model::Train>& trains,
                                                               const PrecedenceOrder& order,
                                                               const QDateTime& referenceTime) const {
    if (order.trainCount() != trains.size()) {
        return StageResult<QList<Model::Decision>>::failure(
            StageFailureKind::INCONSISTENT_ORDER, "decision extraction",
            QString("Order ranks %1 trains but %2 are eligible").arg(order.trainCount()).arg(trains.size()));
    }

    QList<int> byRank;
    byRank.reserve(trains.size());
    for (int i = 0; i < trains.size(); ++i) {
        byRank.append(i);
    }
    std::stable_sort(byRank.begin(), byRank.end(), [&order](int a, int b) {
        return order.ranks.at(a) < order.ranks.at(b);
    });

    QList<Model::Decision> decisions;
    decisions.reserve(trains.size());

    for (int index : byRank) {
        const int rank = order.ranks.at(index);
        if (rank == 0) {
            decisions.append(makeProceed(trains.at(index), order.path, referenceTime));
        } else {
            decisions.append(makeWait(trains.at(index), rank, order.path, referenceTime));
        }
    }

    return StageResult<QList<Model::Decision>>::success(decisions);
}

QString DecisionExtractor::proceedReason(PrecedencePath path) {
    return path == PrecedencePath::SOLVED
        ? QStringLiteral("Highest priority in precedence order")
        : QStringLiteral("Highest priority by heuristic");
}

QString DecisionExtractor::waitReason(int rank) {
    return QString("Waiting for %1 higher priority trains").arg(rank);
}

Model::Decision DecisionExtractor::makeProceed(const Model::Train& train,
                                               PrecedencePath path,
                                               const QDateTime& referenceTime) const {
    const double confidence = path == PrecedencePath::SOLVED
        ? SOLVED_PROCEED_CONFIDENCE
        : HEURISTIC_PROCEED_CONFIDENCE;

    Model::Decision decision = Model::Decision::create(
        train.id(), Model::DecisionAction::PROCEED, proceedReason(path), confidence);
    decision.targetSectionId = train.currentSectionId();
    decision.estimatedTime = referenceTime;
    decision.estimatedWaitMinutes = 0;
    return decision;
}

Model::Decision DecisionExtractor::makeWait(const Model::Train& train,
                                            int rank,
                                            PrecedencePath path,
                                            const QDateTime& referenceTime) const {
    const double confidence = path == PrecedencePath::SOLVED
        ? SOLVED_WAIT_CONFIDENCE
        : HEURISTIC_WAIT_CONFIDENCE;

    // No target section: the train has no clearance yet
    Model::Decision decision = Model::Decision::create(
        train.id(), Model::DecisionAction::WAIT, waitReason(rank), confidence);
    decision.estimatedWaitMinutes = rank * WAIT_MINUTES_PER_RANK;
    if (referenceTime.isValid()) {
        decision.estimatedTime = referenceTime.addSecs(static_cast<qint64>(decision.estimatedWaitMinutes) * 60);
    }
    return decision;
}

} // namespace RailPrecedence::Engine
