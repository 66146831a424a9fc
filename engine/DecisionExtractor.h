#pragma once

#include <QDateTime>
#include <QList>

#include "../model/Decision.h"
#include "../model/Train.h"
#include "PrecedenceOrder.h"
#include "StageResult.h"

namespace RailPrecedence::Engine {

class DecisionExtractor {
public:
    static constexpr int WAIT_MINUTES_PER_RANK = 5;

    static constexpr double SOLVED_PROCEED_CONFIDENCE = 0.9;
    static constexpr double SOLVED_WAIT_CONFIDENCE = 0.8;
    static constexpr double HEURISTIC_PROCEED_CONFIDENCE = 0.6;
    static constexpr double HEURISTIC_WAIT_CONFIDENCE = 0.5;

    // One decision per eligible train, in rank order. referenceTime anchors
    // the estimated times (the snapshot timestamp).
    StageResult<QList<Model::Decision>> extract(const QList<Model::Train>& trains,
                                                const PrecedenceOrder& order,
                                                const QDateTime& referenceTime) const;

    static QString proceedReason(PrecedencePath path);
    static QString waitReason(int rank);

private:
    Model::Decision makeProceed(const Model::Train& train, PrecedencePath path, const QDateTime& referenceTime) const;
    Model::Decision makeWait(const Model::Train& train, int rank, PrecedencePath path, const QDateTime& referenceTime) const;
};

} // namespace RailPrecedence::Engine
