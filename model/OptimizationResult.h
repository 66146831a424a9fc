#pragma once

#include <QDateTime>
#include <QList>
#include <QString>

#include "Decision.h"

namespace RailPrecedence::Model {

// Which branch of the optimizer produced a result
enum class OptimizationPath {
    EMPTY,          // Nothing eligible, trivial result
    SOLVED,         // Precedence model solved within budget
    HEURISTIC,      // Solver gave no assignment, priority/delay sort used
    DEGRADED        // Internal failure, proceed-with-caution for every active train
};

QString optimizationPathToString(OptimizationPath path);

struct OptimizationResult {
    QList<Decision> decisions;
    int totalDelayReduction = 0;        // minutes
    double throughputImprovement = 0.0; // percent
    double confidenceScore = 0.0;       // 0.0 to 1.0
    double computationTime = 0.0;       // seconds
    QDateTime createdAt;
    OptimizationPath path = OptimizationPath::EMPTY;

    int proceedCount() const;
    int waitCount() const;
    const Decision* decisionForTrain(const QUuid& trainId) const;
};

} // namespace RailPrecedence::Model
