#pragma once

#include <QList>

#include "../model/Decision.h"
#include "../model/SystemState.h"
#include "StageResult.h"

namespace RailPrecedence::Engine {

struct OptimizationMetrics {
    int totalDelayReduction = 0;        // minutes
    double throughputImprovement = 0.0; // percent
    double confidenceScore = 1.0;       // 0.0 to 1.0
};

class MetricsCalculator {
public:
    static constexpr int MAX_REDUCTION_PER_TRAIN_MINUTES = 10;
    static constexpr double MAX_THROUGHPUT_IMPROVEMENT = 20.0;
    static constexpr double CONFIDENCE_SATURATION_TRAINS = 20.0;

    StageResult<OptimizationMetrics> score(const QList<Model::Decision>& decisions,
                                           const Model::SystemState& state) const;

    // Each proceeding, delayed train credits its delay, capped at 10 minutes.
    // A decision whose train is missing from the snapshot makes this fail.
    StageResult<int> calculateDelayReduction(const QList<Model::Decision>& decisions,
                                             const Model::SystemState& state) const;

    double calculateThroughputImprovement(const QList<Model::Decision>& decisions) const;

    // Mean decision confidence, damped for snapshots with fewer than 20 trains
    double calculateConfidence(const QList<Model::Decision>& decisions,
                               const Model::SystemState& state) const;
};

} // namespace RailPrecedence::Engine
