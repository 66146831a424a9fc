#include "MetricsCalculator.h"

#include <QtGlobal>

namespace RailPrecedence::Engine {

StageResult<OptimizationMetrics> MetricsCalculator::score(const QList<Model::Decision>& decisions,
                                                          const Model::SystemState& state) const {
    const auto delayReduction = calculateDelayReduction(decisions, state);
    if (delayReduction.isFailure()) {
        return StageResult<OptimizationMetrics>::failure(delayReduction.error());
    }

    OptimizationMetrics metrics;
    metrics.totalDelayReduction = delayReduction.value();
    metrics.throughputImprovement = calculateThroughputImprovement(decisions);
    metrics.confidenceScore = calculateConfidence(decisions, state);
    return StageResult<OptimizationMetrics>::success(metrics);
}

StageResult<int> MetricsCalculator::calculateDelayReduction(const QList<Model::Decision>& decisions,
                                                            const Model::SystemState& state) const {
    int totalReduction = 0;

    for (const Model::Decision& decision : decisions) {
        if (!decision.isProceed()) {
            continue;
        }

        const Model::Train* train = state.trainById(decision.trainId);
        if (!train) {
            return StageResult<int>::failure(
                StageFailureKind::INVALID_INPUT, "scoring",
                QString("Decision %1 references train %2 missing from the snapshot")
                    .arg(decision.id.toString(QUuid::WithoutBraces),
                         decision.trainId.toString(QUuid::WithoutBraces)));
        }

        if (train->isDelayed()) {
            totalReduction += qMin(train->delayMinutes(), MAX_REDUCTION_PER_TRAIN_MINUTES);
        }
    }

    return StageResult<int>::success(totalReduction);
}

double MetricsCalculator::calculateThroughputImprovement(const QList<Model::Decision>& decisions) const {
    if (decisions.isEmpty()) {
        return 0.0;
    }

    int proceedCount = 0;
    for (const Model::Decision& decision : decisions) {
        if (decision.isProceed()) {
            proceedCount++;
        }
    }

    return (static_cast<double>(proceedCount) / decisions.size()) * MAX_THROUGHPUT_IMPROVEMENT;
}

double MetricsCalculator::calculateConfidence(const QList<Model::Decision>& decisions,
                                              const Model::SystemState& state) const {
    if (decisions.isEmpty()) {
        return 1.0;
    }

    double confidenceSum = 0.0;
    for (const Model::Decision& decision : decisions) {
        confidenceSum += decision.confidence;
    }
    const double averageConfidence = confidenceSum / decisions.size();

    const double complexityFactor = qMin(1.0, state.trains.size() / CONFIDENCE_SATURATION_TRAINS);

    return qBound(0.0, averageConfidence * complexityFactor, 1.0);
}

} // namespace RailPrecedence::Engine
