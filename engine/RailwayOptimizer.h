#pragma once

#include <QObject>
#include <QList>
#include <QString>
#include <memory>

#include "../model/OptimizationResult.h"
#include "../model/SystemState.h"
#include "ConflictDetector.h"
#include "DecisionExtractor.h"
#include "HeuristicOrdering.h"
#include "MetricsCalculator.h"
#include "OptimizerConfig.h"
#include "PrecedenceModel.h"
#include "PrecedenceOrder.h"
#include "PrecedenceSolver.h"
#include "StageResult.h"

namespace RailPrecedence::Engine {

/**
 * Single entry point of the precedence engine.
 *
 *   IDLE -> FILTERING -> SOLVING_CONSTRAINT | SOLVING_HEURISTIC
 *        -> EXTRACTING -> SCORING -> DONE
 *
 * Any stage failure moves to FALLBACK_DONE, which still produces a result.
 * optimize() never throws; the only state kept between calls is the
 * configuration and the solver strategy.
 */
class RailwayOptimizer : public QObject {
    Q_OBJECT
    Q_PROPERTY(double timeLimitSeconds READ timeLimitSeconds CONSTANT)
    Q_PROPERTY(QString solverName READ solverName CONSTANT)

public:
    enum class Phase {
        IDLE,
        FILTERING,
        SOLVING_CONSTRAINT,
        SOLVING_HEURISTIC,
        EXTRACTING,
        SCORING,
        DONE,
        FALLBACK_DONE
    };
    Q_ENUM(Phase)

    static constexpr double FALLBACK_CONFIDENCE = 0.3;

    explicit RailwayOptimizer(const OptimizerConfig& config = OptimizerConfig(), QObject* parent = nullptr);
    RailwayOptimizer(const OptimizerConfig& config, std::unique_ptr<PrecedenceSolver> solver, QObject* parent = nullptr);
    ~RailwayOptimizer() override;

    Model::OptimizationResult optimize(const Model::SystemState& state);

    const OptimizerConfig& config() const { return m_config; }
    double timeLimitSeconds() const { return m_config.timeLimitSeconds; }
    QString solverName() const;

    // Running or delayed trains with a current section
    static QList<Model::Train> eligibleTrains(const Model::SystemState& state);
    static QString phaseToString(Phase phase);

signals:
    void optimizationCompleted(double confidenceScore, double computationTimeSeconds, int decisionCount);
    void heuristicFallbackUsed(const QString& reason);
    void degradedFallbackUsed(const QString& phase, const QString& error);
    void performanceWarning(const QString& metric, double value, double threshold);

private:
    StageResult<QList<Model::Train>> filterEligibleTrains(const Model::SystemState& state) const;
    StageResult<PrecedenceOrder> solvePrecedence(const QList<Model::Train>& trains,
                                                 const Model::SystemState& state,
                                                 Phase& phase);

    Model::OptimizationResult emptyResult() const;
    Model::OptimizationResult degradedResult(const Model::SystemState& state,
                                             Phase failedPhase,
                                             const StageFailure& failure);

private:
    OptimizerConfig m_config;
    std::unique_ptr<PrecedenceSolver> m_solver;

    ConflictDetector m_conflictDetector;
    HeuristicOrdering m_heuristicOrdering;
    DecisionExtractor m_decisionExtractor;
    MetricsCalculator m_metricsCalculator;
};

} // namespace RailPrecedence::Engine
