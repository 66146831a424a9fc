#include "RailwayOptimizer.h"
#include "CpSatPrecedenceSolver.h"

#include <QDateTime>
#include <QDeadlineTimer>
#include <QDebug>
#include <QElapsedTimer>

namespace RailPrecedence::Engine {

RailwayOptimizer::RailwayOptimizer(const OptimizerConfig& config, QObject* parent)
    : RailwayOptimizer(config, nullptr, parent)
{
}

RailwayOptimizer::RailwayOptimizer(const OptimizerConfig& config,
                                   std::unique_ptr<PrecedenceSolver> solver,
                                   QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_solver(std::move(solver))
{
    if (!m_solver) {
        m_solver = std::make_unique<CpSatPrecedenceSolver>(m_config.verboseLogging);
    }
}

RailwayOptimizer::~RailwayOptimizer() = default;

QString RailwayOptimizer::solverName() const {
    return m_solver ? m_solver->name() : QString();
}

QString RailwayOptimizer::phaseToString(Phase phase) {
    switch (phase) {
        case Phase::IDLE:               return "IDLE";
        case Phase::FILTERING:          return "FILTERING";
        case Phase::SOLVING_CONSTRAINT: return "SOLVING_CONSTRAINT";
        case Phase::SOLVING_HEURISTIC:  return "SOLVING_HEURISTIC";
        case Phase::EXTRACTING:         return "EXTRACTING";
        case Phase::SCORING:            return "SCORING";
        case Phase::DONE:               return "DONE";
        case Phase::FALLBACK_DONE:      return "FALLBACK_DONE";
    }
    return "UNKNOWN";
}

QList<Model::Train> RailwayOptimizer::eligibleTrains(const Model::SystemState& state) {
    QList<Model::Train> eligible;
    for (const Model::Train& train : state.trains) {
        if (train.needsDecision()) {
            eligible.append(train);
        }
    }
    return eligible;
}

Model::OptimizationResult RailwayOptimizer::optimize(const Model::SystemState& state) {
    QElapsedTimer timer;
    timer.start();

    Phase phase = Phase::IDLE;

    // === FILTERING ===
    phase = Phase::FILTERING;
    auto eligible = runGuardedStage("filtering", [&]() {
        return filterEligibleTrains(state);
    });
    if (eligible.isFailure()) {
        return degradedResult(state, phase, eligible.error());
    }

    if (eligible.value().isEmpty()) {
        phase = Phase::DONE;
        if (m_config.verboseLogging) {
            qDebug() << "[RailwayOptimizer > optimize] No trains need a decision";
        }
        Model::OptimizationResult result = emptyResult();
        emit optimizationCompleted(result.confidenceScore, result.computationTime, 0);
        return result;
    }

    // === SOLVING ===
    phase = Phase::SOLVING_CONSTRAINT;
    auto order = runGuardedStage("solving", [&]() {
        return solvePrecedence(eligible.value(), state, phase);
    });
    if (order.isFailure()) {
        return degradedResult(state, phase, order.error());
    }

    // === EXTRACTING ===
    phase = Phase::EXTRACTING;
    const QDateTime referenceTime = state.timestamp.isValid() ? state.timestamp : QDateTime::currentDateTimeUtc();
    auto decisions = runGuardedStage("extracting", [&]() {
        return m_decisionExtractor.extract(eligible.value(), order.value(), referenceTime);
    });
    if (decisions.isFailure()) {
        return degradedResult(state, phase, decisions.error());
    }

    // === SCORING ===
    phase = Phase::SCORING;
    auto metrics = runGuardedStage("scoring", [&]() {
        return m_metricsCalculator.score(decisions.value(), state);
    });
    if (metrics.isFailure()) {
        return degradedResult(state, phase, metrics.error());
    }

    phase = Phase::DONE;

    Model::OptimizationResult result;
    result.decisions = decisions.value();
    result.totalDelayReduction = metrics.value().totalDelayReduction;
    result.throughputImprovement = metrics.value().throughputImprovement;
    result.confidenceScore = metrics.value().confidenceScore;
    result.computationTime = qMax(0.0, timer.nsecsElapsed() / 1.0e9);
    result.createdAt = QDateTime::currentDateTimeUtc();
    result.path = order.value().path == PrecedencePath::SOLVED
        ? Model::OptimizationPath::SOLVED
        : Model::OptimizationPath::HEURISTIC;

    if (m_config.verboseLogging) {
        qDebug() << "[RailwayOptimizer > optimize]" << phaseToString(phase)
                 << "path:" << Model::optimizationPathToString(result.path)
                 << "decisions:" << result.decisions.size()
                 << "proceed:" << result.proceedCount()
                 << "confidence:" << result.confidenceScore
                 << "time:" << result.computationTime << "s";
    }

    if (result.computationTime > m_config.performanceWarningSeconds) {
        qWarning() << "[RailwayOptimizer > optimize] Slow optimization:" << result.computationTime
                   << "s (threshold:" << m_config.performanceWarningSeconds << "s)";
        emit performanceWarning("computation_time", result.computationTime, m_config.performanceWarningSeconds);
    }

    emit optimizationCompleted(result.confidenceScore, result.computationTime, static_cast<int>(result.decisions.size()));
    return result;
}

StageResult<QList<Model::Train>> RailwayOptimizer::filterEligibleTrains(const Model::SystemState& state) const {
    return StageResult<QList<Model::Train>>::success(eligibleTrains(state));
}

StageResult<PrecedenceOrder> RailwayOptimizer::solvePrecedence(const QList<Model::Train>& trains,
                                                               const Model::SystemState& state,
                                                               Phase& phase) {
    auto model = PrecedenceModel::build(trains, state, m_conflictDetector);
    if (model.isFailure()) {
        return StageResult<PrecedenceOrder>::failure(model.error());
    }

    if (m_config.verboseLogging) {
        qDebug() << "[RailwayOptimizer > solvePrecedence] Model:" << model.value().summary();
    }
    for (const OversubscribedSection& group : model.value().oversubscribedSections()) {
        qDebug() << "[RailwayOptimizer > solvePrecedence] Section"
                 << group.sectionId.toString(QUuid::WithoutBraces)
                 << "holds" << group.trainIndices.size() << "trains on" << group.tracks << "tracks";
    }

    const QDeadlineTimer deadline(m_config.timeLimitMs());
    const PrecedenceSolution solution = m_solver->solve(model.value(), deadline);

    if (solution.hasAssignment()) {
        return PrecedenceOrder::fromSolution(solution);
    }

    phase = Phase::SOLVING_HEURISTIC;

    const QString reason = QString("%1 solver returned %2: %3")
                               .arg(m_solver->name(), solveStatusToString(solution.status), solution.detail);
    qWarning() << "[RailwayOptimizer > solvePrecedence] Optimization solver failed, using heuristic -" << reason;
    emit heuristicFallbackUsed(reason);

    return PrecedenceOrder::fromHeuristic(m_heuristicOrdering.order(trains));
}

Model::OptimizationResult RailwayOptimizer::emptyResult() const {
    Model::OptimizationResult result;
    result.totalDelayReduction = 0;
    result.throughputImprovement = 0.0;
    result.confidenceScore = 1.0;
    result.computationTime = 0.0;
    result.createdAt = QDateTime::currentDateTimeUtc();
    result.path = Model::OptimizationPath::EMPTY;
    return result;
}

Model::OptimizationResult RailwayOptimizer::degradedResult(const Model::SystemState& state,
                                                           Phase failedPhase,
                                                           const StageFailure& failure) {
    qCritical() << "[RailwayOptimizer > optimize] Optimization failed during" << phaseToString(failedPhase)
                << "-" << failure.describe();
    qCritical() << "[RailwayOptimizer > optimize] Falling back to proceed-with-caution decisions";

    Model::OptimizationResult result;
    for (const Model::Train& train : state.trains) {
        if (!train.isActive()) {
            continue;
        }
        Model::Decision decision = Model::Decision::create(
            train.id(), Model::DecisionAction::PROCEED, "Fallback: proceed with caution", FALLBACK_CONFIDENCE);
        decision.targetSectionId = train.currentSectionId();
        result.decisions.append(decision);
    }

    result.totalDelayReduction = 0;
    result.throughputImprovement = 0.0;
    result.confidenceScore = FALLBACK_CONFIDENCE;
    result.computationTime = 0.0;
    result.createdAt = QDateTime::currentDateTimeUtc();
    result.path = Model::OptimizationPath::DEGRADED;

    emit degradedFallbackUsed(phaseToString(failedPhase), failure.describe());
    return result;
}

} // namespace RailPrecedence::Engine
