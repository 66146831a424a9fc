#include "CpSatPrecedenceSolver.h"
#include "HeuristicOrdering.h"

#include <QDebug>
#include <QElapsedTimer>

#include <algorithm>
#include <vector>

#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"
#include "ortools/util/sorted_interval_list.h"

namespace RailPrecedence::Engine {

namespace sat = operations_research::sat;

CpSatPrecedenceSolver::CpSatPrecedenceSolver(bool verboseLogging)
    : m_verboseLogging(verboseLogging)
{
}

bool CpSatPrecedenceSolver::prefersFirst(const Model::Train& a, const Model::Train& b) {
    const qint64 weightedA = static_cast<qint64>(a.priority()) * PrecedenceModel::PRIORITY_WEIGHT * a.delayMinutes();
    const qint64 weightedB = static_cast<qint64>(b.priority()) * PrecedenceModel::PRIORITY_WEIGHT * b.delayMinutes();
    if (weightedA != weightedB) {
        return weightedA > weightedB;
    }
    return HeuristicOrdering::ranksAhead(a, b);
}

PrecedenceSolution CpSatPrecedenceSolver::solve(const PrecedenceModel& model, const QDeadlineTimer& deadline) {
    QElapsedTimer timer;
    timer.start();

    PrecedenceSolution solution;
    solution.trainCount = model.trainCount();
    solution.objectiveValue = model.objectiveValue();

    if (deadline.hasExpired()) {
        solution.status = SolveStatus::TIMEOUT;
        solution.detail = "Time budget exhausted before solving";
        return solution;
    }

    const int n = model.trainCount();
    sat::CpModelBuilder cpModel;

    std::vector<sat::BoolVar> before(static_cast<size_t>(model.variableCount()));
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }
            const int var = model.variableIndex(i, j);
            before[var] = cpModel.NewBoolVar().WithName(QString("before_%1_%2").arg(i).arg(j).toStdString());

            if (model.isForced(i, j)) {
                cpModel.AddEquality(before[var], 1);
            } else if (!model.isExclusive(i, j)) {
                cpModel.AddEquality(before[var], 0);
            }
        }
    }

    // Exactly one of before(i,j), before(j,i) for a conflicting pair
    for (const auto& pair : model.conflictPairs()) {
        cpModel.AddExactlyOne({before[model.variableIndex(pair.first, pair.second)],
                               before[model.variableIndex(pair.second, pair.first)]});
    }

    // before(a,b) and before(b,c) imply before(a,c) inside a section
    int transitivityClauses = 0;
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            if (!model.isExclusive(i, j)) {
                continue;
            }
            for (int k = j + 1; k < n; ++k) {
                if (!model.isExclusive(i, k)) {
                    continue;
                }
                const int triple[3] = {i, j, k};
                for (int a : triple) {
                    for (int b : triple) {
                        for (int c : triple) {
                            if (a == b || b == c || a == c) {
                                continue;
                            }
                            cpModel.AddBoolOr({before[model.variableIndex(a, b)].Not(),
                                               before[model.variableIndex(b, c)].Not(),
                                               before[model.variableIndex(a, c)]});
                            transitivityClauses++;
                        }
                    }
                }
            }
        }
    }

    const sat::IntVar totalWeightedDelay = cpModel.NewIntVar(
        operations_research::Domain(PrecedenceModel::OBJECTIVE_LOWER_BOUND,
                                    PrecedenceModel::OBJECTIVE_UPPER_BOUND))
        .WithName("total_weighted_delay");
    cpModel.AddEquality(totalWeightedDelay, model.objectiveValue());

    // Weighted delay dominates; each free pair against its preferred orientation costs one
    const qint64 pairCount = model.conflictPairs().size();
    sat::LinearExpr objective = sat::LinearExpr::Term(totalWeightedDelay, pairCount + 1);
    for (const auto& pair : model.conflictPairs()) {
        int first = pair.first;
        int second = pair.second;
        if (!prefersFirst(model.train(first), model.train(second))) {
            std::swap(first, second);
        }
        objective += before[model.variableIndex(second, first)];
        if (!model.isForced(second, first)) {
            cpModel.AddHint(before[model.variableIndex(first, second)], true);
        }
    }
    cpModel.Minimize(objective);

    sat::SatParameters parameters;
    const qint64 remainingMs = deadline.remainingTime();
    if (remainingMs >= 0) {
        parameters.set_max_time_in_seconds(remainingMs / 1000.0);
    }
    parameters.set_num_workers(m_workerCount);
    parameters.set_log_search_progress(m_verboseLogging);

    sat::Model satModel;
    satModel.Add(sat::NewSatParameters(parameters));
    const sat::CpSolverResponse response = sat::SolveCpModel(cpModel.Build(), &satModel);

    solution.nodesExplored = static_cast<int>(response.num_branches());
    solution.timeMs = timer.nsecsElapsed() / 1.0e6;

    switch (response.status()) {
        case sat::CpSolverStatus::OPTIMAL:
            solution.status = SolveStatus::OPTIMAL;
            break;
        case sat::CpSolverStatus::FEASIBLE:
            solution.status = SolveStatus::FEASIBLE;
            break;
        case sat::CpSolverStatus::INFEASIBLE:
        case sat::CpSolverStatus::MODEL_INVALID:
            solution.status = SolveStatus::INFEASIBLE;
            break;
        default:
            solution.status = SolveStatus::TIMEOUT;
            break;
    }

    if (!solution.hasAssignment()) {
        if (!model.objectiveWithinBounds()) {
            solution.detail = QString("Weighted delay %1 outside objective domain [%2, %3]")
                                  .arg(model.objectiveValue())
                                  .arg(PrecedenceModel::OBJECTIVE_LOWER_BOUND)
                                  .arg(PrecedenceModel::OBJECTIVE_UPPER_BOUND);
        } else if (response.status() == sat::CpSolverStatus::MODEL_INVALID) {
            solution.detail = "CP-SAT rejected the model";
        } else if (solution.status == SolveStatus::TIMEOUT) {
            solution.detail = QString("Time budget exhausted after %1 branches").arg(solution.nodesExplored);
        } else {
            solution.detail = "Priority constraints contradict section exclusivity";
        }
        return solution;
    }

    solution.before = QVector<bool>(n * n, false);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i != j) {
                const int var = model.variableIndex(i, j);
                solution.before[var] = sat::SolutionBooleanValue(response, before[var]);
            }
        }
    }

    const qint64 reversedPairs = static_cast<qint64>(response.objective_value()) - model.objectiveValue() * (pairCount + 1);
    solution.detail = QString("%1 free pairs against preference, %2 branches")
                          .arg(reversedPairs)
                          .arg(solution.nodesExplored);

    if (m_verboseLogging) {
        qDebug() << "[CpSatPrecedenceSolver > solve]" << solveStatusToString(solution.status)
                 << "pairs:" << pairCount
                 << "transitivity clauses:" << transitivityClauses
                 << "branches:" << solution.nodesExplored
                 << "time:" << solution.timeMs << "ms";
    }

    return solution;
}

} // namespace RailPrecedence::Engine
