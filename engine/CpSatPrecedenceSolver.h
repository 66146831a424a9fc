#pragma once

#include "PrecedenceSolver.h"

namespace RailPrecedence::Engine {

/**
 * Solves the precedence model with the OR-Tools CP-SAT solver.
 *
 * One Boolean per ordered pair holds before(i,j). Conflicting pairs are
 * exclusive, priority-forced pairs are fixed to true and every other pair
 * is fixed to false. Same-section triples carry transitivity clauses, so the
 * order on a section is always a chain and exactly one of its trains has no
 * predecessor there.
 *
 * The weighted delay is bound to an integer variable on [0, 10000]; a value
 * outside that domain makes the model INFEASIBLE. It is constant over all
 * orderings, so the objective adds a secondary term counting free pairs not
 * in their preferred orientation (see prefersFirst). OPTIMAL means that term
 * is proven minimal, FEASIBLE that the time limit hit first.
 */
class CpSatPrecedenceSolver : public PrecedenceSolver {
public:
    explicit CpSatPrecedenceSolver(bool verboseLogging = false);

    PrecedenceSolution solve(const PrecedenceModel& model, const QDeadlineTimer& deadline) override;
    QString name() const override { return "cp-sat"; }

    void setWorkerCount(int workers) { m_workerCount = workers; }
    int workerCount() const { return m_workerCount; }

    // True when train a should go before train b on a free conflicting pair
    static bool prefersFirst(const Model::Train& a, const Model::Train& b);

private:
    bool m_verboseLogging = false;
    int m_workerCount = DEFAULT_WORKER_COUNT;

    // A single worker keeps the search deterministic
    static constexpr int DEFAULT_WORKER_COUNT = 1;
};

} // namespace RailPrecedence::Engine
