#pragma once

#include <QDeadlineTimer>
#include <QString>
#include <QVector>

#include "PrecedenceModel.h"

namespace RailPrecedence::Engine {

enum class SolveStatus {
    OPTIMAL,        // Assignment found and proven optimal
    FEASIBLE,       // Assignment found, optimality not proven before the deadline
    INFEASIBLE,     // Proven that no assignment satisfies the model
    TIMEOUT         // Deadline reached before any assignment was found
};

QString solveStatusToString(SolveStatus status);

struct PrecedenceSolution {
    SolveStatus status = SolveStatus::TIMEOUT;
    int trainCount = 0;
    QVector<bool> before;               // Row-major, before[i * trainCount + j]
    qint64 objectiveValue = 0;
    int nodesExplored = 0;
    double timeMs = 0.0;
    QString detail;

    bool hasAssignment() const {
        return status == SolveStatus::OPTIMAL || status == SolveStatus::FEASIBLE;
    }

    bool isBefore(int i, int j) const { return before.at(i * trainCount + j); }
};

// Strategy that searches the precedence model for an assignment of the
// before(i,j) variables. Implementations must return once the deadline has
// expired, with or without an assignment.
class PrecedenceSolver {
public:
    virtual ~PrecedenceSolver() = default;

    virtual PrecedenceSolution solve(const PrecedenceModel& model, const QDeadlineTimer& deadline) = 0;
    virtual QString name() const = 0;
};

} // namespace RailPrecedence::Engine
