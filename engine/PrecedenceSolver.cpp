#include "PrecedenceSolver.h"

namespace RailPrecedence::Engine {

QString solveStatusToString(SolveStatus status) {
    switch (status) {
        case SolveStatus::OPTIMAL:    return "OPTIMAL";
        case SolveStatus::FEASIBLE:   return "FEASIBLE";
        case SolveStatus::INFEASIBLE: return "INFEASIBLE";
        case SolveStatus::TIMEOUT:    return "TIMEOUT";
    }
    return "UNKNOWN";
}

} // namespace RailPrecedence::Engine
