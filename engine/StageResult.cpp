#include "StageResult.h"

namespace RailPrecedence::Engine {

QString stageFailureKindToString(StageFailureKind kind) {
    switch (kind) {
        case StageFailureKind::INVALID_INPUT:        return "INVALID_INPUT";
        case StageFailureKind::MODEL_CONSTRUCTION:   return "MODEL_CONSTRUCTION";
        case StageFailureKind::INCONSISTENT_ORDER:   return "INCONSISTENT_ORDER";
        case StageFailureKind::UNEXPECTED_EXCEPTION: return "UNEXPECTED_EXCEPTION";
    }
    return "UNKNOWN";
}

QString StageFailure::describe() const {
    return QString("%1 in %2: %3").arg(stageFailureKindToString(kind), stage, message);
}

} // namespace RailPrecedence::Engine
