#include "Decision.h"

#include <QtGlobal>

namespace RailPrecedence::Model {

QString decisionActionToString(DecisionAction action) {
    switch (action) {
        case DecisionAction::PROCEED: return "proceed";
        case DecisionAction::WAIT:    return "wait";
        case DecisionAction::REROUTE: return "reroute";
        case DecisionAction::CROSS:   return "cross";
    }
    return "wait";
}

std::optional<DecisionAction> decisionActionFromString(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    if (normalized == "proceed") return DecisionAction::PROCEED;
    if (normalized == "wait")    return DecisionAction::WAIT;
    if (normalized == "reroute") return DecisionAction::REROUTE;
    if (normalized == "cross")   return DecisionAction::CROSS;
    return std::nullopt;
}

Decision Decision::create(const QUuid& trainId,
                          DecisionAction action,
                          const QString& reason,
                          double confidence) {
    Decision decision;
    decision.id = QUuid::createUuid();
    decision.trainId = trainId;
    decision.action = action;
    decision.reason = reason;
    decision.confidence = qBound(0.0, confidence, 1.0);
    decision.createdAt = QDateTime::currentDateTimeUtc();
    return decision;
}

} // namespace RailPrecedence::Model
