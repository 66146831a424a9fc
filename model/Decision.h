#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

namespace RailPrecedence::Model {

// REROUTE and CROSS are reserved; the engine only emits PROCEED and WAIT
enum class DecisionAction {
    PROCEED,
    WAIT,
    REROUTE,
    CROSS
};

QString decisionActionToString(DecisionAction action);
std::optional<DecisionAction> decisionActionFromString(const QString& value);

struct Decision {
    QUuid id;
    QUuid trainId;
    DecisionAction action = DecisionAction::WAIT;
    std::optional<QUuid> targetSectionId;
    std::optional<QUuid> targetStationId;
    QDateTime estimatedTime;
    int estimatedWaitMinutes = 0;
    QString reason;
    double confidence = 0.0;            // 0.0 to 1.0
    bool applied = false;               // Owned by whoever applies the decision
    QDateTime createdAt;

    static Decision create(const QUuid& trainId,
                           DecisionAction action,
                           const QString& reason,
                           double confidence);

    bool isProceed() const { return action == DecisionAction::PROCEED; }
    bool isWait() const { return action == DecisionAction::WAIT; }
};

} // namespace RailPrecedence::Model
