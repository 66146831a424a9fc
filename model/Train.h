#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

namespace RailPrecedence::Model {

enum class TrainType {
    SPECIAL,
    EXPRESS,
    PASSENGER,
    FREIGHT
};

enum class TrainStatus {
    ON_TIME,
    DELAYED,
    CANCELLED,
    RUNNING,
    STOPPED
};

QString trainTypeToString(TrainType type);
std::optional<TrainType> trainTypeFromString(const QString& value);
QString trainStatusToString(TrainStatus status);
std::optional<TrainStatus> trainStatusFromString(const QString& value);

class Train {
public:
    // Everything a caller supplies about a train. Priority is not part of it:
    // it is always derived from the train type by create().
    struct Attributes {
        QUuid id;
        QString number;
        QString name;
        TrainType type = TrainType::PASSENGER;
        int maxSpeed = 0;                       // km/h
        int length = 0;                         // metres
        std::optional<QUuid> currentSectionId;
        std::optional<QUuid> currentStationId;
        TrainStatus status = TrainStatus::ON_TIME;
        int delayMinutes = 0;
        QDateTime scheduledDeparture;
        QDateTime actualDeparture;
        QDateTime scheduledArrival;
        QDateTime actualArrival;
    };

    static Train create(const Attributes& attributes);
    static int priorityForType(TrainType type);

    const QUuid& id() const { return m_attributes.id; }
    const QString& number() const { return m_attributes.number; }
    const QString& name() const { return m_attributes.name; }
    TrainType type() const { return m_attributes.type; }
    int maxSpeed() const { return m_attributes.maxSpeed; }
    int length() const { return m_attributes.length; }
    const std::optional<QUuid>& currentSectionId() const { return m_attributes.currentSectionId; }
    const std::optional<QUuid>& currentStationId() const { return m_attributes.currentStationId; }
    TrainStatus status() const { return m_attributes.status; }
    int delayMinutes() const { return m_attributes.delayMinutes; }
    int priority() const { return m_priority; }

    const QDateTime& scheduledDeparture() const { return m_attributes.scheduledDeparture; }
    const QDateTime& actualDeparture() const { return m_attributes.actualDeparture; }
    const QDateTime& scheduledArrival() const { return m_attributes.scheduledArrival; }
    const QDateTime& actualArrival() const { return m_attributes.actualArrival; }

    const Attributes& attributes() const { return m_attributes; }

    bool isDelayed() const { return m_attributes.delayMinutes > 0; }
    bool isActive() const;
    bool needsDecision() const;

    // Scheduled arrival shifted by the current delay; invalid when no arrival is scheduled
    QDateTime estimatedArrival() const;

    // Departure delay in whole minutes, never negative
    int calculateDelay(const QDateTime& currentTime) const;

private:
    explicit Train(const Attributes& attributes);

    Attributes m_attributes;
    int m_priority = 1;
};

} // namespace RailPrecedence::Model
