#include "Train.h"

namespace RailPrecedence::Model {

QString trainTypeToString(TrainType type) {
    switch (type) {
        case TrainType::SPECIAL:   return "special";
        case TrainType::EXPRESS:   return "express";
        case TrainType::PASSENGER: return "passenger";
        case TrainType::FREIGHT:   return "freight";
    }
    return "unknown";
}

std::optional<TrainType> trainTypeFromString(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    if (normalized == "special")   return TrainType::SPECIAL;
    if (normalized == "express")   return TrainType::EXPRESS;
    if (normalized == "passenger") return TrainType::PASSENGER;
    if (normalized == "freight")   return TrainType::FREIGHT;
    return std::nullopt;
}

QString trainStatusToString(TrainStatus status) {
    switch (status) {
        case TrainStatus::ON_TIME:   return "on_time";
        case TrainStatus::DELAYED:   return "delayed";
        case TrainStatus::CANCELLED: return "cancelled";
        case TrainStatus::RUNNING:   return "running";
        case TrainStatus::STOPPED:   return "stopped";
    }
    return "unknown";
}

std::optional<TrainStatus> trainStatusFromString(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    if (normalized == "on_time")   return TrainStatus::ON_TIME;
    if (normalized == "delayed")   return TrainStatus::DELAYED;
    if (normalized == "cancelled") return TrainStatus::CANCELLED;
    if (normalized == "running")   return TrainStatus::RUNNING;
    if (normalized == "stopped")   return TrainStatus::STOPPED;
    return std::nullopt;
}

Train::Train(const Attributes& attributes)
    : m_attributes(attributes)
    , m_priority(priorityForType(attributes.type))
{
}

Train Train::create(const Attributes& attributes) {
    Attributes normalized = attributes;
    if (normalized.id.isNull()) {
        normalized.id = QUuid::createUuid();
    }
    return Train(normalized);
}

int Train::priorityForType(TrainType type) {
    switch (type) {
        case TrainType::SPECIAL:   return 4;
        case TrainType::EXPRESS:   return 3;
        case TrainType::PASSENGER: return 2;
        case TrainType::FREIGHT:   return 1;
    }
    return 1;
}

bool Train::isActive() const {
    return m_attributes.status == TrainStatus::RUNNING
        || m_attributes.status == TrainStatus::DELAYED;
}

bool Train::needsDecision() const {
    return isActive() && m_attributes.currentSectionId.has_value();
}

QDateTime Train::estimatedArrival() const {
    if (!m_attributes.scheduledArrival.isValid()) {
        return QDateTime();
    }
    return m_attributes.scheduledArrival.addSecs(static_cast<qint64>(m_attributes.delayMinutes) * 60);
}

int Train::calculateDelay(const QDateTime& currentTime) const {
    Q_UNUSED(currentTime)

    if (!m_attributes.scheduledDeparture.isValid() || !m_attributes.actualDeparture.isValid()) {
        return 0;
    }

    const qint64 lateSeconds = m_attributes.scheduledDeparture.secsTo(m_attributes.actualDeparture);
    return lateSeconds > 0 ? static_cast<int>(lateSeconds / 60) : 0;
}

} // namespace RailPrecedence::Model
