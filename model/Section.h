#pragma once

#include <QList>
#include <QString>
#include <QUuid>
#include <optional>

namespace RailPrecedence::Model {

class Train;

enum class SectionStatus {
    AVAILABLE,
    OCCUPIED,
    MAINTENANCE,
    BLOCKED
};

QString sectionStatusToString(SectionStatus status);
std::optional<SectionStatus> sectionStatusFromString(const QString& value);

struct Section {
    QUuid id;
    QUuid fromStationId;
    QUuid toStationId;
    double lengthKm = 0.0;
    int maxSpeedKmh = 0;
    int tracks = 1;                         // Capacity: trains that may occupy it at once
    SectionStatus status = SectionStatus::AVAILABLE;
    QList<QUuid> currentTrainIds;

    int occupantCount() const { return currentTrainIds.size(); }
    bool isOccupiedBy(const QUuid& trainId) const { return currentTrainIds.contains(trainId); }

    // Usable by one more train: open for traffic and below its track count
    bool isAvailable() const;
    bool canAccommodate(const Train& train) const;
};

} // namespace RailPrecedence::Model
