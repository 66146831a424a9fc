#pragma once

#include <QDateTime>
#include <QList>
#include <QUuid>
#include <optional>

#include "Section.h"

namespace RailPrecedence::Model {

struct Schedule {
    QUuid id;
    QUuid trainId;
    QList<QUuid> stationIds;            // Calling order
    QList<QDateTime> arrivalTimes;      // Parallel to stationIds
    QList<QDateTime> departureTimes;    // Parallel to stationIds
    QList<QUuid> sectionSequence;

    std::optional<QUuid> nextStation(const QUuid& currentStationId) const;
    std::optional<QUuid> sectionToNextStation(const QUuid& currentStationId,
                                              const QList<Section>& sections) const;
};

} // namespace RailPrecedence::Model
