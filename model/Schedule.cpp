#include "Schedule.h"

namespace RailPrecedence::Model {

std::optional<QUuid> Schedule::nextStation(const QUuid& currentStationId) const {
    const qsizetype index = stationIds.indexOf(currentStationId);
    if (index < 0 || index >= stationIds.size() - 1) {
        return std::nullopt;
    }
    return stationIds.at(index + 1);
}

std::optional<QUuid> Schedule::sectionToNextStation(const QUuid& currentStationId,
                                                    const QList<Section>& sections) const {
    const auto next = nextStation(currentStationId);
    if (!next) {
        return std::nullopt;
    }

    for (const QUuid& sectionId : sectionSequence) {
        for (const Section& section : sections) {
            if (section.id == sectionId
                && section.fromStationId == currentStationId
                && section.toStationId == *next) {
                return section.id;
            }
        }
    }
    return std::nullopt;
}

} // namespace RailPrecedence::Model
