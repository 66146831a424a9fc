#include "SystemState.h"

namespace RailPrecedence::Model {

const Train* SystemState::trainById(const QUuid& trainId) const {
    for (const Train& train : trains) {
        if (train.id() == trainId) {
            return &train;
        }
    }
    return nullptr;
}

const Section* SystemState::sectionById(const QUuid& sectionId) const {
    for (const Section& section : sections) {
        if (section.id == sectionId) {
            return &section;
        }
    }
    return nullptr;
}

const Station* SystemState::stationById(const QUuid& stationId) const {
    for (const Station& station : stations) {
        if (station.id == stationId) {
            return &station;
        }
    }
    return nullptr;
}

const Schedule* SystemState::scheduleForTrain(const QUuid& trainId) const {
    for (const Schedule& schedule : schedules) {
        if (schedule.trainId == trainId) {
            return &schedule;
        }
    }
    return nullptr;
}

} // namespace RailPrecedence::Model
