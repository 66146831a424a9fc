#pragma once

#include <QDateTime>
#include <QList>
#include <QUuid>

#include "Decision.h"
#include "Schedule.h"
#include "Section.h"
#include "Station.h"
#include "Train.h"

namespace RailPrecedence::Model {

// One snapshot of the network. Built by the caller for every optimization
// call and only read by the engine.
struct SystemState {
    QDateTime timestamp;
    QList<Train> trains;
    QList<Section> sections;
    QList<Station> stations;
    QList<Decision> activeDecisions;
    QList<Schedule> schedules;

    // Lookups are linear scans; a null pointer means "not in this snapshot"
    const Train* trainById(const QUuid& trainId) const;
    const Section* sectionById(const QUuid& sectionId) const;
    const Station* stationById(const QUuid& stationId) const;
    const Schedule* scheduleForTrain(const QUuid& trainId) const;
};

} // namespace RailPrecedence::Model
