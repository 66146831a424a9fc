#include "PrecedenceModel.h"

#include <QDebug>
#include <QHash>
#include <QSet>

namespace RailPrecedence::Engine {

StageResult<PrecedenceModel> PrecedenceModel::build(const QList<Model::Train>& trains,
                                                    const Model::SystemState& state,
                                                    const ConflictDetector& detector) {
    const QString stage = "model construction";

    QSet<QUuid> seen;
    for (const Model::Train& train : trains) {
        if (train.id().isNull()) {
            return StageResult<PrecedenceModel>::failure(
                StageFailureKind::MODEL_CONSTRUCTION, stage,
                QString("Train %1 has no identity").arg(train.number()));
        }
        if (seen.contains(train.id())) {
            return StageResult<PrecedenceModel>::failure(
                StageFailureKind::MODEL_CONSTRUCTION, stage,
                QString("Duplicate train identity %1").arg(train.id().toString(QUuid::WithoutBraces)));
        }
        if (!train.currentSectionId()) {
            return StageResult<PrecedenceModel>::failure(
                StageFailureKind::INVALID_INPUT, stage,
                QString("Train %1 has no current section").arg(train.number()));
        }
        seen.insert(train.id());
    }

    PrecedenceModel model;
    model.m_trains = trains;
    model.m_exclusive = QVector<bool>(model.variableCount(), false);
    model.m_forced = QVector<bool>(model.variableCount(), false);

    model.addExclusivityConstraints(detector);
    model.addPriorityConstraints();
    model.recordCapacityGroups(state);
    model.computeObjective();

    return StageResult<PrecedenceModel>::success(model);
}

void PrecedenceModel::addExclusivityConstraints(const ConflictDetector& detector) {
    const int n = trainCount();
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            if (detector.competesForResource(m_trains.at(i), m_trains.at(j))) {
                m_exclusive[variableIndex(i, j)] = true;
                m_exclusive[variableIndex(j, i)] = true;
                m_conflictPairs.append(qMakePair(i, j));
            }
        }
    }
}

void PrecedenceModel::addPriorityConstraints() {
    const int n = trainCount();
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }
            const Model::Train& higher = m_trains.at(i);
            const Model::Train& lower = m_trains.at(j);

            // A much later lower-priority train releases the higher-priority one
            // from going first; the search may then order them either way.
            if (higher.priority() > lower.priority()
                && lower.delayMinutes() - higher.delayMinutes() < PRIORITY_OVERRIDE_DELAY_MINUTES) {
                m_forced[variableIndex(i, j)] = true;
                m_forcedCount++;
            }
        }
    }
}

void PrecedenceModel::recordCapacityGroups(const Model::SystemState& state) {
    QHash<QUuid, QList<int>> groups;
    QList<QUuid> groupOrder;

    for (int i = 0; i < trainCount(); ++i) {
        const QUuid sectionId = *m_trains.at(i).currentSectionId();
        if (!groups.contains(sectionId)) {
            groupOrder.append(sectionId);
        }
        groups[sectionId].append(i);
    }

    // More trains than tracks: some of them must wait. The exclusivity and
    // priority constraints already serialize every same-section pair, so no
    // capacity inequality is added here.
    for (const QUuid& sectionId : groupOrder) {
        const Model::Section* section = state.sectionById(sectionId);
        const QList<int>& members = groups.value(sectionId);
        if (section && members.size() > section->tracks) {
            m_oversubscribed.append(OversubscribedSection{sectionId, section->tracks, members});
        }
    }
}

void PrecedenceModel::computeObjective() {
    m_objectiveValue = 0;
    for (int i = 0; i < trainCount(); ++i) {
        m_objectiveValue += objectiveWeight(i) * m_trains.at(i).delayMinutes();
    }
}

qint64 PrecedenceModel::objectiveWeight(int index) const {
    return static_cast<qint64>(m_trains.at(index).priority()) * PRIORITY_WEIGHT;
}

bool PrecedenceModel::objectiveWithinBounds() const {
    return m_objectiveValue >= OBJECTIVE_LOWER_BOUND && m_objectiveValue <= OBJECTIVE_UPPER_BOUND;
}

QString PrecedenceModel::summary() const {
    return QString("%1 trains, %2 variables, %3 conflicting pairs, %4 priority-forced, "
                   "%5 oversubscribed sections, weighted delay %6")
        .arg(trainCount())
        .arg(variableCount() - trainCount())
        .arg(m_conflictPairs.size())
        .arg(m_forcedCount)
        .arg(m_oversubscribed.size())
        .arg(m_objectiveValue);
}

} // namespace RailPrecedence::Engine
