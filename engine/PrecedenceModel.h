#pragma once

#include <QList>
#include <QPair>
#include <QString>
#include <QUuid>
#include <QVector>

#include "../model/SystemState.h"
#include "../model/Train.h"
#include "ConflictDetector.h"
#include "StageResult.h"

namespace RailPrecedence::Engine {

// A section holding more eligible trains than it has tracks. Reported for
// diagnostics only: no capacity constraint is added for it.
struct OversubscribedSection {
    QUuid sectionId;
    int tracks = 0;
    QList<int> trainIndices;
};

/**
 * Pairwise ordering problem over the eligible trains.
 *
 * One boolean before(i,j) per ordered pair i != j: "train i goes strictly
 * before train j".
 *
 *   Exclusivity:  before(i,j) + before(j,i) == 1      for conflicting pairs
 *   Priority:     before(i,j) == 1                    if prio(i) > prio(j) and
 *                                                     delay(j) - delay(i) < 30
 *   Objective:    minimize sum(prio(t) * 10 * delay(t)), total in [0, 10000]
 *
 * The model is immutable once built and owned by a single optimize() call.
 */
class PrecedenceModel {
public:
    static constexpr int PRIORITY_OVERRIDE_DELAY_MINUTES = 30;
    static constexpr int PRIORITY_WEIGHT = 10;
    static constexpr qint64 OBJECTIVE_LOWER_BOUND = 0;
    static constexpr qint64 OBJECTIVE_UPPER_BOUND = 10000;

    static StageResult<PrecedenceModel> build(const QList<Model::Train>& trains,
                                              const Model::SystemState& state,
                                              const ConflictDetector& detector = ConflictDetector());

    int trainCount() const { return m_trains.size(); }
    const QList<Model::Train>& trains() const { return m_trains; }
    const Model::Train& train(int index) const { return m_trains.at(index); }

    int variableIndex(int i, int j) const { return i * trainCount() + j; }
    int variableCount() const { return trainCount() * trainCount(); }

    bool isExclusive(int i, int j) const { return m_exclusive.at(variableIndex(i, j)); }
    bool isForced(int i, int j) const { return m_forced.at(variableIndex(i, j)); }

    // Unordered conflicting pairs, first index lower than second
    const QList<QPair<int, int>>& conflictPairs() const { return m_conflictPairs; }
    int forcedCount() const { return m_forcedCount; }

    qint64 objectiveWeight(int index) const;
    qint64 objectiveValue() const { return m_objectiveValue; }
    bool objectiveWithinBounds() const;

    const QList<OversubscribedSection>& oversubscribedSections() const { return m_oversubscribed; }

    QString summary() const;

private:
    PrecedenceModel() = default;

    void addExclusivityConstraints(const ConflictDetector& detector);
    void addPriorityConstraints();
    void recordCapacityGroups(const Model::SystemState& state);
    void computeObjective();

    QList<Model::Train> m_trains;
    QVector<bool> m_exclusive;
    QVector<bool> m_forced;
    QList<QPair<int, int>> m_conflictPairs;
    int m_forcedCount = 0;
    qint64 m_objectiveValue = 0;
    QList<OversubscribedSection> m_oversubscribed;
};

} // namespace RailPrecedence::Engine
