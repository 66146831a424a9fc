#include <QtTest>
#include <QDeadlineTimer>

#include <algorithm>

#include "TestFixtures.h"
#include "engine/CpSatPrecedenceSolver.h"
#include "engine/PrecedenceModel.h"
#include "engine/PrecedenceOrder.h"

using namespace RailPrecedence;
using namespace RailPrecedence::Engine;
using namespace RailPrecedence::TestFixtures;

class TestPrecedenceSolver : public QObject {
    Q_OBJECT

private slots:
    // Model construction
    void priorityOverrideAtThirtyMinuteGap_data();
    void priorityOverrideAtThirtyMinuteGap();
    void priorityConstraintAppliesAcrossSections();
    void exclusivityOnlyForSameSection();
    void objectiveIsPriorityWeightedDelay();
    void duplicateTrainIdentityFailsConstruction();
    void trainWithoutSectionIsInvalidInput();
    void oversubscribedSectionsAreReported();

    // Search
    void equalPriorityPrefersLargerWeightedDelay();
    void forcedPriorityBeatsWeightedDelay();
    void overriddenPriorityFollowsWeightedDelay();
    void sameSectionChainIsTotallyOrdered();
    void freePairFollowsForcedChain();
    void contestedSectionOrderIsAcyclic_data();
    void contestedSectionOrderIsAcyclic();
    void unconstrainedPairsStayUnordered();
    void objectiveOutsideDomainIsInfeasible();
    void expiredDeadlineTimesOut();
    void repeatedSolveIsDeterministic();

    // Order derivation
    void ranksCountPredecessors();
    void solutionWithoutAssignmentHasNoOrder();
    void heuristicOrderMustBePermutation();

private:
    PrecedenceModel buildModel(const QList<Model::Train>& trains, const QList<Model::Section>& sections);
    PrecedenceSolution solve(const PrecedenceModel& model);
};

PrecedenceModel TestPrecedenceSolver::buildModel(const QList<Model::Train>& trains,
                                                 const QList<Model::Section>& sections) {
    const Model::SystemState state = makeState(trains, sections);
    auto model = PrecedenceModel::build(trains, state);
    if (model.isFailure()) {
        qFatal("Model construction failed: %s", qPrintable(model.error().describe()));
    }
    return model.value();
}

PrecedenceSolution TestPrecedenceSolver::solve(const PrecedenceModel& model) {
    CpSatPrecedenceSolver solver;
    return solver.solve(model, QDeadlineTimer(5000));
}

void TestPrecedenceSolver::priorityOverrideAtThirtyMinuteGap_data() {
    QTest::addColumn<int>("expressDelay");
    QTest::addColumn<int>("passengerDelay");
    QTest::addColumn<bool>("forced");

    QTest::newRow("both on time") << 0 << 0 << true;
    QTest::newRow("gap 29") << 0 << 29 << true;
    QTest::newRow("gap 30") << 0 << 30 << false;
    QTest::newRow("gap 45") << 5 << 50 << false;
    QTest::newRow("higher priority more delayed") << 40 << 0 << true;
}

void TestPrecedenceSolver::priorityOverrideAtThirtyMinuteGap() {
    QFETCH(int, expressDelay);
    QFETCH(int, passengerDelay);
    QFETCH(bool, forced);

    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::EXPRESS, expressDelay, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, passengerDelay, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});

    QCOMPARE(model.isForced(0, 1), forced);
    QVERIFY(!model.isForced(1, 0));
}

void TestPrecedenceSolver::priorityConstraintAppliesAcrossSections() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::SPECIAL, 0, fixedId(1)),
        makeTrain(Model::TrainType::FREIGHT, 0, fixedId(2))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1)), makeSection(fixedId(2))});

    QVERIFY(model.isForced(0, 1));
    QVERIFY(!model.isExclusive(0, 1));

    const PrecedenceSolution solution = solve(model);
    QVERIFY(solution.hasAssignment());
    QVERIFY(solution.isBefore(0, 1));
    QVERIFY(!solution.isBefore(1, 0));
}

void TestPrecedenceSolver::exclusivityOnlyForSameSection() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::PASSENGER, 0, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 0, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 0, fixedId(2))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1)), makeSection(fixedId(2))});

    QVERIFY(model.isExclusive(0, 1));
    QVERIFY(model.isExclusive(1, 0));
    QVERIFY(!model.isExclusive(0, 2));
    QVERIFY(!model.isExclusive(1, 2));
    QCOMPARE(model.conflictPairs().size(), 1);
    QCOMPARE(model.conflictPairs().first(), qMakePair(0, 1));
}

void TestPrecedenceSolver::objectiveIsPriorityWeightedDelay() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::EXPRESS, 7, fixedId(1)),      // 3 * 10 * 7
        makeTrain(Model::TrainType::FREIGHT, 20, fixedId(1))      // 1 * 10 * 20
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});

    QCOMPARE(model.objectiveWeight(0), qint64(30));
    QCOMPARE(model.objectiveWeight(1), qint64(10));
    QCOMPARE(model.objectiveValue(), qint64(410));
    QVERIFY(model.objectiveWithinBounds());
}

void TestPrecedenceSolver::duplicateTrainIdentityFailsConstruction() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::EXPRESS, 0, fixedId(1), Model::TrainStatus::RUNNING, fixedId(10)),
        makeTrain(Model::TrainType::FREIGHT, 0, fixedId(1), Model::TrainStatus::RUNNING, fixedId(10))
    };
    const Model::SystemState state = makeState(trains, {makeSection(fixedId(1))});

    const auto model = PrecedenceModel::build(trains, state);
    QVERIFY(model.isFailure());
    QCOMPARE(model.error().kind, StageFailureKind::MODEL_CONSTRUCTION);
}

void TestPrecedenceSolver::trainWithoutSectionIsInvalidInput() {
    const QList<Model::Train> trains{makeTrain(Model::TrainType::EXPRESS, 0, std::nullopt)};
    const Model::SystemState state = makeState(trains, {});

    const auto model = PrecedenceModel::build(trains, state);
    QVERIFY(model.isFailure());
    QCOMPARE(model.error().kind, StageFailureKind::INVALID_INPUT);
}

void TestPrecedenceSolver::oversubscribedSectionsAreReported() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::PASSENGER, 0, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 1, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 2, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 0, fixedId(2)),
        makeTrain(Model::TrainType::PASSENGER, 1, fixedId(2))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1), 2), makeSection(fixedId(2), 2)});

    QCOMPARE(model.oversubscribedSections().size(), 1);
    const OversubscribedSection& group = model.oversubscribedSections().first();
    QCOMPARE(group.sectionId, fixedId(1));
    QCOMPARE(group.tracks, 2);
    QCOMPARE(group.trainIndices, QList<int>({0, 1, 2}));
}

void TestPrecedenceSolver::equalPriorityPrefersLargerWeightedDelay() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::PASSENGER, 5, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 10, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});

    const PrecedenceSolution solution = solve(model);
    QCOMPARE(solution.status, SolveStatus::OPTIMAL);
    QVERIFY(solution.isBefore(1, 0));
    QVERIFY(!solution.isBefore(0, 1));
    QCOMPARE(solution.objectiveValue, qint64(300));
}

void TestPrecedenceSolver::forcedPriorityBeatsWeightedDelay() {
    // Passenger carries the larger weighted delay but is within the 30 minute window
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::EXPRESS, 0, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 20, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});

    const PrecedenceSolution solution = solve(model);
    QVERIFY(solution.hasAssignment());
    QVERIFY(solution.isBefore(0, 1));
    QVERIFY(!solution.isBefore(1, 0));
}

void TestPrecedenceSolver::overriddenPriorityFollowsWeightedDelay() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::EXPRESS, 0, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 40, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});
    QVERIFY(!model.isForced(0, 1));

    const PrecedenceSolution solution = solve(model);
    QVERIFY(solution.hasAssignment());
    QVERIFY(solution.isBefore(1, 0));
}

void TestPrecedenceSolver::sameSectionChainIsTotallyOrdered() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::FREIGHT, 0, fixedId(1)),
        makeTrain(Model::TrainType::SPECIAL, 0, fixedId(1)),
        makeTrain(Model::TrainType::EXPRESS, 0, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});
    QCOMPARE(model.forcedCount(), 3);

    const PrecedenceSolution solution = solve(model);
    QVERIFY(solution.hasAssignment());

    const auto order = PrecedenceOrder::fromSolution(solution);
    QVERIFY(order.isSuccess());
    QCOMPARE(order.value().ranks, QVector<int>({2, 0, 1}));
}

void TestPrecedenceSolver::freePairFollowsForcedChain() {
    // Special before Express and Express before Freight are forced (gaps of 20).
    // Special/Freight is free (gap 40) and weighted delay alone would put Freight first.
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::SPECIAL, 0, fixedId(1)),
        makeTrain(Model::TrainType::EXPRESS, 20, fixedId(1)),
        makeTrain(Model::TrainType::FREIGHT, 40, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});
    QVERIFY(model.isForced(0, 1));
    QVERIFY(model.isForced(1, 2));
    QVERIFY(!model.isForced(0, 2));
    QVERIFY(!CpSatPrecedenceSolver::prefersFirst(model.train(0), model.train(2)));

    const PrecedenceSolution solution = solve(model);
    QCOMPARE(solution.status, SolveStatus::OPTIMAL);
    QVERIFY(solution.isBefore(0, 2));

    const auto order = PrecedenceOrder::fromSolution(solution);
    QVERIFY(order.isSuccess());
    QCOMPARE(order.value().ranks.count(0), 1);
    QCOMPARE(order.value().ranks, QVector<int>({0, 1, 2}));
}

void TestPrecedenceSolver::contestedSectionOrderIsAcyclic_data() {
    QTest::addColumn<QList<int>>("types");
    QTest::addColumn<QList<int>>("delays");

    const int special = static_cast<int>(Model::TrainType::SPECIAL);
    const int express = static_cast<int>(Model::TrainType::EXPRESS);
    const int passenger = static_cast<int>(Model::TrainType::PASSENGER);
    const int freight = static_cast<int>(Model::TrainType::FREIGHT);

    QTest::newRow("forced chain with free ends")
        << QList<int>{special, express, freight} << QList<int>{0, 20, 40};
    QTest::newRow("two chains interleaved")
        << QList<int>{special, express, passenger, freight} << QList<int>{0, 25, 50, 75};
    QTest::newRow("equal priorities")
        << QList<int>{passenger, passenger, passenger, passenger} << QList<int>{3, 9, 1, 9};
    QTest::newRow("mixed")
        << QList<int>{freight, special, passenger, express, freight} << QList<int>{60, 10, 35, 0, 5};
}

void TestPrecedenceSolver::contestedSectionOrderIsAcyclic() {
    QFETCH(QList<int>, types);
    QFETCH(QList<int>, delays);

    QList<Model::Train> trains;
    for (int k = 0; k < types.size(); ++k) {
        trains.append(makeTrain(static_cast<Model::TrainType>(types.at(k)), delays.at(k), fixedId(1)));
    }
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});

    const PrecedenceSolution solution = solve(model);
    QVERIFY(solution.hasAssignment());

    for (int i = 0; i < trains.size(); ++i) {
        for (int j = 0; j < trains.size(); ++j) {
            if (model.isForced(i, j)) {
                QVERIFY(solution.isBefore(i, j));
            }
        }
    }

    // One section: the ranks are a permutation of 0..n-1
    const auto order = PrecedenceOrder::fromSolution(solution);
    QVERIFY(order.isSuccess());
    QVector<int> ranks = order.value().ranks;
    std::sort(ranks.begin(), ranks.end());
    for (int k = 0; k < ranks.size(); ++k) {
        QCOMPARE(ranks.at(k), k);
    }
}

void TestPrecedenceSolver::unconstrainedPairsStayUnordered() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::PASSENGER, 3, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 9, fixedId(2))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1)), makeSection(fixedId(2))});

    const PrecedenceSolution solution = solve(model);
    QVERIFY(solution.hasAssignment());
    QVERIFY(!solution.isBefore(0, 1));
    QVERIFY(!solution.isBefore(1, 0));

    const auto order = PrecedenceOrder::fromSolution(solution);
    QVERIFY(order.isSuccess());
    QCOMPARE(order.value().ranks, QVector<int>({0, 0}));
}

void TestPrecedenceSolver::objectiveOutsideDomainIsInfeasible() {
    // 4 * 10 * 300 = 12000, above the 10000 ceiling
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::SPECIAL, 300, fixedId(1)),
        makeTrain(Model::TrainType::FREIGHT, 0, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});
    QVERIFY(!model.objectiveWithinBounds());

    const PrecedenceSolution solution = solve(model);
    QCOMPARE(solution.status, SolveStatus::INFEASIBLE);
    QVERIFY(!solution.hasAssignment());
    QVERIFY(solution.before.isEmpty());
}

void TestPrecedenceSolver::expiredDeadlineTimesOut() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::PASSENGER, 5, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 10, fixedId(1))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1))});

    CpSatPrecedenceSolver solver;
    const PrecedenceSolution solution = solver.solve(model, QDeadlineTimer(qint64(0)));
    QCOMPARE(solution.status, SolveStatus::TIMEOUT);
    QVERIFY(!solution.hasAssignment());
}

void TestPrecedenceSolver::repeatedSolveIsDeterministic() {
    const QList<Model::Train> trains{
        makeTrain(Model::TrainType::PASSENGER, 4, fixedId(1)),
        makeTrain(Model::TrainType::PASSENGER, 4, fixedId(1)),
        makeTrain(Model::TrainType::FREIGHT, 12, fixedId(1)),
        makeTrain(Model::TrainType::EXPRESS, 0, fixedId(2))
    };
    const PrecedenceModel model = buildModel(trains, {makeSection(fixedId(1)), makeSection(fixedId(2))});

    const PrecedenceSolution first = solve(model);
    const PrecedenceSolution second = solve(model);
    QVERIFY(first.hasAssignment());
    QCOMPARE(first.status, second.status);
    QCOMPARE(first.before, second.before);
}

void TestPrecedenceSolver::ranksCountPredecessors() {
    PrecedenceSolution solution;
    solution.status = SolveStatus::FEASIBLE;
    solution.trainCount = 3;
    solution.before = QVector<bool>(9, false);
    solution.before[0 * 3 + 1] = true;      // 0 before 1
    solution.before[0 * 3 + 2] = true;      // 0 before 2
    solution.before[1 * 3 + 2] = true;      // 1 before 2

    const auto order = PrecedenceOrder::fromSolution(solution);
    QVERIFY(order.isSuccess());
    QCOMPARE(order.value().path, PrecedencePath::SOLVED);
    QCOMPARE(order.value().ranks, QVector<int>({0, 1, 2}));
}

void TestPrecedenceSolver::solutionWithoutAssignmentHasNoOrder() {
    PrecedenceSolution solution;
    solution.status = SolveStatus::TIMEOUT;
    solution.trainCount = 2;

    const auto order = PrecedenceOrder::fromSolution(solution);
    QVERIFY(order.isFailure());
    QCOMPARE(order.error().kind, StageFailureKind::INCONSISTENT_ORDER);
}

void TestPrecedenceSolver::heuristicOrderMustBePermutation() {
    QVERIFY(PrecedenceOrder::fromHeuristic({2, 0, 1}).isSuccess());
    QCOMPARE(PrecedenceOrder::fromHeuristic({2, 0, 1}).value().ranks, QVector<int>({1, 2, 0}));
    QVERIFY(PrecedenceOrder::fromHeuristic({0, 0, 1}).isFailure());
    QVERIFY(PrecedenceOrder::fromHeuristic({0, 3, 1}).isFailure());
}

QTEST_APPLESS_MAIN(TestPrecedenceSolver)
#include "tst_precedencesolver.moc"
