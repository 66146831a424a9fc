#include <QtTest>

#include "TestFixtures.h"
#include "model/OptimizationResult.h"
#include "model/SystemState.h"

using namespace RailPrecedence;
using namespace RailPrecedence::TestFixtures;

class TestModels : public QObject {
    Q_OBJECT

private slots:
    void priorityFollowsTrainType_data();
    void priorityFollowsTrainType();
    void createAssignsIdentityWhenMissing();
    void createKeepsGivenIdentity();
    void needsDecisionRequiresActiveTrainOnSection_data();
    void needsDecisionRequiresActiveTrainOnSection();
    void estimatedArrivalAddsDelay();
    void calculateDelayNeverNegative();
    void enumerationsParseCaseInsensitively();
    void unknownEnumerationValuesAreRejected();
    void sectionAvailabilityHonoursTracksAndStatus();
    void decisionConfidenceIsClamped();
    void scheduleNextStationAndSection();
    void systemStateLookups();
    void resultCountsActions();
};

void TestModels::priorityFollowsTrainType_data() {
    QTest::addColumn<QString>("type");
    QTest::addColumn<int>("priority");

    QTest::newRow("special") << "special" << 4;
    QTest::newRow("express") << "express" << 3;
    QTest::newRow("passenger") << "passenger" << 2;
    QTest::newRow("freight") << "freight" << 1;
}

void TestModels::priorityFollowsTrainType() {
    QFETCH(QString, type);
    QFETCH(int, priority);

    const auto parsed = Model::trainTypeFromString(type);
    QVERIFY(parsed.has_value());

    const Model::Train train = makeTrain(*parsed, 0, std::nullopt);
    QCOMPARE(train.priority(), priority);
    QCOMPARE(Model::Train::priorityForType(*parsed), priority);
}

void TestModels::createAssignsIdentityWhenMissing() {
    const Model::Train first = makeTrain(Model::TrainType::FREIGHT, 0, std::nullopt);
    const Model::Train second = makeTrain(Model::TrainType::FREIGHT, 0, std::nullopt);

    QVERIFY(!first.id().isNull());
    QVERIFY(first.id() != second.id());
}

void TestModels::createKeepsGivenIdentity() {
    const Model::Train train = makeTrain(Model::TrainType::EXPRESS, 3, fixedId(1),
                                         Model::TrainStatus::DELAYED, fixedId(42));
    QCOMPARE(train.id(), fixedId(42));
    QCOMPARE(train.delayMinutes(), 3);
    QVERIFY(train.isDelayed());
}

void TestModels::needsDecisionRequiresActiveTrainOnSection_data() {
    QTest::addColumn<QString>("status");
    QTest::addColumn<bool>("onSection");
    QTest::addColumn<bool>("expected");

    QTest::newRow("running on section") << "running" << true << true;
    QTest::newRow("delayed on section") << "delayed" << true << true;
    QTest::newRow("running at station") << "running" << false << false;
    QTest::newRow("on time") << "on_time" << true << false;
    QTest::newRow("stopped") << "stopped" << true << false;
    QTest::newRow("cancelled") << "cancelled" << true << false;
}

void TestModels::needsDecisionRequiresActiveTrainOnSection() {
    QFETCH(QString, status);
    QFETCH(bool, onSection);
    QFETCH(bool, expected);

    const auto parsed = Model::trainStatusFromString(status);
    QVERIFY(parsed.has_value());

    const std::optional<QUuid> section = onSection ? std::optional<QUuid>(fixedId(1)) : std::nullopt;
    const Model::Train train = makeTrain(Model::TrainType::PASSENGER, 0, section, *parsed);
    QCOMPARE(train.needsDecision(), expected);
}

void TestModels::estimatedArrivalAddsDelay() {
    Model::Train::Attributes attributes;
    attributes.number = "12951";
    attributes.type = Model::TrainType::EXPRESS;
    attributes.delayMinutes = 15;
    attributes.scheduledArrival = referenceTime();

    const Model::Train train = Model::Train::create(attributes);
    QCOMPARE(train.estimatedArrival(), referenceTime().addSecs(15 * 60));

    attributes.scheduledArrival = QDateTime();
    QVERIFY(!Model::Train::create(attributes).estimatedArrival().isValid());
}

void TestModels::calculateDelayNeverNegative() {
    Model::Train::Attributes attributes;
    attributes.type = Model::TrainType::PASSENGER;
    attributes.scheduledDeparture = referenceTime();
    attributes.actualDeparture = referenceTime().addSecs(7 * 60 + 30);
    QCOMPARE(Model::Train::create(attributes).calculateDelay(referenceTime()), 7);

    attributes.actualDeparture = referenceTime().addSecs(-5 * 60);
    QCOMPARE(Model::Train::create(attributes).calculateDelay(referenceTime()), 0);

    attributes.actualDeparture = QDateTime();
    QCOMPARE(Model::Train::create(attributes).calculateDelay(referenceTime()), 0);
}

void TestModels::enumerationsParseCaseInsensitively() {
    QVERIFY(Model::trainTypeFromString("EXPRESS") == std::optional<Model::TrainType>(Model::TrainType::EXPRESS));
    QVERIFY(Model::trainStatusFromString(" On_Time ") == std::optional<Model::TrainStatus>(Model::TrainStatus::ON_TIME));
    QVERIFY(Model::sectionStatusFromString("Maintenance") == std::optional<Model::SectionStatus>(Model::SectionStatus::MAINTENANCE));
    QVERIFY(Model::decisionActionFromString("WAIT") == std::optional<Model::DecisionAction>(Model::DecisionAction::WAIT));

    QCOMPARE(Model::trainTypeToString(Model::TrainType::SPECIAL), QString("special"));
    QCOMPARE(Model::trainStatusToString(Model::TrainStatus::ON_TIME), QString("on_time"));
    QCOMPARE(Model::sectionStatusToString(Model::SectionStatus::BLOCKED), QString("blocked"));
    QCOMPARE(Model::decisionActionToString(Model::DecisionAction::PROCEED), QString("proceed"));
}

void TestModels::unknownEnumerationValuesAreRejected() {
    QVERIFY(!Model::trainTypeFromString("maglev").has_value());
    QVERIFY(!Model::trainStatusFromString("late").has_value());
    QVERIFY(!Model::sectionStatusFromString("closed").has_value());
    QVERIFY(!Model::decisionActionFromString("hold").has_value());
}

void TestModels::sectionAvailabilityHonoursTracksAndStatus() {
    Model::Section section = makeSection(fixedId(1), 2);
    QVERIFY(section.isAvailable());

    section.currentTrainIds = {fixedId(10)};
    QVERIFY(section.isAvailable());
    QVERIFY(section.isOccupiedBy(fixedId(10)));

    section.currentTrainIds.append(fixedId(11));
    QVERIFY(!section.isAvailable());

    section.currentTrainIds.clear();
    section.status = Model::SectionStatus::MAINTENANCE;
    QVERIFY(!section.isAvailable());

    section.status = Model::SectionStatus::AVAILABLE;
    Model::Train::Attributes fast;
    fast.type = Model::TrainType::EXPRESS;
    fast.maxSpeed = 160;
    QVERIFY(!section.canAccommodate(Model::Train::create(fast)));
    fast.maxSpeed = 110;
    QVERIFY(section.canAccommodate(Model::Train::create(fast)));
}

void TestModels::decisionConfidenceIsClamped() {
    const Model::Decision high = Model::Decision::create(fixedId(1), Model::DecisionAction::PROCEED, "test", 1.7);
    const Model::Decision low = Model::Decision::create(fixedId(1), Model::DecisionAction::WAIT, "test", -0.2);

    QCOMPARE(high.confidence, 1.0);
    QCOMPARE(low.confidence, 0.0);
    QVERIFY(!high.applied);
    QVERIFY(high.createdAt.isValid());
    QVERIFY(high.id != low.id);
}

void TestModels::scheduleNextStationAndSection() {
    Model::Section first = makeSection(fixedId(100));
    first.fromStationId = fixedId(1);
    first.toStationId = fixedId(2);
    Model::Section second = makeSection(fixedId(101));
    second.fromStationId = fixedId(2);
    second.toStationId = fixedId(3);

    Model::Schedule schedule;
    schedule.id = fixedId(500);
    schedule.stationIds = {fixedId(1), fixedId(2), fixedId(3)};
    schedule.sectionSequence = {first.id, second.id};

    QVERIFY(schedule.nextStation(fixedId(1)) == std::optional<QUuid>(fixedId(2)));
    QVERIFY(!schedule.nextStation(fixedId(3)).has_value());
    QVERIFY(!schedule.nextStation(fixedId(77)).has_value());

    const QList<Model::Section> sections{first, second};
    QVERIFY(schedule.sectionToNextStation(fixedId(2), sections) == std::optional<QUuid>(second.id));
    QVERIFY(!schedule.sectionToNextStation(fixedId(3), sections).has_value());
}

void TestModels::systemStateLookups() {
    const Model::Train train = makeTrain(Model::TrainType::EXPRESS, 0, fixedId(1),
                                         Model::TrainStatus::RUNNING, fixedId(10));
    Model::SystemState state = makeState({train}, {makeSection(fixedId(1))});

    Model::Schedule schedule;
    schedule.id = fixedId(500);
    schedule.trainId = train.id();
    state.schedules.append(schedule);

    QVERIFY(state.trainById(fixedId(10)) != nullptr);
    QCOMPARE(state.trainById(fixedId(10))->priority(), 3);
    QVERIFY(state.trainById(fixedId(11)) == nullptr);
    QVERIFY(state.sectionById(fixedId(1)) != nullptr);
    QVERIFY(state.sectionById(fixedId(1))->isOccupiedBy(fixedId(10)));
    QVERIFY(state.stationById(fixedId(9000)) != nullptr);
    QVERIFY(state.scheduleForTrain(fixedId(10)) != nullptr);
    QVERIFY(state.scheduleForTrain(fixedId(11)) == nullptr);
}

void TestModels::resultCountsActions() {
    Model::OptimizationResult result;
    result.decisions.append(Model::Decision::create(fixedId(1), Model::DecisionAction::PROCEED, "go", 0.9));
    result.decisions.append(Model::Decision::create(fixedId(2), Model::DecisionAction::WAIT, "hold", 0.8));
    result.decisions.append(Model::Decision::create(fixedId(3), Model::DecisionAction::WAIT, "hold", 0.8));

    QCOMPARE(result.proceedCount(), 1);
    QCOMPARE(result.waitCount(), 2);
    QVERIFY(result.decisionForTrain(fixedId(2)) != nullptr);
    QVERIFY(result.decisionForTrain(fixedId(2))->isWait());
    QVERIFY(result.decisionForTrain(fixedId(4)) == nullptr);
    QCOMPARE(Model::optimizationPathToString(Model::OptimizationPath::DEGRADED), QString("degraded"));
}

QTEST_APPLESS_MAIN(TestModels)
#include "tst_models.moc"
