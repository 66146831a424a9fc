#include "SnapshotCodec.h"

#include <QDebug>
#include <QFile>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>
#include <QtMath>
#include <climits>

namespace RailPrecedence::Snapshot {

namespace {

using Model::Decision;
using Model::Schedule;
using Model::Section;
using Model::Station;
using Model::SystemState;
using Model::Train;

class SnapshotParser {
public:
    bool parse(const QJsonObject& root, SystemState& state);
    const QString& error() const { return m_error; }

private:
    bool fail(const QString& message) {
        if (m_error.isEmpty()) {
            m_error = message;
        }
        return false;
    }

    bool parseStations(const QJsonArray& array, SystemState& state);
    bool parseSections(const QJsonArray& array, SystemState& state);
    bool parseTrains(const QJsonArray& array, SystemState& state);
    bool parseSchedules(const QJsonArray& array, SystemState& state);
    bool parseDecisions(const QJsonArray& array, SystemState& state);
    bool resolveOccupancy(SystemState& state);

    bool readArray(const QJsonObject& root, const QString& key, QJsonArray& out);
    bool readId(const QJsonObject& object, const QString& key, const QString& context, QUuid& out);
    bool readOptionalId(const QJsonObject& object, const QString& key, const QString& context,
                        std::optional<QUuid>& out);
    bool readIdList(const QJsonObject& object, const QString& key, const QString& context,
                    QList<QUuid>& out);
    bool readString(const QJsonObject& object, const QString& key, const QString& context,
                    QString& out, bool required = false);
    bool readInt(const QJsonObject& object, const QString& key, const QString& context,
                 int& out, int minimum);
    bool readDouble(const QJsonObject& object, const QString& key, const QString& context,
                    double& out, double minimum, double maximum);
    bool readBool(const QJsonObject& object, const QString& key, const QString& context, bool& out);
    bool readDateTime(const QJsonObject& object, const QString& key, const QString& context,
                      QDateTime& out);
    bool readDateTimeList(const QJsonObject& object, const QString& key, const QString& context,
                          QList<QDateTime>& out);

    QString m_error;

    QSet<QUuid> m_stationIds;
    QSet<QUuid> m_sectionIds;
    QSet<QUuid> m_trainIds;

    // Sections that listed their occupants explicitly, by index in state.sections
    QHash<int, bool> m_explicitOccupancy;
};

std::optional<QUuid> parseUuid(const QString& text) {
    const QUuid id = QUuid::fromString(text);
    if (id.isNull()) {
        return std::nullopt;
    }
    return id;
}

QDateTime parseDateTime(const QString& text) {
    QDateTime value = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!value.isValid()) {
        value = QDateTime::fromString(text, Qt::ISODate);
    }
    return value;
}

// === FIELD READERS ===

bool SnapshotParser::readArray(const QJsonObject& root, const QString& key, QJsonArray& out) {
    if (!root.contains(key) || root.value(key).isNull()) {
        out = QJsonArray();
        return true;
    }
    if (!root.value(key).isArray()) {
        return fail(QString("\"%1\" must be an array").arg(key));
    }
    out = root.value(key).toArray();
    return true;
}

bool SnapshotParser::readId(const QJsonObject& object, const QString& key, const QString& context, QUuid& out) {
    const QJsonValue value = object.value(key);
    if (!value.isString()) {
        return fail(QString("%1: \"%2\" is required").arg(context, key));
    }
    const auto id = parseUuid(value.toString());
    if (!id) {
        return fail(QString("%1: \"%2\" is not a valid UUID: %3").arg(context, key, value.toString()));
    }
    out = *id;
    return true;
}

bool SnapshotParser::readOptionalId(const QJsonObject& object, const QString& key, const QString& context,
                                    std::optional<QUuid>& out) {
    out.reset();
    if (!object.contains(key) || object.value(key).isNull()) {
        return true;
    }
    QUuid id;
    if (!readId(object, key, context, id)) {
        return false;
    }
    out = id;
    return true;
}

bool SnapshotParser::readIdList(const QJsonObject& object, const QString& key, const QString& context,
                                QList<QUuid>& out) {
    out.clear();
    if (!object.contains(key) || object.value(key).isNull()) {
        return true;
    }
    if (!object.value(key).isArray()) {
        return fail(QString("%1: \"%2\" must be an array").arg(context, key));
    }
    for (const QJsonValue& value : object.value(key).toArray()) {
        const auto id = value.isString() ? parseUuid(value.toString()) : std::nullopt;
        if (!id) {
            return fail(QString("%1: \"%2\" contains an invalid UUID").arg(context, key));
        }
        out.append(*id);
    }
    return true;
}

bool SnapshotParser::readString(const QJsonObject& object, const QString& key, const QString& context,
                                QString& out, bool required) {
    if (!object.contains(key) || object.value(key).isNull()) {
        if (required) {
            return fail(QString("%1: \"%2\" is required").arg(context, key));
        }
        return true;
    }
    if (!object.value(key).isString()) {
        return fail(QString("%1: \"%2\" must be a string").arg(context, key));
    }
    out = object.value(key).toString();
    return true;
}

bool SnapshotParser::readInt(const QJsonObject& object, const QString& key, const QString& context,
                             int& out, int minimum) {
    if (!object.contains(key) || object.value(key).isNull()) {
        return true;
    }
    const QJsonValue value = object.value(key);
    const double number = value.toDouble();
    if (!value.isDouble() || number != qFloor(number) || number < minimum || number > INT_MAX) {
        return fail(QString("%1: \"%2\" must be an integer >= %3").arg(context, key).arg(minimum));
    }
    out = static_cast<int>(number);
    return true;
}

bool SnapshotParser::readDouble(const QJsonObject& object, const QString& key, const QString& context,
                                double& out, double minimum, double maximum) {
    if (!object.contains(key) || object.value(key).isNull()) {
        return true;
    }
    const QJsonValue value = object.value(key);
    if (!value.isDouble() || value.toDouble() < minimum || value.toDouble() > maximum) {
        return fail(QString("%1: \"%2\" must be a number in [%3, %4]")
                        .arg(context, key).arg(minimum).arg(maximum));
    }
    out = value.toDouble();
    return true;
}

bool SnapshotParser::readBool(const QJsonObject& object, const QString& key, const QString& context, bool& out) {
    if (!object.contains(key) || object.value(key).isNull()) {
        return true;
    }
    if (!object.value(key).isBool()) {
        return fail(QString("%1: \"%2\" must be a boolean").arg(context, key));
    }
    out = object.value(key).toBool();
    return true;
}

bool SnapshotParser::readDateTime(const QJsonObject& object, const QString& key, const QString& context,
                                  QDateTime& out) {
    if (!object.contains(key) || object.value(key).isNull()) {
        out = QDateTime();
        return true;
    }
    const QDateTime value = object.value(key).isString() ? parseDateTime(object.value(key).toString()) : QDateTime();
    if (!value.isValid()) {
        return fail(QString("%1: \"%2\" must be an ISO-8601 timestamp").arg(context, key));
    }
    out = value;
    return true;
}

bool SnapshotParser::readDateTimeList(const QJsonObject& object, const QString& key, const QString& context,
                                      QList<QDateTime>& out) {
    out.clear();
    if (!object.contains(key) || object.value(key).isNull()) {
        return true;
    }
    if (!object.value(key).isArray()) {
        return fail(QString("%1: \"%2\" must be an array").arg(context, key));
    }
    for (const QJsonValue& value : object.value(key).toArray()) {
        // Null marks a station without arrival (origin) or departure (terminus)
        if (value.isNull()) {
            out.append(QDateTime());
            continue;
        }
        const QDateTime parsed = value.isString() ? parseDateTime(value.toString()) : QDateTime();
        if (!parsed.isValid()) {
            return fail(QString("%1: \"%2\" contains an invalid timestamp").arg(context, key));
        }
        out.append(parsed);
    }
    return true;
}

// === ENTITIES ===

bool SnapshotParser::parseStations(const QJsonArray& array, SystemState& state) {
    for (int index = 0; index < array.size(); ++index) {
        const QString context = QString("stations[%1]").arg(index);
        if (!array.at(index).isObject()) {
            return fail(context + ": must be an object");
        }
        const QJsonObject object = array.at(index).toObject();

        Station station;
        if (!readId(object, "id", context, station.id)
            || !readString(object, "name", context, station.name)
            || !readString(object, "code", context, station.code)
            || !readDouble(object, "latitude", context, station.latitude, -90.0, 90.0)
            || !readDouble(object, "longitude", context, station.longitude, -180.0, 180.0)
            || !readInt(object, "platforms", context, station.platforms, 1)
            || !readBool(object, "is_junction", context, station.isJunction)) {
            return false;
        }

        if (m_stationIds.contains(station.id)) {
            return fail(QString("%1: duplicate station id %2").arg(context, station.id.toString(QUuid::WithoutBraces)));
        }
        m_stationIds.insert(station.id);
        state.stations.append(station);
    }
    return true;
}

bool SnapshotParser::parseSections(const QJsonArray& array, SystemState& state) {
    for (int index = 0; index < array.size(); ++index) {
        const QString context = QString("sections[%1]").arg(index);
        if (!array.at(index).isObject()) {
            return fail(context + ": must be an object");
        }
        const QJsonObject object = array.at(index).toObject();

        Section section;
        QString status;
        if (!readId(object, "id", context, section.id)
            || !readId(object, "from_station_id", context, section.fromStationId)
            || !readId(object, "to_station_id", context, section.toStationId)
            || !readDouble(object, "length_km", context, section.lengthKm, 0.0, 1.0e6)
            || !readInt(object, "max_speed_kmh", context, section.maxSpeedKmh, 0)
            || !readInt(object, "tracks", context, section.tracks, 1)
            || !readString(object, "status", context, status)
            || !readIdList(object, "current_train_ids", context, section.currentTrainIds)) {
            return false;
        }

        if (!status.isEmpty()) {
            const auto parsed = Model::sectionStatusFromString(status);
            if (!parsed) {
                return fail(QString("%1: unknown section status \"%2\"").arg(context, status));
            }
            section.status = *parsed;
        }

        if (!m_stationIds.contains(section.fromStationId) || !m_stationIds.contains(section.toStationId)) {
            return fail(QString("%1: references an unknown station").arg(context));
        }
        if (m_sectionIds.contains(section.id)) {
            return fail(QString("%1: duplicate section id %2").arg(context, section.id.toString(QUuid::WithoutBraces)));
        }

        m_sectionIds.insert(section.id);
        m_explicitOccupancy.insert(static_cast<int>(state.sections.size()),
                                   object.contains("current_train_ids") && !object.value("current_train_ids").isNull());
        state.sections.append(section);
    }
    return true;
}

bool SnapshotParser::parseTrains(const QJsonArray& array, SystemState& state) {
    for (int index = 0; index < array.size(); ++index) {
        const QString context = QString("trains[%1]").arg(index);
        if (!array.at(index).isObject()) {
            return fail(context + ": must be an object");
        }
        const QJsonObject object = array.at(index).toObject();

        Train::Attributes attributes;
        QString type;
        QString status;
        if (!readId(object, "id", context, attributes.id)
            || !readString(object, "number", context, attributes.number, true)
            || !readString(object, "name", context, attributes.name)
            || !readString(object, "train_type", context, type, true)
            || !readInt(object, "max_speed", context, attributes.maxSpeed, 0)
            || !readInt(object, "length", context, attributes.length, 0)
            || !readOptionalId(object, "current_section_id", context, attributes.currentSectionId)
            || !readOptionalId(object, "current_station_id", context, attributes.currentStationId)
            || !readString(object, "status", context, status)
            || !readInt(object, "delay_minutes", context, attributes.delayMinutes, 0)
            || !readDateTime(object, "scheduled_departure", context, attributes.scheduledDeparture)
            || !readDateTime(object, "actual_departure", context, attributes.actualDeparture)
            || !readDateTime(object, "scheduled_arrival", context, attributes.scheduledArrival)
            || !readDateTime(object, "actual_arrival", context, attributes.actualArrival)) {
            return false;
        }

        const auto parsedType = Model::trainTypeFromString(type);
        if (!parsedType) {
            return fail(QString("%1: unknown train type \"%2\"").arg(context, type));
        }
        attributes.type = *parsedType;

        if (!status.isEmpty()) {
            const auto parsedStatus = Model::trainStatusFromString(status);
            if (!parsedStatus) {
                return fail(QString("%1: unknown train status \"%2\"").arg(context, status));
            }
            attributes.status = *parsedStatus;
        }

        if (attributes.currentSectionId && !m_sectionIds.contains(*attributes.currentSectionId)) {
            return fail(QString("%1: references unknown section %2")
                            .arg(context, attributes.currentSectionId->toString(QUuid::WithoutBraces)));
        }
        if (attributes.currentStationId && !m_stationIds.contains(*attributes.currentStationId)) {
            return fail(QString("%1: references unknown station %2")
                            .arg(context, attributes.currentStationId->toString(QUuid::WithoutBraces)));
        }
        if (m_trainIds.contains(attributes.id)) {
            return fail(QString("%1: duplicate train id %2").arg(context, attributes.id.toString(QUuid::WithoutBraces)));
        }

        m_trainIds.insert(attributes.id);
        state.trains.append(Train::create(attributes));
    }
    return true;
}

bool SnapshotParser::resolveOccupancy(SystemState& state) {
    for (int index = 0; index < state.sections.size(); ++index) {
        Section& section = state.sections[index];

        if (m_explicitOccupancy.value(index, false)) {
            for (const QUuid& trainId : section.currentTrainIds) {
                if (!m_trainIds.contains(trainId)) {
                    return fail(QString("sections[%1]: current_train_ids references unknown train %2")
                                    .arg(index).arg(trainId.toString(QUuid::WithoutBraces)));
                }
            }
            continue;
        }

        for (const Train& train : state.trains) {
            if (train.currentSectionId() && *train.currentSectionId() == section.id) {
                section.currentTrainIds.append(train.id());
            }
        }
    }
    return true;
}

bool SnapshotParser::parseSchedules(const QJsonArray& array, SystemState& state) {
    QSet<QUuid> scheduleIds;

    for (int index = 0; index < array.size(); ++index) {
        const QString context = QString("schedules[%1]").arg(index);
        if (!array.at(index).isObject()) {
            return fail(context + ": must be an object");
        }
        const QJsonObject object = array.at(index).toObject();

        Schedule schedule;
        if (!readId(object, "id", context, schedule.id)
            || !readId(object, "train_id", context, schedule.trainId)
            || !readIdList(object, "station_ids", context, schedule.stationIds)
            || !readDateTimeList(object, "arrival_times", context, schedule.arrivalTimes)
            || !readDateTimeList(object, "departure_times", context, schedule.departureTimes)
            || !readIdList(object, "section_ids", context, schedule.sectionSequence)) {
            return false;
        }

        if (!m_trainIds.contains(schedule.trainId)) {
            return fail(QString("%1: references unknown train %2")
                            .arg(context, schedule.trainId.toString(QUuid::WithoutBraces)));
        }
        for (const QUuid& stationId : schedule.stationIds) {
            if (!m_stationIds.contains(stationId)) {
                return fail(QString("%1: references unknown station %2")
                                .arg(context, stationId.toString(QUuid::WithoutBraces)));
            }
        }
        for (const QUuid& sectionId : schedule.sectionSequence) {
            if (!m_sectionIds.contains(sectionId)) {
                return fail(QString("%1: references unknown section %2")
                                .arg(context, sectionId.toString(QUuid::WithoutBraces)));
            }
        }

        const int stops = schedule.stationIds.size();
        if ((!schedule.arrivalTimes.isEmpty() && schedule.arrivalTimes.size() != stops)
            || (!schedule.departureTimes.isEmpty() && schedule.departureTimes.size() != stops)) {
            return fail(QString("%1: timetable length does not match station_ids").arg(context));
        }

        if (scheduleIds.contains(schedule.id)) {
            return fail(QString("%1: duplicate schedule id %2").arg(context, schedule.id.toString(QUuid::WithoutBraces)));
        }
        scheduleIds.insert(schedule.id);
        state.schedules.append(schedule);
    }
    return true;
}

bool SnapshotParser::parseDecisions(const QJsonArray& array, SystemState& state) {
    QSet<QUuid> decisionIds;

    for (int index = 0; index < array.size(); ++index) {
        const QString context = QString("active_decisions[%1]").arg(index);
        if (!array.at(index).isObject()) {
            return fail(context + ": must be an object");
        }
        const QJsonObject object = array.at(index).toObject();

        Decision decision;
        QString action;
        if (!readId(object, "id", context, decision.id)
            || !readId(object, "train_id", context, decision.trainId)
            || !readString(object, "action", context, action, true)
            || !readOptionalId(object, "target_section_id", context, decision.targetSectionId)
            || !readOptionalId(object, "target_station_id", context, decision.targetStationId)
            || !readDateTime(object, "estimated_time", context, decision.estimatedTime)
            || !readInt(object, "estimated_wait_minutes", context, decision.estimatedWaitMinutes, 0)
            || !readString(object, "reason", context, decision.reason)
            || !readDouble(object, "confidence", context, decision.confidence, 0.0, 1.0)
            || !readBool(object, "applied", context, decision.applied)
            || !readDateTime(object, "created_at", context, decision.createdAt)) {
            return false;
        }

        const auto parsedAction = Model::decisionActionFromString(action);
        if (!parsedAction) {
            return fail(QString("%1: unknown decision action \"%2\"").arg(context, action));
        }
        decision.action = *parsedAction;

        if (!m_trainIds.contains(decision.trainId)) {
            return fail(QString("%1: references unknown train %2")
                            .arg(context, decision.trainId.toString(QUuid::WithoutBraces)));
        }
        if (decision.targetSectionId && !m_sectionIds.contains(*decision.targetSectionId)) {
            return fail(QString("%1: references unknown section").arg(context));
        }
        if (decision.targetStationId && !m_stationIds.contains(*decision.targetStationId)) {
            return fail(QString("%1: references unknown station").arg(context));
        }
        if (decisionIds.contains(decision.id)) {
            return fail(QString("%1: duplicate decision id %2").arg(context, decision.id.toString(QUuid::WithoutBraces)));
        }
        decisionIds.insert(decision.id);
        state.activeDecisions.append(decision);
    }
    return true;
}

bool SnapshotParser::parse(const QJsonObject& root, SystemState& state) {
    if (!readDateTime(root, "timestamp", "snapshot", state.timestamp)) {
        return false;
    }
    if (!state.timestamp.isValid()) {
        state.timestamp = QDateTime::currentDateTimeUtc();
    }

    QJsonArray stations, sections, trains, schedules, decisions;
    if (!readArray(root, "stations", stations)
        || !readArray(root, "sections", sections)
        || !readArray(root, "trains", trains)
        || !readArray(root, "schedules", schedules)
        || !readArray(root, "active_decisions", decisions)) {
        return false;
    }

    // Order matters: each entity may only reference kinds parsed before it,
    // except section occupancy which is resolved once trains are known
    return parseStations(stations, state)
        && parseSections(sections, state)
        && parseTrains(trains, state)
        && resolveOccupancy(state)
        && parseSchedules(schedules, state)
        && parseDecisions(decisions, state);
}

QJsonValue optionalIdValue(const std::optional<QUuid>& id) {
    return id ? QJsonValue(SnapshotCodec::uuidToString(*id)) : QJsonValue(QJsonValue::Null);
}

QJsonValue dateTimeValue(const QDateTime& value) {
    return value.isValid() ? QJsonValue(SnapshotCodec::dateTimeToString(value)) : QJsonValue(QJsonValue::Null);
}

} // namespace

// === DECODING ===

SnapshotLoadResult SnapshotCodec::decode(const QJsonObject& root) {
    SnapshotParser parser;
    SystemState state;
    if (!parser.parse(root, state)) {
        qWarning() << "[SnapshotCodec > decode] Rejected snapshot:" << parser.error();
        return SnapshotLoadResult::failed(parser.error());
    }
    return SnapshotLoadResult::loaded(state);
}

SnapshotLoadResult SnapshotCodec::decode(const QByteArray& json) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return SnapshotLoadResult::failed(QString("Invalid JSON: %1").arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return SnapshotLoadResult::failed("Snapshot root must be an object");
    }
    return decode(doc.object());
}

SnapshotLoadResult SnapshotCodec::loadFromFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical() << "[SnapshotCodec > loadFromFile] Cannot open snapshot file:" << path;
        return SnapshotLoadResult::failed(QString("Cannot open snapshot file %1: %2").arg(path, file.errorString()));
    }

    SnapshotLoadResult result = decode(file.readAll());
    if (result.success) {
        qDebug() << "[SnapshotCodec > loadFromFile] Loaded" << path << "-"
                 << result.state.trains.size() << "trains,"
                 << result.state.sections.size() << "sections,"
                 << result.state.stations.size() << "stations";
    }
    return result;
}

// === ENCODING ===

QString SnapshotCodec::uuidToString(const QUuid& id) {
    return id.toString(QUuid::WithoutBraces);
}

QString SnapshotCodec::dateTimeToString(const QDateTime& value) {
    return value.toUTC().toString(Qt::ISODateWithMs);
}

QJsonObject SnapshotCodec::encodeDecision(const Model::Decision& decision, const Model::SystemState& state) {
    const Model::Train* train = state.trainById(decision.trainId);

    QJsonObject object;
    object["id"] = uuidToString(decision.id);
    object["train_id"] = uuidToString(decision.trainId);
    object["train_number"] = train ? train->number() : QString();
    object["action"] = Model::decisionActionToString(decision.action);
    object["target_section_id"] = optionalIdValue(decision.targetSectionId);
    object["target_station_id"] = optionalIdValue(decision.targetStationId);
    object["estimated_time"] = dateTimeValue(decision.estimatedTime);
    object["estimated_wait_minutes"] = decision.estimatedWaitMinutes;
    object["reason"] = decision.reason;
    object["confidence"] = decision.confidence;
    object["applied"] = decision.applied;
    object["created_at"] = dateTimeValue(decision.createdAt);
    return object;
}

QJsonObject SnapshotCodec::encodeResult(const Model::OptimizationResult& result, const Model::SystemState& state) {
    QJsonArray decisions;
    for (const Model::Decision& decision : result.decisions) {
        decisions.append(encodeDecision(decision, state));
    }

    QJsonObject object;
    object["decisions"] = decisions;
    object["total_delay_reduction"] = result.totalDelayReduction;
    object["throughput_improvement"] = result.throughputImprovement;
    object["confidence_score"] = result.confidenceScore;
    object["computation_time"] = result.computationTime;
    object["created_at"] = dateTimeValue(result.createdAt);
    object["path"] = Model::optimizationPathToString(result.path);
    return object;
}

} // namespace RailPrecedence::Snapshot
