#pragma once

#include <QJsonObject>
#include <QString>

#include "../model/OptimizationResult.h"
#include "../model/SystemState.h"

namespace RailPrecedence::Snapshot {

struct SnapshotLoadResult {
    bool success = false;
    QString error;
    Model::SystemState state;

    static SnapshotLoadResult loaded(const Model::SystemState& state) {
        SnapshotLoadResult result;
        result.success = true;
        result.state = state;
        return result;
    }

    static SnapshotLoadResult failed(const QString& error) {
        SnapshotLoadResult result;
        result.success = false;
        result.error = error;
        return result;
    }
};

/**
 * JSON boundary of the engine.
 *
 * Snapshots are untrusted input: every identifier, enumeration value and
 * cross-reference is checked before a SystemState is handed out, so the
 * engine itself can assume a consistent network.
 */
class SnapshotCodec {
public:
    static SnapshotLoadResult decode(const QJsonObject& root);
    static SnapshotLoadResult decode(const QByteArray& json);
    static SnapshotLoadResult loadFromFile(const QString& path);

    // train_number is looked up in state; it is empty for unknown trains
    static QJsonObject encodeResult(const Model::OptimizationResult& result,
                                    const Model::SystemState& state);
    static QJsonObject encodeDecision(const Model::Decision& decision,
                                      const Model::SystemState& state);

    static QString uuidToString(const QUuid& id);
    static QString dateTimeToString(const QDateTime& value);
};

} // namespace RailPrecedence::Snapshot
