#include "OptimizerConfig.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtMath>

namespace RailPrecedence::Engine {

namespace {

void reportError(QString* error, const QString& message) {
    if (error) {
        *error = message;
    }
}

} // namespace

std::optional<OptimizerConfig> OptimizerConfig::fromJson(const QJsonObject& root, QString* error) {
    OptimizerConfig config;

    if (!root.contains("optimizer")) {
        return config;
    }

    if (!root.value("optimizer").isObject()) {
        reportError(error, "\"optimizer\" must be an object");
        return std::nullopt;
    }

    const QJsonObject optimizer = root.value("optimizer").toObject();

    if (optimizer.contains("time_limit_seconds")) {
        const QJsonValue value = optimizer.value("time_limit_seconds");
        if (!value.isDouble() || value.toDouble() < 0.0 || !qIsFinite(value.toDouble())) {
            reportError(error, "time_limit_seconds must be a non-negative number");
            return std::nullopt;
        }
        config.timeLimitSeconds = value.toDouble();
    }

    if (optimizer.contains("performance_warning_seconds")) {
        const QJsonValue value = optimizer.value("performance_warning_seconds");
        if (!value.isDouble() || value.toDouble() <= 0.0 || !qIsFinite(value.toDouble())) {
            reportError(error, "performance_warning_seconds must be a positive number");
            return std::nullopt;
        }
        config.performanceWarningSeconds = value.toDouble();
    }

    if (optimizer.contains("verbose_logging")) {
        const QJsonValue value = optimizer.value("verbose_logging");
        if (!value.isBool()) {
            reportError(error, "verbose_logging must be a boolean");
            return std::nullopt;
        }
        config.verboseLogging = value.toBool();
    }

    return config;
}

std::optional<OptimizerConfig> OptimizerConfig::loadFromFile(const QString& path, QString* error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        reportError(error, QString("Cannot open configuration file %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        reportError(error, QString("Invalid JSON in %1: %2").arg(path, parseError.errorString()));
        return std::nullopt;
    }

    if (!doc.isObject()) {
        reportError(error, QString("Configuration root in %1 must be an object").arg(path));
        return std::nullopt;
    }

    return fromJson(doc.object(), error);
}

OptimizerConfig OptimizerConfig::loadDefault() {
    QString error;
    const auto config = loadFromFile(DEFAULT_RESOURCE_PATH, &error);
    if (!config) {
        qWarning() << "[OptimizerConfig > loadDefault] Using compiled-in defaults:" << error;
        return OptimizerConfig();
    }
    return *config;
}

qint64 OptimizerConfig::timeLimitMs() const {
    // QDeadlineTimer treats negative intervals as "forever", so never go below zero
    return qMax<qint64>(0, qRound64(timeLimitSeconds * 1000.0));
}

QJsonObject OptimizerConfig::toJson() const {
    return QJsonObject{
        {"optimizer", QJsonObject{
            {"time_limit_seconds", timeLimitSeconds},
            {"performance_warning_seconds", performanceWarningSeconds},
            {"verbose_logging", verboseLogging}
        }}
    };
}

} // namespace RailPrecedence::Engine
