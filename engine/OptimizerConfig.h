#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

namespace RailPrecedence::Engine {

struct OptimizerConfig {
    double timeLimitSeconds = 30.0;             // Wall-clock budget of one precedence solve
    double performanceWarningSeconds = 5.0;     // Slower optimize() calls raise performanceWarning
    bool verboseLogging = false;                // Log solver search progress

    static constexpr const char* DEFAULT_RESOURCE_PATH = ":/resources/config/optimizer.json";

    // Parses the "optimizer" object of a configuration document. Keys that are
    // missing keep their defaults; present keys must hold valid values.
    static std::optional<OptimizerConfig> fromJson(const QJsonObject& root, QString* error = nullptr);
    static std::optional<OptimizerConfig> loadFromFile(const QString& path, QString* error = nullptr);

    // Built-in resource if it can be read, compiled-in defaults otherwise
    static OptimizerConfig loadDefault();

    qint64 timeLimitMs() const;
    QJsonObject toJson() const;
};

} // namespace RailPrecedence::Engine
