#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>
#include "engine/OptimizerConfig.h"
#include "engine/RailwayOptimizer.h"
#include "snapshot/SnapshotCodec.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("railprecedence");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Decides which trains proceed and which wait on contested sections.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption snapshotOption(QStringList{"s", "snapshot"}, "Network snapshot to optimize (JSON).", "file");
    QCommandLineOption configOption(QStringList{"c", "config"}, "Optimizer configuration (JSON).", "file");
    QCommandLineOption timeLimitOption(QStringList{"t", "time-limit"}, "Solver time budget in seconds.", "seconds");
    QCommandLineOption outputOption(QStringList{"o", "output"}, "Write the result here instead of stdout.", "file");
    QCommandLineOption compactOption("compact", "Emit compact JSON.");
    parser.addOptions({snapshotOption, configOption, timeLimitOption, outputOption, compactOption});

    parser.process(app);

    if (!parser.isSet(snapshotOption)) {
        qCritical() << "No snapshot given, use --snapshot <file>";
        return 1;
    }

    using namespace RailPrecedence;

    // Configuration: bundled defaults, then --config, then --time-limit
    Engine::OptimizerConfig config = Engine::OptimizerConfig::loadDefault();
    if (parser.isSet(configOption)) {
        QString error;
        const auto loaded = Engine::OptimizerConfig::loadFromFile(parser.value(configOption), &error);
        if (!loaded) {
            qCritical() << "Invalid configuration:" << error;
            return 1;
        }
        config = *loaded;
    }
    if (parser.isSet(timeLimitOption)) {
        bool ok = false;
        const double seconds = parser.value(timeLimitOption).toDouble(&ok);
        if (!ok || seconds < 0.0) {
            qCritical() << "Invalid --time-limit:" << parser.value(timeLimitOption);
            return 1;
        }
        config.timeLimitSeconds = seconds;
    }

    const Snapshot::SnapshotLoadResult snapshot = Snapshot::SnapshotCodec::loadFromFile(parser.value(snapshotOption));
    if (!snapshot.success) {
        qCritical() << "Invalid snapshot:" << snapshot.error;
        return 1;
    }

    Engine::RailwayOptimizer optimizer(config);

    QObject::connect(&optimizer, &Engine::RailwayOptimizer::heuristicFallbackUsed,
                     [](const QString& reason) {
                         qWarning() << "Heuristic ordering used:" << reason;
                     });

    QObject::connect(&optimizer, &Engine::RailwayOptimizer::degradedFallbackUsed,
                     [](const QString& phase, const QString& error) {
                         qCritical() << "DEGRADED RESULT";
                         qCritical() << "Failed phase:" << phase;
                         qCritical() << "Error:" << error;
                         qCritical() << "All active trains proceed with caution, MANUAL REVIEW REQUIRED";
                     });

    QObject::connect(&optimizer, &Engine::RailwayOptimizer::performanceWarning,
                     [](const QString& metric, double value, double threshold) {
                         qWarning() << "Optimizer Performance Warning:" << metric << "=" << value << "(threshold:" << threshold << ")";
                     });

    QObject::connect(&optimizer, &Engine::RailwayOptimizer::optimizationCompleted,
                     [](double confidence, double seconds, int decisionCount) {
                         qDebug() << "Optimization completed:" << decisionCount << "decisions, confidence"
                                  << confidence << "in" << seconds << "s";
                     });

    const Model::OptimizationResult result = optimizer.optimize(snapshot.state);

    const QJsonDocument output(Snapshot::SnapshotCodec::encodeResult(result, snapshot.state));
    const QByteArray json = output.toJson(parser.isSet(compactOption) ? QJsonDocument::Compact : QJsonDocument::Indented);

    if (parser.isSet(outputOption)) {
        QFile file(parser.value(outputOption));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            qCritical() << "Cannot write result to" << parser.value(outputOption) << ":" << file.errorString();
            return 1;
        }
        file.write(json);
    } else {
        QTextStream(stdout) << json;
    }

    return 0;
}
