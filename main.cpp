#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTimer>
#include <QDebug>
#include "config/SchedulerConfig.h"
#include "service/SchedulingService.h"

using namespace RailPlan;

namespace {

QList<Network::Station> sampleStations() {
    return {
        {"ALT", "Altstadt", "terminal", 4},
        {"BRK", "Brunnkreuz", "station", 2},
        {"CAS", "Castell", "junction", 2},
        {"DOR", "Dornfeld", "station", 3},
        {"ELM", "Elmsee", "terminal", 2}
    };
}

QList<Network::TrackSegment> sampleSegments() {
    QList<Network::TrackSegment> segments;

    auto add = [&segments](const QString& id, const QString& from, const QString& to,
                           double km, double limit, Network::TrackType type) {
        Network::TrackSegment segment;
        segment.id = id;
        segment.fromStationId = from;
        segment.toStationId = to;
        segment.distanceKm = km;
        segment.speedLimitKmh = limit;
        segment.trackType = type;
        segment.capacity = type == Network::TrackType::SINGLE ? 1 : 2;
        segments.append(segment);
    };

    add("S1", "ALT", "BRK", 32.0, 140.0, Network::TrackType::DOUBLE);
    add("S2", "BRK", "CAS", 18.5, 100.0, Network::TrackType::SINGLE);
    add("S3", "CAS", "DOR", 41.0, 160.0, Network::TrackType::HIGH_SPEED);
    add("S4", "CAS", "ELM", 22.0, 80.0, Network::TrackType::REGIONAL);
    return segments;
}

Schedule::Train makeTrain(int number, const QString& name, int priority, const QDateTime& departure,
                          const QStringList& stationIds) {
    Schedule::Train train;
    train.number = number;
    train.name = name;
    train.priority = priority;
    train.departureTime = departure;
    for (const QString& stationId : stationIds) {
        Schedule::Stop stop;
        stop.stationId = stationId;
        train.stops.append(stop);
    }
    return train;
}

void logConflicts(const QList<Schedule::Conflict>& conflicts) {
    for (const Schedule::Conflict& conflict : conflicts) {
        qDebug() << "   " << conflict.description();
    }
}

int runDemo(const Config::SchedulerConfig& config) {
    SchedulingService service(config);

    QObject::connect(service.telemetry(), &Telemetry::TelemetryService::performanceThresholdExceeded,
                     [](const QString& operation, double responseTimeMs, double thresholdMs) {
                         qWarning() << "Performance warning:" << operation << "=" << responseTimeMs
                                    << "ms (threshold:" << thresholdMs << ")";
                     });

    QObject::connect(service.pipeline(), &Resolution::ResolutionPipeline::stageChanged,
                     [](const QString& stage) {
                         qDebug() << "Pipeline stage:" << stage;
                     });

    QObject::connect(service.pipeline()->optimizer(), &Resolution::GeneticOptimizer::progressUpdated,
                     [](int generation, int conflicts, double fitness) {
                         if (generation % 25 == 0) {
                             qDebug() << "   generation" << generation << "conflicts" << conflicts << "fitness" << fitness;
                         }
                     });

    if (!service.loadNetwork(sampleStations(), sampleSegments())) {
        qCritical() << "CRITICAL: Sample network failed to load";
        return 1;
    }

    QList<Schedule::Train> existing = {
        makeTrain(101, "IC 101", 8, Schedule::referenceTime(7, 0), {"ALT", "BRK", "CAS", "DOR"}),
        makeTrain(205, "RB 205", 4, Schedule::referenceTime(7, 20), {"ELM", "CAS", "BRK", "ALT"})
    };

    QList<Schedule::Train> fleet = existing;
    DetectionResult detection = service.detectConflicts(fleet);
    qDebug() << "Existing fleet:" << detection.conflicts.size() << "conflicts";
    logConflicts(detection.conflicts);

    QList<Schedule::Train> locallyResolved = existing;
    Resolution::LocalResolutionResult local = service.resolveLocally(locallyResolved);
    qDebug() << "Local resolution:" << resolverStateToString(local.state) << "after" << local.iterations
             << "iterations," << local.remainingConflicts.size() << "remaining";

    QList<Schedule::Train> newTrains = {
        makeTrain(310, "RE 310", 6, Schedule::referenceTime(7, 5), {"ALT", "BRK", "CAS", "ELM"}),
        makeTrain(412, "RB 412", 3, Schedule::referenceTime(7, 30), {"DOR", "CAS", "BRK"})
    };

    QList<Schedule::Train> combined = existing + newTrains;
    qDebug().noquote() << service.generateConflictReport(combined);

    for (const Schedule::Hotspot& hotspot : service.analyzeHotspots(combined)) {
        qDebug() << "Hotspot:" << hotspot.locationName << Schedule::conflictTypeToString(hotspot.type)
                 << hotspot.conflictCount;
    }

    Resolution::PipelineResult result = service.executePipeline(newTrains, existing, config.oracle.enabled);
    qDebug() << "Pipeline:" << result.baselineConflictCount << "->" << result.finalConflictCount << "conflicts,"
             << result.departureShiftsApplied << "departure shifts, optimizer"
             << optimizerStatusToString(result.optimizerStatus);
    if (!result.oracleError.isEmpty()) {
        qWarning() << "Oracle:" << result.oracleErrorCode << result.oracleError;
    }
    logConflicts(result.displayedResiduals);

    for (const Schedule::Train& train : result.refinedNewTrains) {
        qDebug() << "  " << train.name << "departs" << train.departureTime.time().toString("HH:mm:ss")
                 << "delay" << train.totalDelayMinutes << "min";
    }

    qDebug() << "Telemetry:" << service.telemetry()->allStageStatistics();
    return result.completed ? 0 : 2;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("railplan_demo");

    QCommandLineParser parser;
    parser.setApplicationDescription("Timetable propagation and conflict resolution demo");
    parser.addHelpOption();
    parser.addPositionalArgument("config", "Scheduler configuration JSON", "[config]");
    parser.process(app);

    Config::SchedulerConfig config;
    const QStringList args = parser.positionalArguments();
    const QString configPath = args.isEmpty() ? QString("resources/scheduler_config.json") : args.first();

    Config::ConfigLoadResult loaded = Config::SchedulerConfigLoader::loadFromFile(configPath);
    if (loaded.success) {
        config = loaded.config;
        qDebug() << "Configuration loaded from" << configPath;
    } else {
        for (const QString& error : loaded.validationErrors) {
            qWarning() << "Config:" << error;
        }
        if (!loaded.validationErrors.isEmpty()) {
            qCritical() << "Configuration rejected, aborting";
            return 1;
        }
        qWarning() << "Using built-in defaults:" << loaded.error;
        Config::SchedulerConfigLoader::applyEnvironmentOverrides(config);
    }

    int exitCode = 0;
    QTimer::singleShot(0, &app, [&app, &exitCode, config]() {
        exitCode = runDemo(config);
        app.exit(exitCode);
    });

    app.exec();
    return exitCode;
}
