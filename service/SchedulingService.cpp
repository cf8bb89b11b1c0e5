#include "SchedulingService.h"
#include "../core/ErrorCodes.h"
#include "../oracle/HttpOracleClient.h"
#include <QElapsedTimer>
#include <QDebug>

namespace RailPlan {

using Schedule::Train;

SchedulingService::SchedulingService(const Config::SchedulerConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_graph(new Network::GraphService(this))
    , m_telemetry(new Telemetry::TelemetryService(this))
    , m_propagator(std::make_unique<Schedule::TimetablePropagator>(m_graph))
    , m_detector(std::make_unique<Schedule::ConflictDetector>(m_graph))
    , m_resolver(std::make_unique<Resolution::PriorityResolver>(m_propagator.get(), m_detector.get(), config.resolver))
    , m_pipeline(new Resolution::ResolutionPipeline(m_propagator.get(), m_detector.get(), config, m_telemetry, this))
{
    if (m_config.oracle.enabled) {
        auto client = std::make_shared<Oracle::HttpOracleClient>(m_config.oracle);
        if (client->isConfigured()) {
            m_pipeline->setOracle(client);
            qDebug() << "[SchedulingService] Oracle client configured for" << m_config.oracle.endpoint;
        } else {
            qWarning() << "[SchedulingService] Oracle enabled but endpoint is unusable:" << m_config.oracle.endpoint;
        }
    }

    connect(m_graph, &Network::GraphService::graphLoadError, this, [](const QString& error) {
        qWarning() << "[SchedulingService] Network rejected:" << error;
    });
}

SchedulingService::~SchedulingService() {
    // The pipeline keeps raw pointers to the engines below
    delete m_pipeline;
    m_pipeline = nullptr;
}

void SchedulingService::setOperational(bool operational) {
    if (m_isOperational == operational) {
        return;
    }
    m_isOperational = operational;
    emit operationalStateChanged();
}

bool SchedulingService::loadNetwork(const QList<Network::Station>& stations, const QList<Network::TrackSegment>& segments) {
    m_propagator->clearPathCache();
    bool loaded = m_graph->loadGraph(stations, segments);
    if (loaded) {
        qDebug() << "[SchedulingService > loadNetwork] Network loaded:" << m_graph->totalStations()
                 << "stations," << m_graph->totalSegments() << "segments";
    }

    setOperational(loaded);
    return loaded;
}

void SchedulingService::setOracle(std::shared_ptr<Oracle::OptimizationOracle> oracle) {
    m_pipeline->setOracle(std::move(oracle));
}

Schedule::FleetRefreshResult SchedulingService::refreshSchedules(QList<Train>& trains) {
    QElapsedTimer timer;
    timer.start();

    Schedule::FleetRefreshResult result;
    try {
        result = m_propagator->refreshSchedules(trains);
    } catch (const std::exception& e) {
        qCritical() << "[SchedulingService > refreshSchedules] Unexpected failure:" << e.what();
        for (const Train& train : trains) {
            result.failures.append(Schedule::PropagationFailure{train.id, train.name, ErrorCode::INTERNAL_ERROR, e.what()});
        }
    }

    m_telemetry->recordStageTiming(Telemetry::TelemetryService::OP_PROPAGATION, timer.elapsed(), result.allSucceeded());
    return result;
}

DetectionResult SchedulingService::detectConflicts(QList<Train>& trains) {
    DetectionResult result;

    Schedule::FleetRefreshResult refreshed = refreshSchedules(trains);
    result.failures = refreshed.failures;

    QElapsedTimer timer;
    timer.start();

    try {
        result.conflicts = m_detector->detect(refreshed.timetables);
        Schedule::ConflictDetector::sortConflicts(result.conflicts);
        result.success = true;
    } catch (const std::exception& e) {
        result.errorCode = ErrorCode::INTERNAL_ERROR;
        result.error = QString("Conflict detection failed: %1").arg(e.what());
        qCritical() << "[SchedulingService > detectConflicts]" << result.error;
    }

    m_telemetry->recordStageTiming(Telemetry::TelemetryService::OP_CONFLICT_DETECTION, timer.elapsed(), result.success);
    m_lastConflictCount = result.conflicts.size();
    emit conflictsDetected(m_lastConflictCount);
    return result;
}

Resolution::LocalResolutionResult SchedulingService::resolveLocally(
    QList<Train>& trains,
    const Resolution::CancellationToken* cancel
) {
    QElapsedTimer timer;
    timer.start();

    Resolution::LocalResolutionResult result;
    try {
        result = m_resolver->resolve(trains, cancel);
    } catch (const std::exception& e) {
        result.errorCode = ErrorCode::INTERNAL_ERROR;
        result.error = QString("Local resolution failed: %1").arg(e.what());
        qCritical() << "[SchedulingService > resolveLocally]" << result.error;
    }

    m_telemetry->recordStageTiming(Telemetry::TelemetryService::OP_LOCAL_RESOLUTION, timer.elapsed(), result.success);
    m_telemetry->recordCounter("local_resolution_iterations", result.iterations);
    return result;
}

Resolution::PipelineResult SchedulingService::executePipeline(
    const QList<Train>& newTrains,
    const QList<Train>& existingTrains,
    bool useOracle,
    const Resolution::CancellationToken* cancel
) {
    Resolution::PipelineOptions options;
    options.useOracle = useOracle;

    Resolution::PipelineResult result;
    try {
        result = m_pipeline->execute(newTrains, existingTrains, options, cancel);
    } catch (const std::exception& e) {
        result.trains = existingTrains;
        result.refinedNewTrains = newTrains;
        result.errorCode = ErrorCode::INTERNAL_ERROR;
        result.error = QString("Pipeline failed: %1").arg(e.what());
        qCritical() << "[SchedulingService > executePipeline]" << result.error;
    }

    if (result.completed) {
        m_lastConflictCount = result.finalConflictCount;
        emit conflictsDetected(m_lastConflictCount);
    }
    emit pipelineFinished(result.success, result.finalConflictCount);
    return result;
}

QString SchedulingService::generateConflictReport(QList<Train>& trains) {
    DetectionResult detection = detectConflicts(trains);
    if (!detection.success) {
        return QString("Conflict report unavailable: %1").arg(detection.error);
    }
    return Schedule::ConflictDetector::generateConflictReport(detection.conflicts);
}

QList<Schedule::Hotspot> SchedulingService::analyzeHotspots(QList<Train>& trains) {
    DetectionResult detection = detectConflicts(trains);
    return Schedule::ConflictDetector::analyzeHotspots(detection.conflicts);
}

QVariantMap SchedulingService::getStatistics() const {
    return QVariantMap{
        {"isOperational", m_isOperational},
        {"lastConflictCount", m_lastConflictCount},
        {"oracleAttached", m_pipeline && m_pipeline->hasOracle()},
        {"graph", m_graph->getGraphStatistics()},
        {"telemetry", m_telemetry->getLiveMetrics()},
        {"config", m_config.toVariantMap()}
    };
}

} // namespace RailPlan
