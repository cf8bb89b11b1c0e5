#pragma once

#include "../config/SchedulerConfig.h"
#include "../network/GraphService.h"
#include "../schedule/TimetablePropagator.h"
#include "../schedule/ConflictDetector.h"
#include "../resolution/PriorityResolver.h"
#include "../resolution/ResolutionPipeline.h"
#include "../telemetry/TelemetryService.h"
#include <QObject>
#include <QVariantMap>
#include <memory>

namespace RailPlan {

struct DetectionResult {
    bool success = false;
    QString errorCode;
    QString error;
    QList<Schedule::Conflict> conflicts;
    QList<Schedule::PropagationFailure> failures;
};

/*
 * Entry point for callers: owns the network graph, the propagation and
 * detection engines and both resolvers, wired from one SchedulerConfig.
 */
class SchedulingService : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool isOperational READ isOperational NOTIFY operationalStateChanged)
    Q_PROPERTY(int lastConflictCount READ lastConflictCount NOTIFY conflictsDetected)

public:
    explicit SchedulingService(const Config::SchedulerConfig& config = Config::SchedulerConfig(), QObject* parent = nullptr);
    ~SchedulingService();

    bool loadNetwork(const QList<Network::Station>& stations, const QList<Network::TrackSegment>& segments);

    // Replaces the oracle built from config.oracle
    void setOracle(std::shared_ptr<Oracle::OptimizationOracle> oracle);

    bool isOperational() const { return m_isOperational; }
    int lastConflictCount() const { return m_lastConflictCount; }

    // === MAIN API ===
    Schedule::FleetRefreshResult refreshSchedules(QList<Schedule::Train>& trains);
    DetectionResult detectConflicts(QList<Schedule::Train>& trains);
    Resolution::LocalResolutionResult resolveLocally(
        QList<Schedule::Train>& trains,
        const Resolution::CancellationToken* cancel = nullptr
    );
    Resolution::PipelineResult executePipeline(
        const QList<Schedule::Train>& newTrains,
        const QList<Schedule::Train>& existingTrains,
        bool useOracle = false,
        const Resolution::CancellationToken* cancel = nullptr
    );

    QString generateConflictReport(QList<Schedule::Train>& trains);
    QList<Schedule::Hotspot> analyzeHotspots(QList<Schedule::Train>& trains);

    Q_INVOKABLE QVariantMap getStatistics() const;

    const Config::SchedulerConfig& config() const { return m_config; }
    Network::GraphService* graph() const { return m_graph; }
    Telemetry::TelemetryService* telemetry() const { return m_telemetry; }
    Resolution::ResolutionPipeline* pipeline() const { return m_pipeline; }

signals:
    void operationalStateChanged();
    void conflictsDetected(int count);
    void pipelineFinished(bool success, int residualConflicts);

private:
    void setOperational(bool operational);

    Config::SchedulerConfig m_config;

    Network::GraphService* m_graph;
    Telemetry::TelemetryService* m_telemetry;
    std::unique_ptr<Schedule::TimetablePropagator> m_propagator;
    std::unique_ptr<Schedule::ConflictDetector> m_detector;
    std::unique_ptr<Resolution::PriorityResolver> m_resolver;
    Resolution::ResolutionPipeline* m_pipeline;

    bool m_isOperational = false;
    int m_lastConflictCount = 0;
};

} // namespace RailPlan
