#pragma once

#include "CancellationToken.h"
#include "GeneticOptimizer.h"
#include "TrainAdjustment.h"
#include "../schedule/TimetablePropagator.h"
#include "../schedule/ConflictDetector.h"
#include "../config/SchedulerConfig.h"
#include "../oracle/OptimizationOracle.h"
#include <QObject>
#include <QStringList>
#include <atomic>
#include <memory>

namespace RailPlan::Telemetry {
class TelemetryService;
}

namespace RailPlan::Resolution {

struct PipelineOptions {
    bool useOracle = false;
    int refinementGenerations = -1;         // < 0 uses the configured value
};

struct PipelineResult {
    bool success = false;                   // no residual conflicts
    bool completed = false;                 // every stage ran
    bool cancelled = false;
    QString errorCode;
    QString error;

    QList<Schedule::Train> trains;          // existing fleet followed by the refined new trains
    QList<Schedule::Train> refinedNewTrains;

    int baselineConflictCount = 0;
    int finalConflictCount = 0;
    QList<Schedule::Conflict> residualConflicts;
    QList<Schedule::Conflict> displayedResiduals;

    int departureShiftsApplied = 0;
    bool oracleConsulted = false;
    bool oracleApplied = false;
    bool oracleRolledBack = false;
    int oracleResolutionsAccepted = 0;
    QString oracleErrorCode;
    QString oracleError;

    OptimizerStatus optimizerStatus = OptimizerStatus::IDLE;
    int optimizerGenerations = 0;

    QList<Schedule::PropagationFailure> failures;
    QStringList stageLog;
    int runId = 0;                          // telemetry run, 0 without telemetry

    QVariantMap toVariantMap() const;
};

/*
 * Full resolution cycle for a batch of new trains against an existing fleet:
 * reset, baseline, departure search, oracle, genetic refinement, verification, merge.
 * The existing fleet is never modified. One run at a time per instance.
 */
class ResolutionPipeline : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool isRunning READ isRunning NOTIFY runningChanged)

public:
    ResolutionPipeline(
        const Schedule::TimetablePropagator* propagator,
        const Schedule::ConflictDetector* detector,
        const Config::SchedulerConfig& config,
        Telemetry::TelemetryService* telemetry = nullptr,
        QObject* parent = nullptr
    );
    ~ResolutionPipeline();

    void setOracle(std::shared_ptr<Oracle::OptimizationOracle> oracle) { m_oracle = std::move(oracle); }
    bool hasOracle() const { return static_cast<bool>(m_oracle); }

    PipelineResult execute(
        const QList<Schedule::Train>& newTrains,
        const QList<Schedule::Train>& existingTrains,
        const PipelineOptions& options = PipelineOptions(),
        const CancellationToken* cancel = nullptr
    );

    bool isRunning() const { return m_running.load(); }
    GeneticOptimizer* optimizer() const { return m_optimizer; }

signals:
    void runningChanged();
    void stageChanged(const QString& stage);
    void residualConflictsReported(int count, const QStringList& descriptions);

private:
    struct FleetState {
        QList<Schedule::Timetable> existingTimetables;
        QList<Schedule::Timetable> newTimetables;
        QList<Schedule::Conflict> conflicts;
    };

    QString validateInput(const QList<Schedule::Train>& newTrains, const QList<Schedule::Train>& existingTrains) const;
    FleetState evaluateFleet(
        const QList<Schedule::Timetable>& existingTimetables,
        QList<Schedule::Train>& newTrains,
        QList<Schedule::PropagationFailure>* failures = nullptr
    ) const;

    int runDepartureSearch(
        QList<Schedule::Train>& newTrains,
        const QList<Schedule::Timetable>& existingTimetables,
        const CancellationToken* cancel
    ) const;

    void runOracleStage(
        QList<Schedule::Train>& newTrains,
        const QList<Schedule::Train>& existingTrains,
        const QList<Schedule::Timetable>& existingTimetables,
        PipelineResult& result,
        const CancellationToken* cancel
    );

    bool checkCancelled(const CancellationToken* cancel, const QString& stage, PipelineResult& result,
                        const QList<Schedule::Train>& newTrains, const QList<Schedule::Train>& existingTrains) const;
    void enterStage(const QString& stage, PipelineResult& result);
    void recordStage(const char* operation, qint64 elapsedMs, bool success) const;
    void finishRun(const char* operation, qint64 elapsedMs, bool success);

    static int conflictsInvolving(const QList<Schedule::Conflict>& conflicts, const QUuid& trainId);

    const Schedule::TimetablePropagator* m_propagator;
    const Schedule::ConflictDetector* m_detector;
    Config::SchedulerConfig m_config;
    Telemetry::TelemetryService* m_telemetry;
    GeneticOptimizer* m_optimizer;
    std::shared_ptr<Oracle::OptimizationOracle> m_oracle;

    std::atomic_bool m_running{false};
    int m_runId = 0;
};

} // namespace RailPlan::Resolution
