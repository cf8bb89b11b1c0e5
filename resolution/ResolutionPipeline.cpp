#include "ResolutionPipeline.h"
#include "../core/ErrorCodes.h"
#include "../telemetry/TelemetryService.h"
#include <QElapsedTimer>
#include <QSet>
#include <QVariantList>
#include <QDebug>

namespace RailPlan::Resolution {

using Schedule::Conflict;
using Schedule::PropagationFailure;
using Schedule::PropagationResult;
using Schedule::Timetable;
using Schedule::Train;

namespace {

// Keeps m_running true for the duration of one execute() call; listeners
// notified on the way out already see the run as finished
class RunningGuard {
public:
    RunningGuard(ResolutionPipeline* pipeline, std::atomic_bool& flag)
        : m_pipeline(pipeline), m_flag(flag)
    {
        emit m_pipeline->runningChanged();
    }

    ~RunningGuard() {
        m_flag.store(false);
        emit m_pipeline->runningChanged();
    }

private:
    ResolutionPipeline* m_pipeline;
    std::atomic_bool& m_flag;
};

QList<Conflict> conflictsInvolvingAny(const QList<Conflict>& conflicts, const QSet<QUuid>& trainIds) {
    QList<Conflict> involved;
    for (const Conflict& conflict : conflicts) {
        if (trainIds.contains(conflict.first.trainId) || trainIds.contains(conflict.second.trainId)) {
            involved.append(conflict);
        }
    }
    return involved;
}

} // namespace

QVariantMap PipelineResult::toVariantMap() const {
    QVariantList residuals;
    for (const Conflict& conflict : residualConflicts) {
        residuals.append(conflict.toVariantMap());
    }

    QVariantList failed;
    for (const PropagationFailure& failure : failures) {
        failed.append(QVariantMap{
            {"trainId", failure.trainId.toString(QUuid::WithoutBraces)},
            {"trainName", failure.trainName},
            {"errorCode", failure.errorCode},
            {"error", failure.error}
        });
    }

    return QVariantMap{
        {"success", success},
        {"completed", completed},
        {"cancelled", cancelled},
        {"errorCode", errorCode},
        {"error", error},
        {"baselineConflictCount", baselineConflictCount},
        {"finalConflictCount", finalConflictCount},
        {"residualConflicts", residuals},
        {"departureShiftsApplied", departureShiftsApplied},
        {"oracleConsulted", oracleConsulted},
        {"oracleApplied", oracleApplied},
        {"oracleRolledBack", oracleRolledBack},
        {"oracleResolutionsAccepted", oracleResolutionsAccepted},
        {"oracleErrorCode", oracleErrorCode},
        {"oracleError", oracleError},
        {"optimizerStatus", optimizerStatusToString(optimizerStatus)},
        {"optimizerGenerations", optimizerGenerations},
        {"failures", failed},
        {"stages", stageLog},
        {"trainCount", trains.size()}
    };
}

ResolutionPipeline::ResolutionPipeline(
    const Schedule::TimetablePropagator* propagator,
    const Schedule::ConflictDetector* detector,
    const Config::SchedulerConfig& config,
    Telemetry::TelemetryService* telemetry,
    QObject* parent
)
    : QObject(parent)
    , m_propagator(propagator)
    , m_detector(detector)
    , m_config(config)
    , m_telemetry(telemetry)
    , m_optimizer(new GeneticOptimizer(propagator, *detector, config.optimizer, this))
{
}

ResolutionPipeline::~ResolutionPipeline() = default;

int ResolutionPipeline::conflictsInvolving(const QList<Conflict>& conflicts, const QUuid& trainId) {
    int count = 0;
    for (const Conflict& conflict : conflicts) {
        if (conflict.involves(trainId)) {
            count++;
        }
    }
    return count;
}

void ResolutionPipeline::enterStage(const QString& stage, PipelineResult& result) {
    result.stageLog.append(stage);
    qDebug() << "[ResolutionPipeline > execute] Stage:" << stage;
    emit stageChanged(stage);
}

void ResolutionPipeline::recordStage(const char* operation, qint64 elapsedMs, bool success) const {
    if (m_telemetry) {
        m_telemetry->recordStageTiming(operation, static_cast<double>(elapsedMs), success, m_runId);
    }
}

void ResolutionPipeline::finishRun(const char* operation, qint64 elapsedMs, bool success) {
    recordStage(operation, elapsedMs, success);
    if (m_telemetry && m_runId > 0) {
        m_telemetry->finishRun(m_runId, success);
    }
    m_runId = 0;
}

bool ResolutionPipeline::checkCancelled(
    const CancellationToken* cancel,
    const QString& stage,
    PipelineResult& result,
    const QList<Train>& newTrains,
    const QList<Train>& existingTrains
) const {
    if (!cancel || !cancel->isCancelled()) {
        return false;
    }

    // All or nothing: nothing from this batch is merged
    result.cancelled = true;
    result.completed = false;
    result.success = false;
    result.errorCode = ErrorCode::CANCELLED;
    result.error = QString("Pipeline cancelled during %1").arg(stage);
    result.trains = existingTrains;
    result.refinedNewTrains = newTrains;
    qDebug() << "[ResolutionPipeline > execute]" << result.error;
    return true;
}

QString ResolutionPipeline::validateInput(const QList<Train>& newTrains, const QList<Train>& existingTrains) const {
    QSet<QUuid> seen;
    for (const Train& train : existingTrains) {
        if (seen.contains(train.id)) {
            return QString("Duplicate train id %1 in existing fleet").arg(train.id.toString(QUuid::WithoutBraces));
        }
        seen.insert(train.id);
    }

    for (const Train& train : newTrains) {
        if (seen.contains(train.id)) {
            return QString("Duplicate train id %1 (%2)").arg(train.id.toString(QUuid::WithoutBraces), train.name);
        }
        seen.insert(train.id);

        if (train.stops.size() < 2) {
            return QString("Train %1 has fewer than two stops").arg(train.name);
        }
        if (!train.departureTime.isValid()) {
            return QString("Train %1 has no departure time").arg(train.name);
        }
    }
    return QString();
}

ResolutionPipeline::FleetState ResolutionPipeline::evaluateFleet(
    const QList<Timetable>& existingTimetables,
    QList<Train>& newTrains,
    QList<PropagationFailure>* failures
) const {
    FleetState state;
    state.existingTimetables = existingTimetables;

    for (Train& train : newTrains) {
        PropagationResult propagated = m_propagator->propagate(train);
        if (propagated.success) {
            state.newTimetables.append(propagated.timetable);
        } else if (failures) {
            failures->append(PropagationFailure{train.id, train.name, propagated.errorCode, propagated.error});
        }
    }

    QList<Timetable> all = state.existingTimetables;
    all.append(state.newTimetables);
    state.conflicts = m_detector->detect(all);
    return state;
}

int ResolutionPipeline::runDepartureSearch(
    QList<Train>& newTrains,
    const QList<Timetable>& existingTimetables,
    const CancellationToken* cancel
) const {
    const QList<int> candidates = m_config.departureShiftCandidates();
    int shiftsApplied = 0;

    for (int i = 0; i < newTrains.size(); ++i) {
        if (cancel && cancel->isCancelled()) {
            break;
        }

        FleetState state = evaluateFleet(existingTimetables, newTrains);
        const QUuid trainId = newTrains[i].id;
        if (conflictsInvolving(state.conflicts, trainId) == 0) {
            continue;
        }

        // Everything except the train under search stays where it is
        QList<Timetable> others = state.existingTimetables;
        for (const Timetable& timetable : state.newTimetables) {
            if (timetable.trainId != trainId) {
                others.append(timetable);
            }
        }

        for (int shift : candidates) {
            Train candidate = newTrains[i];
            // Pinned entries travel with the shift
            candidate.shiftDeparture(shift);

            PropagationResult propagated = m_propagator->propagate(candidate);
            if (!propagated.success) {
                continue;
            }

            QList<Timetable> trial = others;
            trial.append(propagated.timetable);
            if (conflictsInvolving(m_detector->detect(trial), trainId) == 0) {
                candidate.totalDelayMinutes += shift;
                newTrains[i] = candidate;
                shiftsApplied++;
                qDebug() << "[ResolutionPipeline > runDepartureSearch]" << candidate.name
                         << "shifted by" << shift << "min";
                break;
            }
        }
    }

    return shiftsApplied;
}

void ResolutionPipeline::runOracleStage(
    QList<Train>& newTrains,
    const QList<Train>& existingTrains,
    const QList<Timetable>& existingTimetables,
    PipelineResult& result,
    const CancellationToken* cancel
) {
    QElapsedTimer timer;
    timer.start();

    FleetState before = evaluateFleet(existingTimetables, newTrains);

    QList<Train> snapshotTrains = existingTrains;
    snapshotTrains.append(newTrains);
    QList<Timetable> snapshotTimetables = before.existingTimetables;
    snapshotTimetables.append(before.newTimetables);

    Oracle::SnapshotBuilder builder;
    Oracle::OracleRequest request = builder.build(
        *m_propagator->pathService(),
        snapshotTrains,
        snapshotTimetables,
        before.conflicts,
        m_config.oracle.maxIterations,
        m_config.optimizer.maxGenerations,
        m_config.optimizer.populationSize
    );

    result.oracleConsulted = true;
    Oracle::OracleResult response = m_oracle->requestAdjustments(request, m_config.oracle.timeoutMs, cancel);
    recordStage(Telemetry::TelemetryService::OP_ORACLE_ROUNDTRIP, timer.elapsed(), response.success);

    if (!response.success) {
        result.oracleErrorCode = response.errorCode;
        result.oracleError = response.error;
        qWarning() << "[ResolutionPipeline > runOracleStage] Oracle unavailable, continuing with local refinement:"
                   << response.error;
        return;
    }

    QSet<QUuid> newIds;
    for (const Train& train : newTrains) {
        newIds.insert(train.id);
    }

    const QList<Train> backup = newTrains;
    int accepted = 0;

    for (const TrainAdjustment& adjustment : builder.toAdjustments(response.response)) {
        if (adjustment.confidence < m_config.pipeline.oracleConfidenceThreshold) {
            continue;
        }
        // Existing fleet stays untouched
        if (!newIds.contains(adjustment.trainId)) {
            continue;
        }

        for (Train& train : newTrains) {
            if (train.id != adjustment.trainId) {
                continue;
            }
            AdjustmentOutcome outcome = applyAdjustment(train, adjustment, m_propagator->pathService());
            if (outcome.applied) {
                accepted++;
            } else if (!outcome.error.isEmpty()) {
                qWarning() << "[ResolutionPipeline > runOracleStage]" << outcome.error;
            }
            break;
        }
    }

    if (accepted == 0) {
        qDebug() << "[ResolutionPipeline > runOracleStage] No oracle resolution passed the confidence threshold";
        return;
    }

    FleetState after = evaluateFleet(existingTimetables, newTrains);
    const int countBefore = before.conflicts.size();
    const int countAfter = after.conflicts.size();

    if (countAfter > countBefore + m_config.pipeline.oracleRollbackMargin) {
        newTrains = backup;
        result.oracleRolledBack = true;
        qWarning() << "[ResolutionPipeline > runOracleStage] Oracle adjustments rolled back:"
                   << countBefore << "->" << countAfter << "conflicts";
        return;
    }

    result.oracleApplied = true;
    result.oracleResolutionsAccepted = accepted;
    qDebug() << "[ResolutionPipeline > runOracleStage] Applied" << accepted << "oracle resolutions:"
             << countBefore << "->" << countAfter << "conflicts";
}

PipelineResult ResolutionPipeline::execute(
    const QList<Train>& newTrains,
    const QList<Train>& existingTrains,
    const PipelineOptions& options,
    const CancellationToken* cancel
) {
    PipelineResult result;
    result.trains = existingTrains;
    result.refinedNewTrains = newTrains;

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        result.errorCode = ErrorCode::PIPELINE_BUSY;
        result.error = "A resolution run is already in progress";
        qWarning() << "[ResolutionPipeline > execute]" << result.error;
        return result;
    }
    RunningGuard guard(this, m_running);

    QElapsedTimer pipelineTimer;
    pipelineTimer.start();

    if (!m_propagator || !m_detector || !m_propagator->pathService()) {
        result.errorCode = ErrorCode::INTERNAL_ERROR;
        result.error = "Pipeline is missing its propagator or detector";
        qCritical() << "[ResolutionPipeline > execute]" << result.error;
        return result;
    }

    const QString validationError = validateInput(newTrains, existingTrains);
    if (!validationError.isEmpty()) {
        result.errorCode = ErrorCode::INVALID_INPUT;
        result.error = validationError;
        qWarning() << "[ResolutionPipeline > execute]" << result.error;
        return result;
    }

    m_runId = m_telemetry ? m_telemetry->beginRun() : 0;
    result.runId = m_runId;

    auto finishCancelled = [&](const QString& stage) {
        bool cancelled = checkCancelled(cancel, stage, result, newTrains, existingTrains);
        if (cancelled) {
            finishRun(Telemetry::TelemetryService::OP_PIPELINE, pipelineTimer.elapsed(), false);
        }
        return cancelled;
    };

    if (finishCancelled("reset")) {
        return result;
    }

    // 1. Reset: resolution penalties from earlier runs are discarded
    enterStage("reset", result);
    QList<Train> working = newTrains;
    resetExtraDwell(working);

    // 2. Baseline
    enterStage("baseline", result);
    QElapsedTimer stageTimer;
    stageTimer.start();

    QList<Train> existingCopy = existingTrains;
    Schedule::FleetRefreshResult existingRefresh = m_propagator->refreshSchedules(existingCopy);
    result.failures = existingRefresh.failures;
    const QList<Timetable> existingTimetables = existingRefresh.timetables;

    // Trains that cannot be propagated are reported and left out of the search
    QList<PropagationFailure> newFailures;
    FleetState baseline = evaluateFleet(existingTimetables, working, &newFailures);
    result.failures.append(newFailures);
    result.baselineConflictCount = baseline.conflicts.size();
    recordStage(Telemetry::TelemetryService::OP_CONFLICT_DETECTION, stageTimer.elapsed(), true);

    QSet<QUuid> unpropagatable;
    for (const PropagationFailure& failure : newFailures) {
        unpropagatable.insert(failure.trainId);
    }

    QList<Train> searchable;
    for (const Train& train : working) {
        if (!unpropagatable.contains(train.id)) {
            searchable.append(train);
        }
    }

    QSet<QUuid> newIds;
    for (const Train& train : searchable) {
        newIds.insert(train.id);
    }

    qDebug() << "[ResolutionPipeline > execute] Baseline:" << result.baselineConflictCount << "conflicts,"
             << searchable.size() << "new trains," << existingTimetables.size() << "existing";

    if (finishCancelled("baseline")) {
        return result;
    }

    // 3. Departure search
    if (m_config.pipeline.departureSearchEnabled && !searchable.isEmpty()
        && !conflictsInvolvingAny(baseline.conflicts, newIds).isEmpty()) {
        enterStage("departure_search", result);
        stageTimer.restart();
        result.departureShiftsApplied = runDepartureSearch(searchable, existingTimetables, cancel);
        recordStage(Telemetry::TelemetryService::OP_DEPARTURE_SEARCH, stageTimer.elapsed(), true);

        if (finishCancelled("departure_search")) {
            return result;
        }
    }

    // 4. Oracle
    if (options.useOracle && !searchable.isEmpty()) {
        if (!m_oracle) {
            result.oracleErrorCode = ErrorCode::ORACLE_UNAVAILABLE;
            result.oracleError = "No oracle configured";
            qWarning() << "[ResolutionPipeline > execute]" << result.oracleError;
        } else {
            FleetState current = evaluateFleet(existingTimetables, searchable);
            if (!conflictsInvolvingAny(current.conflicts, newIds).isEmpty()) {
                enterStage("oracle", result);
                runOracleStage(searchable, existingCopy, existingTimetables, result, cancel);
            }
        }

        if (finishCancelled("oracle")) {
            return result;
        }
    }

    // 5. Genetic refinement, disabled by a zero generation budget
    const int generations = options.refinementGenerations < 0
        ? m_config.pipeline.refinementGenerations
        : options.refinementGenerations;
    if (generations > 0 && !searchable.isEmpty()) {
        FleetState current = evaluateFleet(existingTimetables, searchable);
        if (!conflictsInvolvingAny(current.conflicts, newIds).isEmpty()) {
            enterStage("refinement", result);
            stageTimer.restart();

            OptimizationResult optimized = m_optimizer->optimize(searchable, existingTimetables, generations, cancel);
            recordStage(Telemetry::TelemetryService::OP_GENETIC_OPTIMIZATION, stageTimer.elapsed(),
                        optimized.status != OptimizerStatus::CANCELLED);

            result.optimizerStatus = optimized.status;
            result.optimizerGenerations = optimized.generations;

            if (finishCancelled("refinement")) {
                return result;
            }
            const bool searched = optimized.status == OptimizerStatus::CONVERGED
                               || optimized.status == OptimizerStatus::EXHAUSTED;
            if (searched && optimized.failures.isEmpty()) {
                searchable = optimized.trains;
            } else {
                qWarning() << "[ResolutionPipeline > execute] Refinement failed:" << optimized.error;
            }
        }
    }

    // 6. Verify
    enterStage("verify", result);
    FleetState verified = evaluateFleet(existingTimetables, searchable);
    result.residualConflicts = verified.conflicts;
    Schedule::ConflictDetector::sortConflicts(result.residualConflicts);
    result.finalConflictCount = result.residualConflicts.size();
    result.displayedResiduals = result.residualConflicts.mid(0, m_config.pipeline.residualDisplayLimit);

    if (!result.residualConflicts.isEmpty()) {
        QStringList descriptions;
        for (const Conflict& conflict : result.displayedResiduals) {
            descriptions.append(conflict.description());
            qWarning() << "[ResolutionPipeline > execute] Residual:" << conflict.description();
        }
        if (result.residualConflicts.size() > result.displayedResiduals.size()) {
            qWarning() << "[ResolutionPipeline > execute] ..." << result.residualConflicts.size() - result.displayedResiduals.size()
                       << "more residual conflicts";
        }
        emit residualConflictsReported(result.residualConflicts.size(), descriptions);
    }

    if (finishCancelled("verify")) {
        return result;
    }

    // 7. Merge: refined trains replace their inputs, unpropagatable ones are kept as given
    enterStage("merge", result);
    QHash<QUuid, Train> refinedById;
    for (const Train& train : searchable) {
        refinedById.insert(train.id, train);
    }

    QList<Train> refinedNew;
    for (const Train& train : working) {
        refinedNew.append(refinedById.value(train.id, train));
    }

    result.refinedNewTrains = refinedNew;
    result.trains = existingTrains;
    result.trains.append(refinedNew);

    result.completed = true;
    result.success = result.residualConflicts.isEmpty();
    if (!result.success) {
        result.errorCode = ErrorCode::RESOLUTION_EXHAUSTED;
        result.error = QString("%1 conflicts remain after resolution").arg(result.finalConflictCount);
    }

    if (m_telemetry) {
        m_telemetry->recordCounter("pipeline_baseline_conflicts", result.baselineConflictCount);
        m_telemetry->recordCounter("pipeline_residual_conflicts", result.finalConflictCount);
    }
    finishRun(Telemetry::TelemetryService::OP_PIPELINE, pipelineTimer.elapsed(), result.success);

    qDebug() << "[ResolutionPipeline > execute] Completed in" << pipelineTimer.elapsed() << "ms:"
             << result.baselineConflictCount << "->" << result.finalConflictCount << "conflicts";

    return result;
}

} // namespace RailPlan::Resolution
