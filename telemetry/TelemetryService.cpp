#include "TelemetryService.h"
#include <QSet>
#include <QtMath>
#include <algorithm>

namespace RailPlan::Telemetry {

TelemetryService::TelemetryService(QObject* parent)
    : QObject(parent)
{
    m_thresholds[OP_PROPAGATION] = 50.0;
    m_thresholds[OP_CONFLICT_DETECTION] = 50.0;
    m_thresholds[OP_LOCAL_RESOLUTION] = 500.0;
    m_thresholds[OP_DEPARTURE_SEARCH] = 2000.0;
    m_thresholds[OP_ORACLE_ROUNDTRIP] = 30000.0;
    m_thresholds[OP_GENETIC_OPTIMIZATION] = 10000.0;
    m_thresholds[OP_PIPELINE] = 60000.0;
}

void TelemetryService::setEnabled(bool enabled) {
    if (m_enabled == enabled) {
        return;
    }
    m_enabled = enabled;
    emit enabledChanged();
}

int TelemetryService::beginRun() {
    const int runId = m_nextRunId++;
    m_openRuns.insert(runId, QDateTime::currentDateTime());
    return runId;
}

void TelemetryService::finishRun(int runId, bool success) {
    auto it = m_openRuns.find(runId);
    if (it == m_openRuns.end()) {
        qWarning() << "[TelemetryService > finishRun] Unknown or already finished run" << runId;
        return;
    }
    const double totalMs = it.value().msecsTo(QDateTime::currentDateTime());
    m_openRuns.erase(it);

    m_completedRuns++;
    if (!success) {
        m_failedRuns++;
    }
    emit runFinished(runId, success, totalMs);
}

void TelemetryService::recordStageTiming(const QString& stage, double durationMs, bool success, int runId) {
    if (!m_enabled) {
        return;
    }

    m_samples.push_back(StageSample{stage, durationMs, success, runId, QDateTime::currentDateTime()});
    if (m_samples.size() > MAX_STAGE_SAMPLES) {
        m_samples.pop_front();
    }

    const double threshold = m_thresholds.value(stage, 0.0);
    if (threshold > 0.0 && durationMs > threshold) {
        m_thresholdViolations++;
        qWarning() << "[TelemetryService > recordStageTiming]" << stage << "took" << durationMs
                   << "ms (threshold:" << threshold << "ms)";
        emit performanceThresholdExceeded(stage, durationMs, threshold);
    }

    emit metricsUpdated();
}

void TelemetryService::recordCounter(const QString& name, double value) {
    if (!m_enabled) {
        return;
    }

    CounterStats& stats = m_counters[name];
    stats.last = value;
    stats.total += value;
    stats.max = stats.samples == 0 ? value : std::max(stats.max, value);
    stats.samples++;
    emit metricsUpdated();
}

void TelemetryService::setStageThreshold(const QString& stage, double thresholdMs) {
    m_thresholds[stage] = thresholdMs;
}

QVariantMap TelemetryService::stageStatistics(const QString& stage) const {
    QList<double> durations;
    int failures = 0;
    const double threshold = m_thresholds.value(stage, 0.0);
    int slowSamples = 0;

    for (const StageSample& sample : m_samples) {
        if (sample.stage != stage) {
            continue;
        }
        durations.append(sample.durationMs);
        if (!sample.success) failures++;
        if (threshold > 0.0 && sample.durationMs > threshold) slowSamples++;
    }

    QVariantMap stats{
        {"stage", stage},
        {"count", durations.size()},
        {"failures", failures},
        {"thresholdMs", threshold},
        {"slowSamples", slowSamples}
    };
    if (durations.isEmpty()) {
        return stats;
    }

    std::sort(durations.begin(), durations.end());
    double sum = 0.0;
    for (double duration : durations) {
        sum += duration;
    }
    stats["averageMs"] = sum / durations.size();
    stats["maxMs"] = durations.last();
    stats["p95Ms"] = durations[std::max(0, qCeil(durations.size() * 0.95) - 1)];
    return stats;
}

QVariantMap TelemetryService::allStageStatistics() const {
    QSet<QString> stages;
    for (const StageSample& sample : m_samples) {
        stages.insert(sample.stage);
    }

    QVariantMap all;
    for (const QString& stage : stages) {
        all[stage] = stageStatistics(stage);
    }
    return all;
}

QVariantMap TelemetryService::runBreakdown(int runId) const {
    QVariantMap breakdown;
    for (const StageSample& sample : m_samples) {
        if (sample.runId == runId) {
            breakdown[sample.stage] = breakdown.value(sample.stage, 0.0).toDouble() + sample.durationMs;
        }
    }
    return breakdown;
}

QVariantMap TelemetryService::counters() const {
    QVariantMap result;
    for (auto it = m_counters.constBegin(); it != m_counters.constEnd(); ++it) {
        result[it.key()] = QVariantMap{
            {"last", it.value().last},
            {"total", it.value().total},
            {"max", it.value().max},
            {"samples", it.value().samples}
        };
    }
    return result;
}

QVariantMap TelemetryService::getLiveMetrics() const {
    return QVariantMap{
        {"enabled", m_enabled},
        {"completedRuns", m_completedRuns},
        {"failedRuns", m_failedRuns},
        {"openRuns", m_openRuns.size()},
        {"stageSamples", static_cast<int>(m_samples.size())},
        {"thresholdViolations", m_thresholdViolations}
    };
}

void TelemetryService::clear() {
    m_samples.clear();
    m_counters.clear();
    m_completedRuns = 0;
    m_failedRuns = 0;
    m_thresholdViolations = 0;
    emit metricsUpdated();
}

} // namespace RailPlan::Telemetry
