#pragma once

#include <QObject>
#include <QVariantMap>
#include <QString>
#include <QStringList>
#include <QHash>
#include <QDateTime>
#include <QDebug>
#include <deque>

namespace RailPlan::Telemetry {

struct StageSample {
    QString stage;
    double durationMs = 0.0;
    bool success = true;
    int runId = 0;              // 0 = outside a pipeline run
    QDateTime recordedAt;
};

struct CounterStats {
    double last = 0.0;
    double total = 0.0;
    double max = 0.0;
    int samples = 0;
};

/*
 * Stage timings for scheduling work. Pipeline runs open a run id so one run's
 * stages can be read back together; stand-alone calls record with run id 0.
 */
class TelemetryService : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool enabled READ isEnabled WRITE setEnabled NOTIFY enabledChanged)
    Q_PROPERTY(int completedRuns READ completedRuns NOTIFY runFinished)

public:
    explicit TelemetryService(QObject* parent = nullptr);

    bool isEnabled() const { return m_enabled; }
    void setEnabled(bool enabled);
    int completedRuns() const { return m_completedRuns; }

    int beginRun();
    void finishRun(int runId, bool success);

    void recordStageTiming(const QString& stage, double durationMs, bool success = true, int runId = 0);
    void recordCounter(const QString& name, double value);

    void setStageThreshold(const QString& stage, double thresholdMs);
    double stageThreshold(const QString& stage) const { return m_thresholds.value(stage, 0.0); }

    // count, averageMs, maxMs, p95Ms, failures, thresholdMs, slowSamples
    QVariantMap stageStatistics(const QString& stage) const;
    QVariantMap allStageStatistics() const;
    // stage -> summed milliseconds for one run
    QVariantMap runBreakdown(int runId) const;
    QVariantMap counters() const;
    QVariantMap getLiveMetrics() const;

    void clear();

    static constexpr const char* OP_PROPAGATION = "propagation";
    static constexpr const char* OP_CONFLICT_DETECTION = "conflict_detection";
    static constexpr const char* OP_LOCAL_RESOLUTION = "local_resolution";
    static constexpr const char* OP_DEPARTURE_SEARCH = "departure_search";
    static constexpr const char* OP_ORACLE_ROUNDTRIP = "oracle_roundtrip";
    static constexpr const char* OP_GENETIC_OPTIMIZATION = "genetic_optimization";
    static constexpr const char* OP_PIPELINE = "pipeline";

signals:
    void enabledChanged();
    void metricsUpdated();
    void performanceThresholdExceeded(const QString& stage, double durationMs, double thresholdMs);
    void runFinished(int runId, bool success, double totalMs);

private:
    bool m_enabled = true;

    std::deque<StageSample> m_samples;
    QHash<QString, CounterStats> m_counters;
    QHash<QString, double> m_thresholds;
    QHash<int, QDateTime> m_openRuns;

    int m_nextRunId = 1;
    int m_completedRuns = 0;
    int m_failedRuns = 0;
    int m_thresholdViolations = 0;

    static constexpr int MAX_STAGE_SAMPLES = 5000;
};

} // namespace RailPlan::Telemetry
