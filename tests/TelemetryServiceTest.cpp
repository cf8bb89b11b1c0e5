#include "telemetry/TelemetryService.h"
#include <gtest/gtest.h>

using RailPlan::Telemetry::TelemetryService;

TEST(TelemetryServiceTest, SlowStageRaisesThresholdSignal) {
    TelemetryService telemetry;
    telemetry.setStageThreshold("propagation", 10.0);

    QString reported;
    QObject::connect(&telemetry, &TelemetryService::performanceThresholdExceeded,
                     [&reported](const QString& stage, double, double) { reported = stage; });

    telemetry.recordStageTiming("propagation", 4.0);
    EXPECT_TRUE(reported.isEmpty());

    telemetry.recordStageTiming("propagation", 25.0, false);
    EXPECT_EQ(reported, "propagation");

    QVariantMap stats = telemetry.stageStatistics("propagation");
    EXPECT_EQ(stats["count"].toInt(), 2);
    EXPECT_EQ(stats["failures"].toInt(), 1);
    EXPECT_EQ(stats["slowSamples"].toInt(), 1);
    EXPECT_DOUBLE_EQ(stats["maxMs"].toDouble(), 25.0);
    EXPECT_DOUBLE_EQ(stats["averageMs"].toDouble(), 14.5);
    EXPECT_EQ(telemetry.getLiveMetrics()["thresholdViolations"].toInt(), 1);
}

TEST(TelemetryServiceTest, RunBreakdownSumsStagesOfOneRun) {
    TelemetryService telemetry;

    const int first = telemetry.beginRun();
    const int second = telemetry.beginRun();
    EXPECT_NE(first, second);

    telemetry.recordStageTiming("conflict_detection", 3.0, true, first);
    telemetry.recordStageTiming("conflict_detection", 2.0, true, first);
    telemetry.recordStageTiming("genetic_optimization", 40.0, true, second);
    telemetry.recordStageTiming("conflict_detection", 9.0);

    QVariantMap breakdown = telemetry.runBreakdown(first);
    ASSERT_EQ(breakdown.size(), 1);
    EXPECT_DOUBLE_EQ(breakdown["conflict_detection"].toDouble(), 5.0);

    bool finishedOk = false;
    QObject::connect(&telemetry, &TelemetryService::runFinished,
                     [&finishedOk](int, bool success, double) { finishedOk = success; });

    telemetry.finishRun(first, true);
    telemetry.finishRun(second, false);
    telemetry.finishRun(second, true);   // already closed, ignored

    EXPECT_FALSE(finishedOk);
    EXPECT_EQ(telemetry.completedRuns(), 2);
    EXPECT_EQ(telemetry.getLiveMetrics()["failedRuns"].toInt(), 1);
}

TEST(TelemetryServiceTest, CountersTrackLastTotalAndMax) {
    TelemetryService telemetry;
    telemetry.recordCounter("pipeline_residual_conflicts", 4);
    telemetry.recordCounter("pipeline_residual_conflicts", 1);

    QVariantMap counter = telemetry.counters()["pipeline_residual_conflicts"].toMap();
    EXPECT_DOUBLE_EQ(counter["last"].toDouble(), 1.0);
    EXPECT_DOUBLE_EQ(counter["total"].toDouble(), 5.0);
    EXPECT_DOUBLE_EQ(counter["max"].toDouble(), 4.0);
    EXPECT_EQ(counter["samples"].toInt(), 2);
}

TEST(TelemetryServiceTest, DisabledServiceRecordsNothing) {
    TelemetryService telemetry;
    telemetry.setEnabled(false);

    telemetry.recordStageTiming("pipeline", 1.0);
    telemetry.recordCounter("local_resolution_iterations", 3);

    EXPECT_EQ(telemetry.stageStatistics("pipeline")["count"].toInt(), 0);
    EXPECT_TRUE(telemetry.counters().isEmpty());
    EXPECT_TRUE(telemetry.allStageStatistics().isEmpty());
}
