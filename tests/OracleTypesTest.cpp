#include "oracle/OracleTypes.h"
#include "schedule/TimetablePropagator.h"
#include "schedule/ConflictDetector.h"
#include "TestFixtures.h"
#include <QJsonArray>

using namespace RailPlan::Schedule;
using namespace RailPlan::Oracle;
using RailPlan::Resolution::TrainAdjustment;
using RailPlan::Resolution::applyAdjustment;
using RailPlan::Testing::CorridorTest;
using RailPlan::Testing::makeTrain;

class OracleTypesTest : public CorridorTest {};

TEST(OracleResponseTest, ParsesResolutions) {
    QByteArray payload = R"({
        "success": true,
        "resolutions": [
            {"train_id": 2, "time_adjustment_min": 4.5, "track_assignment": 3,
             "confidence": 0.8, "dwell_delays": [1.0, 0.0]},
            {"train_id": 1, "time_adjustment_min": -2}
        ],
        "total_delay_minutes": 6.5,
        "inference_time_ms": 12.0,
        "conflicts_detected": 3,
        "conflicts_resolved": 2,
        "timestamp": "2026-01-01T00:00:00",
        "ml_confidence": 0.71
    })";

    QString error;
    auto response = OracleResponse::fromJson(payload, &error);
    ASSERT_TRUE(response.has_value()) << error.toStdString();

    EXPECT_TRUE(response->success);
    ASSERT_EQ(response->resolutions.size(), 2);
    EXPECT_EQ(response->resolutions[0].trainId, 2);
    EXPECT_DOUBLE_EQ(response->resolutions[0].timeAdjustmentMin, 4.5);
    ASSERT_TRUE(response->resolutions[0].trackAssignment.has_value());
    EXPECT_EQ(*response->resolutions[0].trackAssignment, 3);
    EXPECT_EQ(response->resolutions[0].dwellDelays.size(), 2);
    EXPECT_FALSE(response->resolutions[1].trackAssignment.has_value());
    EXPECT_DOUBLE_EQ(response->resolutions[1].confidence, 0.0);
    EXPECT_EQ(response->conflictsResolved, 2);
    ASSERT_TRUE(response->mlConfidence.has_value());
    EXPECT_DOUBLE_EQ(*response->mlConfidence, 0.71);
}

TEST(OracleResponseTest, SuccessDefaultsToTrue) {
    auto response = OracleResponse::fromJson(R"({"resolutions": []})");
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response->success);
    EXPECT_FALSE(response->mlConfidence.has_value());
}

TEST(OracleResponseTest, RejectsMalformedPayloads) {
    QString error;
    EXPECT_FALSE(OracleResponse::fromJson("not json", &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    EXPECT_FALSE(OracleResponse::fromJson(R"({"success": true})", &error).has_value());
    EXPECT_TRUE(error.contains("resolutions"));

    EXPECT_FALSE(OracleResponse::fromJson(R"({"resolutions": [{"train_id": "x", "time_adjustment_min": 1}]})").has_value());
}

TEST_F(OracleTypesTest, SnapshotUsesOneBasedIntegerIds) {
    TimetablePropagator propagator(&graph);
    ConflictDetector detector(&graph);

    QList<Train> trains = {
        makeTrain(1, "IC 1", 8, referenceTime(8, 0), {"A", "B", "C"}),
        makeTrain(2, "RB 2", 3, referenceTime(8, 0), {"A", "B"})
    };
    FleetRefreshResult refreshed = propagator.refreshSchedules(trains);
    QList<Conflict> conflicts = detector.detect(refreshed.timetables);
    ASSERT_FALSE(conflicts.isEmpty());

    SnapshotBuilder builder;
    OracleRequest request = builder.build(graph, trains, refreshed.timetables, conflicts, 15, 100, 40);

    EXPECT_EQ(request.stations.size(), 4);
    EXPECT_EQ(request.tracks.size(), 2);
    ASSERT_EQ(request.trains.size(), 2);
    EXPECT_EQ(request.trains[0].id, 1);
    EXPECT_EQ(request.trains[1].id, 2);
    EXPECT_EQ(builder.oracleIdForTrain(trains[1].id), 2);
    EXPECT_EQ(request.trains[0].plannedRoute.size(), 2);
    EXPECT_EQ(request.trains[0].timetable.size(), 3);
    EXPECT_EQ(request.trains[0].scheduledDepartureTime, "08:00:00");
    EXPECT_EQ(request.conflicts.size(), conflicts.size());

    QJsonObject json = request.toJson();
    EXPECT_EQ(json["max_iterations"].toInt(), 15);
    EXPECT_EQ(json["ga_max_iterations"].toInt(), 100);
    EXPECT_EQ(json["ga_population_size"].toInt(), 40);
    EXPECT_TRUE(json["tracks"].toArray().first().toObject().contains("is_single_track"));
    EXPECT_TRUE(json["trains"].toArray().first().toObject().contains("timetable"));

    OracleRequest minimal = builder.build(graph, trains, refreshed.timetables, {}, 15);
    EXPECT_FALSE(minimal.toJson().contains("ga_max_iterations"));
}

TEST_F(OracleTypesTest, AdjustmentsDropUnknownTrains) {
    QList<Train> trains = {makeTrain(1, "IC 1", 8, referenceTime(8, 0), {"A", "B", "C"})};

    SnapshotBuilder builder;
    builder.build(graph, trains, {}, {}, 15);

    OracleResponse response;
    response.resolutions = {
        OracleResolution{1, 5.0, 2, 0.9, {}},
        OracleResolution{42, 3.0, std::nullopt, 0.9, {}}
    };

    QList<TrainAdjustment> adjustments = builder.toAdjustments(response);
    ASSERT_EQ(adjustments.size(), 1);
    EXPECT_EQ(adjustments.first().trainId, trains.first().id);
    EXPECT_DOUBLE_EQ(adjustments.first().timeAdjustmentMinutes, 5.0);
    ASSERT_TRUE(adjustments.first().trackHint.has_value());
    EXPECT_EQ(*adjustments.first().trackHint, 2);
}

TEST_F(OracleTypesTest, AdjustmentAppliesDwellToIntermediateStopsOnly) {
    Train train = makeTrain(1, "IC 1", 8, referenceTime(8, 0), {"A", "B", "C"});

    TrainAdjustment adjustment;
    adjustment.trainId = train.id;
    adjustment.timeAdjustmentMinutes = 2.0;
    adjustment.dwellDelays = {1.5, 7.0, -1.0};

    auto outcome = applyAdjustment(train, adjustment, &graph);
    EXPECT_TRUE(outcome.applied);
    EXPECT_EQ(outcome.dwellDelaysApplied, 1);
    EXPECT_EQ(train.departureTime, referenceTime(8, 2));
    EXPECT_DOUBLE_EQ(train.stops[1].extraDwellMinutes, 1.5);
    EXPECT_DOUBLE_EQ(train.stops[2].extraDwellMinutes, 0.0);
    EXPECT_DOUBLE_EQ(train.totalDelayMinutes, 3.5);
}

TEST_F(OracleTypesTest, TrackHintMustBeARealPlatform) {
    Train train = makeTrain(1, "IC 1", 8, referenceTime(8, 0), {"B", "C"});

    TrainAdjustment adjustment;
    adjustment.trainId = train.id;
    adjustment.trackHint = 5;

    auto outcome = applyAdjustment(train, adjustment, &graph);
    EXPECT_TRUE(outcome.applied);
    EXPECT_FALSE(outcome.trackHintApplied);
    EXPECT_FALSE(train.stops[0].platform.has_value());

    adjustment.trackHint = 2;
    outcome = applyAdjustment(train, adjustment, &graph);
    EXPECT_TRUE(outcome.trackHintApplied);
    ASSERT_TRUE(train.stops[0].platform.has_value());
    EXPECT_EQ(*train.stops[0].platform, 2);
}
