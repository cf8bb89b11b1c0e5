#include "network/GraphService.h"
#include "TestFixtures.h"

using namespace RailPlan::Network;
using RailPlan::Testing::makeSegment;

TEST(GraphServiceTest, LoadsStationsAndSegments) {
    GraphService graph;
    ASSERT_TRUE(graph.loadGraph(RailPlan::Testing::corridorStations(), RailPlan::Testing::corridorSegments()));

    EXPECT_TRUE(graph.isLoaded());
    EXPECT_EQ(graph.totalStations(), 4);
    EXPECT_EQ(graph.totalSegments(), 2);

    QVariantMap stats = graph.getGraphStatistics();
    EXPECT_EQ(stats["singleOccupancySegments"].toInt(), 1);
    EXPECT_DOUBLE_EQ(stats["networkLengthKm"].toDouble(), 20.0);
}

TEST(GraphServiceTest, SegmentsAreBidirectional) {
    GraphService graph;
    ASSERT_TRUE(graph.loadGraph(RailPlan::Testing::corridorStations(), RailPlan::Testing::corridorSegments()));

    auto forward = graph.findPathEdges("A", "C");
    auto backward = graph.findPathEdges("C", "A");
    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(backward.has_value());
    EXPECT_EQ(forward->size(), 2);
    EXPECT_EQ(backward->size(), 2);
    EXPECT_EQ(backward->first().id, "BC");
}

TEST(GraphServiceTest, ShortestPathPrefersFewerKilometres) {
    QList<Station> stations = {{"A", "A"}, {"B", "B"}, {"C", "C"}};
    QList<TrackSegment> segments = {
        makeSegment("AB", "A", "B", 4.0, 120.0, TrackType::DOUBLE),
        makeSegment("BC", "B", "C", 5.0, 120.0, TrackType::DOUBLE),
        makeSegment("AC", "A", "C", 12.0, 160.0, TrackType::HIGH_SPEED)
    };

    GraphService graph;
    ASSERT_TRUE(graph.loadGraph(stations, segments));

    auto path = graph.findShortestPath("A", "C");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->stationIds, (QStringList{"A", "B", "C"}));
    EXPECT_DOUBLE_EQ(path->distanceKm, 9.0);
}

TEST(GraphServiceTest, IsolatedStationIsUnreachable) {
    GraphService graph;
    ASSERT_TRUE(graph.loadGraph(RailPlan::Testing::corridorStations(), RailPlan::Testing::corridorSegments()));

    EXPECT_FALSE(graph.findPathEdges("A", "D").has_value());
    EXPECT_FALSE(graph.findShortestPath("D", "C").has_value());
}

TEST(GraphServiceTest, RejectsNonPositiveDistance) {
    GraphService graph;
    QString reported;
    QObject::connect(&graph, &GraphService::graphLoadError, [&reported](const QString& error) {
        reported = error;
    });

    QList<TrackSegment> segments = RailPlan::Testing::corridorSegments();
    segments.append(makeSegment("BAD", "A", "D", 0.0, 80.0, TrackType::REGIONAL));

    EXPECT_FALSE(graph.loadGraph(RailPlan::Testing::corridorStations(), segments));
    EXPECT_FALSE(graph.isLoaded());
    EXPECT_TRUE(reported.contains("BAD"));
}

TEST(GraphServiceTest, SkipsSegmentsWithUnknownStations) {
    GraphService graph;
    QList<TrackSegment> segments = RailPlan::Testing::corridorSegments();
    segments.append(makeSegment("BX", "B", "X", 3.0, 80.0, TrackType::DOUBLE));

    ASSERT_TRUE(graph.loadGraph(RailPlan::Testing::corridorStations(), segments));
    EXPECT_EQ(graph.totalSegments(), 2);
}

TEST(GraphServiceTest, IntegrityReportsOrphansAndParallelTrack) {
    GraphService graph;
    QList<TrackSegment> segments = RailPlan::Testing::corridorSegments();
    segments.append(makeSegment("AB2", "B", "A", 10.5, 100.0, TrackType::SINGLE));

    ASSERT_TRUE(graph.loadGraph(RailPlan::Testing::corridorStations(), segments));
    QStringList warnings = graph.validateGraphIntegrity();

    EXPECT_TRUE(warnings.filter("Orphaned station").join(";").contains("D"));
    EXPECT_EQ(warnings.filter("Parallel segments").size(), 1);
}

TEST(GraphServiceTest, RegionalTrackCountsAsSingleOccupancy) {
    EXPECT_TRUE(makeSegment("R", "A", "B", 1.0, 60.0, TrackType::REGIONAL).isSingleOccupancy());
    EXPECT_FALSE(makeSegment("D", "A", "B", 1.0, 60.0, TrackType::DOUBLE).isSingleOccupancy());
    EXPECT_EQ(stringToTrackType(trackTypeToString(TrackType::HIGH_SPEED)), TrackType::HIGH_SPEED);
}
