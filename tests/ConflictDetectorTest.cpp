#include "schedule/ConflictDetector.h"
#include "schedule/TimetablePropagator.h"
#include "TestFixtures.h"
#include <algorithm>

using namespace RailPlan::Schedule;
using RailPlan::Testing::CorridorTest;
using RailPlan::Testing::makeTrain;

namespace {

// Two-stop timetable occupying `station` as its terminus from `arrival` for `dwell` minutes
Timetable arrivingAt(const QString& name, const QString& station, const QDateTime& arrival,
                     double dwell = 3.0, std::optional<int> platform = std::nullopt) {
    Timetable timetable;
    timetable.trainId = QUuid::createUuid();
    timetable.trainName = name;

    Stop origin;
    origin.stationId = "ORIGIN-" + name;
    origin.departure = arrival.addSecs(-600);

    Stop terminus;
    terminus.stationId = station;
    terminus.arrival = arrival;
    terminus.minDwellMinutes = dwell;
    terminus.platform = platform;

    timetable.stops = {origin, terminus};
    return timetable;
}

Timetable onSingleTrack(const QString& name, const QDateTime& entry, const QDateTime& exit, bool single = true) {
    Timetable timetable;
    timetable.trainId = QUuid::createUuid();
    timetable.trainName = name;

    SegmentOccupancy occupancy;
    occupancy.segmentId = "BC";
    occupancy.fromStationId = "B";
    occupancy.toStationId = "C";
    occupancy.singleOccupancy = single;
    occupancy.entry = entry;
    occupancy.exit = exit;
    timetable.segmentOccupancies = {occupancy};
    return timetable;
}

} // namespace

class ConflictDetectorTest : public CorridorTest {};

TEST_F(ConflictDetectorTest, DisjointWindowsDoNotConflict) {
    ConflictDetector detector(&graph);
    QList<Timetable> timetables = {
        arrivingAt("IC 1", "B", referenceTime(8, 0)),
        arrivingAt("IC 2", "B", referenceTime(8, 10))
    };
    EXPECT_TRUE(detector.detect(timetables).isEmpty());
}

TEST_F(ConflictDetectorTest, TouchingWindowsDoNotConflict) {
    ConflictDetector detector(&graph);
    QList<Timetable> timetables = {
        arrivingAt("IC 1", "B", referenceTime(8, 0)),
        arrivingAt("IC 2", "B", referenceTime(8, 3))
    };
    EXPECT_TRUE(detector.detect(timetables).isEmpty());
}

TEST_F(ConflictDetectorTest, OverlapYieldsOneConflictOverTheIntersection) {
    ConflictDetector detector(&graph);
    QList<Timetable> timetables = {
        arrivingAt("IC 1", "B", referenceTime(8, 0), 5.0),
        arrivingAt("IC 2", "B", referenceTime(8, 2), 5.0)
    };

    QList<Conflict> conflicts = detector.detect(timetables);
    ASSERT_EQ(conflicts.size(), 1);

    const Conflict& conflict = conflicts.first();
    EXPECT_EQ(conflict.type, ConflictType::STATION_OCCUPANCY);
    EXPECT_EQ(conflict.locationId, "B");
    EXPECT_EQ(conflict.locationName, "Bergen");
    EXPECT_EQ(conflict.start, referenceTime(8, 2));
    EXPECT_EQ(conflict.end, referenceTime(8, 5));
    EXPECT_TRUE(conflict.involves(timetables[0].trainId));
    EXPECT_TRUE(conflict.involves(timetables[1].trainId));
    EXPECT_TRUE(conflict.description().contains("Bergen"));
}

TEST_F(ConflictDetectorTest, DifferentPlatformsDoNotConflict) {
    ConflictDetector detector(&graph);
    QList<Timetable> timetables = {
        arrivingAt("IC 1", "B", referenceTime(8, 0), 5.0, 1),
        arrivingAt("IC 2", "B", referenceTime(8, 2), 5.0, 2)
    };
    EXPECT_TRUE(detector.detect(timetables).isEmpty());

    timetables[1] = arrivingAt("IC 2", "B", referenceTime(8, 2), 5.0, 1);
    QList<Conflict> samePlatform = detector.detect(timetables);
    ASSERT_EQ(samePlatform.size(), 1);
    ASSERT_TRUE(samePlatform.first().platform.has_value());
    EXPECT_EQ(*samePlatform.first().platform, 1);

    // An unassigned platform may be any platform
    timetables[1] = arrivingAt("IC 2", "B", referenceTime(8, 2), 5.0);
    EXPECT_EQ(detector.detect(timetables).size(), 1);
}

TEST_F(ConflictDetectorTest, OriginWindowPrecedesDeparture) {
    Timetable timetable;
    Stop origin;
    origin.stationId = "A";
    origin.departure = referenceTime(8, 0);
    Stop terminus;
    terminus.stationId = "B";
    terminus.arrival = referenceTime(8, 10);
    timetable.stops = {origin, terminus};

    auto originWindow = ConflictDetector::stationWindow(timetable, 0);
    ASSERT_TRUE(originWindow.has_value());
    EXPECT_EQ(originWindow->first, referenceTime(7, 57));
    EXPECT_EQ(originWindow->second, referenceTime(8, 0));

    auto terminusWindow = ConflictDetector::stationWindow(timetable, 1);
    ASSERT_TRUE(terminusWindow.has_value());
    EXPECT_EQ(terminusWindow->second, referenceTime(8, 13));

    timetable.stops[1].isSkipped = true;
    EXPECT_FALSE(ConflictDetector::stationWindow(timetable, 1).has_value());
}

TEST_F(ConflictDetectorTest, SingleTrackOverlapIsTrackConflict) {
    ConflictDetector detector(&graph);
    QList<Timetable> timetables = {
        onSingleTrack("IC 1", referenceTime(8, 0), referenceTime(8, 6)),
        onSingleTrack("IC 2", referenceTime(8, 4), referenceTime(8, 10))
    };

    QList<Conflict> conflicts = detector.detect(timetables);
    ASSERT_EQ(conflicts.size(), 1);
    EXPECT_EQ(conflicts.first().type, ConflictType::TRACK_OCCUPANCY);
    EXPECT_EQ(conflicts.first().locationName, "Bergen-Cella");
    EXPECT_EQ(conflicts.first().start, referenceTime(8, 4));
    EXPECT_EQ(conflicts.first().end, referenceTime(8, 6));
}

TEST_F(ConflictDetectorTest, DoubleTrackOverlapIsAllowed) {
    ConflictDetector detector(&graph);
    QList<Timetable> timetables = {
        onSingleTrack("IC 1", referenceTime(8, 0), referenceTime(8, 6), false),
        onSingleTrack("IC 2", referenceTime(8, 4), referenceTime(8, 10), false)
    };
    EXPECT_TRUE(detector.detect(timetables).isEmpty());
}

TEST_F(ConflictDetectorTest, PropagatedHeadOnTrainsConflict) {
    TimetablePropagator propagator(&graph);
    ConflictDetector detector(&graph);

    QList<Train> fleet = {
        makeTrain(1, "RE 1", 5, referenceTime(8, 0), {"B", "C"}),
        makeTrain(2, "RE 2", 5, referenceTime(8, 2), {"C", "B"})
    };
    FleetRefreshResult refreshed = propagator.refreshSchedules(fleet);
    ASSERT_TRUE(refreshed.allSucceeded());

    QList<Conflict> conflicts = detector.detect(refreshed.timetables);
    bool trackConflict = std::any_of(conflicts.begin(), conflicts.end(), [](const Conflict& c) {
        return c.type == ConflictType::TRACK_OCCUPANCY && c.locationId == "BC";
    });
    EXPECT_TRUE(trackConflict);
}

TEST_F(ConflictDetectorTest, ParallelDetectionMatchesSerial) {
    QList<Timetable> timetables;
    for (int station = 0; station < 12; ++station) {
        const QString id = QString("S%1").arg(station);
        timetables.append(arrivingAt(QString("T%1a").arg(station), id, referenceTime(8, 0), 5.0));
        timetables.append(arrivingAt(QString("T%1b").arg(station), id, referenceTime(8, 1), 5.0));
        timetables.append(arrivingAt(QString("T%1c").arg(station), id, referenceTime(9, 0), 5.0));
    }

    ConflictDetector parallel(&graph);
    ConflictDetector serial(&graph);
    serial.setParallelEnabled(false);

    QList<Conflict> a = parallel.detect(timetables);
    QList<Conflict> b = serial.detect(timetables);
    ConflictDetector::sortConflicts(a);
    ConflictDetector::sortConflicts(b);

    ASSERT_EQ(a.size(), 12);
    ASSERT_EQ(a.size(), b.size());
    for (int i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].key(), b[i].key());
    }
}

TEST_F(ConflictDetectorTest, HotspotsRankByConflictCount) {
    ConflictDetector detector(&graph);
    QList<Timetable> timetables = {
        arrivingAt("IC 1", "B", referenceTime(8, 0), 10.0),
        arrivingAt("IC 2", "B", referenceTime(8, 2), 10.0),
        arrivingAt("IC 3", "B", referenceTime(8, 4), 10.0),
        arrivingAt("IC 4", "C", referenceTime(8, 0), 10.0),
        arrivingAt("IC 5", "C", referenceTime(8, 5), 10.0)
    };

    QList<Conflict> conflicts = detector.detect(timetables);
    QList<Hotspot> hotspots = ConflictDetector::analyzeHotspots(conflicts);
    ASSERT_EQ(hotspots.size(), 2);
    EXPECT_EQ(hotspots[0].locationId, "B");
    EXPECT_EQ(hotspots[0].conflictCount, 3);
    EXPECT_EQ(hotspots[1].conflictCount, 1);

    QString report = ConflictDetector::generateConflictReport(conflicts);
    EXPECT_TRUE(report.contains("4 conflicts"));
    EXPECT_TRUE(report.contains("Hotspots"));
    EXPECT_EQ(ConflictDetector::generateConflictReport({}), "No conflicts detected.\n");
}
