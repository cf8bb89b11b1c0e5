#pragma once

#include "network/GraphService.h"
#include "schedule/Train.h"
#include "schedule/Timetable.h"
#include <gtest/gtest.h>
#include <QStringList>

namespace RailPlan::Testing {

inline Network::TrackSegment makeSegment(const QString& id, const QString& from, const QString& to,
                                         double km, double limitKmh, Network::TrackType type) {
    Network::TrackSegment segment;
    segment.id = id;
    segment.fromStationId = from;
    segment.toStationId = to;
    segment.distanceKm = km;
    segment.speedLimitKmh = limitKmh;
    segment.trackType = type;
    segment.capacity = type == Network::TrackType::SINGLE ? 1 : 2;
    return segment;
}

// Aurach - Bergen on double track, Bergen - Cella on single track, Delfs isolated.
// 10 km at 120 km/h with the default profile takes 6:07 (rounded).
inline QList<Network::Station> corridorStations() {
    return {
        {"A", "Aurach", "terminal", 4},
        {"B", "Bergen", "station", 2},
        {"C", "Cella", "terminal", 2},
        {"D", "Delfs", "station", 1}
    };
}

inline QList<Network::TrackSegment> corridorSegments() {
    return {
        makeSegment("AB", "A", "B", 10.0, 120.0, Network::TrackType::DOUBLE),
        makeSegment("BC", "B", "C", 10.0, 120.0, Network::TrackType::SINGLE)
    };
}

inline Schedule::Train makeTrain(int number, const QString& name, int priority,
                                 const QDateTime& departure, const QStringList& stationIds) {
    Schedule::Train train;
    train.number = number;
    train.name = name;
    train.priority = priority;
    train.departureTime = departure;
    for (const QString& stationId : stationIds) {
        Schedule::Stop stop;
        stop.stationId = stationId;
        train.stops.append(stop);
    }
    return train;
}

class CorridorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(graph.loadGraph(corridorStations(), corridorSegments()));
    }

    Network::GraphService graph;
};

} // namespace RailPlan::Testing
