#pragma once

#include "Train.h"

namespace RailPlan::Schedule {

struct SegmentOccupancy {
    QString segmentId;
    QString fromStationId;
    QString toStationId;
    bool singleOccupancy = false;
    QDateTime entry;
    QDateTime exit;
    int fromStopIndex = 0;     // stop the leg departs from
};

// Propagated schedule of one train. Derived from Train + network, never stored.
struct Timetable {
    QUuid trainId;
    QString trainName;
    int trainNumber = 0;
    int priority = 5;
    QList<Stop> stops;
    QList<SegmentOccupancy> segmentOccupancies;
    double totalDelayMinutes = 0.0;
};

} // namespace RailPlan::Schedule
