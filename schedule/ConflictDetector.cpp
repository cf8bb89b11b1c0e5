#include "ConflictDetector.h"
#include <QtConcurrent/QtConcurrent>
#include <QTextStream>
#include <algorithm>
#include <vector>

namespace RailPlan::Schedule {

ConflictDetector::ConflictDetector(const Network::PathService* pathService)
    : m_pathService(pathService)
{
}

std::optional<QPair<QDateTime, QDateTime>> ConflictDetector::stationWindow(const Timetable& timetable, int stopIndex) {
    if (stopIndex < 0 || stopIndex >= timetable.stops.size()) {
        return std::nullopt;
    }

    const Stop& stop = timetable.stops[stopIndex];
    if (stop.isSkipped) {
        return std::nullopt;
    }

    const int lastIndex = timetable.stops.size() - 1;
    if (stopIndex == 0) {
        if (!stop.departure.isValid()) {
            return std::nullopt;
        }
        return qMakePair(roundToSecond(addMinutes(stop.departure, -stop.dwellMinutes())), stop.departure);
    }
    if (stopIndex == lastIndex) {
        if (!stop.arrival.isValid()) {
            return std::nullopt;
        }
        return qMakePair(stop.arrival, roundToSecond(addMinutes(stop.arrival, stop.dwellMinutes())));
    }
    if (!stop.arrival.isValid() || !stop.departure.isValid()) {
        return std::nullopt;
    }
    return qMakePair(stop.arrival, stop.departure);
}

QString ConflictDetector::stationName(const QString& stationId) const {
    if (m_pathService) {
        auto station = m_pathService->station(stationId);
        if (station && !station->name.isEmpty()) {
            return station->name;
        }
    }
    return stationId;
}

void ConflictDetector::collectStationIntervals(const QList<Timetable>& timetables,
                                               QHash<QString, IntervalGroup>& groups) const {
    for (int t = 0; t < timetables.size(); ++t) {
        const Timetable& timetable = timetables[t];
        for (int s = 0; s < timetable.stops.size(); ++s) {
            auto window = stationWindow(timetable, s);
            if (!window) {
                continue;
            }

            OccupancyInterval interval;
            interval.locationId = timetable.stops[s].stationId;
            interval.platform = timetable.stops[s].platform;
            interval.start = window->first;
            interval.end = window->second;
            interval.timetableIndex = t;
            interval.stopIndex = s;
            groups[interval.locationId].append(interval);
        }
    }
}

void ConflictDetector::collectTrackIntervals(const QList<Timetable>& timetables,
                                             QHash<QString, IntervalGroup>& groups) const {
    for (int t = 0; t < timetables.size(); ++t) {
        for (const SegmentOccupancy& occupancy : timetables[t].segmentOccupancies) {
            if (!occupancy.singleOccupancy || !occupancy.entry.isValid() || !occupancy.exit.isValid()) {
                continue;
            }

            OccupancyInterval interval;
            interval.locationId = occupancy.segmentId;
            interval.label = QString("%1-%2").arg(stationName(occupancy.fromStationId),
                                                  stationName(occupancy.toStationId));
            interval.start = occupancy.entry;
            interval.end = occupancy.exit;
            interval.timetableIndex = t;
            interval.stopIndex = occupancy.fromStopIndex;
            groups[interval.locationId].append(interval);
        }
    }
}

QList<Conflict> ConflictDetector::sweepGroup(
    IntervalGroup group,
    ConflictType type,
    const QList<Timetable>& timetables
) const {
    QList<Conflict> conflicts;
    if (group.size() < 2) {
        return conflicts;
    }

    std::sort(group.begin(), group.end(), [](const OccupancyInterval& a, const OccupancyInterval& b) {
        return a.start < b.start;
    });

    const QString name = type == ConflictType::STATION_OCCUPANCY
        ? stationName(group.first().locationId)
        : group.first().label;

    for (int i = 0; i < group.size(); ++i) {
        const OccupancyInterval& a = group[i];

        // Sorted by start: once b starts at or after a ends, no later interval overlaps a
        for (int j = i + 1; j < group.size() && group[j].start < a.end; ++j) {
            const OccupancyInterval& b = group[j];
            if (!(a.start < b.end)) {
                continue;
            }
            if (a.timetableIndex == b.timetableIndex) {
                continue;
            }
            if (type == ConflictType::STATION_OCCUPANCY && a.platform && b.platform && *a.platform != *b.platform) {
                continue;
            }

            const Timetable& ta = timetables[a.timetableIndex];
            const Timetable& tb = timetables[b.timetableIndex];

            Conflict conflict;
            conflict.type = type;
            conflict.locationId = a.locationId;
            conflict.locationName = name;
            if (type == ConflictType::STATION_OCCUPANCY) {
                conflict.platform = a.platform ? a.platform : b.platform;
            }
            conflict.first = ConflictParty{ta.trainId, ta.trainName, ta.trainNumber, ta.priority, a.stopIndex};
            conflict.second = ConflictParty{tb.trainId, tb.trainName, tb.trainNumber, tb.priority, b.stopIndex};
            conflict.start = std::max(a.start, b.start);
            conflict.end = std::min(a.end, b.end);
            conflicts.append(conflict);
        }
    }

    return conflicts;
}

QList<Conflict> ConflictDetector::detectGroups(
    const QHash<QString, IntervalGroup>& groups,
    ConflictType type,
    const QList<Timetable>& timetables
) const {
    QList<Conflict> conflicts;
    QList<IntervalGroup> work;
    for (auto it = groups.constBegin(); it != groups.constEnd(); ++it) {
        if (it.value().size() > 1) {
            work.append(it.value());
        }
    }

    if (m_parallelEnabled && work.size() >= PARALLEL_GROUP_THRESHOLD) {
        // Groups are independent; each worker writes only its own slot
        std::vector<QList<Conflict>> partial(work.size());
        QList<int> indices;
        for (int i = 0; i < work.size(); ++i) {
            indices.append(i);
        }
        QtConcurrent::blockingMap(indices, [&](int& index) {
            partial[index] = sweepGroup(work[index], type, timetables);
        });
        for (const QList<Conflict>& chunk : partial) {
            conflicts.append(chunk);
        }
    } else {
        for (const IntervalGroup& group : work) {
            conflicts.append(sweepGroup(group, type, timetables));
        }
    }

    return conflicts;
}

QList<Conflict> ConflictDetector::detect(const QList<Timetable>& timetables) const {
    QHash<QString, IntervalGroup> stationGroups;
    QHash<QString, IntervalGroup> trackGroups;
    collectStationIntervals(timetables, stationGroups);
    collectTrackIntervals(timetables, trackGroups);

    QList<Conflict> conflicts = detectGroups(stationGroups, ConflictType::STATION_OCCUPANCY, timetables);
    conflicts.append(detectGroups(trackGroups, ConflictType::TRACK_OCCUPANCY, timetables));
    return conflicts;
}

void ConflictDetector::sortConflicts(QList<Conflict>& conflicts) {
    std::sort(conflicts.begin(), conflicts.end(), [](const Conflict& a, const Conflict& b) {
        if (a.locationId != b.locationId) return a.locationId < b.locationId;
        if (a.start != b.start) return a.start < b.start;
        if (a.type != b.type) return a.type < b.type;
        QString aFirst = a.first.trainId.toString();
        QString bFirst = b.first.trainId.toString();
        if (aFirst != bFirst) return aFirst < bFirst;
        return a.second.trainId.toString() < b.second.trainId.toString();
    });
}

QList<Hotspot> ConflictDetector::analyzeHotspots(const QList<Conflict>& conflicts) {
    QHash<QString, Hotspot> byLocation;
    for (const Conflict& conflict : conflicts) {
        Hotspot& spot = byLocation[conflict.locationId];
        spot.locationId = conflict.locationId;
        spot.locationName = conflict.locationName;
        spot.type = conflict.type;
        spot.conflictCount++;
    }

    QList<Hotspot> hotspots = byLocation.values();
    std::sort(hotspots.begin(), hotspots.end(), [](const Hotspot& a, const Hotspot& b) {
        if (a.conflictCount != b.conflictCount) return a.conflictCount > b.conflictCount;
        return a.locationId < b.locationId;
    });
    return hotspots;
}

QString ConflictDetector::generateConflictReport(const QList<Conflict>& conflicts) {
    QString report;
    QTextStream out(&report);

    if (conflicts.isEmpty()) {
        out << "No conflicts detected.\n";
        return report;
    }

    QList<Conflict> sorted = conflicts;
    sortConflicts(sorted);

    int stationCount = 0;
    int trackCount = 0;
    for (const Conflict& conflict : sorted) {
        if (conflict.type == ConflictType::STATION_OCCUPANCY) {
            stationCount++;
        } else {
            trackCount++;
        }
    }

    out << "Conflict report: " << sorted.size() << " conflicts\n";

    if (stationCount > 0) {
        out << "\nStation occupancy (" << stationCount << "):\n";
        for (const Conflict& conflict : sorted) {
            if (conflict.type == ConflictType::STATION_OCCUPANCY) {
                out << "  - " << conflict.description() << "\n";
            }
        }
    }

    if (trackCount > 0) {
        out << "\nTrack occupancy (" << trackCount << "):\n";
        for (const Conflict& conflict : sorted) {
            if (conflict.type == ConflictType::TRACK_OCCUPANCY) {
                out << "  - " << conflict.description() << "\n";
            }
        }
    }

    QList<Hotspot> hotspots = analyzeHotspots(sorted);
    out << "\nHotspots:\n";
    for (int i = 0; i < hotspots.size() && i < 3; ++i) {
        out << "  " << (i + 1) << ". " << hotspots[i].locationName
            << " (" << hotspots[i].conflictCount << ")\n";
    }

    out.flush();
    return report;
}

} // namespace RailPlan::Schedule
