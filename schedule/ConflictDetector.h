#pragma once

#include "Timetable.h"
#include "Conflict.h"
#include "../network/PathService.h"
#include <QList>
#include <QHash>
#include <QPair>

namespace RailPlan::Schedule {

struct OccupancyInterval {
    QString locationId;
    std::optional<int> platform;
    QDateTime start;
    QDateTime end;
    QString label;
    int timetableIndex = 0;
    int stopIndex = 0;
};

/*
 * Interval-overlap conflict detection over propagated timetables.
 * Station windows: origin [dep - dwell, dep], intermediate [arr, dep],
 * terminus [arr, arr + dwell]. Track windows only on single-occupancy segments.
 */
class ConflictDetector {
public:
    explicit ConflictDetector(const Network::PathService* pathService = nullptr);

    QList<Conflict> detect(const QList<Timetable>& timetables) const;

    void setParallelEnabled(bool enabled) { m_parallelEnabled = enabled; }
    bool isParallelEnabled() const { return m_parallelEnabled; }

    // Canonical order: location, start, then train ids
    static void sortConflicts(QList<Conflict>& conflicts);
    static QList<Hotspot> analyzeHotspots(const QList<Conflict>& conflicts);
    static QString generateConflictReport(const QList<Conflict>& conflicts);

    static std::optional<QPair<QDateTime, QDateTime>> stationWindow(const Timetable& timetable, int stopIndex);

private:
    using IntervalGroup = QList<OccupancyInterval>;

    void collectStationIntervals(const QList<Timetable>& timetables, QHash<QString, IntervalGroup>& groups) const;
    void collectTrackIntervals(const QList<Timetable>& timetables, QHash<QString, IntervalGroup>& groups) const;

    QList<Conflict> sweepGroup(
        IntervalGroup group,
        ConflictType type,
        const QList<Timetable>& timetables
    ) const;

    QList<Conflict> detectGroups(
        const QHash<QString, IntervalGroup>& groups,
        ConflictType type,
        const QList<Timetable>& timetables
    ) const;

    QString stationName(const QString& stationId) const;

    const Network::PathService* m_pathService;
    bool m_parallelEnabled = true;

    static constexpr int PARALLEL_GROUP_THRESHOLD = 8;
};

} // namespace RailPlan::Schedule
