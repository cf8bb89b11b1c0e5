#pragma once

#include "Timetable.h"
#include "../network/PathService.h"
#include <QHash>
#include <QMutex>
#include <QDebug>

namespace RailPlan::Schedule {

struct PropagationResult {
    bool success = false;
    QString errorCode;
    QString error;
    Timetable timetable;
};

struct PropagationFailure {
    QUuid trainId;
    QString trainName;
    QString errorCode;
    QString error;
};

struct FleetRefreshResult {
    QList<Timetable> timetables;             // successfully propagated trains only
    QList<PropagationFailure> failures;

    bool allSucceeded() const { return failures.isEmpty(); }
};

/*
 * Walks a train's stops and computes arrival/departure at each one.
 * Thread-safe: distinct trains may be propagated concurrently.
 */
class TimetablePropagator {
public:
    explicit TimetablePropagator(const Network::PathService* pathService);

    // Writes the computed times into train.stops. On failure the times are cleared.
    PropagationResult propagate(Train& train) const;

    FleetRefreshResult refreshSchedules(QList<Train>& trains) const;

    void clearPathCache();
    const Network::PathService* pathService() const { return m_pathService; }

    static Timetable buildTimetable(const Train& train, const QList<SegmentOccupancy>& occupancies);

private:
    std::optional<QList<Network::TrackSegment>> cachedPath(const QString& from, const QString& to) const;
    PropagationResult fail(Train& train, const char* code, const QString& message) const;

    const Network::PathService* m_pathService;

    mutable QMutex m_cacheMutex;
    mutable QHash<QString, std::optional<QList<Network::TrackSegment>>> m_pathCache;
};

} // namespace RailPlan::Schedule
