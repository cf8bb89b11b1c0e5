#include "TimetablePropagator.h"
#include "TravelTimeCalculator.h"
#include "../core/ErrorCodes.h"
#include <QMutexLocker>
#include <algorithm>

namespace RailPlan::Schedule {

TimetablePropagator::TimetablePropagator(const Network::PathService* pathService)
    : m_pathService(pathService)
{
    if (!m_pathService) {
        qCritical() << "[TimetablePropagator] Initialized with null PathService";
    }
}

PropagationResult TimetablePropagator::fail(Train& train, const char* code, const QString& message) const {
    train.clearComputedTimes();

    PropagationResult result;
    result.success = false;
    result.errorCode = code;
    result.error = message;
    return result;
}

PropagationResult TimetablePropagator::propagate(Train& train) const {
    if (train.stops.size() < 2) {
        return fail(train, ErrorCode::EMPTY_ROUTE,
                    QString("Train %1 has %2 stops, at least 2 required").arg(train.name).arg(train.stops.size()));
    }
    if (!train.departureTime.isValid()) {
        return fail(train, ErrorCode::INVALID_INPUT,
                    QString("Train %1 has no departure time").arg(train.name));
    }
    if (!m_pathService) {
        return fail(train, ErrorCode::UNREACHABLE_STOP, "No network available");
    }

    const KinematicProfile profile = train.profile();
    QList<SegmentOccupancy> occupancies;

    train.clearComputedTimes();

    Stop& origin = train.stops.first();
    QDateTime departure = roundToSecond(normalizeToReferenceDay(train.departureTime));
    if (origin.plannedDeparture.isValid()) {
        departure = roundToSecond(normalizeToReferenceDay(origin.plannedDeparture));
    }
    origin.departure = departure;

    const int lastIndex = train.stops.size() - 1;
    for (int i = 1; i <= lastIndex; ++i) {
        const Stop& previous = train.stops[i - 1];
        Stop& stop = train.stops[i];

        auto path = cachedPath(previous.stationId, stop.stationId);
        if (!path) {
            QString message = QString("No path from %1 to %2 for train %3")
                                  .arg(previous.stationId, stop.stationId, train.name);
            qWarning() << "[TimetablePropagator > propagate]" << message;
            return fail(train, ErrorCode::UNREACHABLE_STOP, message);
        }

        QDateTime cursor = previous.departure;
        const int legStart = occupancies.size();
        for (const Network::TrackSegment& segment : *path) {
            double hours = 0.0;
            try {
                hours = TravelTimeCalculator::travelTimeHours(segment.distanceKm, segment.speedLimitKmh, profile);
            } catch (const InvalidKinematics& e) {
                qWarning() << "[TimetablePropagator > propagate] Invalid kinematics for" << train.name << ":" << e.what();
                return fail(train, ErrorCode::INVALID_KINEMATICS, QString::fromStdString(e.what()));
            }

            SegmentOccupancy occupancy;
            occupancy.segmentId = segment.id;
            occupancy.fromStationId = segment.fromStationId;
            occupancy.toStationId = segment.toStationId;
            occupancy.singleOccupancy = segment.isSingleOccupancy();
            occupancy.fromStopIndex = i - 1;
            occupancy.entry = roundToSecond(cursor);
            cursor = cursor.addMSecs(qRound64(hours * 3600.0 * 1000.0));
            occupancy.exit = roundToSecond(cursor);
            occupancies.append(occupancy);
        }

        QDateTime arrival = roundToSecond(cursor);
        if (stop.plannedArrival.isValid()) {
            // A pinned arrival wins, but a train cannot arrive before it left
            arrival = std::max(roundToSecond(normalizeToReferenceDay(stop.plannedArrival)), previous.departure);
        }
        stop.arrival = arrival;

        if (occupancies.size() > legStart) {
            SegmentOccupancy& lastLeg = occupancies.last();
            lastLeg.exit = std::max(lastLeg.exit, arrival);
        }

        if (i < lastIndex) {
            QDateTime earliest = roundToSecond(addMinutes(arrival, stop.dwellMinutes()));
            if (stop.plannedDeparture.isValid()) {
                QDateTime pinned = roundToSecond(normalizeToReferenceDay(stop.plannedDeparture));
                stop.departure = std::max(earliest, pinned);
            } else {
                stop.departure = earliest;
            }
        }
    }

    PropagationResult result;
    result.success = true;
    result.timetable = buildTimetable(train, occupancies);
    return result;
}

FleetRefreshResult TimetablePropagator::refreshSchedules(QList<Train>& trains) const {
    FleetRefreshResult fleet;

    for (Train& train : trains) {
        PropagationResult result = propagate(train);
        if (result.success) {
            fleet.timetables.append(result.timetable);
        } else {
            fleet.failures.append(PropagationFailure{train.id, train.name, result.errorCode, result.error});
        }
    }

    if (!fleet.failures.isEmpty()) {
        qWarning() << "[TimetablePropagator > refreshSchedules]" << fleet.failures.size()
                   << "of" << trains.size() << "trains excluded from conflict detection";
    }

    return fleet;
}

Timetable TimetablePropagator::buildTimetable(const Train& train, const QList<SegmentOccupancy>& occupancies) {
    Timetable timetable;
    timetable.trainId = train.id;
    timetable.trainName = train.name;
    timetable.trainNumber = train.number;
    timetable.priority = train.priority;
    timetable.stops = train.stops;
    timetable.segmentOccupancies = occupancies;
    timetable.totalDelayMinutes = train.totalDelayMinutes;
    return timetable;
}

std::optional<QList<Network::TrackSegment>> TimetablePropagator::cachedPath(const QString& from, const QString& to) const {
    const QString key = from + "\x1f" + to;

    {
        QMutexLocker locker(&m_cacheMutex);
        auto it = m_pathCache.constFind(key);
        if (it != m_pathCache.constEnd()) {
            return it.value();
        }
    }

    auto path = m_pathService->findPathEdges(from, to);

    QMutexLocker locker(&m_cacheMutex);
    m_pathCache.insert(key, path);
    return path;
}

void TimetablePropagator::clearPathCache() {
    QMutexLocker locker(&m_cacheMutex);
    m_pathCache.clear();
}

} // namespace RailPlan::Schedule
