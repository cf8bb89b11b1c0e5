#pragma once

#include <QString>
#include <QList>
#include <QUuid>
#include <QDateTime>
#include <QVariantMap>
#include <optional>

namespace RailPlan::Schedule {

struct KinematicProfile {
    double maxSpeedKmh = 160.0;
    double accelerationMs2 = 0.5;
    double decelerationMs2 = 0.5;
};

struct Stop {
    QString stationId;
    std::optional<int> platform;       // 1-based, unset = no assignment
    double minDwellMinutes = 3.0;
    double extraDwellMinutes = 0.0;    // resolution penalty
    bool isSkipped = false;

    // Computed by the propagator; invalid when not applicable
    QDateTime arrival;
    QDateTime departure;

    // Fixed timetable entries
    QDateTime plannedArrival;
    QDateTime plannedDeparture;

    double dwellMinutes() const {
        return isSkipped ? 0.0 : minDwellMinutes + extraDwellMinutes;
    }
};

struct Train {
    QUuid id = QUuid::createUuid();
    int number = 0;
    QString name;
    QString category;
    double maxSpeedKmh = 160.0;
    int priority = 5;                  // 1..10, higher is more important
    double acceleration = 0.5;         // m/s²
    double deceleration = 0.5;         // m/s²
    QString lineId;
    QDateTime departureTime;
    QList<Stop> stops;
    double totalDelayMinutes = 0.0;

    KinematicProfile profile() const {
        return KinematicProfile{maxSpeedKmh, acceleration, deceleration};
    }

    void resetExtraDwell();
    void clearComputedTimes();

    // Moves the nominal departure and every pinned time, so the whole run shifts
    void shiftDeparture(double minutes);
    // Moves the pinned departure at stopIndex and every pinned time after it
    void shiftPinsFrom(int stopIndex, double minutes);
    QVariantMap toVariantMap() const;
};

// Reference day used for all time-of-day arithmetic. Times within
// REFERENCE_SPAN_DAYS of it keep their day offset, so a shift past midnight
// stays on the following day; any other date is projected onto the reference day.
constexpr int REFERENCE_SPAN_DAYS = 7;
QDate referenceDate();
QDateTime normalizeToReferenceDay(const QDateTime& time);
QDateTime shiftOnReferenceDay(const QDateTime& time, double minutes);
QDateTime roundToSecond(const QDateTime& time);
QDateTime addMinutes(const QDateTime& time, double minutes);
QDateTime referenceTime(int hour, int minute, int second = 0);

} // namespace RailPlan::Schedule
