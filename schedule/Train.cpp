#include "Train.h"
#include <QTimeZone>
#include <QVariantList>
#include <QtMath>
#include <algorithm>

namespace RailPlan::Schedule {

void Train::resetExtraDwell() {
    for (Stop& stop : stops) {
        stop.extraDwellMinutes = 0.0;
    }
}

void Train::clearComputedTimes() {
    for (Stop& stop : stops) {
        stop.arrival = QDateTime();
        stop.departure = QDateTime();
    }
}

void Train::shiftDeparture(double minutes) {
    departureTime = shiftOnReferenceDay(departureTime, minutes);
    shiftPinsFrom(0, minutes);
}

void Train::shiftPinsFrom(int stopIndex, double minutes) {
    for (int s = std::max(0, stopIndex); s < stops.size(); ++s) {
        Stop& stop = stops[s];
        if (s > stopIndex && stop.plannedArrival.isValid()) {
            stop.plannedArrival = shiftOnReferenceDay(stop.plannedArrival, minutes);
        }
        if (stop.plannedDeparture.isValid()) {
            stop.plannedDeparture = shiftOnReferenceDay(stop.plannedDeparture, minutes);
        }
    }
}

QVariantMap Train::toVariantMap() const {
    QVariantList stopList;
    for (const Stop& stop : stops) {
        stopList.append(QVariantMap{
            {"stationId", stop.stationId},
            {"platform", stop.platform ? QVariant(*stop.platform) : QVariant()},
            {"minDwellMinutes", stop.minDwellMinutes},
            {"extraDwellMinutes", stop.extraDwellMinutes},
            {"isSkipped", stop.isSkipped},
            {"arrival", stop.arrival.isValid() ? stop.arrival.toString(Qt::ISODate) : QString()},
            {"departure", stop.departure.isValid() ? stop.departure.toString(Qt::ISODate) : QString()}
        });
    }

    return QVariantMap{
        {"id", id.toString(QUuid::WithoutBraces)},
        {"number", number},
        {"name", name},
        {"category", category},
        {"priority", priority},
        {"maxSpeedKmh", maxSpeedKmh},
        {"departureTime", departureTime.toString(Qt::ISODate)},
        {"totalDelayMinutes", totalDelayMinutes},
        {"stops", stopList}
    };
}

QDate referenceDate() {
    return QDate(2000, 1, 1);
}

QDateTime normalizeToReferenceDay(const QDateTime& time) {
    if (!time.isValid()) {
        return QDateTime();
    }
    // Wall-clock time is kept, whatever zone it came in
    if (qAbs(referenceDate().daysTo(time.date())) <= REFERENCE_SPAN_DAYS) {
        return QDateTime(time.date(), time.time(), QTimeZone::utc());
    }
    return QDateTime(referenceDate(), time.time(), QTimeZone::utc());
}

QDateTime shiftOnReferenceDay(const QDateTime& time, double minutes) {
    if (!time.isValid()) {
        return QDateTime();
    }
    return addMinutes(normalizeToReferenceDay(time), minutes);
}

QDateTime roundToSecond(const QDateTime& time) {
    if (!time.isValid()) {
        return QDateTime();
    }
    qint64 ms = time.toMSecsSinceEpoch();
    qint64 rounded = qRound64(ms / 1000.0) * 1000;
    return QDateTime::fromMSecsSinceEpoch(rounded, QTimeZone::utc());
}

QDateTime addMinutes(const QDateTime& time, double minutes) {
    return time.addMSecs(qRound64(minutes * 60000.0));
}

QDateTime referenceTime(int hour, int minute, int second) {
    return QDateTime(referenceDate(), QTime(hour, minute, second), QTimeZone::utc());
}

} // namespace RailPlan::Schedule
