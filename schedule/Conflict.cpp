#include "Conflict.h"
#include <algorithm>

namespace RailPlan::Schedule {

QString conflictTypeToString(ConflictType type) {
    switch (type) {
        case ConflictType::STATION_OCCUPANCY: return "STATION_OCCUPANCY";
        case ConflictType::TRACK_OCCUPANCY: return "TRACK_OCCUPANCY";
        default: return "UNKNOWN";
    }
}

QString Conflict::key() const {
    QString a = first.trainId.toString(QUuid::WithoutBraces);
    QString b = second.trainId.toString(QUuid::WithoutBraces);
    if (b < a) {
        std::swap(a, b);
    }
    return QString("%1:%2:%3:%4:%5")
        .arg(conflictTypeToString(type), locationId, a, b)
        .arg(start.toMSecsSinceEpoch());
}

QString Conflict::description() const {
    QString where = type == ConflictType::STATION_OCCUPANCY
        ? QString("station %1").arg(locationName.isEmpty() ? locationId : locationName)
        : QString("single track %1").arg(locationName.isEmpty() ? locationId : locationName);
    if (platform) {
        where += QString(" platform %1").arg(*platform);
    }

    return QString("%1 and %2 overlap at %3 from %4 to %5")
        .arg(first.trainName, second.trainName, where,
             start.time().toString("HH:mm:ss"), end.time().toString("HH:mm:ss"));
}

QVariantMap Conflict::toVariantMap() const {
    return QVariantMap{
        {"type", conflictTypeToString(type)},
        {"locationId", locationId},
        {"locationName", locationName},
        {"platform", platform ? QVariant(*platform) : QVariant()},
        {"firstTrainId", first.trainId.toString(QUuid::WithoutBraces)},
        {"firstTrainName", first.trainName},
        {"secondTrainId", second.trainId.toString(QUuid::WithoutBraces)},
        {"secondTrainName", second.trainName},
        {"start", start.toString(Qt::ISODate)},
        {"end", end.toString(Qt::ISODate)},
        {"description", description()}
    };
}

} // namespace RailPlan::Schedule
