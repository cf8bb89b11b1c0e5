#include "NetworkTypes.h"

namespace RailPlan::Network {

QString trackTypeToString(TrackType type) {
    switch (type) {
        case TrackType::SINGLE: return "single";
        case TrackType::DOUBLE: return "double";
        case TrackType::REGIONAL: return "regional";
        case TrackType::HIGH_SPEED: return "highSpeed";
        default: return "double";
    }
}

TrackType stringToTrackType(const QString& typeStr) {
    QString normalized = typeStr.trimmed().toLower();
    if (normalized == "single") return TrackType::SINGLE;
    if (normalized == "regional") return TrackType::REGIONAL;
    if (normalized == "highspeed" || normalized == "high_speed") return TrackType::HIGH_SPEED;
    return TrackType::DOUBLE;
}

QVariantMap Station::toVariantMap() const {
    return QVariantMap{
        {"id", id},
        {"name", name},
        {"type", type},
        {"platforms", platforms}
    };
}

QVariantMap TrackSegment::toVariantMap() const {
    return QVariantMap{
        {"id", id},
        {"from", fromStationId},
        {"to", toStationId},
        {"distanceKm", distanceKm},
        {"speedLimitKmh", speedLimitKmh},
        {"trackType", trackTypeToString(trackType)},
        {"capacity", capacity}
    };
}

} // namespace RailPlan::Network
