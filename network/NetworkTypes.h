#pragma once

#include <QString>
#include <QVariantMap>

namespace RailPlan::Network {

enum class TrackType {
    SINGLE,
    DOUBLE,
    REGIONAL,
    HIGH_SPEED
};

struct Station {
    QString id;
    QString name;
    QString type = "station";   // station / junction / terminal
    int platforms = 2;

    bool isTerminal() const { return type == "terminal"; }
    QVariantMap toVariantMap() const;
};

struct TrackSegment {
    QString id;
    QString fromStationId;
    QString toStationId;
    double distanceKm = 0.0;
    double speedLimitKmh = 120.0;
    TrackType trackType = TrackType::DOUBLE;
    int capacity = 2;

    // Single track and regional lines cannot host two trains at once
    bool isSingleOccupancy() const {
        return trackType == TrackType::SINGLE || trackType == TrackType::REGIONAL || capacity <= 1;
    }

    bool connects(const QString& a, const QString& b) const {
        return (fromStationId == a && toStationId == b) || (fromStationId == b && toStationId == a);
    }

    QString otherEnd(const QString& stationId) const {
        return stationId == fromStationId ? toStationId : fromStationId;
    }

    QVariantMap toVariantMap() const;
};

QString trackTypeToString(TrackType type);
TrackType stringToTrackType(const QString& typeStr);

} // namespace RailPlan::Network
