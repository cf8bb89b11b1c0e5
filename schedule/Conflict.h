#pragma once

#include <QString>
#include <QUuid>
#include <QDateTime>
#include <QVariantMap>
#include <optional>

namespace RailPlan::Schedule {

enum class ConflictType {
    STATION_OCCUPANCY,
    TRACK_OCCUPANCY
};

struct ConflictParty {
    QUuid trainId;
    QString trainName;
    int trainNumber = 0;
    int priority = 5;
    int stopIndex = 0;         // stop at the station, or departure stop of the leg
};

struct Conflict {
    ConflictType type = ConflictType::STATION_OCCUPANCY;
    QString locationId;
    QString locationName;
    std::optional<int> platform;
    ConflictParty first;
    ConflictParty second;
    QDateTime start;           // max of starts
    QDateTime end;             // min of ends

    bool involves(const QUuid& trainId) const {
        return first.trainId == trainId || second.trainId == trainId;
    }

    QString key() const;
    QString description() const;
    QVariantMap toVariantMap() const;
};

struct Hotspot {
    QString locationId;
    QString locationName;
    ConflictType type = ConflictType::STATION_OCCUPANCY;
    int conflictCount = 0;
};

QString conflictTypeToString(ConflictType type);

} // namespace RailPlan::Schedule
