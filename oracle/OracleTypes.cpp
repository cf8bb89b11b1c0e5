#include "OracleTypes.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>
#include <algorithm>

namespace RailPlan::Oracle {

namespace {

QString timeOfDay(const QDateTime& time) {
    return time.isValid() ? time.time().toString("HH:mm:ss") : QString();
}

QJsonArray intArray(const QList<int>& values) {
    QJsonArray array;
    for (int value : values) {
        array.append(value);
    }
    return array;
}

} // namespace

QJsonObject OracleRequest::toJson() const {
    QJsonArray trainArray;
    for (const OracleTrain& train : trains) {
        QJsonArray stops;
        for (const OracleStopTime& stop : train.timetable) {
            QJsonObject stopObject{{"station_id", stop.stationId}};
            if (!stop.arrival.isEmpty()) stopObject["arrival"] = stop.arrival;
            if (!stop.departure.isEmpty()) stopObject["departure"] = stop.departure;
            stops.append(stopObject);
        }

        trainArray.append(QJsonObject{
            {"id", train.id},
            {"position_km", train.positionKm},
            {"velocity_kmh", train.velocityKmh},
            {"current_track", train.currentTrack},
            {"origin_station", train.originStation},
            {"destination_station", train.destinationStation},
            {"delay_minutes", train.delayMinutes},
            {"priority", train.priority},
            {"is_delayed", train.isDelayed},
            {"scheduled_departure_time", train.scheduledDepartureTime},
            {"planned_route", intArray(train.plannedRoute)},
            {"min_dwell_minutes", train.minDwellMinutes},
            {"timetable", stops}
        });
    }

    QJsonArray trackArray;
    for (const OracleTrack& track : tracks) {
        trackArray.append(QJsonObject{
            {"id", track.id},
            {"length_km", track.lengthKm},
            {"is_single_track", track.isSingleTrack},
            {"capacity", track.capacity},
            {"station_ids", intArray(track.stationIds)},
            {"max_speed", track.maxSpeed}
        });
    }

    QJsonArray stationArray;
    for (const OracleStation& station : stations) {
        stationArray.append(QJsonObject{
            {"id", station.id},
            {"name", station.name},
            {"num_platforms", station.numPlatforms}
        });
    }

    QJsonArray conflictArray;
    for (const OracleConflict& conflict : conflicts) {
        conflictArray.append(QJsonObject{
            {"type", conflict.type},
            {"location_id", conflict.locationId},
            {"train_ids", intArray(conflict.trainIds)},
            {"start", conflict.start},
            {"end", conflict.end}
        });
    }

    QJsonObject root{
        {"trains", trainArray},
        {"tracks", trackArray},
        {"stations", stationArray},
        {"conflicts", conflictArray},
        {"max_iterations", maxIterations}
    };
    if (gaMaxIterations) root["ga_max_iterations"] = *gaMaxIterations;
    if (gaPopulationSize) root["ga_population_size"] = *gaPopulationSize;
    return root;
}

QByteArray OracleRequest::toJsonBytes() const {
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

std::optional<OracleResponse> OracleResponse::fromJson(const QByteArray& payload, QString* error) {
    auto reject = [error](const QString& message) -> std::optional<OracleResponse> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return reject(QString("Invalid JSON in oracle response: %1").arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return reject("Oracle response root must be an object");
    }

    const QJsonObject root = doc.object();
    if (!root["resolutions"].isArray()) {
        return reject("Oracle response has no resolutions array");
    }

    OracleResponse response;
    response.success = root["success"].toBool(true);
    response.totalDelayMinutes = root["total_delay_minutes"].toDouble();
    response.inferenceTimeMs = root["inference_time_ms"].toDouble();
    response.conflictsDetected = root["conflicts_detected"].toInt();
    response.conflictsResolved = root["conflicts_resolved"].toInt();
    response.timestamp = root["timestamp"].toString();
    if (root["ml_confidence"].isDouble()) {
        response.mlConfidence = root["ml_confidence"].toDouble();
    }

    const QJsonArray resolutions = root["resolutions"].toArray();
    for (const QJsonValue& value : resolutions) {
        const QJsonObject obj = value.toObject();
        if (!obj["train_id"].isDouble() || !obj["time_adjustment_min"].isDouble()) {
            return reject("Resolution missing train_id or time_adjustment_min");
        }

        OracleResolution resolution;
        resolution.trainId = obj["train_id"].toInt();
        resolution.timeAdjustmentMin = obj["time_adjustment_min"].toDouble();
        resolution.confidence = obj["confidence"].toDouble(0.0);
        if (obj["track_assignment"].isDouble()) {
            resolution.trackAssignment = obj["track_assignment"].toInt();
        }
        if (obj["dwell_delays"].isArray()) {
            for (const QJsonValue& delay : obj["dwell_delays"].toArray()) {
                resolution.dwellDelays.append(delay.toDouble());
            }
        }
        response.resolutions.append(resolution);
    }

    return response;
}

OracleRequest SnapshotBuilder::build(
    const Network::PathService& network,
    const QList<Schedule::Train>& trains,
    const QList<Schedule::Timetable>& timetables,
    const QList<Schedule::Conflict>& baselineConflicts,
    int maxIterations,
    std::optional<int> gaMaxIterations,
    std::optional<int> gaPopulationSize
) {
    m_trainIds.clear();
    m_trainsByOracleId.clear();
    m_stationIds.clear();
    m_segmentIds.clear();

    OracleRequest request;
    request.maxIterations = maxIterations;
    request.gaMaxIterations = gaMaxIterations;
    request.gaPopulationSize = gaPopulationSize;

    // Integer ids start at 1; 0 means unknown
    int nextStation = 1;
    for (const Network::Station& station : network.stations()) {
        m_stationIds.insert(station.id, nextStation);
        request.stations.append(OracleStation{nextStation, station.name, station.platforms});
        nextStation++;
    }

    int nextSegment = 1;
    for (const Network::TrackSegment& segment : network.segments()) {
        m_segmentIds.insert(segment.id, nextSegment);

        OracleTrack track;
        track.id = nextSegment;
        track.lengthKm = segment.distanceKm;
        track.isSingleTrack = segment.isSingleOccupancy();
        track.capacity = segment.capacity;
        track.stationIds = {m_stationIds.value(segment.fromStationId), m_stationIds.value(segment.toStationId)};
        track.maxSpeed = static_cast<int>(segment.speedLimitKmh);
        request.tracks.append(track);
        nextSegment++;
    }

    QHash<QUuid, const Schedule::Timetable*> timetableById;
    for (const Schedule::Timetable& timetable : timetables) {
        timetableById.insert(timetable.trainId, &timetable);
    }

    int nextTrain = 1;
    for (const Schedule::Train& train : trains) {
        m_trainIds.insert(train.id, nextTrain);
        m_trainsByOracleId.insert(nextTrain, train.id);

        OracleTrain entry;
        entry.id = nextTrain;
        entry.velocityKmh = train.maxSpeedKmh;
        entry.priority = train.priority;
        entry.delayMinutes = static_cast<int>(train.totalDelayMinutes);
        entry.isDelayed = train.totalDelayMinutes > 0.0;
        entry.scheduledDepartureTime = timeOfDay(train.departureTime);
        if (!train.stops.isEmpty()) {
            entry.originStation = m_stationIds.value(train.stops.first().stationId);
            entry.destinationStation = m_stationIds.value(train.stops.last().stationId);
            double maxDwell = 0.0;
            for (const Schedule::Stop& stop : train.stops) {
                maxDwell = std::max(maxDwell, stop.minDwellMinutes);
            }
            entry.minDwellMinutes = static_cast<int>(maxDwell);
        }

        const Schedule::Timetable* timetable = timetableById.value(train.id, nullptr);
        if (timetable) {
            for (const Schedule::SegmentOccupancy& occupancy : timetable->segmentOccupancies) {
                entry.plannedRoute.append(m_segmentIds.value(occupancy.segmentId));
            }
            for (const Schedule::Stop& stop : timetable->stops) {
                entry.timetable.append(OracleStopTime{m_stationIds.value(stop.stationId),
                                                      timeOfDay(stop.arrival), timeOfDay(stop.departure)});
            }
        }
        entry.currentTrack = entry.plannedRoute.value(0, 0);

        request.trains.append(entry);
        nextTrain++;
    }

    for (const Schedule::Conflict& conflict : baselineConflicts) {
        OracleConflict entry;
        entry.type = Schedule::conflictTypeToString(conflict.type);
        entry.locationId = conflict.type == Schedule::ConflictType::STATION_OCCUPANCY
            ? m_stationIds.value(conflict.locationId)
            : m_segmentIds.value(conflict.locationId);
        entry.trainIds = {m_trainIds.value(conflict.first.trainId), m_trainIds.value(conflict.second.trainId)};
        entry.start = timeOfDay(conflict.start);
        entry.end = timeOfDay(conflict.end);
        request.conflicts.append(entry);
    }

    return request;
}

std::optional<QUuid> SnapshotBuilder::trainIdFor(int oracleTrainId) const {
    auto it = m_trainsByOracleId.constFind(oracleTrainId);
    if (it == m_trainsByOracleId.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QList<Resolution::TrainAdjustment> SnapshotBuilder::toAdjustments(const OracleResponse& response) const {
    QList<Resolution::TrainAdjustment> adjustments;
    for (const OracleResolution& resolution : response.resolutions) {
        auto trainId = trainIdFor(resolution.trainId);
        if (!trainId) {
            qWarning() << "[SnapshotBuilder > toAdjustments] Unknown oracle train id" << resolution.trainId;
            continue;
        }

        Resolution::TrainAdjustment adjustment;
        adjustment.trainId = *trainId;
        adjustment.timeAdjustmentMinutes = resolution.timeAdjustmentMin;
        adjustment.dwellDelays = resolution.dwellDelays;
        adjustment.trackHint = resolution.trackAssignment;
        adjustment.confidence = resolution.confidence;
        adjustments.append(adjustment);
    }
    return adjustments;
}

} // namespace RailPlan::Oracle
