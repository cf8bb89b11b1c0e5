#pragma once

#include "../network/PathService.h"
#include "../schedule/Train.h"
#include "../schedule/Timetable.h"
#include "../schedule/Conflict.h"
#include "../resolution/TrainAdjustment.h"
#include <QJsonObject>
#include <QByteArray>
#include <QHash>
#include <optional>

namespace RailPlan::Oracle {

struct OracleStation {
    int id = 0;
    QString name;
    int numPlatforms = 1;
};

struct OracleTrack {
    int id = 0;
    double lengthKm = 0.0;
    bool isSingleTrack = false;
    int capacity = 1;
    QList<int> stationIds;
    int maxSpeed = 0;
};

struct OracleStopTime {
    int stationId = 0;
    QString arrival;        // HH:mm:ss, empty at origin
    QString departure;      // HH:mm:ss, empty at terminus
};

struct OracleTrain {
    int id = 0;
    double positionKm = 0.0;
    double velocityKmh = 0.0;
    int currentTrack = 0;
    int originStation = 0;
    int destinationStation = 0;
    int delayMinutes = 0;
    int priority = 5;
    bool isDelayed = false;
    QString scheduledDepartureTime;
    QList<int> plannedRoute;            // track ids
    int minDwellMinutes = 3;
    QList<OracleStopTime> timetable;
};

struct OracleConflict {
    QString type;
    int locationId = 0;
    QList<int> trainIds;
    QString start;
    QString end;
};

struct OracleRequest {
    QList<OracleTrain> trains;
    QList<OracleTrack> tracks;
    QList<OracleStation> stations;
    QList<OracleConflict> conflicts;
    int maxIterations = 15;
    std::optional<int> gaMaxIterations;
    std::optional<int> gaPopulationSize;

    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;
};

struct OracleResolution {
    int trainId = 0;
    double timeAdjustmentMin = 0.0;
    std::optional<int> trackAssignment;
    double confidence = 0.0;
    QList<double> dwellDelays;
};

struct OracleResponse {
    bool success = false;
    QList<OracleResolution> resolutions;
    double totalDelayMinutes = 0.0;
    double inferenceTimeMs = 0.0;
    int conflictsDetected = 0;
    int conflictsResolved = 0;
    QString timestamp;
    std::optional<double> mlConfidence;

    // Returns nullopt and fills error on malformed payloads
    static std::optional<OracleResponse> fromJson(const QByteArray& payload, QString* error = nullptr);
};

/*
 * Builds the integer-keyed snapshot the oracle works on and maps its answers
 * back to train UUIDs. One instance per oracle round-trip.
 */
class SnapshotBuilder {
public:
    OracleRequest build(
        const Network::PathService& network,
        const QList<Schedule::Train>& trains,
        const QList<Schedule::Timetable>& timetables,
        const QList<Schedule::Conflict>& baselineConflicts,
        int maxIterations,
        std::optional<int> gaMaxIterations = std::nullopt,
        std::optional<int> gaPopulationSize = std::nullopt
    );

    std::optional<QUuid> trainIdFor(int oracleTrainId) const;
    int oracleIdForTrain(const QUuid& trainId) const { return m_trainIds.value(trainId, 0); }
    int oracleIdForStation(const QString& stationId) const { return m_stationIds.value(stationId, 0); }

    // Drops resolutions for unknown trains
    QList<Resolution::TrainAdjustment> toAdjustments(const OracleResponse& response) const;

private:
    QHash<QUuid, int> m_trainIds;
    QHash<int, QUuid> m_trainsByOracleId;
    QHash<QString, int> m_stationIds;
    QHash<QString, int> m_segmentIds;
};

} // namespace RailPlan::Oracle
