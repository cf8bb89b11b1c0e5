#pragma once

#include "NetworkTypes.h"
#include <QList>
#include <QStringList>
#include <optional>

namespace RailPlan::Network {

struct ShortestPath {
    QStringList stationIds;
    double distanceKm = 0.0;
};

// Read-only view of the railway graph. Segments are traversable in both directions.
class PathService {
public:
    virtual ~PathService() = default;

    virtual std::optional<QList<TrackSegment>> findPathEdges(const QString& fromStationId,
                                                             const QString& toStationId) const = 0;
    virtual std::optional<ShortestPath> findShortestPath(const QString& fromStationId,
                                                         const QString& toStationId) const = 0;
    virtual std::optional<Station> station(const QString& stationId) const = 0;
    virtual QList<Station> stations() const = 0;
    virtual QList<TrackSegment> segments() const = 0;
};

} // namespace RailPlan::Network
