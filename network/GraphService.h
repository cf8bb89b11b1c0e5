#pragma once

#include "PathService.h"
#include <QObject>
#include <QVariantMap>
#include <QString>
#include <QStringList>
#include <QHash>
#include <QMutex>
#include <QDebug>
#include <queue>

namespace RailPlan::Network {

struct PathfindingNode {
    QString stationId;
    double costKm = 0.0;

    bool operator<(const PathfindingNode& other) const {
        return costKm > other.costKm; // For min-heap
    }
};

class GraphService : public QObject, public PathService {
    Q_OBJECT
    Q_PROPERTY(bool isLoaded READ isLoaded NOTIFY isLoadedChanged)
    Q_PROPERTY(int totalSegments READ totalSegments NOTIFY graphChanged)
    Q_PROPERTY(int totalStations READ totalStations NOTIFY graphChanged)

public:
    explicit GraphService(QObject* parent = nullptr);
    ~GraphService();

    // Properties
    bool isLoaded() const { return m_isLoaded; }
    int totalSegments() const { return m_segments.size(); }
    int totalStations() const { return m_stations.size(); }

    // Graph management
    bool loadGraph(const QList<Station>& stations, const QList<TrackSegment>& segments);
    void clearGraph();

    // PathService
    std::optional<QList<TrackSegment>> findPathEdges(const QString& fromStationId,
                                                     const QString& toStationId) const override;
    std::optional<ShortestPath> findShortestPath(const QString& fromStationId,
                                                 const QString& toStationId) const override;
    std::optional<Station> station(const QString& stationId) const override;
    QList<Station> stations() const override;
    QList<TrackSegment> segments() const override { return m_segments; }

    // Graph analysis
    QVariantMap getGraphStatistics() const;
    QStringList validateGraphIntegrity() const;

signals:
    void isLoadedChanged();
    void graphChanged();
    void graphLoadError(const QString& error);

private:
    struct PathfindingResult {
        QStringList stationPath;
        QList<int> segmentPath;    // indices into m_segments
        double totalKm = 0.0;
        bool success = false;
        QString error;
        int nodesExplored = 0;
    };

    PathfindingResult findPathDijkstra(const QString& start, const QString& goal) const;
    void buildAdjacencyMap();
    void recordPathfinding(bool success, double timeMs) const;

private:
    bool m_isLoaded = false;

    QHash<QString, Station> m_stations;
    QStringList m_stationOrder;
    QList<TrackSegment> m_segments;
    QHash<QString, QList<int>> m_adjacencyMap;  // stationId -> incident segment indices

    static constexpr int MAX_NODES_EXPLORED = 100000;
    static constexpr double PATHFINDING_WARNING_THRESHOLD_MS = 50.0;

    // Pathfinding statistics, updated from concurrent propagation
    mutable QMutex m_statsMutex;
    mutable int m_totalPathfindingCalls = 0;
    mutable int m_successfulPaths = 0;
    mutable double m_totalPathfindingTime = 0.0;
};

} // namespace RailPlan::Network
