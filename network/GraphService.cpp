#include "GraphService.h"
#include <QSet>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <algorithm>

namespace RailPlan::Network {

GraphService::GraphService(QObject* parent)
    : QObject(parent)
{
}

GraphService::~GraphService() = default;

bool GraphService::loadGraph(const QList<Station>& stations, const QList<TrackSegment>& segments) {
    clearGraph();

    for (const Station& s : stations) {
        if (s.id.isEmpty()) {
            qWarning() << "[GraphService > loadGraph] Skipping station without id";
            continue;
        }
        if (m_stations.contains(s.id)) {
            qWarning() << "[GraphService > loadGraph] Duplicate station id:" << s.id;
            continue;
        }
        Station copy = s;
        copy.platforms = std::max(1, s.platforms);
        m_stations.insert(copy.id, copy);
        m_stationOrder.append(copy.id);
    }

    for (const TrackSegment& segment : segments) {
        if (!(segment.distanceKm > 0.0)) {
            QString error = QString("Segment %1 has non-positive distance %2")
                                .arg(segment.id).arg(segment.distanceKm);
            qCritical() << "[GraphService > loadGraph]" << error;
            emit graphLoadError(error);
            clearGraph();
            return false;
        }

        // Validate segment references exist in station nodes
        if (!m_stations.contains(segment.fromStationId) || !m_stations.contains(segment.toStationId)) {
            qWarning() << "[GraphService > loadGraph] Segment" << segment.id
                       << "references unknown station:" << segment.fromStationId << "/" << segment.toStationId;
            continue;
        }

        m_segments.append(segment);
    }

    buildAdjacencyMap();
    m_isLoaded = true;

    emit isLoadedChanged();
    emit graphChanged();

    QStringList warnings = validateGraphIntegrity();
    if (!warnings.isEmpty()) {
        qWarning() << "[GraphService > loadGraph] Graph integrity warnings:";
        for (const QString& warning : warnings) {
            qWarning() << " -" << warning;
        }
    }

    qDebug() << "[GraphService > loadGraph] Loaded" << m_stations.size() << "stations,"
             << m_segments.size() << "segments";
    return true;
}

void GraphService::buildAdjacencyMap() {
    m_adjacencyMap.clear();

    // Segments are bidirectional: index each one under both ends
    for (int i = 0; i < m_segments.size(); ++i) {
        const TrackSegment& segment = m_segments[i];
        m_adjacencyMap[segment.fromStationId].append(i);
        if (segment.toStationId != segment.fromStationId) {
            m_adjacencyMap[segment.toStationId].append(i);
        }
    }
}

void GraphService::clearGraph() {
    m_stations.clear();
    m_stationOrder.clear();
    m_segments.clear();
    m_adjacencyMap.clear();
    m_isLoaded = false;
    emit isLoadedChanged();
    emit graphChanged();
}

std::optional<Station> GraphService::station(const QString& stationId) const {
    auto it = m_stations.constFind(stationId);
    if (it == m_stations.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QList<Station> GraphService::stations() const {
    QList<Station> result;
    result.reserve(m_stationOrder.size());
    for (const QString& id : m_stationOrder) {
        result.append(m_stations.value(id));
    }
    return result;
}

std::optional<QList<TrackSegment>> GraphService::findPathEdges(const QString& fromStationId,
                                                               const QString& toStationId) const {
    QElapsedTimer timer;
    timer.start();

    PathfindingResult result = findPathDijkstra(fromStationId, toStationId);
    recordPathfinding(result.success, timer.nsecsElapsed() / 1e6);

    if (!result.success) {
        qWarning() << "[GraphService > findPathEdges] Pathfinding failed for"
                   << fromStationId << "->" << toStationId << ":" << result.error;
        return std::nullopt;
    }

    QList<TrackSegment> edges;
    edges.reserve(result.segmentPath.size());
    for (int index : result.segmentPath) {
        edges.append(m_segments[index]);
    }
    return edges;
}

std::optional<ShortestPath> GraphService::findShortestPath(const QString& fromStationId,
                                                           const QString& toStationId) const {
    QElapsedTimer timer;
    timer.start();

    PathfindingResult result = findPathDijkstra(fromStationId, toStationId);
    recordPathfinding(result.success, timer.nsecsElapsed() / 1e6);

    if (!result.success) {
        return std::nullopt;
    }
    return ShortestPath{result.stationPath, result.totalKm};
}

GraphService::PathfindingResult GraphService::findPathDijkstra(const QString& start, const QString& goal) const {
    PathfindingResult result;

    if (!m_stations.contains(start)) {
        result.error = QString("Start station not found: %1").arg(start);
        return result;
    }
    if (!m_stations.contains(goal)) {
        result.error = QString("Goal station not found: %1").arg(goal);
        return result;
    }

    if (start == goal) {
        result.stationPath = QStringList{start};
        result.success = true;
        return result;
    }

    std::priority_queue<PathfindingNode> openSet;
    QSet<QString> closedSet;
    QHash<QString, double> bestCost;
    QHash<QString, int> cameBySegment;   // stationId -> segment index used to reach it

    openSet.push(PathfindingNode{start, 0.0});
    bestCost[start] = 0.0;

    while (!openSet.empty()) {
        PathfindingNode current = openSet.top();
        openSet.pop();

        if (closedSet.contains(current.stationId)) {
            continue;
        }
        closedSet.insert(current.stationId);
        result.nodesExplored++;

        if (current.stationId == goal) {
            QString cursor = goal;
            while (cursor != start) {
                int segmentIndex = cameBySegment.value(cursor);
                result.segmentPath.prepend(segmentIndex);
                result.stationPath.prepend(cursor);
                cursor = m_segments[segmentIndex].otherEnd(cursor);
            }
            result.stationPath.prepend(start);
            result.totalKm = current.costKm;
            result.success = true;
            return result;
        }

        if (result.nodesExplored > MAX_NODES_EXPLORED) {
            result.error = "Maximum nodes explored limit reached";
            return result;
        }

        const QList<int> incident = m_adjacencyMap.value(current.stationId);
        for (int segmentIndex : incident) {
            const TrackSegment& segment = m_segments[segmentIndex];
            QString neighbor = segment.otherEnd(current.stationId);
            if (closedSet.contains(neighbor)) {
                continue;
            }

            double tentative = current.costKm + segment.distanceKm;
            auto known = bestCost.constFind(neighbor);
            if (known == bestCost.constEnd() || tentative < known.value()) {
                bestCost[neighbor] = tentative;
                cameBySegment[neighbor] = segmentIndex;
                openSet.push(PathfindingNode{neighbor, tentative});
            }
        }
    }

    result.error = "No path found";
    return result;
}

void GraphService::recordPathfinding(bool success, double timeMs) const {
    QMutexLocker locker(&m_statsMutex);
    m_totalPathfindingCalls++;
    if (success) {
        m_successfulPaths++;
    }
    m_totalPathfindingTime += timeMs;

    if (timeMs > PATHFINDING_WARNING_THRESHOLD_MS) {
        qWarning() << "[GraphService > findPath] Slow pathfinding:" << timeMs << "ms";
    }
}

QVariantMap GraphService::getGraphStatistics() const {
    int singleOccupancy = 0;
    double totalKm = 0.0;
    for (const TrackSegment& segment : m_segments) {
        if (segment.isSingleOccupancy()) {
            singleOccupancy++;
        }
        totalKm += segment.distanceKm;
    }

    QMutexLocker locker(&m_statsMutex);
    double successRate = m_totalPathfindingCalls > 0 ?
                        (double)m_successfulPaths / m_totalPathfindingCalls * 100.0 : 0.0;
    double avgTimeMs = m_totalPathfindingCalls > 0 ?
                      m_totalPathfindingTime / m_totalPathfindingCalls : 0.0;

    return QVariantMap{
        {"isLoaded", m_isLoaded},
        {"totalStations", m_stations.size()},
        {"totalSegments", m_segments.size()},
        {"singleOccupancySegments", singleOccupancy},
        {"networkLengthKm", totalKm},
        {"totalPathfindingCalls", m_totalPathfindingCalls},
        {"successfulPaths", m_successfulPaths},
        {"successRate", successRate},
        {"averagePathfindingTimeMs", avgTimeMs}
    };
}

QStringList GraphService::validateGraphIntegrity() const {
    QStringList warnings;

    // Orphaned stations
    for (const QString& id : m_stationOrder) {
        if (!m_adjacencyMap.contains(id)) {
            warnings.append(QString("Orphaned station (no segments): %1").arg(id));
        }
    }

    // Parallel segments between the same pair of stations
    QSet<QString> seenPairs;
    for (const TrackSegment& segment : m_segments) {
        QString a = std::min(segment.fromStationId, segment.toStationId);
        QString b = std::max(segment.fromStationId, segment.toStationId);
        QString pairKey = a + "|" + b;
        if (seenPairs.contains(pairKey)) {
            warnings.append(QString("Parallel segments between %1 and %2").arg(a, b));
        }
        seenPairs.insert(pairKey);

        if (segment.fromStationId == segment.toStationId) {
            warnings.append(QString("Self-loop segment: %1").arg(segment.id));
        }
    }

    return warnings;
}

} // namespace RailPlan::Network
