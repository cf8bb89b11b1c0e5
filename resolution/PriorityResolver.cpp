#include "PriorityResolver.h"
#include "../core/ErrorCodes.h"
#include <QSet>
#include <QVariantList>
#include <algorithm>

namespace RailPlan::Resolution {

using Schedule::Conflict;
using Schedule::ConflictParty;
using Schedule::ConflictType;
using Schedule::Train;

QString resolverStateToString(ResolverState state) {
    switch (state) {
        case ResolverState::DETECTING: return "DETECTING";
        case ResolverState::RESOLVING: return "RESOLVING";
        case ResolverState::CONVERGED: return "CONVERGED";
        case ResolverState::EXHAUSTED: return "EXHAUSTED";
        default: return "UNKNOWN";
    }
}

QVariantMap LocalResolutionResult::toVariantMap() const {
    QVariantList conflicts;
    for (const Conflict& conflict : remainingConflicts) {
        conflicts.append(conflict.toVariantMap());
    }

    QVariantMap delays;
    for (auto it = delayAppliedMinutes.constBegin(); it != delayAppliedMinutes.constEnd(); ++it) {
        delays[it.key().toString(QUuid::WithoutBraces)] = it.value();
    }

    return QVariantMap{
        {"success", success},
        {"errorCode", errorCode},
        {"error", error},
        {"state", resolverStateToString(state)},
        {"iterations", iterations},
        {"initialConflictCount", initialConflictCount},
        {"remainingConflictCount", remainingConflicts.size()},
        {"remainingConflicts", conflicts},
        {"delayAppliedMinutes", delays},
        {"excludedTrains", failures.size()}
    };
}

PriorityResolver::PriorityResolver(
    const Schedule::TimetablePropagator* propagator,
    const Schedule::ConflictDetector* detector,
    const Config::ResolverConfig& config
)
    : m_propagator(propagator)
    , m_detector(detector)
    , m_config(config)
{
}

const ConflictParty& PriorityResolver::choosePartyToDelay(const Conflict& conflict) {
    const ConflictParty& a = conflict.first;
    const ConflictParty& b = conflict.second;

    if (a.priority != b.priority) {
        return a.priority < b.priority ? a : b;
    }
    if (a.trainNumber != b.trainNumber) {
        return a.trainNumber > b.trainNumber ? a : b;
    }
    return a.trainId.toString() > b.trainId.toString() ? a : b;
}

int PriorityResolver::delayStopFor(const Conflict& conflict, const ConflictParty& party) {
    if (conflict.type == ConflictType::TRACK_OCCUPANCY) {
        // Hold the train at the stop the leg starts from
        return party.stopIndex;
    }
    // Station: arrival at the conflict stop moves when the previous stop departs later
    return party.stopIndex == 0 ? 0 : party.stopIndex - 1;
}

int PriorityResolver::absorbingStop(const Train& train, int stopIndex) {
    // The terminus has no departure and a skipped stop has no dwell
    int stop = std::min(stopIndex, static_cast<int>(train.stops.size()) - 2);
    while (stop > 0 && train.stops[stop].isSkipped) {
        --stop;
    }
    return std::max(0, stop);
}

bool PriorityResolver::delayFromStop(Train& train, int stopIndex, double minutes) {
    if (stopIndex < 0 || stopIndex >= train.stops.size() || train.stops.size() < 2) {
        return false;
    }

    const int stop = absorbingStop(train, stopIndex);
    if (stop == 0) {
        train.shiftDeparture(minutes);
    } else {
        train.stops[stop].extraDwellMinutes += minutes;
        train.shiftPinsFrom(stop, minutes);
    }
    train.totalDelayMinutes += minutes;
    return true;
}

LocalResolutionResult PriorityResolver::resolve(QList<Train>& trains, const CancellationToken* cancel) const {
    LocalResolutionResult result;

    if (!m_propagator || !m_detector) {
        result.errorCode = ErrorCode::INTERNAL_ERROR;
        result.error = "Resolver is missing its propagator or detector";
        qCritical() << "[PriorityResolver > resolve]" << result.error;
        return result;
    }

    QHash<QUuid, int> indexById;
    for (int i = 0; i < trains.size(); ++i) {
        indexById.insert(trains[i].id, i);
    }

    bool firstPass = true;
    while (true) {
        if (cancel && cancel->isCancelled()) {
            result.errorCode = ErrorCode::CANCELLED;
            result.error = "Local resolution cancelled";
            return result;
        }

        // Detecting
        result.state = ResolverState::DETECTING;
        Schedule::FleetRefreshResult fleet = m_propagator->refreshSchedules(trains);
        QList<Conflict> conflicts = m_detector->detect(fleet.timetables);
        Schedule::ConflictDetector::sortConflicts(conflicts);
        result.failures = fleet.failures;

        if (firstPass) {
            result.initialConflictCount = conflicts.size();
            firstPass = false;
        }

        if (conflicts.isEmpty()) {
            result.state = ResolverState::CONVERGED;
            result.success = true;
            qDebug() << "[PriorityResolver > resolve] Converged after" << result.iterations << "iterations";
            return result;
        }

        if (result.iterations >= m_config.maxIterations) {
            result.state = ResolverState::EXHAUSTED;
            result.remainingConflicts = conflicts;
            result.errorCode = ErrorCode::RESOLUTION_EXHAUSTED;
            result.error = QString("%1 conflicts remain after %2 iterations")
                               .arg(conflicts.size()).arg(result.iterations);
            qWarning() << "[PriorityResolver > resolve]" << result.error;
            return result;
        }

        // Resolving
        result.state = ResolverState::RESOLVING;
        QSet<QUuid> delayedThisRound;
        for (const Conflict& conflict : conflicts) {
            const ConflictParty& party = choosePartyToDelay(conflict);
            if (delayedThisRound.contains(party.trainId)) {
                continue;
            }

            auto it = indexById.constFind(party.trainId);
            if (it == indexById.constEnd()) {
                continue;
            }

            Train& train = trains[it.value()];
            if (!delayFromStop(train, delayStopFor(conflict, party), m_config.delayIncrementMinutes)) {
                qWarning() << "[PriorityResolver > resolve] Cannot delay" << train.name << "at stop" << party.stopIndex;
                continue;
            }
            result.delayAppliedMinutes[train.id] += m_config.delayIncrementMinutes;
            delayedThisRound.insert(train.id);
        }

        result.iterations++;
    }
}

} // namespace RailPlan::Resolution
