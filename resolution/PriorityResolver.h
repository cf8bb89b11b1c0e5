#pragma once

#include "CancellationToken.h"
#include "../schedule/TimetablePropagator.h"
#include "../schedule/ConflictDetector.h"
#include "../config/SchedulerConfig.h"
#include <QHash>

namespace RailPlan::Resolution {

enum class ResolverState {
    DETECTING,
    RESOLVING,
    CONVERGED,
    EXHAUSTED
};

struct LocalResolutionResult {
    bool success = false;
    QString errorCode;
    QString error;
    ResolverState state = ResolverState::DETECTING;
    int iterations = 0;
    int initialConflictCount = 0;
    QList<Schedule::Conflict> remainingConflicts;
    QHash<QUuid, double> delayAppliedMinutes;
    QList<Schedule::PropagationFailure> failures;

    QVariantMap toVariantMap() const;
};

/*
 * Greedy local repair: each iteration delays the lowest-priority train of every
 * conflict by a fixed increment, then re-detects. No backtracking.
 */
class PriorityResolver {
public:
    PriorityResolver(
        const Schedule::TimetablePropagator* propagator,
        const Schedule::ConflictDetector* detector,
        const Config::ResolverConfig& config = Config::ResolverConfig()
    );

    LocalResolutionResult resolve(QList<Schedule::Train>& trains, const CancellationToken* cancel = nullptr) const;

    // Party absorbing the delay: lower priority, then higher number, then higher id
    static const Schedule::ConflictParty& choosePartyToDelay(const Schedule::Conflict& conflict);

    // Delays the train from stopIndex onward; earlier stops keep their times.
    // A skipped stop passes the delay back to the last stop the train calls at,
    // and pinned times from there on move with it.
    static bool delayFromStop(Schedule::Train& train, int stopIndex, double minutes);

private:
    static int delayStopFor(const Schedule::Conflict& conflict, const Schedule::ConflictParty& party);
    static int absorbingStop(const Schedule::Train& train, int stopIndex);

    const Schedule::TimetablePropagator* m_propagator;
    const Schedule::ConflictDetector* m_detector;
    Config::ResolverConfig m_config;
};

QString resolverStateToString(ResolverState state);

} // namespace RailPlan::Resolution
