#include "TrainAdjustment.h"
#include <QDebug>

namespace RailPlan::Resolution {

AdjustmentOutcome applyAdjustment(
    Schedule::Train& train,
    const TrainAdjustment& adjustment,
    const Network::PathService* pathService
) {
    AdjustmentOutcome outcome;

    if (adjustment.trainId != train.id) {
        outcome.error = QString("Adjustment for %1 applied to train %2")
                            .arg(adjustment.trainId.toString(), train.id.toString());
        return outcome;
    }
    if (!train.departureTime.isValid()) {
        outcome.error = QString("Train %1 has no departure time").arg(train.name);
        return outcome;
    }

    if (adjustment.timeAdjustmentMinutes != 0.0) {
        train.shiftDeparture(adjustment.timeAdjustmentMinutes);
        train.totalDelayMinutes += adjustment.timeAdjustmentMinutes;
    }

    const int lastIndex = train.stops.size() - 1;
    for (int k = 0; k < adjustment.dwellDelays.size(); ++k) {
        const int stopIndex = k + 1;
        if (stopIndex >= lastIndex) {
            break;
        }
        const double extra = adjustment.dwellDelays[k];
        if (extra > 0.0) {
            train.stops[stopIndex].extraDwellMinutes += extra;
            train.totalDelayMinutes += extra;
            outcome.dwellDelaysApplied++;
        }
    }

    if (adjustment.trackHint && !train.stops.isEmpty() && pathService) {
        auto origin = pathService->station(train.stops.first().stationId);
        const int hint = *adjustment.trackHint;
        if (origin && hint >= 1 && hint <= origin->platforms) {
            train.stops.first().platform = hint;
            outcome.trackHintApplied = true;
        } else {
            qDebug() << "[TrainAdjustment > applyAdjustment] Ignoring track hint" << hint
                     << "for" << train.name << ": not a platform of" << train.stops.first().stationId;
        }
    }

    outcome.applied = true;
    return outcome;
}

void resetExtraDwell(QList<Schedule::Train>& trains) {
    for (Schedule::Train& train : trains) {
        train.resetExtraDwell();
    }
}

} // namespace RailPlan::Resolution
