#pragma once

#include "../schedule/Train.h"
#include "../network/PathService.h"
#include <QList>
#include <optional>

namespace RailPlan::Resolution {

struct TrainAdjustment {
    QUuid trainId;
    double timeAdjustmentMinutes = 0.0;
    QList<double> dwellDelays;          // aligned to intermediate stops (stop index k + 1)
    std::optional<int> trackHint;       // advisory only
    double confidence = 1.0;
};

struct AdjustmentOutcome {
    bool applied = false;
    bool trackHintApplied = false;
    int dwellDelaysApplied = 0;
    QString error;
};

// Shifts departure, adds dwell delays > 0 and takes the track hint only when the
// origin station actually has that platform.
AdjustmentOutcome applyAdjustment(
    Schedule::Train& train,
    const TrainAdjustment& adjustment,
    const Network::PathService* pathService
);

void resetExtraDwell(QList<Schedule::Train>& trains);

} // namespace RailPlan::Resolution
