#pragma once

#include "OracleTypes.h"
#include "../resolution/CancellationToken.h"

namespace RailPlan::Oracle {

struct OracleResult {
    bool success = false;
    QString errorCode;
    QString error;
    OracleResponse response;
    double roundTripMs = 0.0;
};

// Remote service proposing per-train adjustments for a timetable snapshot.
class OptimizationOracle {
public:
    virtual ~OptimizationOracle() = default;

    // Must return within timeoutMs; any failure is reported, never thrown
    virtual OracleResult requestAdjustments(
        const OracleRequest& request,
        int timeoutMs,
        const Resolution::CancellationToken* cancel
    ) = 0;

    virtual QString name() const = 0;
};

} // namespace RailPlan::Oracle
