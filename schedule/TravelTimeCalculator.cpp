#include "TravelTimeCalculator.h"
#include <cmath>
#include <algorithm>

namespace RailPlan::Schedule {

double TravelTimeCalculator::travelTimeHours(
    double distanceKm,
    double speedLimitKmh,
    const KinematicProfile& profile,
    double startSpeedKmh,
    double endSpeedKmh
) {
    if (!(profile.accelerationMs2 > 0.0) || !(profile.decelerationMs2 > 0.0)) {
        throw InvalidKinematics("acceleration and deceleration must be positive");
    }
    if (!(profile.maxSpeedKmh > 0.0) || !(speedLimitKmh > 0.0)) {
        throw InvalidKinematics("max speed and speed limit must be positive");
    }
    if (distanceKm < 0.0 || std::isnan(distanceKm)) {
        throw InvalidKinematics("distance must not be negative");
    }
    if (distanceKm == 0.0) {
        return 0.0;
    }

    const double a = profile.accelerationMs2;
    const double d = profile.decelerationMs2;
    const double distance = distanceKm * 1000.0;
    const double vMax = std::min(profile.maxSpeedKmh, speedLimitKmh) / 3.6;
    const double v0 = std::clamp(startSpeedKmh / 3.6, 0.0, vMax);
    const double v1 = std::clamp(endSpeedKmh / 3.6, 0.0, vMax);

    const double accelDistance = (vMax * vMax - v0 * v0) / (2.0 * a);
    const double brakeDistance = (vMax * vMax - v1 * v1) / (2.0 * d);

    double seconds = 0.0;
    if (accelDistance + brakeDistance <= distance) {
        const double tAccel = (vMax - v0) / a;
        const double tBrake = (vMax - v1) / d;
        const double tCruise = (distance - accelDistance - brakeDistance) / vMax;
        seconds = tAccel + tCruise + tBrake;
    } else {
        // Peak speed never reached: acceleration and braking distances meet
        const double radicand = (distance + (v0 * v0) / (2.0 * a) + (v1 * v1) / (2.0 * d))
                                / (1.0 / (2.0 * a) + 1.0 / (2.0 * d));
        const double vPeak = radicand >= 0.0 ? std::sqrt(radicand) : 0.0;

        if (radicand < 0.0 || vPeak < std::max(v0, v1)) {
            seconds = distance / std::max((v0 + v1) / 2.0, MIN_FALLBACK_SPEED_MS);
        } else {
            seconds = (vPeak - v0) / a + (vPeak - v1) / d;
        }
    }

    return seconds / 3600.0;
}

} // namespace RailPlan::Schedule
