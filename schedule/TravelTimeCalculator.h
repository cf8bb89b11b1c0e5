#pragma once

#include "Train.h"
#include <stdexcept>
#include <string>

namespace RailPlan::Schedule {

class InvalidKinematics : public std::invalid_argument {
public:
    explicit InvalidKinematics(const std::string& what) : std::invalid_argument(what) {}
};

// Trapezoidal velocity profile: accelerate, cruise at min(maxSpeed, limit), brake.
class TravelTimeCalculator {
public:
    // Returns hours. Throws InvalidKinematics on non-positive rates or speeds.
    static double travelTimeHours(
        double distanceKm,
        double speedLimitKmh,
        const KinematicProfile& profile,
        double startSpeedKmh = 0.0,
        double endSpeedKmh = 0.0
    );

private:
    static constexpr double MIN_FALLBACK_SPEED_MS = 1.0;
};

} // namespace RailPlan::Schedule
