#pragma once

namespace RailPlan::ErrorCode {

inline constexpr const char* INVALID_KINEMATICS = "INVALID_KINEMATICS";
inline constexpr const char* UNREACHABLE_STOP = "UNREACHABLE_STOP";
inline constexpr const char* EMPTY_ROUTE = "EMPTY_ROUTE";
inline constexpr const char* INVALID_INPUT = "INVALID_INPUT";
inline constexpr const char* ORACLE_UNAVAILABLE = "ORACLE_UNAVAILABLE";
inline constexpr const char* RESOLUTION_EXHAUSTED = "RESOLUTION_EXHAUSTED";
inline constexpr const char* OPTIMIZATION_INCOMPLETE = "OPTIMIZATION_INCOMPLETE";
inline constexpr const char* PIPELINE_BUSY = "PIPELINE_BUSY";
inline constexpr const char* CANCELLED = "CANCELLED";
inline constexpr const char* CONFIG_INVALID = "CONFIG_INVALID";
inline constexpr const char* INTERNAL_ERROR = "INTERNAL_ERROR";

} // namespace RailPlan::ErrorCode
