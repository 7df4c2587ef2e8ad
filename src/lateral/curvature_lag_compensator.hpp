// src/lateral/curvature_lag_compensator.hpp
#pragma once

#include <vector>

#include "lateral/model_time_grid.hpp"

namespace lateral {

constexpr double kMinSpeedMps = 1.0;

// EU guideline, m/s^3
constexpr double kMaxLateralJerk = 5.0;

// Unmodeled latency on top of the actuator delay
constexpr double kExtraDelayS = 0.2;

struct CurvatureCommand {
    double curvature = 0.0;        // 1/m
    double curvature_rate = 0.0;   // 1/(m*s)
};

/**
 * CurvatureLagCompensator - Delay-compensated curvature setpoint
 *
 * The planner may turn the wheel and turn back within the actuator delay,
 * so corrections inside that window never get commanded. Instead, the
 * heading reached at t = delay gives an average curvature over the delay,
 * and the current setpoint is extrapolated from it. Both outputs are
 * clamped by the lateral jerk limit scaled by 1/v^2.
 *
 * Trajectories must have kControlN samples on t_idxs(); anything else is
 * replaced by zeros.
 */
class CurvatureLagCompensator {
public:
    static CurvatureCommand compensate(double actuator_delay_s,
                                       double v_ego_mps,
                                       const std::vector<double>& psis,
                                       const std::vector<double>& curvatures,
                                       const std::vector<double>& curvature_rates);

    // Not exact: ignores the curvature already present
    static double max_curvature_rate(double v_ego_mps);
};

} // namespace lateral
