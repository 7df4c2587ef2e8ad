// src/lateral/curvature_lag_compensator.cpp
#include "lateral/curvature_lag_compensator.hpp"
#include "utils/control_math.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace lateral {

CurvatureCommand CurvatureLagCompensator::compensate(double actuator_delay_s,
                                                     double v_ego_mps,
                                                     const std::vector<double>& psis,
                                                     const std::vector<double>& curvatures,
                                                     const std::vector<double>& curvature_rates) {
    static const std::vector<double> zeros(kControlN, 0.0);

    const bool aligned = psis.size() == kControlN &&
                         curvatures.size() == kControlN &&
                         curvature_rates.size() == kControlN;
    if (!aligned) {
        LOG_DEBUG("[CurvatureLagCompensator] trajectory sizes %zu/%zu/%zu, expected %zu; "
                  "commanding zero",
                  psis.size(), curvatures.size(), curvature_rates.size(), kControlN);
    }
    const std::vector<double>& psi_traj = aligned ? psis : zeros;
    const std::vector<double>& curv_traj = aligned ? curvatures : zeros;
    const std::vector<double>& rate_traj = aligned ? curvature_rates : zeros;

    const double v = std::max(kMinSpeedMps, v_ego_mps);
    const double delay = std::max(0.0, actuator_delay_s) + kExtraDelayS;

    const double current_curvature_desired = curv_traj[0];
    const double psi = utils::interp(delay, t_idxs().data(), psi_traj.data(), kControlN);
    const double average_curvature_desired = psi / (v * delay);
    const double desired_curvature = 2.0 * average_curvature_desired - current_curvature_desired;

    // Rate of the setpoint, not an actual steering rate
    const double max_rate = max_curvature_rate(v);

    CurvatureCommand cmd;
    cmd.curvature_rate = utils::clip(rate_traj[0], -max_rate, max_rate);
    cmd.curvature = utils::clip(desired_curvature,
                                current_curvature_desired - max_rate * kDtMdl,
                                current_curvature_desired + max_rate * kDtMdl);
    return cmd;
}

double CurvatureLagCompensator::max_curvature_rate(double v_ego_mps) {
    const double v = std::max(kMinSpeedMps, v_ego_mps);
    return kMaxLateralJerk / (v * v);
}

} // namespace lateral
