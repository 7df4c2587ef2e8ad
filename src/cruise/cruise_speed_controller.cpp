// src/cruise/cruise_speed_controller.cpp
#include "cruise/cruise_speed_controller.hpp"
#include "utils/control_math.hpp"
#include "utils/conversions.hpp"
#include "utils/logging.hpp"

#include <cmath>

namespace cruise {

CruiseSpeedController::CruiseSpeedController(const config::VehicleParams& params,
                                             const config::SettingsProvider& settings)
    : CruiseSpeedController(params, settings, policy_kind_for_brand(params.brand))
{
}

CruiseSpeedController::CruiseSpeedController(const config::VehicleParams& params,
                                             const config::SettingsProvider& settings,
                                             AdjustPolicyKind policy)
    : params_(params),
      settings_(&settings),
      policy_(make_policy(policy))
{
    reverse_acc_change_ = settings_->get_bool(config::kReverseAccChangeKey, false);

    LOG_INFO("[CruiseSpeedController] brand=%s policy=%s set_speed_owner=%s",
             params_.brand.c_str(), to_string(policy_->kind()),
             params_.owns_set_speed() ? "pcm" : "local");
}

void CruiseSpeedController::update(const VehicleState& cs, bool long_enabled,
                                   bool is_metric, double now_s) {
    previous_kph_ = target_kph_;

    reverse_acc_change_ = settings_->get_bool(config::kReverseAccChangeKey, false);

    if (!cs.cruise_available) {
        if (target_kph_) {
            LOG_DEBUG("[CruiseSpeedController] cruise unavailable, clearing set speed");
        }
        target_kph_.reset();
        cluster_kph_.reset();
        return;
    }

    if (params_.owns_set_speed()) {
        target_kph_ = cs.cruise_speed_mps * utils::MS_TO_KPH;
        cluster_kph_ = cs.cruise_speed_cluster_mps * utils::MS_TO_KPH;
        return;
    }

    if (!cs.cruise_enabled) return;

    const AdjustContext ctx{cs, long_enabled, is_metric, reverse_acc_change_, now_s, holds_};
    target_kph_ = policy_->adjust(target_kph_, ctx);
    cluster_kph_ = target_kph_;

    holds_.update(cs);
}

void CruiseSpeedController::initialize(const VehicleState& cs, bool is_metric) {
    if (params_.owns_set_speed()) return;

    const bool resume = cs.has_event(ButtonType::AccelCruise) ||
                        cs.has_event(ButtonType::ResumeCruise);

    if (resume && previous_kph_ && *previous_kph_ < kNeverSetThresholdKph) {
        target_kph_ = previous_kph_;
        LOG_INFO("[CruiseSpeedController] Resuming set speed %.1f kph", *target_kph_);
    } else {
        const double enable_min = is_metric ? kCruiseEnableMinKph : kCruiseEnableMinMphKph;
        target_kph_ = std::round(utils::clip(cs.v_ego_mps * utils::MS_TO_KPH,
                                             enable_min, kCruiseMaxKph));
        LOG_INFO("[CruiseSpeedController] Set speed from ego: %.0f kph", *target_kph_);
    }

    cluster_kph_ = target_kph_;
}

void CruiseSpeedController::reset() {
    target_kph_.reset();
    cluster_kph_.reset();
    previous_kph_.reset();
    holds_.reset();
    policy_->reset();
}

} // namespace cruise
