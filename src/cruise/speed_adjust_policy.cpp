// src/cruise/speed_adjust_policy.cpp
#include "cruise/speed_adjust_policy.hpp"
#include "cruise/ramping_speed_policy.hpp"
#include "cruise/simple_speed_policy.hpp"

namespace cruise {

const char* to_string(AdjustPolicyKind kind) {
    switch (kind) {
    case AdjustPolicyKind::Simple:
        return "simple";
    case AdjustPolicyKind::Ramping:
        return "ramping";
    }
    return "unknown";
}

AdjustPolicyKind policy_kind_for_brand(const std::string& brand) {
    if (brand == "honda") return AdjustPolicyKind::Ramping;
    return AdjustPolicyKind::Simple;
}

std::unique_ptr<SpeedAdjustPolicy> make_policy(AdjustPolicyKind kind) {
    switch (kind) {
    case AdjustPolicyKind::Ramping:
        return std::make_unique<RampingSpeedPolicy>();
    case AdjustPolicyKind::Simple:
        break;
    }
    return std::make_unique<SimpleSpeedPolicy>();
}

} // namespace cruise
