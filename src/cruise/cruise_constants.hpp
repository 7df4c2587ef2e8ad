// src/cruise/cruise_constants.hpp
#pragma once

#include <cstdint>

namespace cruise {

// Model predictions above this speed are outside the training distribution
constexpr double kCruiseMaxKph = 145.0;
constexpr double kCruiseMinKph = 8.0;
constexpr double kCruiseMinRampingKph = 5.0;
constexpr double kRampingDelta = 5.0;

constexpr double kCruiseEnableMinKph = 30.0;
constexpr double kCruiseEnableMinMphKph = 32.0;  // imperial cars, still in kph

// Display value for a speed that was never set
constexpr double kCruiseInitialKph = 255.0;
// Anything at or above this was never a real set speed
constexpr double kNeverSetThresholdKph = 250.0;

constexpr uint32_t kLongPressCycles = 50;

// Simple policy intervals. 1.6 rather than MPH_TO_KPH: the exact factor drifts
// after repeated round-to-tenth.
constexpr double kIntervalMetric = 1.0;
constexpr double kIntervalImperial = 1.6;
constexpr double kLongPressMultiplierMetric = 10.0;
constexpr double kLongPressMultiplierImperial = 5.0;

// Ramping policy hold timing
constexpr double kRampHoldPeriodS = 1.0;
constexpr double kRampFastHoldPeriodS = 0.5;

// Linear fit to the cluster's mph display
constexpr double kDisplayMphGain = 0.6233;
constexpr double kDisplayMphOffset = 0.0995;

// Control loop period
constexpr double kDtCtrl = 0.01;

inline double cycle_to_seconds(uint64_t frame) {
    return static_cast<double>(frame) * kDtCtrl;
}

} // namespace cruise
