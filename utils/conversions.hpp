#pragma once

namespace utils
{

    constexpr double MS_TO_KPH = 3.6;
    constexpr double KPH_TO_MS = 1.0 / MS_TO_KPH;
    constexpr double MPH_TO_KPH = 1.609344;
    constexpr double KPH_TO_MPH = 1.0 / MPH_TO_KPH;
    constexpr double MS_TO_MPH = MS_TO_KPH * KPH_TO_MPH;

} // namespace utils
