#pragma once
#include <cmath>
#include <cstddef>

namespace utils
{

    inline double clip(double v, double lo, double hi)
    {
        return (v < lo) ? lo : ((v > hi) ? hi : v);
    }

    // Shrinks |error| by deadzone; anything inside the band is exactly zero
    inline double apply_deadzone(double error, double deadzone)
    {
        if (error > deadzone)
            return error - deadzone;
        if (error < -deadzone)
            return error + deadzone;
        return 0.0;
    }

    // down_step is expected <= 0
    inline double rate_limit(double new_value, double last_value, double down_step, double up_step)
    {
        return clip(new_value, last_value + down_step, last_value + up_step);
    }

    // Modulo with the sign of the divisor (floored division)
    inline double floor_mod(double a, double b)
    {
        double r = std::fmod(a, b);
        if (r != 0.0 && ((r < 0.0) != (b < 0.0)))
            r += b;
        return r;
    }

    // Half away from zero at one decimal place
    inline double round_to_tenth(double v)
    {
        return std::round(v * 10.0) / 10.0;
    }

    // Piecewise-linear interpolation over ascending xp.
    // Outside [xp[0], xp[n-1]] the end values are held.
    inline double interp(double x, const double *xp, const double *fp, std::size_t n)
    {
        if (n == 0)
            return 0.0;
        if (x <= xp[0])
            return fp[0];
        if (x >= xp[n - 1])
            return fp[n - 1];

        std::size_t hi = 1;
        while (hi < n - 1 && xp[hi] < x)
            ++hi;

        const std::size_t lo = hi - 1;
        const double span = xp[hi] - xp[lo];
        if (span <= 0.0)
            return fp[hi];

        const double a = (x - xp[lo]) / span;
        return fp[lo] + a * (fp[hi] - fp[lo]);
    }

} // namespace utils
