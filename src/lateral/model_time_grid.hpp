// src/lateral/model_time_grid.hpp
#pragma once

#include <array>
#include <cstddef>

namespace lateral {

// Planner output: 33 samples, quadratically spaced over 10 s
constexpr std::size_t kIdxN = 33;
constexpr double kModelHorizonS = 10.0;

// Planning step of the model (20 Hz)
constexpr double kDtMdl = 0.05;

// Samples of the trajectory the lateral controller consumes
constexpr std::size_t kControlN = 17;

// T_IDXS[i] = 10 * (i / 32)^2
inline const std::array<double, kIdxN>& t_idxs() {
    static const std::array<double, kIdxN> grid = [] {
        std::array<double, kIdxN> g{};
        for (std::size_t i = 0; i < kIdxN; ++i) {
            const double r = static_cast<double>(i) / static_cast<double>(kIdxN - 1);
            g[i] = kModelHorizonS * r * r;
        }
        return g;
    }();
    return grid;
}

} // namespace lateral
