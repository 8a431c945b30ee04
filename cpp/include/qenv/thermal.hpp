#pragma once

#include <cmath>

namespace qenv {

inline constexpr double PI = 3.141592653589793238462643383279502884;

// Bose-Einstein occupation 1/(exp(w/T) - 1); zero for T <= 0 and at w == 0.
inline double n_thermal(double w, double T) noexcept {
    if (!(T > 0.0) || w == 0.0) return 0.0;
    return 1.0 / std::expm1(w / T);
}

inline double heaviside(double x) noexcept { return x > 0.0 ? 1.0 : 0.0; }

inline double sign(double x) noexcept {
    if (x > 0.0) return 1.0;
    if (x < 0.0) return -1.0;
    return 0.0;
}

} // namespace qenv
