// interpolation.hpp — Callable-or-table adapters for functions of one real variable

#pragma once

#include <complex>
#include <functional>
#include <string>
#include <vector>

namespace qenv {

using RealFunction = std::function<double(double)>;
using ComplexFunction = std::function<std::complex<double>(double)>;

// Callables are used as given.
inline RealFunction real_interpolation(RealFunction f) { return f; }
inline ComplexFunction complex_interpolation(ComplexFunction f) { return f; }

// Tabulated data -> piecewise cubic (modified Akima) interpolant.
// Samples may come in any order; they are sorted by x. Needs at least four points
// with distinct abscissae. Outside [min x, max x] the interpolant returns zero.
// Throws ShapeMismatch if x and y differ in length or are empty.
RealFunction real_interpolation(std::vector<double> x,
                                std::vector<double> y,
                                const std::string& who = "real_interpolation");

// Real and imaginary parts are interpolated separately and recombined as re + i*im.
ComplexFunction complex_interpolation(const std::vector<double>& x,
                                      const std::vector<std::complex<double>>& y,
                                      const std::string& who = "complex_interpolation");

} // namespace qenv
