#pragma once

#include <complex>
#include <cstddef>
#include <vector>

#include "qenv/interpolation.hpp"

namespace qenv::fourier {

using cd = std::complex<double>;

enum class Direction { Forward, Inverse };

// Smallest power of two >= n (1 for n == 0).
std::size_t next_pow2(std::size_t n);

// In-place radix-2 FFT of a power-of-two length. Forward uses e^{-2 pi i k m / n};
// Inverse uses e^{+2 pi i k m / n} and divides by n.
void fft(std::vector<cd>& a, Direction dir);

// Number of samples on [-tMax, tMax] needed to resolve frequencies up to wMax
// (Nyquist spacing dt ~ pi / (2 wMax), never fewer than 250), rounded up to a power of two.
std::size_t transform_length(double wMax, double tMax);

// Approximates g(w) = \int f(t) e^{-i w t} dt by sampling f uniformly on [-tMax, tMax].
// The returned callable interpolates the discrete transform and is zero outside the
// resolved frequency window. f must be negligible outside [-tMax, tMax].
ComplexFunction transform(const ComplexFunction& f, double wMax, double tMax);

} // namespace qenv::fourier
