#include "qenv/fourier.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "qenv/thermal.hpp"

namespace qenv::fourier {

std::size_t next_pow2(std::size_t n) {
    std::size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

void fft(std::vector<cd>& a, Direction dir) {
    const std::size_t n = a.size();
    if (n == 0) return;
    if ((n & (n - 1)) != 0) {
        throw std::invalid_argument("fourier::fft: length " + std::to_string(n) + " is not a power of two");
    }

    std::size_t bits = 0;
    while ((std::size_t{1} << bits) < n) ++bits;
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t r = 0;
        for (std::size_t b = 0; b < bits; ++b) r |= ((i >> b) & 1U) << (bits - 1 - b);
        if (i < r) std::swap(a[i], a[r]);
    }

    const double sign = dir == Direction::Forward ? -1.0 : 1.0;
    for (std::size_t span = 1; span < n; span <<= 1) {
        const double step = sign * PI / static_cast<double>(span);
        for (std::size_t k = 0; k < span; ++k) {
            // twiddles from the angle directly; a running product drifts on long grids
            const cd w = std::polar(1.0, step * static_cast<double>(k));
            for (std::size_t i = k; i < n; i += 2 * span) {
                const cd odd = w * a[i + span];
                a[i + span] = a[i] - odd;
                a[i] += odd;
            }
        }
    }

    if (dir == Direction::Inverse) {
        const double scale = 1.0 / static_cast<double>(n);
        for (auto& x : a) x *= scale;
    }
}

std::size_t transform_length(double wMax, double tMax) {
    const double wanted = std::ceil(4.0 * tMax * wMax / PI + 1.0);
    std::size_t n = 250;
    if (wanted > static_cast<double>(n)) n = static_cast<std::size_t>(wanted);
    return next_pow2(n);
}

ComplexFunction transform(const ComplexFunction& f, double wMax, double tMax) {
    if (!(tMax > 0.0) || !std::isfinite(tMax)) {
        throw std::invalid_argument("fourier::transform: tMax must be positive and finite");
    }
    if (!(wMax >= 0.0) || !std::isfinite(wMax)) {
        throw std::invalid_argument("fourier::transform: wMax must be non-negative and finite");
    }

    const std::size_t n = transform_length(wMax, tMax);
    const double dt = 2.0 * tMax / static_cast<double>(n - 1);

    std::vector<cd> g(n);
    for (std::size_t k = 0; k < n; ++k) {
        g[k] = f(-tMax + dt * static_cast<double>(k));
    }
    fft(g, Direction::Forward);

    // Reorder to ascending frequencies (fftshift) and undo the shift of the time origin.
    const std::size_t half = n / 2;
    const double dw = 2.0 * PI / (static_cast<double>(n) * dt);
    std::vector<double> w(n);
    std::vector<cd> G(n);
    for (std::size_t m = 0; m < n; ++m) {
        const std::size_t src = (m + half) % n;
        const double wm = dw * (static_cast<double>(m) - static_cast<double>(half));
        w[m] = wm;
        G[m] = dt * std::exp(cd(0.0, wm * tMax)) * g[src];
    }
    return complex_interpolation(w, G, "fourier::transform");
}

} // namespace qenv::fourier
