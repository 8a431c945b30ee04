#include "qenv/fit.hpp"

#include "qenv/errors.hpp"
#include "qenv/thermal.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace qenv::fit {

std::vector<double> pack(const Parameters& params) {
    std::vector<double> flat;
    for (const auto& kind : params) flat.insert(flat.end(), kind.begin(), kind.end());
    return flat;
}

Parameters unpack(const std::vector<double>& flat, std::size_t n) {
    if (n == 0 || flat.size() % n != 0) {
        throw std::invalid_argument("unpack: " + std::to_string(flat.size())
                                    + " values cannot be split into " + std::to_string(n) + " kinds");
    }
    const std::size_t N = flat.size() / n;
    Parameters params(n);
    for (std::size_t j = 0; j < n; ++j) {
        params[j].assign(flat.begin() + static_cast<std::ptrdiff_t>(j * N),
                         flat.begin() + static_cast<std::ptrdiff_t>((j + 1) * N));
    }
    return params;
}

std::vector<double> replicate(const std::vector<double>& per_kind, std::size_t N) {
    std::vector<double> flat;
    flat.reserve(per_kind.size() * N);
    for (double v : per_kind) flat.insert(flat.end(), N, v);
    return flat;
}

double nyquist_frequency(const std::vector<double>& x) {
    std::vector<double> sorted(x);
    std::sort(sorted.begin(), sorted.end());
    double dx = std::numeric_limits<double>::infinity();
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        const double step = sorted[i] - sorted[i - 1];
        if (step > 0.0) dx = std::min(dx, step);
    }
    return std::isfinite(dx) ? PI / dx : std::numeric_limits<double>::infinity();
}

Guesses default_guesses(const std::vector<double>& y,
                        const std::vector<double>& x,
                        Scenario scenario,
                        std::size_t N,
                        std::size_t n) {
    if (y.empty() || x.size() != y.size()) {
        throw ShapeMismatch("default_guesses: x and y must be non-empty and of equal length");
    }
    constexpr double inf = std::numeric_limits<double>::infinity();

    double peak = 0.0;
    for (double v : y) peak = std::max(peak, std::abs(v));

    Guesses g;
    if (peak == 0.0) {
        g.guesses.assign(n * N, 0.0);
        g.lower = g.guesses;
        g.upper = g.guesses;
        return g;
    }
    const double xp = x[static_cast<std::size_t>(std::max_element(y.begin(), y.end()) - y.begin())];

    const bool full = (n == 4);
    const double c_max = nyquist_frequency(x);
    if (n != 3 && !(full && scenario != Scenario::SpectralDensity)) {
        throw std::invalid_argument("default_guesses: unsupported number of parameter kinds "
                                    + std::to_string(n));
    }
    switch (scenario) {
        case Scenario::CorrelationReal:
            if (full) {
                g.guesses = replicate({peak, -100 * peak, 0, 0}, N);
                g.lower = replicate({-100 * peak, -inf, -1, -100 * peak}, N);
                g.upper = replicate({100 * peak, 0, 1, 100 * peak}, N);
            } else {
                g.guesses = replicate({peak, -xp, std::min(xp, c_max)}, N);
                g.lower = replicate({-20 * peak, -inf, 0}, N);
                g.upper = replicate({20 * peak, 0.1, c_max}, N);
            }
            break;
        case Scenario::CorrelationImag:
            if (full) {
                g.guesses = replicate({0, -10 * peak, 0, 0}, N);
                g.lower = replicate({-100 * peak, -inf, -1, -100 * peak}, N);
                g.upper = replicate({100 * peak, 0, 2, 100 * peak}, N);
            } else {
                g.guesses = replicate({-peak, -10 * peak, std::min(1.0, c_max)}, N);
                g.lower = replicate({-20 * peak, -inf, 0}, N);
                g.upper = replicate({10 * peak, 0, c_max}, N);
            }
            break;
        case Scenario::SpectralDensity:
            g.guesses = replicate({peak, xp, xp}, N);
            g.lower = replicate({-100 * peak, 0.1 * xp, 0.1 * xp}, N);
            g.upper = replicate({100 * peak, 100 * xp, 100 * xp}, N);
            break;
    }
    return g;
}

double rmse(const Model& model,
            const std::vector<double>& x,
            const std::vector<double>& y,
            const Parameters& params) {
    if (y.empty() || x.size() != y.size()) {
        throw ShapeMismatch("rmse: x and y must be non-empty and of equal length");
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double r = model(x[i], params) - y[i];
        sum += r * r;
    }
    const double len = static_cast<double>(y.size());
    const auto [lo, hi] = std::minmax_element(y.begin(), y.end());
    double span = *hi - *lo;
    if (span == 0.0) {
        span = std::max(std::abs(*lo), std::abs(*hi));
        if (span == 0.0) span = 1.0;
    }
    return std::sqrt(sum / len / len) / span;
}

FitResult fit(const Model& model,
              const std::vector<double>& y,
              const std::vector<double>& x,
              std::size_t N,
              Scenario scenario,
              const FitOptions& options,
              std::size_t n) {
    if (y.empty() || x.size() != y.size()) {
        throw ShapeMismatch("fit: x and y must be non-empty and of equal length");
    }
    if (N == 0) throw std::invalid_argument("fit: N must be >= 1");

    std::vector<double> guesses, lower, upper;
    double sigma = 0.0;
    if (options.guesses && options.lower && options.upper && options.sigma) {
        guesses = replicate(*options.guesses, N);
        lower = replicate(*options.lower, N);
        upper = replicate(*options.upper, N);
        sigma = *options.sigma;
    } else {
        Guesses g = default_guesses(y, x, scenario, N, n);
        if (g.lower == g.upper && g.guesses == g.upper) {
            return FitResult{0.0, unpack(g.lower, n)};
        }
        guesses = std::move(g.guesses);
        lower = std::move(g.lower);
        upper = std::move(g.upper);
        sigma = g.sigma;
    }
    if (guesses.size() != lower.size() || guesses.size() != upper.size() || guesses.size() != n * N) {
        throw ShapeMismatch("fit: the shape of the provided fit parameters is not consistent");
    }

    FitResult result;
    result.params = least_squares(model, y, x, guesses, lower, upper, sigma, n,
                                  options.max_function_evaluations);
    result.rmse = rmse(model, x, y, result.params);
    return result;
}

FitResult run_fit(const Model& model,
                  const std::vector<double>& y,
                  const std::vector<double>& x,
                  double final_rmse,
                  Scenario scenario,
                  std::optional<std::size_t> N,
                  const FitOptions& options,
                  std::size_t n) {
    if (N) return fit(model, y, x, *N, scenario, options, n);

    for (std::size_t terms = 2;; ++terms) {
        if (terms > options.max_terms) {
            throw MaxTermsExceeded("run_fit: no fit with at most " + std::to_string(options.max_terms)
                                   + " terms reached the target rmse " + std::to_string(final_rmse));
        }
        FitResult result = fit(model, y, x, terms, scenario, options, n);
        if (result.rmse <= final_rmse) return result;
    }
}

std::complex<double> correlation_model(double t, const Parameters& params) {
    if (params.size() != 3 && params.size() != 4) {
        throw std::invalid_argument("correlation_model: expected 3 or 4 parameter kinds");
    }
    const auto& a = params[0];
    const auto& b = params[1];
    const auto& c = params[2];
    const bool has_d = params.size() == 4;
    std::complex<double> sum{0.0, 0.0};
    for (std::size_t k = 0; k < a.size(); ++k) {
        const std::complex<double> amp{a[k], has_d ? params[3][k] : 0.0};
        sum += amp * std::exp(std::complex<double>(b[k] * t, c[k] * t));
    }
    return sum;
}

double correlation_model_real(double t, const Parameters& params) {
    return correlation_model(t, params).real();
}

double correlation_model_imag(double t, const Parameters& params) {
    return correlation_model(t, params).imag();
}

double meier_tannor(double w, const Parameters& params) {
    if (params.size() != 3) throw std::invalid_argument("meier_tannor: expected 3 parameter kinds");
    const auto& a = params[0];
    const auto& b = params[1];
    const auto& c = params[2];
    double sum = 0.0;
    for (std::size_t k = 0; k < a.size(); ++k) {
        const double b2 = b[k] * b[k];
        sum += 2.0 * a[k] * b[k] * w
               / (((w + c[k]) * (w + c[k]) + b2) * ((w - c[k]) * (w - c[k]) + b2));
    }
    return sum;
}

} // namespace qenv::fit
