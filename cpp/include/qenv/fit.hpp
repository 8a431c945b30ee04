// fit.hpp — Multi-exponential / underdamped-mode fits of sampled bath functions

#pragma once

#include <complex>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "qenv/interpolation.hpp"

namespace qenv::fit {

// Fit parameters grouped by kind: params[j][i] is parameter j (a, b, c[, d]) of term i.
// Flattened ("packed") vectors store kind j of term i at j*N + i.
using Parameters = std::vector<std::vector<double>>;

// Value of the fitted function at one abscissa.
using Model = std::function<double(double x, const Parameters& params)>;

// Selects the default guesses and bounds when the caller provides none.
enum class Scenario { CorrelationReal, CorrelationImag, SpectralDensity };

struct FitOptions {
    // One entry per parameter kind, shared by every term. Ignored unless all four
    // of guesses, lower, upper and sigma are set.
    std::optional<std::vector<double>> guesses;
    std::optional<std::vector<double>> lower;
    std::optional<std::vector<double>> upper;
    std::optional<double> sigma;

    // Ceiling of the automatic term search.
    std::size_t max_terms{20};
    // Per least-squares run.
    int max_function_evaluations{100000};
};

struct FitResult {
    double rmse{0.0};
    Parameters params;
};

struct Guesses {
    std::vector<double> guesses;
    std::vector<double> lower;
    std::vector<double> upper;
    double sigma{1e-2};
};

std::vector<double> pack(const Parameters& params);
Parameters unpack(const std::vector<double>& flat, std::size_t n);
// {p0, p1, ...} -> {p0 x N, p1 x N, ...}
std::vector<double> replicate(const std::vector<double>& per_kind, std::size_t N);

// pi / (smallest positive spacing of x); infinite for fewer than two distinct points.
double nyquist_frequency(const std::vector<double>& x);

// Heuristic starting point keyed off the peak magnitude of y and the abscissa of max(y).
// Correlation frequencies are bounded by nyquist_frequency(x).
Guesses default_guesses(const std::vector<double>& y,
                        const std::vector<double>& x,
                        Scenario scenario,
                        std::size_t N,
                        std::size_t n);

// sqrt(mean((model - y)^2) / len(y)) / (max(y) - min(y))
double rmse(const Model& model,
            const std::vector<double>& x,
            const std::vector<double>& y,
            const Parameters& params);

// Box-constrained nonlinear least squares on packed parameters with residuals
// (model - y) / sigma. A parameter whose guess equals a finite bound stays on it.
// Throws std::invalid_argument on inconsistent sizes and std::runtime_error when
// the solver rejects the problem or stops without converging.
Parameters least_squares(const Model& model,
                         const std::vector<double>& y,
                         const std::vector<double>& x,
                         const std::vector<double>& guesses,
                         const std::vector<double>& lower,
                         const std::vector<double>& upper,
                         double sigma,
                         std::size_t n,
                         int max_function_evaluations);

// One fit with N terms of n parameters each.
FitResult fit(const Model& model,
              const std::vector<double>& y,
              const std::vector<double>& x,
              std::size_t N,
              Scenario scenario,
              const FitOptions& options,
              std::size_t n);

// Fits with a fixed N, or searches N = 2, 3, ... until rmse <= final_rmse.
// Throws MaxTermsExceeded when the search passes options.max_terms.
FitResult run_fit(const Model& model,
                  const std::vector<double>& y,
                  const std::vector<double>& x,
                  double final_rmse,
                  Scenario scenario,
                  std::optional<std::size_t> N,
                  const FitOptions& options,
                  std::size_t n);

// ------------------------------ Model functions ------------------------------

// sum_k (a_k + i d_k) exp(b_k t) exp(i c_k t); d is optional (3 or 4 kinds).
std::complex<double> correlation_model(double t, const Parameters& params);
double correlation_model_real(double t, const Parameters& params);
double correlation_model_imag(double t, const Parameters& params);

// Meier-Tannor form sum_k 2 a_k b_k w / (((w + c_k)^2 + b_k^2) ((w - c_k)^2 + b_k^2)).
double meier_tannor(double w, const Parameters& params);

// ------------------------------ Correlation fit ------------------------------

struct CorrelationFitInfo {
    std::size_t Nr{0};
    std::size_t Ni{0};
    double fit_time_real{0.0};  // seconds
    double fit_time_imag{0.0};
    double rmse_real{0.0};
    double rmse_imag{0.0};
    Parameters params_real;
    Parameters params_imag;
    std::string summary;
};

struct CorrelationFit {
    std::vector<std::complex<double>> ck_real;
    std::vector<std::complex<double>> vk_real;
    std::vector<std::complex<double>> ck_imag;
    std::vector<std::complex<double>> vk_imag;
    CorrelationFitInfo info;
};

// Fits Re C and Im C separately with Nr / Ni damped oscillations (searched when
// unset). full_ansatz adds the imaginary amplitude d to every term.
CorrelationFit fit_correlation(const std::vector<std::complex<double>>& C,
                               const std::vector<double>& t,
                               std::optional<std::size_t> Nr = std::nullopt,
                               std::optional<std::size_t> Ni = std::nullopt,
                               double final_rmse = 2e-5,
                               const FitOptions& options = {},
                               bool full_ansatz = false);
CorrelationFit fit_correlation(const ComplexFunction& C,
                               const std::vector<double>& t,
                               std::optional<std::size_t> Nr = std::nullopt,
                               std::optional<std::size_t> Ni = std::nullopt,
                               double final_rmse = 2e-5,
                               const FitOptions& options = {},
                               bool full_ansatz = false);

// Each fitted oscillation becomes a pair of conjugate exponents.
void correlation_exponents(const Parameters& params_real,
                           const Parameters& params_imag,
                           CorrelationFit& out);

// ------------------------------ Spectral fit ---------------------------------

struct SpectralFitInfo {
    double fit_time{0.0};  // seconds
    double rmse{0.0};
    std::size_t N{0};
    Parameters params;
    std::optional<std::size_t> Nk;
    std::string summary;
};

struct SpectralFit {
    Parameters params;  // {a, b, c}: coupling^2, width, resonance
    SpectralFitInfo info;
};

SpectralFit fit_underdamped(const std::vector<double>& J,
                            const std::vector<double>& w,
                            std::optional<std::size_t> N = std::nullopt,
                            std::optional<std::size_t> Nk = std::nullopt,
                            double final_rmse = 5e-6,
                            const FitOptions& options = {});
SpectralFit fit_underdamped(const RealFunction& J,
                            const std::vector<double>& w,
                            std::optional<std::size_t> N = std::nullopt,
                            std::optional<std::size_t> Nk = std::nullopt,
                            double final_rmse = 5e-6,
                            const FitOptions& options = {});

// ------------------------------ Summaries ------------------------------------

std::string summary(double time,
                    double rmse,
                    std::size_t N,
                    const std::string& label,
                    const Parameters& params,
                    const std::vector<std::string>& columns = {"lam", "gamma", "w0"});

std::string two_column_summary(const Parameters& params_real,
                               const Parameters& params_imag,
                               double fit_time_real,
                               double fit_time_imag,
                               std::size_t Nr,
                               std::size_t Ni,
                               double rmse_imag,
                               double rmse_real,
                               std::size_t n = 3);

} // namespace qenv::fit
