#include "qenv/fit.hpp"

#include "qenv/errors.hpp"
#include "qenv/profile.hpp"

#include <utility>

namespace qenv::fit {

namespace {

constexpr std::complex<double> I{0.0, 1.0};

// Appends (amp_k, -b_k - i c_k) for every term, then the conjugate pairs.
void append_pairs(const Parameters& params,
                  std::complex<double> phase,
                  std::vector<std::complex<double>>& ck,
                  std::vector<std::complex<double>>& vk) {
    const std::size_t N = params.empty() ? 0 : params[0].size();
    const bool has_d = params.size() == 4;
    std::vector<std::complex<double>> amp(N), rate(N);
    for (std::size_t k = 0; k < N; ++k) {
        amp[k] = phase * std::complex<double>(params[0][k], has_d ? params[3][k] : 0.0) / 2.0;
        rate[k] = std::complex<double>(-params[1][k], -params[2][k]);
    }
    for (std::size_t k = 0; k < N; ++k) {
        ck.push_back(amp[k]);
        vk.push_back(rate[k]);
    }
    for (std::size_t k = 0; k < N; ++k) {
        ck.push_back(std::conj(amp[k]));
        vk.push_back(std::conj(rate[k]));
    }
}

} // namespace

void correlation_exponents(const Parameters& params_real,
                           const Parameters& params_imag,
                           CorrelationFit& out) {
    out.ck_real.clear();
    out.vk_real.clear();
    out.ck_imag.clear();
    out.vk_imag.clear();
    append_pairs(params_real, 1.0, out.ck_real, out.vk_real);
    append_pairs(params_imag, -I, out.ck_imag, out.vk_imag);
}

CorrelationFit fit_correlation(const std::vector<std::complex<double>>& C,
                               const std::vector<double>& t,
                               std::optional<std::size_t> Nr,
                               std::optional<std::size_t> Ni,
                               double final_rmse,
                               const FitOptions& options,
                               bool full_ansatz) {
    if (C.empty() || C.size() != t.size()) {
        throw ShapeMismatch("fit_correlation: C and t must be non-empty and of equal length");
    }
    const std::size_t n = full_ansatz ? 4 : 3;

    std::vector<double> C_re(C.size()), C_im(C.size());
    for (std::size_t i = 0; i < C.size(); ++i) {
        C_re[i] = C[i].real();
        C_im[i] = C[i].imag();
    }

    profile::Stopwatch watch;
    FitResult real = run_fit(correlation_model_real, C_re, t, final_rmse,
                             Scenario::CorrelationReal, Nr, options, n);
    const double fit_time_real = watch.seconds();

    watch.reset();
    FitResult imag = run_fit(correlation_model_imag, C_im, t, final_rmse,
                             Scenario::CorrelationImag, Ni, options, n);
    const double fit_time_imag = watch.seconds();

    CorrelationFit out;
    correlation_exponents(real.params, imag.params, out);

    CorrelationFitInfo& info = out.info;
    info.Nr = real.params.empty() ? 0 : real.params[0].size();
    info.Ni = imag.params.empty() ? 0 : imag.params[0].size();
    info.fit_time_real = fit_time_real;
    info.fit_time_imag = fit_time_imag;
    info.rmse_real = real.rmse;
    info.rmse_imag = imag.rmse;
    info.summary = two_column_summary(real.params, imag.params, fit_time_real, fit_time_imag,
                                      info.Nr, info.Ni, imag.rmse, real.rmse, n);
    info.params_real = std::move(real.params);
    info.params_imag = std::move(imag.params);
    return out;
}

CorrelationFit fit_correlation(const ComplexFunction& C,
                               const std::vector<double>& t,
                               std::optional<std::size_t> Nr,
                               std::optional<std::size_t> Ni,
                               double final_rmse,
                               const FitOptions& options,
                               bool full_ansatz) {
    std::vector<std::complex<double>> samples;
    samples.reserve(t.size());
    for (double ti : t) samples.push_back(C(ti));
    return fit_correlation(samples, t, Nr, Ni, final_rmse, options, full_ansatz);
}

} // namespace qenv::fit
