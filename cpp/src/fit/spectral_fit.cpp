#include "qenv/fit.hpp"

#include "qenv/errors.hpp"
#include "qenv/profile.hpp"

#include <utility>

namespace qenv::fit {

SpectralFit fit_underdamped(const std::vector<double>& J,
                            const std::vector<double>& w,
                            std::optional<std::size_t> N,
                            std::optional<std::size_t> Nk,
                            double final_rmse,
                            const FitOptions& options) {
    if (J.empty() || J.size() != w.size()) {
        throw ShapeMismatch("fit_underdamped: J and w must be non-empty and of equal length");
    }

    profile::Stopwatch watch;
    FitResult result = run_fit(meier_tannor, J, w, final_rmse, Scenario::SpectralDensity, N, options, 3);
    const double fit_time = watch.seconds();

    SpectralFit out;
    SpectralFitInfo& info = out.info;
    info.fit_time = fit_time;
    info.rmse = result.rmse;
    info.N = result.params.empty() ? 0 : result.params[0].size();
    info.Nk = Nk;
    info.summary = summary(fit_time, result.rmse, info.N, "The Spectral Density", result.params);
    info.params = result.params;
    out.params = std::move(result.params);
    return out;
}

SpectralFit fit_underdamped(const RealFunction& J,
                            const std::vector<double>& w,
                            std::optional<std::size_t> N,
                            std::optional<std::size_t> Nk,
                            double final_rmse,
                            const FitOptions& options) {
    std::vector<double> samples;
    samples.reserve(w.size());
    for (double wi : w) samples.push_back(J(wi));
    return fit_underdamped(samples, w, N, Nk, final_rmse, options);
}

} // namespace qenv::fit
