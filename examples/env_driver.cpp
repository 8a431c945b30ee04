#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <complex>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "qenv/bath_models.hpp"
#include "qenv/environment.hpp"
#include "qenv/exponential.hpp"
#include "qenv/io.hpp"
#include "qenv/profile.hpp"

namespace {

using cd = std::complex<double>;

std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

double require_double(const YAML::Node& n, const std::string& key, const std::string& where) {
    if (!n[key]) throw std::runtime_error("Missing key: " + where + "." + key);
    return n[key].as<double>();
}

std::optional<double> optional_double(const YAML::Node& n, const std::string& key) {
    if (!n[key]) return std::nullopt;
    return n[key].as<double>();
}

std::optional<std::size_t> optional_count(const YAML::Node& n, const std::string& key) {
    if (!n[key]) return std::nullopt;
    return static_cast<std::size_t>(n[key].as<unsigned long long>());
}

// {min, max, n} -> evenly spaced samples including both ends
std::vector<double> parse_grid(const YAML::Node& n, const std::string& name) {
    if (!n || !n.IsMap()) throw std::runtime_error(name + " must be a map with keys {min, max, n}");
    const double lo = require_double(n, "min", name);
    const double hi = require_double(n, "max", name);
    if (!n["n"]) throw std::runtime_error("Missing key: " + name + ".n");
    const auto count = static_cast<std::size_t>(n["n"].as<unsigned long long>());
    if (count < 2) throw std::runtime_error(name + ".n must be >= 2");
    if (!(hi > lo)) throw std::runtime_error(name + ": max must exceed min");
    std::vector<double> x(count);
    for (std::size_t k = 0; k < count; ++k) {
        x[k] = lo + (hi - lo) * static_cast<double>(k) / static_cast<double>(count - 1);
    }
    return x;
}

std::unique_ptr<qenv::BosonicEnvironment> build_environment(const YAML::Node& env) {
    if (!env) throw std::runtime_error("Missing key: environment");
    if (!env["model"]) throw std::runtime_error("Missing key: environment.model");
    const std::string model = lower_copy(env["model"].as<std::string>());
    const std::optional<double> T = optional_double(env, "T");

    if (model == "drude_lorentz" || model == "drude-lorentz" || model == "dl") {
        if (!T) throw std::runtime_error("Missing key: environment.T");
        return std::make_unique<qenv::DrudeLorentzEnvironment>(
            *T, require_double(env, "lam", "environment"), require_double(env, "gamma", "environment"));
    }
    if (model == "underdamped" || model == "ud") {
        if (!T) throw std::runtime_error("Missing key: environment.T");
        return std::make_unique<qenv::UnderDampedEnvironment>(
            *T, require_double(env, "lam", "environment"), require_double(env, "gamma", "environment"),
            require_double(env, "w0", "environment"));
    }
    if (model == "ohmic") {
        if (!T) throw std::runtime_error("Missing key: environment.T");
        return std::make_unique<qenv::OhmicEnvironment>(
            *T, require_double(env, "alpha", "environment"), require_double(env, "wc", "environment"),
            env["s"] ? env["s"].as<double>() : 1.0);
    }
    if (model == "tabulated") {
        if (!env["samples"]) throw std::runtime_error("Missing key: environment.samples");
        if (!env["kind"]) throw std::runtime_error("Missing key: environment.kind");
        const std::string kind = lower_copy(env["kind"].as<std::string>());
        const qenv::io::Samples data = qenv::io::read_csv_samples(env["samples"].as<std::string>());
        if (kind == "correlation_function") {
            return qenv::BosonicEnvironment::from_correlation_function(data.x, data.values, T);
        }
        std::vector<double> re(data.values.size());
        std::transform(data.values.begin(), data.values.end(), re.begin(), [](const cd& v) { return v.real(); });
        if (kind == "power_spectrum") return qenv::BosonicEnvironment::from_power_spectrum(data.x, re, T);
        if (kind == "spectral_density") return qenv::BosonicEnvironment::from_spectral_density(data.x, re, T);
        throw std::runtime_error("Unsupported environment.kind (use spectral_density, power_spectrum or correlation_function)");
    }
    if (model == "exponential") {
        if (!env["exponents"]) throw std::runtime_error("Missing key: environment.exponents");
        return std::make_unique<qenv::ExponentialBosonicEnvironment>(
            qenv::io::read_csv_exponents(env["exponents"].as<std::string>()), T);
    }
    throw std::runtime_error("Unsupported environment.model (use drude_lorentz, underdamped, ohmic, tabulated or exponential)");
}

void print_usage(std::ostream& os) {
    os << "Usage: env_driver [--config=PATH]\n"
          "Defaults: config=configs/env_driver.yaml\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string config_path = "configs/env_driver.yaml";
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--help" || arg == "-h") {
                print_usage(std::cout);
                return 0;
            }
            if (arg.rfind("--config=", 0) == 0) {
                config_path = arg.substr(std::string("--config=").size());
            }
        }

        const YAML::Node cfg = YAML::LoadFile(config_path);

        // ------------------------------ Read config ------------------------------
        const YAML::Node grid = cfg["grid"];
        if (!grid) throw std::runtime_error("Missing key: grid");
        const std::vector<double> wlist = parse_grid(grid["w"], "grid.w");
        const std::vector<double> tlist = parse_grid(grid["t"], "grid.t");

        const YAML::Node out = cfg["output"];
        const YAML::Node approx = cfg["approximation"];
        const bool profile = out && out["profile"] ? out["profile"].as<bool>() : false;

        qenv::profile::Session prof(profile, std::cout);
        auto total = prof.section("Total");

        std::cout.setf(std::ios::scientific);
        std::cout << std::setprecision(6);
        std::cout << "env_driver config: " << config_path << "\n";

        std::unique_ptr<qenv::BosonicEnvironment> env;
        {
            auto sec = prof.section("Build environment");
            env = build_environment(cfg["environment"]);
        }
        std::cout << "T=";
        if (env->temperature()) std::cout << *env->temperature();
        else std::cout << "unset";
        std::cout << ", nw=" << wlist.size() << ", nt=" << tlist.size() << "\n";

        // ------------------------------ Evaluate J, S, C -------------------------
        std::vector<double> J, S;
        std::vector<cd> C;
        {
            auto sec = prof.section("Spectral density");
            J = env->spectral_density(wlist);
        }
        {
            auto sec = prof.section("Power spectrum");
            S = env->power_spectrum(wlist);
        }
        {
            auto sec = prof.section("Correlation function");
            C = env->correlation_function(tlist);
        }
        std::cout << "J(w_max)=" << J.back() << ", S(w_max)=" << S.back() << ", C(0)=" << C.front() << "\n";

        if (out && out["J_csv"]) {
            const std::string p = out["J_csv"].as<std::string>();
            auto ofs = qenv::io::open_output(p);
            qenv::io::write_csv_samples(ofs, wlist, J);
            std::cout << "Wrote J(w) to " << p << "\n";
        }
        if (out && out["S_csv"]) {
            const std::string p = out["S_csv"].as<std::string>();
            auto ofs = qenv::io::open_output(p);
            qenv::io::write_csv_samples(ofs, wlist, S);
            std::cout << "Wrote S(w) to " << p << "\n";
        }
        if (out && out["C_csv"]) {
            const std::string p = out["C_csv"].as<std::string>();
            auto ofs = qenv::io::open_output(p);
            qenv::io::write_csv_samples(ofs, tlist, C);
            std::cout << "Wrote C(t) to " << p << "\n";
        }

        // ------------------------- Exponential approximation ---------------------
        if (approx && approx["method"]) {
            const std::string method = lower_copy(approx["method"].as<std::string>());
            qenv::ApproximationOptions options;
            options.Nk = optional_count(approx, "Nk");
            options.Nr = optional_count(approx, "Nr");
            options.Ni = optional_count(approx, "Ni");
            options.N = optional_count(approx, "N");
            options.final_rmse = optional_double(approx, "final_rmse");
            if (approx["combine"]) options.combine = approx["combine"].as<bool>();
            if (approx["full_ansatz"]) options.full_ansatz = approx["full_ansatz"].as<bool>();
            if (approx["max_terms"]) {
                options.fit.max_terms = static_cast<std::size_t>(approx["max_terms"].as<unsigned long long>());
            }
            options.tlist = tlist;
            options.wlist = wlist;
            qenv::fit::CorrelationFitInfo correlation_info;
            qenv::fit::SpectralFitInfo spectral_info;
            options.correlation_info = &correlation_info;
            options.spectral_info = &spectral_info;

            std::cout << "approximation: " << method << "\n";
            std::unique_ptr<qenv::ExponentialBosonicEnvironment> fitted;
            {
                auto sec = prof.section("Approximation");
                fitted = std::make_unique<qenv::ExponentialBosonicEnvironment>(
                    env->exponential_approximation(method, options));
            }
            if (method == "correlation_fit") std::cout << correlation_info.summary << "\n";
            if (method == "underdamped_fit") std::cout << spectral_info.summary << "\n";

            const std::vector<cd> C_fit = fitted->correlation_function(tlist);
            double max_err = 0.0;
            for (std::size_t k = 0; k < C.size(); ++k) max_err = std::max(max_err, std::abs(C_fit[k] - C[k]));
            std::cout << "exponents=" << fitted->exponents().size() << ", max|C - C_approx|=" << max_err << "\n";

            if (out && out["exponents_csv"]) {
                const std::string p = out["exponents_csv"].as<std::string>();
                auto ofs = qenv::io::open_output(p);
                qenv::io::write_csv_exponents(ofs, fitted->exponents());
                std::cout << "Wrote exponents to " << p << "\n";
            }
            if (out && out["C_approx_csv"]) {
                const std::string p = out["C_approx_csv"].as<std::string>();
                auto ofs = qenv::io::open_output(p);
                qenv::io::write_csv_samples(ofs, tlist, C_fit);
                std::cout << "Wrote approximate C(t) to " << p << "\n";
            }
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
