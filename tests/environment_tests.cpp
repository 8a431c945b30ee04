#include <iostream>
#include <vector>
#include <complex>
#include <cmath>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>

#include "qenv/bath_models.hpp"
#include "qenv/environment.hpp"
#include "qenv/errors.hpp"
#include "qenv/thermal.hpp"

using cd = std::complex<double>;

template <typename T>
static inline double rel_err(T a, T b) {
    double denom = std::max(1.0, std::abs(b));
    return std::abs(a - b) / denom;
}

static int fails = 0;
static std::vector<std::string> g_log;

static void record(bool ok, const std::string& text) {
    if (ok) {
        std::cout << text << "\n";
    } else {
        std::cerr << text << "\n";
        ++fails;
    }
    g_log.push_back(text);
}

template <typename T>
static void check_close(const std::string& name, T got, T expect, double tol) {
    double e = rel_err(got, expect);
    std::ostringstream line;
    line.setf(std::ios::scientific); line.precision(6);
    if (e > tol || std::isnan(std::abs(got))) {
        line << "FAIL " << name << ": got=" << got << " expect=" << expect << " relerr=" << e;
        record(false, line.str());
    } else {
        line << "ok   " << name << " (err=" << e << ")";
        record(true, line.str());
    }
}

template <typename E, typename F>
static void check_throws(const std::string& name, F&& f) {
    try {
        f();
    } catch (const E& ex) {
        record(true, "ok   " + name + " (" + ex.what() + ")");
        return;
    } catch (const std::exception& ex) {
        record(false, "FAIL " + name + ": wrong exception: " + ex.what());
        return;
    }
    record(false, "FAIL " + name + ": no exception");
}

// Drude-Lorentz J with lam = 0.5, gamma = 1
static double J_dl(double w) {
    return w > 0.0 ? w / (1.0 + w * w) : 0.0;
}

static std::vector<double> linspace(double a, double b, std::size_t n) {
    std::vector<double> x(n);
    for (std::size_t k = 0; k < n; ++k) x[k] = a + (b - a) * static_cast<double>(k) / static_cast<double>(n - 1);
    return x;
}

static void test_detailed_balance_round_trip() {
    const double T = 1.0;
    auto from_J = qenv::BosonicEnvironment::from_spectral_density(J_dl, 50.0, T);
    auto from_S = qenv::BosonicEnvironment::from_power_spectrum(
        [&from_J](double w) { return from_J->power_spectrum(w); }, 50.0, T);

    for (double w : {0.1, 0.5, 1.0, 3.0, 10.0}) {
        check_close("J -> S -> J at w=" + std::to_string(w), from_S->spectral_density(w), J_dl(w), 1e-9);
    }
    check_close("J from S at w = 0", from_S->spectral_density(0.0), 0.0, 0.0);
    check_close("J from S at w < 0", from_S->spectral_density(-2.0), 0.0, 0.0);
    check_close("J-backed J at w < 0", from_J->spectral_density(-2.0), 0.0, 0.0);

    // Zero temperature: S = 2 H(w) J
    auto cold = qenv::BosonicEnvironment::from_spectral_density(J_dl, std::nullopt, 0.0);
    check_close("T = 0 S(1)", cold->power_spectrum(1.0), 2.0 * J_dl(1.0), 1e-14);
    check_close("T = 0 S(-1)", cold->power_spectrum(-1.0), 0.0, 0.0);

    // Vector queries agree with scalar ones
    const std::vector<double> ws{-1.0, 0.0, 0.5, 2.0};
    const auto S = from_J->power_spectrum(ws);
    for (std::size_t k = 0; k < ws.size(); ++k) {
        check_close("vector S matches scalar", S[k], from_J->power_spectrum(ws[k]), 0.0);
    }
    check_close("S(0) = 2 T J'(0)", from_J->power_spectrum(0.0, 1e-8), 2.0 * T, 1e-8);
}

static void test_fourier_paths() {
    // C(t) = exp(-t^2 / 2)  <->  S(w) = sqrt(2 pi) exp(-w^2 / 2)
    auto gaussian_C = [](double t) { return cd(std::exp(-0.5 * t * t), 0.0); };
    auto gaussian_S = [](double w) { return std::sqrt(2.0 * qenv::PI) * std::exp(-0.5 * w * w); };

    auto from_C = qenv::BosonicEnvironment::from_correlation_function(gaussian_C, 10.0, 1.0);
    for (double w : {0.0, 0.5, 1.5}) {
        check_close("S from C at w=" + std::to_string(w), from_C->power_spectrum(w), gaussian_S(w), 1e-2);
    }
    check_close("C-backed C(1)", from_C->correlation_function(1.0), gaussian_C(1.0), 1e-14);

    auto from_S = qenv::BosonicEnvironment::from_power_spectrum(gaussian_S, 10.0, 1.0);
    for (double t : {0.0, 1.0, 2.0}) {
        check_close("C from S at t=" + std::to_string(t), from_S->correlation_function(t), gaussian_C(t), 1e-2);
    }

    // A complex correlation function with a known transform: C(t) = 1 / (1 + i t)^2 at wc = 1
    // has S(w) = 2 pi w exp(-w) H(w); check the positive-frequency peak only.
    auto ohmic_C = [](double t) { return 1.0 / std::pow(cd(1.0, t), 2.0); };
    auto ohmic = qenv::BosonicEnvironment::from_correlation_function(ohmic_C, 200.0);
    // the sampling density follows the queried frequency window
    const auto S_ohmic = ohmic->power_spectrum(std::vector<double>{1.0, 10.0});
    check_close("S from ohmic C(t) at w=1", S_ohmic[0], 2.0 * qenv::PI * std::exp(-1.0), 1e-2);

    check_throws<qenv::MissingSupportBound>("C from J without wMax", [] {
        auto env = qenv::BosonicEnvironment::from_spectral_density(J_dl, std::nullopt, 1.0);
        env->correlation_function(1.0);
    });
    check_throws<qenv::MissingSupportBound>("S from C without tMax", [&] {
        auto env = qenv::BosonicEnvironment::from_correlation_function(gaussian_C);
        env->power_spectrum(1.0);
    });
    check_throws<qenv::MissingSupportBound>("C from S without wMax", [&] {
        auto env = qenv::BosonicEnvironment::from_power_spectrum(gaussian_S);
        env->correlation_function(1.0);
    });
}

static void test_symmetry() {
    auto C = [](double t) { return cd(std::exp(-t), 0.3 * std::sin(t)); };
    auto env = qenv::BosonicEnvironment::from_correlation_function(C, 20.0);
    for (double t : {0.2, 1.0, 5.0}) {
        check_close("callable C(-t) = conj C(t)", env->correlation_function(-t), std::conj(env->correlation_function(t)), 0.0);
    }

    const auto tlist = linspace(0.0, 10.0, 201);
    std::vector<cd> samples;
    for (double t : tlist) samples.push_back(C(t));
    auto tabulated = qenv::BosonicEnvironment::from_correlation_function(tlist, samples);
    check_close("tabulated C(1.03)", tabulated->correlation_function(1.03), C(1.03), 1e-4);
    check_close("tabulated C(-1.03)", tabulated->correlation_function(-1.03), std::conj(C(1.03)), 1e-4);
}

static void test_tabulated_factories() {
    const auto wlist = linspace(0.0, 10.0, 201);
    std::vector<double> J;
    for (double w : wlist) J.push_back(J_dl(w));

    auto env = qenv::BosonicEnvironment::from_spectral_density(wlist, J, 1.0, std::string("table"));
    check_close("tabulated J(1.37)", env->spectral_density(1.37), J_dl(1.37), 1e-4);
    check_close("tabulated J outside range", env->spectral_density(12.0), 0.0, 0.0);
    const bool tagged = std::any_cast<std::string>(env->tag()) == "table";
    record(tagged, std::string(tagged ? "ok   " : "FAIL ") + "tag is carried through");
    check_close("tabulated T", *env->temperature(), 1.0, 0.0);
    // S(0) = 2 T J(eps) / eps; J'(0) = 1 here
    check_close("tabulated S(0)", env->power_spectrum(0.0), 2.0, 5e-3);
    // ... a table starting above eps has no data there and gives zero
    const auto shifted = linspace(0.5, 10.0, 191);
    std::vector<double> Jshifted;
    for (double w : shifted) Jshifted.push_back(J_dl(w));
    auto gap = qenv::BosonicEnvironment::from_spectral_density(shifted, Jshifted, 1.0);
    check_close("table above eps gives S(0) = 0", gap->power_spectrum(0.0), 0.0, 0.0);
    check_close("table above eps still gives S(1)", gap->power_spectrum(1.0), env->power_spectrum(1.0), 1e-4);

    // The sample extent acts as wMax, so C(t) is available
    qenv::DrudeLorentzEnvironment dl(1.0, 0.5, 1.0);
    const auto wide = linspace(0.0, 200.0, 20001);
    std::vector<double> Jwide;
    for (double w : wide) Jwide.push_back(dl.spectral_density(w));
    auto tab = qenv::BosonicEnvironment::from_spectral_density(wide, Jwide, 1.0);
    const auto C_tab = tab->correlation_function(std::vector<double>{1.0, 10.0});
    check_close("tabulated DL C(1) via fft", C_tab[0], dl.correlation_function(1.0), 2e-2);

    check_throws<qenv::ShapeMismatch>("J and w differ in length", [] {
        qenv::BosonicEnvironment::from_spectral_density(std::vector<double>{1, 2, 3}, std::vector<double>{1, 2});
    });
    check_throws<qenv::ShapeMismatch>("empty samples", [] {
        qenv::BosonicEnvironment::from_power_spectrum(std::vector<double>{}, std::vector<double>{});
    });
}

static void test_errors() {
    auto env = qenv::BosonicEnvironment::from_spectral_density(J_dl);
    check_throws<qenv::MissingTemperature>("S from J without T", [&] { env->power_spectrum(1.0); });
    auto ps = qenv::BosonicEnvironment::from_power_spectrum([](double w) { return 1.0 / (1.0 + w * w); });
    check_throws<qenv::MissingTemperature>("J from S without T", [&] { ps->spectral_density(1.0); });
    check_throws<qenv::UnknownMethod>("unknown approximation method", [&] { env->exponential_approximation("pade"); });
    check_throws<qenv::MissingTemperature>("underdamped_fit without T", [&] {
        qenv::ApproximationOptions options;
        options.wlist = linspace(0.0, 5.0, 50);
        env->exponential_approximation("underdamped_fit", options);
    });
    const auto methods = env->approximation_methods();
    check_close("generic environments offer two methods", static_cast<double>(methods.size()), 2.0, 0.0);
}

int main(int argc, char** argv) {
    test_detailed_balance_round_trip();
    test_fourier_paths();
    test_symmetry();
    test_tabulated_factories();
    test_errors();

    {
        std::filesystem::path outdir;
        if (argc > 0) {
            std::filesystem::path exe(argv[0]);
            outdir = exe.has_parent_path() ? exe.parent_path() : std::filesystem::current_path();
        } else {
            outdir = std::filesystem::current_path();
        }
        std::ofstream ofs(outdir / "environment_test_results.txt", std::ios::out | std::ios::trunc);
        if (ofs) {
            ofs << "Environment Tests Results\n";
            for (const auto& s : g_log) ofs << s << "\n";
            if (fails) ofs << "FAILED: " << fails << " test(s)\n"; else ofs << "All environment tests passed.\n";
        }
    }

    if (fails) {
        std::cerr << "\nFAILED: " << fails << " test(s)\n";
        return 1;
    }
    std::cout << "\nAll environment tests passed.\n";
    return 0;
}
