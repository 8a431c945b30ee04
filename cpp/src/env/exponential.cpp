#include "qenv/exponential.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "qenv/errors.hpp"
#include "qenv/thermal.hpp"

namespace qenv {

namespace {

constexpr std::complex<double> I1{0.0, 1.0};

bool is_real_part(CFExponent::Type t) { return t == CFExponent::Type::R || t == CFExponent::Type::RI; }

std::vector<CFExponent> collect(ExponentialSpec& spec) {
    const bool any = spec.ck_real || spec.vk_real || spec.ck_imag || spec.vk_imag;
    const bool all = spec.ck_real && spec.vk_real && spec.ck_imag && spec.vk_imag;
    if (any && !all) {
        throw PartialListSpec("ExponentialBosonicEnvironment: if any of the exponent lists ck_real, "
                              "vk_real, ck_imag, vk_imag is provided, all must be provided");
    }
    if (all && (spec.ck_real->size() != spec.vk_real->size()
                || spec.ck_imag->size() != spec.vk_imag->size())) {
        throw ShapeMismatch("ExponentialBosonicEnvironment: ck_real and vk_real, and ck_imag and "
                            "vk_imag must have the same length");
    }
    if (!spec.exponents && !all) {
        throw PartialListSpec("ExponentialBosonicEnvironment: either exponents or the lists ck_real, "
                              "vk_real, ck_imag, vk_imag must be provided");
    }

    std::vector<CFExponent> out;
    if (spec.exponents) {
        for (const auto& e : *spec.exponents) {
            if (e.fermionic()) {
                throw InvalidExponentSpec("ExponentialBosonicEnvironment: fermionic exponent passed "
                                          "to a bosonic environment");
            }
        }
        out = std::move(*spec.exponents);
    }
    if (all) {
        for (std::size_t k = 0; k < spec.ck_real->size(); ++k) {
            out.push_back(CFExponent::real((*spec.ck_real)[k], (*spec.vk_real)[k]));
        }
        for (std::size_t k = 0; k < spec.ck_imag->size(); ++k) {
            out.push_back(CFExponent::imag((*spec.ck_imag)[k], (*spec.vk_imag)[k]));
        }
    }
    return out;
}

ExponentialSpec spec_from_lists(const ExponentLists& lists, bool combine) {
    ExponentialSpec spec;
    spec.ck_real = lists.ck_real;
    spec.vk_real = lists.vk_real;
    spec.ck_imag = lists.ck_imag;
    spec.vk_imag = lists.vk_imag;
    spec.combine = combine;
    return spec;
}

ExponentialSpec spec_from_exponents(std::vector<CFExponent> exponents, bool combine) {
    ExponentialSpec spec;
    spec.exponents = std::move(exponents);
    spec.combine = combine;
    return spec;
}

} // namespace

// --------------------------------- CFExponent --------------------------------

CFExponent::CFExponent(Type type,
                       std::complex<double> ck,
                       std::complex<double> vk,
                       std::optional<std::complex<double>> ck2,
                       std::optional<int> sigma_bar_k_offset)
    : type_(type), ck_(ck), vk_(vk), ck2_(ck2), offset_(sigma_bar_k_offset) {
    if (type_ == Type::RI && !ck2_) {
        throw InvalidExponentSpec("CFExponent: RI type exponents require ck2");
    }
    if (type_ != Type::RI && ck2_) {
        throw InvalidExponentSpec("CFExponent: second coefficient (ck2) should only be specified "
                                  "for RI type exponents");
    }
    if (fermionic() && !offset_) {
        throw InvalidExponentSpec("CFExponent: + and - type exponents require sigma_bar_k_offset");
    }
    if (!fermionic() && offset_) {
        throw InvalidExponentSpec("CFExponent: offset of sigma bar (sigma_bar_k_offset) should only "
                                  "be specified for + and - type exponents");
    }
}

std::complex<double> CFExponent::coefficient() const noexcept {
    std::complex<double> c(0.0, 0.0);
    if (is_real_part(type_)) c += ck_;
    if (type_ == Type::I) c += I1 * ck_;
    if (type_ == Type::RI) c += I1 * *ck2_;
    return c;
}

bool CFExponent::can_combine(const CFExponent& other, double rtol, double atol) const noexcept {
    if (fermionic() || other.fermionic()) return false;
    return std::abs(vk_ - other.vk_) <= atol + rtol * std::abs(other.vk_);
}

CFExponent CFExponent::combined_with(const CFExponent& other) const {
    if (type_ == Type::RI || type_ != other.type_) {
        std::complex<double> re(0.0, 0.0), im(0.0, 0.0);
        for (const CFExponent* e : {this, &other}) {
            if (is_real_part(e->type_)) re += e->ck_;
            if (e->type_ == Type::I) im += e->ck_;
            if (e->type_ == Type::RI) im += *e->ck2_;
        }
        return CFExponent::real_imag(re, im, vk_);
    }
    return CFExponent(type_, ck_ + other.ck_, vk_);
}

std::string to_string(CFExponent::Type type) {
    switch (type) {
        case CFExponent::Type::R: return "R";
        case CFExponent::Type::I: return "I";
        case CFExponent::Type::RI: return "RI";
        case CFExponent::Type::Plus: return "+";
        case CFExponent::Type::Minus: return "-";
    }
    return "?";
}

CFExponent::Type parse_exponent_type(const std::string& s) {
    if (s == "R") return CFExponent::Type::R;
    if (s == "I") return CFExponent::Type::I;
    if (s == "RI") return CFExponent::Type::RI;
    if (s == "+") return CFExponent::Type::Plus;
    if (s == "-") return CFExponent::Type::Minus;
    throw InvalidExponentSpec("Unknown exponent type: " + s);
}

// ------------------------ ExponentialBosonicEnvironment ----------------------

ExponentialBosonicEnvironment::ExponentialBosonicEnvironment(ExponentialSpec spec,
                                                             std::optional<double> T,
                                                             std::any tag)
    : BosonicEnvironment(T, std::move(tag)) {
    std::vector<CFExponent> exps = collect(spec);
    exponents_ = spec.combine ? combine(exps) : std::move(exps);
}

ExponentialBosonicEnvironment::ExponentialBosonicEnvironment(const ExponentLists& lists,
                                                             std::optional<double> T,
                                                             bool combine,
                                                             std::any tag)
    : ExponentialBosonicEnvironment(spec_from_lists(lists, combine), T, std::move(tag)) {}

ExponentialBosonicEnvironment::ExponentialBosonicEnvironment(std::vector<CFExponent> exponents,
                                                             std::optional<double> T,
                                                             bool combine,
                                                             std::any tag)
    : ExponentialBosonicEnvironment(spec_from_exponents(std::move(exponents), combine), T, std::move(tag)) {}

std::vector<CFExponent> ExponentialBosonicEnvironment::combine(const std::vector<CFExponent>& exponents,
                                                               double rtol,
                                                               double atol) {
    std::vector<bool> merged(exponents.size(), false);
    std::vector<CFExponent> out;
    out.reserve(exponents.size());
    for (std::size_t i = 0; i < exponents.size(); ++i) {
        if (merged[i]) continue;
        CFExponent current = exponents[i];
        for (std::size_t j = i + 1; j < exponents.size(); ++j) {
            if (merged[j] || !current.can_combine(exponents[j], rtol, atol)) continue;
            current = current.combined_with(exponents[j]);
            merged[j] = true;
        }
        out.push_back(current);
    }
    return out;
}

std::vector<std::complex<double>> ExponentialBosonicEnvironment::cf_impl(const std::vector<double>& t,
                                                                         double) const {
    std::vector<std::complex<double>> out(t.size(), {0.0, 0.0});
    for (std::size_t k = 0; k < t.size(); ++k) {
        const double tau = std::abs(t[k]);
        std::complex<double> c(0.0, 0.0);
        for (const auto& e : exponents_) c += e.coefficient() * std::exp(-e.exponent() * tau);
        out[k] = t[k] < 0.0 ? std::conj(c) : c;
    }
    return out;
}

std::vector<double> ExponentialBosonicEnvironment::ps_impl(const std::vector<double>& w, double) const {
    std::vector<double> S(w.size(), 0.0);
    for (std::size_t k = 0; k < w.size(); ++k) {
        for (const auto& e : exponents_) {
            S[k] += 2.0 * std::real(e.coefficient() / (e.vk() - I1 * w[k]));
        }
    }
    return S;
}

std::vector<double> ExponentialBosonicEnvironment::sd_impl(const std::vector<double>& w) const {
    const double T = require_temperature("spectral_density");
    const std::vector<double> S = ps_impl(w, 1e-10);
    std::vector<double> J(w.size(), 0.0);
    for (std::size_t k = 0; k < w.size(); ++k) {
        J[k] = heaviside(w[k]) * S[k] / (n_thermal(w[k], T) + 1.0) / 2.0;
    }
    return J;
}

} // namespace qenv
