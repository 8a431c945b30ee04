// exponential.hpp — Exponential decomposition of bath correlation functions

#pragma once

#include <any>
#include <complex>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "qenv/environment.hpp"

namespace qenv {

// One term c * exp(-v t) of a correlation function.
//  R / I / RI : bosonic; the term contributes to the real part (R), the imaginary
//               part (I) or both (RI, with ck2 the imaginary-part coefficient).
//  Plus/Minus : fermionic; carry the offset linking the term to its partner.
class CFExponent {
public:
    enum class Type { R, I, RI, Plus, Minus };

    // Validating constructor: ck2 must be given iff type == RI, and the offset
    // iff the type is fermionic. Throws InvalidExponentSpec otherwise.
    CFExponent(Type type,
               std::complex<double> ck,
               std::complex<double> vk,
               std::optional<std::complex<double>> ck2 = std::nullopt,
               std::optional<int> sigma_bar_k_offset = std::nullopt);

    static CFExponent real(std::complex<double> ck, std::complex<double> vk) {
        return CFExponent(Type::R, ck, vk);
    }
    static CFExponent imag(std::complex<double> ck, std::complex<double> vk) {
        return CFExponent(Type::I, ck, vk);
    }
    static CFExponent real_imag(std::complex<double> ck, std::complex<double> ck2, std::complex<double> vk) {
        return CFExponent(Type::RI, ck, vk, ck2);
    }
    static CFExponent plus(std::complex<double> ck, std::complex<double> vk, int offset) {
        return CFExponent(Type::Plus, ck, vk, std::nullopt, offset);
    }
    static CFExponent minus(std::complex<double> ck, std::complex<double> vk, int offset) {
        return CFExponent(Type::Minus, ck, vk, std::nullopt, offset);
    }

    Type type() const noexcept { return type_; }
    std::complex<double> ck() const noexcept { return ck_; }
    std::complex<double> vk() const noexcept { return vk_; }
    const std::optional<std::complex<double>>& ck2() const noexcept { return ck2_; }
    const std::optional<int>& sigma_bar_k_offset() const noexcept { return offset_; }
    bool fermionic() const noexcept { return type_ == Type::Plus || type_ == Type::Minus; }

    // Complex prefactor of exp(-vk t) in C(t).
    std::complex<double> coefficient() const noexcept;
    std::complex<double> exponent() const noexcept { return vk_; }

    // Both bosonic and vk within |a - b| <= atol + rtol |b| (b = other.vk()).
    bool can_combine(const CFExponent& other, double rtol, double atol) const noexcept;
    // Merge with an exponent of (nearly) the same frequency; keeps this vk.
    CFExponent combined_with(const CFExponent& other) const;

private:
    Type type_;
    std::complex<double> ck_;
    std::complex<double> vk_;
    std::optional<std::complex<double>> ck2_;
    std::optional<int> offset_;
};

std::string to_string(CFExponent::Type type);
CFExponent::Type parse_exponent_type(const std::string& s);

// Coefficient/frequency lists of the real and imaginary parts of C(t).
struct ExponentLists {
    std::vector<std::complex<double>> ck_real;
    std::vector<std::complex<double>> vk_real;
    std::vector<std::complex<double>> ck_imag;
    std::vector<std::complex<double>> vk_imag;
};

// Constructor arguments: either all four lists, an exponent list, or both.
struct ExponentialSpec {
    std::optional<std::vector<std::complex<double>>> ck_real;
    std::optional<std::vector<std::complex<double>>> vk_real;
    std::optional<std::vector<std::complex<double>>> ck_imag;
    std::optional<std::vector<std::complex<double>>> vk_imag;
    std::optional<std::vector<CFExponent>> exponents;
    bool combine{true};
};

class ExponentialBosonicEnvironment : public BosonicEnvironment {
public:
    explicit ExponentialBosonicEnvironment(ExponentialSpec spec,
                                           std::optional<double> T = std::nullopt,
                                           std::any tag = {});
    explicit ExponentialBosonicEnvironment(const ExponentLists& lists,
                                           std::optional<double> T = std::nullopt,
                                           bool combine = true,
                                           std::any tag = {});
    explicit ExponentialBosonicEnvironment(std::vector<CFExponent> exponents,
                                           std::optional<double> T = std::nullopt,
                                           bool combine = true,
                                           std::any tag = {});

    const std::vector<CFExponent>& exponents() const noexcept { return exponents_; }

    // Greedy merge of bosonic exponents sharing a frequency, in first-seen order.
    static std::vector<CFExponent> combine(const std::vector<CFExponent>& exponents,
                                           double rtol = 1e-5,
                                           double atol = 1e-7);

protected:
    std::vector<double> sd_impl(const std::vector<double>& w) const override;
    std::vector<double> ps_impl(const std::vector<double>& w, double eps) const override;
    std::vector<std::complex<double>> cf_impl(const std::vector<double>& t, double eps) const override;

private:
    std::vector<CFExponent> exponents_;
};

} // namespace qenv
