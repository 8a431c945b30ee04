#pragma once

#include <complex>
#include <memory>

namespace qenv {

// Special functions needed by power-law environments. Passed to the models that
// need them so that a missing implementation is an explicit, testable condition.
class SpecialFunctions {
public:
    virtual ~SpecialFunctions() = default;

    virtual double gamma(double x) const = 0;
    // zeta(s, a) = sum_{k>=0} (a + k)^{-s} for s > 1 and Re a > 0.
    virtual std::complex<double> hurwitz_zeta(double s, std::complex<double> a) const = 0;
};

// Boost.Math backed implementation (tgamma, Euler-Maclaurin zeta with bernoulli_b2n).
class BoostSpecialFunctions final : public SpecialFunctions {
public:
    double gamma(double x) const override;
    std::complex<double> hurwitz_zeta(double s, std::complex<double> a) const override;
};

std::shared_ptr<const SpecialFunctions> default_special_functions();

} // namespace qenv
