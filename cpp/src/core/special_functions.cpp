#include "qenv/special_functions.hpp"

#include <boost/math/special_functions/bernoulli.hpp>
#include <boost/math/special_functions/gamma.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace qenv {

namespace {

// Euler-Maclaurin: direct sum over the first kDirect terms, tail integral,
// then kBernoulli correction terms evaluated at b = a + kDirect.
constexpr int kDirect = 25;
constexpr int kBernoulli = 12;

} // namespace

double BoostSpecialFunctions::gamma(double x) const {
    return boost::math::tgamma(x);
}

std::complex<double> BoostSpecialFunctions::hurwitz_zeta(double s, std::complex<double> a) const {
    if (!(s > 1.0)) {
        throw std::invalid_argument("hurwitz_zeta: requires s > 1 (got " + std::to_string(s) + ")");
    }
    if (!(a.real() > 0.0)) {
        throw std::invalid_argument("hurwitz_zeta: requires Re(a) > 0");
    }

    std::complex<double> sum(0.0, 0.0);
    for (int k = 0; k < kDirect; ++k) {
        sum += std::pow(a + static_cast<double>(k), -s);
    }

    const std::complex<double> b = a + static_cast<double>(kDirect);
    const std::complex<double> b_pow = std::pow(b, -s);
    sum += b * b_pow / (s - 1.0);  // b^{1-s} / (s - 1)
    sum += 0.5 * b_pow;

    // term_j = B_{2j} / (2j)! * s (s+1) ... (s+2j-2) * b^{-s-2j+1}
    const std::complex<double> inv_b2 = 1.0 / (b * b);
    std::complex<double> power = b_pow / b;  // b^{-s-1}
    double rising = s;                       // s (s+1) ... (s+2j-2)
    double factorial = 2.0;                  // (2j)!
    for (int j = 1; j <= kBernoulli; ++j) {
        const double bern = boost::math::bernoulli_b2n<double>(j);
        sum += (bern / factorial) * rising * power;

        power *= inv_b2;
        rising *= (s + 2.0 * j - 1.0) * (s + 2.0 * j);
        factorial *= (2.0 * j + 1.0) * (2.0 * j + 2.0);
    }
    return sum;
}

std::shared_ptr<const SpecialFunctions> default_special_functions() {
    static const std::shared_ptr<const SpecialFunctions> instance = std::make_shared<BoostSpecialFunctions>();
    return instance;
}

} // namespace qenv
