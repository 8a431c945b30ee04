#include "qenv/interpolation.hpp"

#include <boost/math/interpolators/makima.hpp>

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "qenv/errors.hpp"

namespace qenv {

namespace {

class AkimaInterpolant {
public:
    AkimaInterpolant(std::vector<double> x, std::vector<double> y)
        : lo_(x.front()), hi_(x.back()),
          spline_(std::move(x), std::move(y)) {}

    double operator()(double x) const {
        if (!(x >= lo_ && x <= hi_)) return 0.0; // zero outside support (and for NaN)
        return spline_(x);
    }

private:
    double lo_;
    double hi_;
    boost::math::interpolators::makima<std::vector<double>> spline_;
};

void sort_samples(std::vector<double>& x, std::vector<double>& y, const std::string& who) {
    if (x.size() != y.size()) {
        throw ShapeMismatch(who + ": abscissae (" + std::to_string(x.size())
                            + ") and values (" + std::to_string(y.size()) + ") differ in length");
    }
    if (x.empty()) throw ShapeMismatch(who + ": no samples given");
    if (x.size() < 4) throw std::invalid_argument(who + ": cubic interpolation needs at least 4 samples");

    if (!std::is_sorted(x.begin(), x.end())) {
        std::vector<std::size_t> order(x.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&x](std::size_t a, std::size_t b) { return x[a] < x[b]; });
        std::vector<double> xs(x.size()), ys(y.size());
        for (std::size_t k = 0; k < order.size(); ++k) {
            xs[k] = x[order[k]];
            ys[k] = y[order[k]];
        }
        x.swap(xs);
        y.swap(ys);
    }
    if (std::adjacent_find(x.begin(), x.end()) != x.end()) {
        throw std::invalid_argument(who + ": abscissae must be distinct");
    }
}

} // namespace

RealFunction real_interpolation(std::vector<double> x,
                                std::vector<double> y,
                                const std::string& who) {
    sort_samples(x, y, who);
    return AkimaInterpolant(std::move(x), std::move(y));
}

ComplexFunction complex_interpolation(const std::vector<double>& x,
                                      const std::vector<std::complex<double>>& y,
                                      const std::string& who) {
    if (x.size() != y.size()) {
        throw ShapeMismatch(who + ": abscissae (" + std::to_string(x.size())
                            + ") and values (" + std::to_string(y.size()) + ") differ in length");
    }
    std::vector<double> re(y.size()), im(y.size());
    for (std::size_t k = 0; k < y.size(); ++k) {
        re[k] = y[k].real();
        im[k] = y[k].imag();
    }
    RealFunction fre = real_interpolation(x, std::move(re), who);
    RealFunction fim = real_interpolation(x, std::move(im), who);
    return [fre = std::move(fre), fim = std::move(fim)](double v) {
        return std::complex<double>(fre(v), fim(v));
    };
}

} // namespace qenv
