#include "qenv/fit.hpp"

#include <Eigen/Dense>
#include <unsupported/Eigen/LevenbergMarquardt>
#include <unsupported/Eigen/NumericalDiff>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace qenv::fit {

namespace {

// Maps bounded parameters x to unconstrained internal variables z:
//   [l, u]   x = l + (u - l) (sin z + 1) / 2
//   [l, inf) x = l - 1 + sqrt(z^2 + 1)
//   (-inf, u] x = u + 1 - sqrt(z^2 + 1)
// Parameters with l == u, and parameters whose guess sits on a finite bound,
// are held there and do not enter z.
class BoxTransform {
  public:
    BoxTransform(const std::vector<double>& guesses,
                 const std::vector<double>& lower,
                 const std::vector<double>& upper)
        : lower_(lower), upper_(upper), held_(lower), kind_(lower.size()) {
        for (std::size_t j = 0; j < lower_.size(); ++j) {
            const double l = lower_[j], u = upper_[j];
            if (std::isnan(l) || std::isnan(u) || l > u) {
                throw std::invalid_argument("least_squares: invalid bounds for parameter " + std::to_string(j));
            }
            const bool has_l = std::isfinite(l);
            const bool has_u = std::isfinite(u);
            if (l == u || (has_l && guesses[j] == l)) {
                kind_[j] = Kind::Fixed;
            } else if (has_u && guesses[j] == u) {
                kind_[j] = Kind::Fixed;
                held_[j] = u;
            } else if (has_l && has_u) kind_[j] = Kind::Both;
            else if (has_l) kind_[j] = Kind::Lower;
            else if (has_u) kind_[j] = Kind::Upper;
            else kind_[j] = Kind::Free;
            if (kind_[j] != Kind::Fixed) free_.push_back(j);
        }
    }

    std::size_t size() const noexcept { return lower_.size(); }
    std::size_t free_count() const noexcept { return free_.size(); }

    // Moves x strictly inside its box so that the mapping has a non-zero slope there.
    double nudge_inside(std::size_t j, double x) const {
        const double l = lower_[j], u = upper_[j];
        switch (kind_[j]) {
            case Kind::Both: {
                const double margin = 1e-4 * (u - l);
                return std::min(std::max(x, l + margin), u - margin);
            }
            case Kind::Lower: return std::max(x, l + 1e-4 * std::max(1.0, std::abs(l)));
            case Kind::Upper: return std::min(x, u - 1e-4 * std::max(1.0, std::abs(u)));
            case Kind::Fixed: return held_[j];
            case Kind::Free: break;
        }
        return x;
    }

    Eigen::VectorXd to_internal(const std::vector<double>& x) const {
        Eigen::VectorXd z(static_cast<Eigen::Index>(free_.size()));
        for (std::size_t f = 0; f < free_.size(); ++f) {
            const std::size_t j = free_[f];
            const double v = nudge_inside(j, x[j]);
            const double l = lower_[j], u = upper_[j];
            double zj = v;
            switch (kind_[j]) {
                case Kind::Both: zj = std::asin(2.0 * (v - l) / (u - l) - 1.0); break;
                case Kind::Lower: zj = std::sqrt((v - l + 1.0) * (v - l + 1.0) - 1.0); break;
                case Kind::Upper: zj = std::sqrt((u - v + 1.0) * (u - v + 1.0) - 1.0); break;
                case Kind::Free:
                case Kind::Fixed: break;
            }
            z(static_cast<Eigen::Index>(f)) = zj;
        }
        return z;
    }

    std::vector<double> to_external(const Eigen::VectorXd& z) const {
        std::vector<double> x(held_);
        for (std::size_t f = 0; f < free_.size(); ++f) {
            const std::size_t j = free_[f];
            const double zj = z(static_cast<Eigen::Index>(f));
            const double l = lower_[j], u = upper_[j];
            switch (kind_[j]) {
                case Kind::Both: x[j] = l + (u - l) * (std::sin(zj) + 1.0) / 2.0; break;
                case Kind::Lower: x[j] = l - 1.0 + std::sqrt(zj * zj + 1.0); break;
                case Kind::Upper: x[j] = u + 1.0 - std::sqrt(zj * zj + 1.0); break;
                case Kind::Free: x[j] = zj; break;
                case Kind::Fixed: break;
            }
        }
        return x;
    }

  private:
    enum class Kind { Free, Lower, Upper, Both, Fixed };

    std::vector<double> lower_;
    std::vector<double> upper_;
    std::vector<double> held_;
    std::vector<Kind> kind_;
    std::vector<std::size_t> free_;
};

struct ResidualFunctor : Eigen::DenseFunctor<double> {
    ResidualFunctor(const Model* model,
                    const std::vector<double>* x,
                    const std::vector<double>* y,
                    double sigma,
                    const BoxTransform* box,
                    std::size_t n)
        : Eigen::DenseFunctor<double>(static_cast<int>(box->free_count()), static_cast<int>(x->size())),
          model_(model), x_(x), y_(y), sigma_(sigma), box_(box), n_(n) {}

    int operator()(const InputType& z, ValueType& fvec) const {
        const Parameters p = unpack(box_->to_external(z), n_);
        for (std::size_t i = 0; i < x_->size(); ++i) {
            fvec(static_cast<Eigen::Index>(i)) = ((*model_)((*x_)[i], p) - (*y_)[i]) / sigma_;
        }
        return 0;
    }

    const Model* model_;
    const std::vector<double>* x_;
    const std::vector<double>* y_;
    double sigma_;
    const BoxTransform* box_;
    std::size_t n_;
};

// 1-4 meet the tolerances; 6-8 mean no further reduction is possible at machine precision.
bool converged(Eigen::LevenbergMarquardtSpace::Status status) {
    using namespace Eigen::LevenbergMarquardtSpace;
    switch (status) {
        case RelativeReductionTooSmall:
        case RelativeErrorTooSmall:
        case RelativeErrorAndReductionTooSmall:
        case CosinusTooSmall:
        case FtolTooSmall:
        case XtolTooSmall:
        case GtolTooSmall:
            return true;
        default:
            return false;
    }
}

std::string describe(Eigen::LevenbergMarquardtSpace::Status status) {
    using namespace Eigen::LevenbergMarquardtSpace;
    switch (status) {
        case ImproperInputParameters: return "solver rejected the problem (improper input parameters)";
        case TooManyFunctionEvaluation: return "no convergence (function evaluation limit reached)";
        case UserAsked: return "solver stopped by the residual function";
        default: return "no convergence (status " + std::to_string(static_cast<int>(status)) + ")";
    }
}

} // namespace

Parameters least_squares(const Model& model,
                         const std::vector<double>& y,
                         const std::vector<double>& x,
                         const std::vector<double>& guesses,
                         const std::vector<double>& lower,
                         const std::vector<double>& upper,
                         double sigma,
                         std::size_t n,
                         int max_function_evaluations) {
    if (x.size() != y.size()) throw std::invalid_argument("least_squares: x and y differ in length");
    if (guesses.size() != lower.size() || guesses.size() != upper.size()) {
        throw std::invalid_argument("least_squares: guesses, lower and upper differ in length");
    }
    if (n == 0 || guesses.size() % n != 0) {
        throw std::invalid_argument("least_squares: parameter count is not a multiple of " + std::to_string(n));
    }
    if (!(sigma > 0.0)) throw std::invalid_argument("least_squares: sigma must be > 0");

    const BoxTransform box(guesses, lower, upper);
    if (box.free_count() == 0) return unpack(box.to_external(Eigen::VectorXd()), n);
    if (box.free_count() > x.size()) {
        throw std::invalid_argument("least_squares: " + std::to_string(box.free_count())
                                    + " free parameters exceed the " + std::to_string(x.size()) + " samples");
    }

    ResidualFunctor functor(&model, &x, &y, sigma, &box, n);
    Eigen::NumericalDiff<ResidualFunctor> numdiff(functor);
    Eigen::LevenbergMarquardt<Eigen::NumericalDiff<ResidualFunctor>> lm(numdiff);
    lm.setMaxfev(max_function_evaluations);

    Eigen::VectorXd z = box.to_internal(guesses);
    const Eigen::LevenbergMarquardtSpace::Status status = lm.minimize(z);
    if (!converged(status)) {
        throw std::runtime_error("least_squares: " + describe(status) + " after "
                                 + std::to_string(lm.nfev()) + " function evaluations");
    }
    if (!z.allFinite()) throw std::runtime_error("least_squares: solver diverged");
    return unpack(box.to_external(z), n);
}

} // namespace qenv::fit
