#include "modules/BeliefSpace.h"
#include "utils/Validation.h"
#include <cmath>
#include <limits>
#include <string>

BeliefSpace::BeliefSpace(std::uint32_t bins) : bins_(bins) {
    validation::require(bins >= 2, "belief space needs at least 2 bins (got " +
                        std::to_string(bins) + ")");

    constexpr double lower = -1.0;
    constexpr double upper = 1.0;
    db_ = (upper - lower) / bins_;

    // Boundaries -1, -1+db, ..., 1; centres halfway between
    const Eigen::VectorXd bounds = Eigen::VectorXd::LinSpaced(bins_ + 1, lower, upper);
    centers_ = bounds.head(bins_) + 0.5 * (bounds.tail(bins_) - bounds.head(bins_));
    centersSq_ = centers_.array().square().matrix();

    uniform_ = BeliefDensity::Constant(bins_, 1.0 / (bins_ * db_));
}

BeliefDensity BeliefSpace::normalDensity(double mu, double sigma) const {
    constexpr double kInvSqrt2Pi = 0.39894228040143267794;
    const Eigen::ArrayXd z = (centers_.array() - mu) / sigma;
    BeliefDensity pdf = ((-0.5 * z.square()).exp() * (kInvSqrt2Pi / sigma)).matrix();
    return normalize(pdf);
}

BeliefSummary BeliefSpace::summarize(const BeliefDensity& d) const {
    BeliefSummary s;
    const double total = d.sum();
    s.mean = d.dot(centers_) / total;
    const double var = d.dot(centersSq_) / total - s.mean * s.mean;
    s.sigma = var > 0.0 ? std::sqrt(var) : std::numeric_limits<double>::epsilon();
    return s;
}

DiffusionOperator::DiffusionOperator(const BeliefSpace& space, double kappa) : kappa_(kappa) {
    validation::require(kappa >= 0.0, "kappa must be >= 0 (got " + std::to_string(kappa) + ")");

    const Eigen::Index n = space.bins();
    constexpr double dt = 1.0;
    const double r = dt * kappa / (space.binWidth() * space.binWidth());

    Eigen::MatrixXd heat = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        heat(i, i) = 1.0 + 2.0 * r;
        if (i + 1 < n) {
            heat(i, i + 1) = -r;
            heat(i + 1, i) = -r;
        }
    }

    propagator_ = heat.partialPivLu().inverse();
}
