#ifndef BELIEF_SPACE_H
#define BELIEF_SPACE_H

#include <Eigen/Dense>
#include <cstdint>

// Discretized belief density: one non-negative weight per axis bin.
using BeliefDensity = Eigen::VectorXd;

// Mean and dispersion of a belief density.
struct BeliefSummary {
    double mean = 0.0;
    double sigma = 0.0;  // floored at machine epsilon
};

/**
 * Opinion axis over [-1, 1].
 *
 * B equal bins; centres are the midpoints of B+1 equally spaced boundaries,
 * bin width db = 2/B. Shared read-only by the model and all agents.
 */
class BeliefSpace {
public:
    explicit BeliefSpace(std::uint32_t bins = 200);

    std::uint32_t bins() const { return bins_; }
    double binWidth() const { return db_; }
    const Eigen::VectorXd& centers() const { return centers_; }

    // Density 1/(B*db) in every bin: total non-informativeness
    const BeliefDensity& uniform() const { return uniform_; }

    // Gaussian pdf sampled at bin centres, normalised over the axis
    BeliefDensity normalDensity(double mu, double sigma) const;

    // sum(d) * db
    double mass(const BeliefDensity& d) const { return d.sum() * db_; }

    // d / (sum(d) * db)
    BeliefDensity normalize(const BeliefDensity& d) const { return d / mass(d); }

    BeliefSummary summarize(const BeliefDensity& d) const;

private:
    std::uint32_t bins_;
    double db_;
    Eigen::VectorXd centers_;
    Eigen::VectorXd centersSq_;
    BeliefDensity uniform_;
};

/**
 * One-step propagator for the 1D diffusion (heat) equation on the axis.
 *
 * Backward Euler, unit time step, central differences:
 *   A = tridiag(-r, 1 + 2r, -r),  r = kappa / db^2
 * Edge bins couple to one neighbour only. A is inverted once at construction;
 * apply() is then a dense matrix-vector product.
 */
class DiffusionOperator {
public:
    DiffusionOperator(const BeliefSpace& space, double kappa);

    double kappa() const { return kappa_; }
    const Eigen::MatrixXd& propagator() const { return propagator_; }

    // A^-1 * d (not normalised)
    BeliefDensity apply(const BeliefDensity& d) const { return propagator_ * d; }

private:
    double kappa_;
    Eigen::MatrixXd propagator_;
};

#endif
