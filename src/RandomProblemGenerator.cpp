#include "RandomProblemGenerator.hpp"
#include "BoundaryErrors.hpp"
#include "ConfidenceRegion.hpp"
#include <Eigen/QR>
#include <cmath>

RandomProblemGenerator::RandomProblemGenerator(Options opts)
    : opts_(std::move(opts)), rng_(opts_.seed)
{
    if (opts_.d <= 0) {
        throw InvalidInput("RandomProblemGenerator: d must be positive.");
    }
    if (!(opts_.lambda_min > 0.0 && opts_.lambda_max > opts_.lambda_min)) {
        throw InvalidInput("RandomProblemGenerator: require 0 < lambda_min < lambda_max.");
    }
    if (!(opts_.scale_min > 0.0 && opts_.scale_max >= opts_.scale_min)) {
        throw InvalidInput("RandomProblemGenerator: require 0 < scale_min <= scale_max.");
    }
    if (!(opts_.crit_min > 0.0 && opts_.crit_max >= opts_.crit_min)) {
        throw InvalidInput("RandomProblemGenerator: require 0 < crit_min <= crit_max.");
    }
    if (!(opts_.target_scale > 0.0) || opts_.perturbation < 0.0) {
        throw InvalidInput("RandomProblemGenerator: target_scale must be positive, perturbation non-negative.");
    }
}

BoundaryProblem RandomProblemGenerator::generate() {
    BoundaryProblem p;
    p.dimension = opts_.d;
    p.covariance = spd_from_loguniform_spectrum();
    p.target = sample_target();
    p.scale = uniform(opts_.scale_min, opts_.scale_max);
    p.critical_value = uniform(opts_.crit_min, opts_.crit_max);
    p.max_iterations = opts_.max_iterations;
    p.tolerance = opts_.tolerance;

    const ConfidenceRegion crb = ConfidenceRegion::from_problem(p);
    const ConfidenceRegion::BoundaryPoint bp =
        opts_.side == Side::Far ? crb.far_point() : crb.near_point();

    p.initial_guess.resize(opts_.d + 1);
    p.initial_guess.head(opts_.d) = bp.t;
    p.initial_guess[opts_.d] = bp.lambda;
    for (int i = 0; i <= opts_.d; ++i) {
        p.initial_guess[i] *= 1.0 + uniform(-opts_.perturbation, opts_.perturbation);
    }
    return p;
}

std::vector<BoundaryProblem> RandomProblemGenerator::generate(int count) {
    std::vector<BoundaryProblem> out;
    out.reserve(static_cast<size_t>(count > 0 ? count : 0));
    for (int i = 0; i < count; ++i) out.push_back(generate());
    return out;
}

double RandomProblemGenerator::uniform(double lo, double hi) {
    if (lo == hi) return lo;
    std::uniform_real_distribution<double> U(lo, hi);
    return U(rng_);
}

RandomProblemGenerator::Vec RandomProblemGenerator::sample_target() {
    Vec v(opts_.d);
    std::uniform_real_distribution<double> U(-opts_.target_scale, opts_.target_scale);
    for (int j = 0; j < opts_.d; ++j) v[j] = U(rng_);
    return v;
}

// Haar-distributed rotation: QR of a Gaussian matrix with the signs of
// diag(R) folded into Q.
RandomProblemGenerator::Mat RandomProblemGenerator::random_rotation(int d) {
    std::normal_distribution<double> N(0.0, 1.0);
    Mat G(d, d);
    for (int j = 0; j < d; ++j)
        for (int i = 0; i < d; ++i) G(i, j) = N(rng_);

    const Eigen::HouseholderQR<Mat> qr(G);
    Mat Q = qr.householderQ();
    const Vec r = qr.matrixQR().diagonal();
    for (int j = 0; j < d; ++j) {
        if (r[j] < 0.0) Q.col(j) *= -1.0;
    }
    return Q;
}

RandomProblemGenerator::Mat RandomProblemGenerator::spd_from_loguniform_spectrum() {
    const int d = opts_.d;
    Mat Q = random_rotation(d);

    std::uniform_real_distribution<double> U(std::log(opts_.lambda_min), std::log(opts_.lambda_max));
    Vec evals(d);
    for (int i = 0; i < d; ++i) evals[i] = std::exp(U(rng_));
    Mat V = Q * evals.asDiagonal() * Q.transpose();
    // exact symmetry for the quadratic forms downstream
    return 0.5 * (V + V.transpose());
}
