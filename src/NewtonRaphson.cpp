#include "NewtonRaphson.hpp"
#include "LinearAlgebra.hpp"
#include <cmath>
#include <iostream>

NRStep newton_step(const Eigen::VectorXd& y, const BoundaryProblem& p, const Eigen::MatrixXd& precision) {
    using Vec = Eigen::VectorXd;
    using Mat = Eigen::MatrixXd;
    const int n = p.dimension;
    const double k = p.scale;

    const Vec t = y.head(n);
    const double lambda = y[n];
    const Vec diff = t - p.target;
    const Vec Ad = precision * diff;

    Vec score(n + 1);
    score.head(n) = 2.0 * (precision * t) - 2.0 * lambda * k * Ad;
    score[n] = p.critical_value - k * LinearAlgebra::quadratic_form(diff, precision);

    Mat H(n + 1, n + 1);
    H.topLeftCorner(n, n) = 2.0 * precision - 2.0 * lambda * k * precision;
    H.topRightCorner(n, 1) = -2.0 * k * Ad;
    H.bottomLeftCorner(1, n) = (-2.0 * k * Ad).transpose();
    H(n, n) = 0.0;

    const Mat Hinv = LinearAlgebra::invert(H, "bordered Hessian");
    return {y - Hinv * score, score.sum()};
}

BoundarySolution locate_boundary_nr(const BoundaryProblem& p, const NROptions& opt) {
    validate_problem(p);
    const Eigen::MatrixXd precision = LinearAlgebra::invert(p.covariance, "covariance");

    Eigen::VectorXd y = p.initial_guess;
    int it = 0;
    bool met = false;
    do {
        NRStep step = newton_step(y, p, precision);
        y = std::move(step.next);
        ++it;
        met = std::abs(step.score_sum) < p.tolerance;
    } while (!met && it < p.max_iterations);

    if (!met && opt.warn) {
        std::cerr << "Warning: the Newton-Raphson search did not converge within "
                  << p.max_iterations << " iterations.\n";
    }

    BoundarySolution sol;
    sol.points = std::move(y);
    sol.converged = it < p.max_iterations;
    sol.iterations = it;
    sol.max_iterations = p.max_iterations;
    sol.tolerance = p.tolerance;
    return sol;
}
