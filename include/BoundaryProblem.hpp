#pragma once
#include <Eigen/Dense>
#include <optional>

// Locate t (and multiplier λ) extremizing t^T V^{-1} t subject to
//   critical_value = scale * (t - target)^T V^{-1} (t - target).
struct BoundaryProblem {
    using Vec = Eigen::VectorXd;
    using Mat = Eigen::MatrixXd;

    int dimension = 0;          // n_p
    double scale = 0.0;         // K
    Vec target;                 // mean difference, length n_p
    Mat covariance;             // V, n_p x n_p
    double critical_value = 0.0;
    Vec initial_guess;          // length n_p + 1, last entry = λ0
    int max_iterations = 100;
    double tolerance = 1e-9;
};

struct BoundarySolution {
    Eigen::VectorXd points;            // (t_1..t_n, λ)
    bool converged = false;
    std::optional<bool> on_boundary;   // unset until verified
    int iterations = 0;
    int max_iterations = 0;
    double tolerance = 0.0;

    int dimension() const noexcept { return static_cast<int>(points.size()) - 1; }
    // Both throw MalformedHandoff while points is empty.
    Eigen::VectorXd location() const;
    double lambda() const;
};

// Throws InvalidInput naming the first offending field.
void validate_problem(const BoundaryProblem& p);
