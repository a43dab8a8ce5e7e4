#pragma once
#include "BoundaryProblem.hpp"

struct NROptions {
    bool warn = true;   // report non-convergence on std::cerr
};

// One Newton-Raphson step on the stacked first-order system
//   s = [2 A t - 2 λ k A (t - d);  c - k (t - d)^T A (t - d)],  A = V^{-1}
// with bordered Hessian H = [[2A - 2λkA, -2kA(t-d)], [-2k(t-d)^T A, 0]].
struct NRStep {
    Eigen::VectorXd next;   // y - H^{-1} s
    double score_sum;       // sum of the entries of s at the incoming iterate
};

NRStep newton_step(const Eigen::VectorXd& y, const BoundaryProblem& p, const Eigen::MatrixXd& precision);

// Iterates newton_step until |sum(s)| < tolerance or the budget is spent.
// The summed test can stop on cancelling components; it is kept as is.
// Throws InvalidInput on a malformed problem, SingularMatrix if V or H cannot be inverted.
BoundarySolution locate_boundary_nr(const BoundaryProblem& p, const NROptions& opt = {});
