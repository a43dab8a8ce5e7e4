#pragma once
#include "BoundaryProblem.hpp"
#include <nlopt.hpp>

struct SlsqpOptions {
    bool maximize = true;     // MSD upper bound; false gives the near point
    int max_evals = 2000;
    double rel_tol = 1e-10;
    double abs_tol = 1e-12;
    double constraint_tol = 1e-12;
    bool warn = true;
};

// Solves the same constrained problem as locate_boundary_nr with NLopt's SLSQP:
// extremize t^T V^{-1} t subject to scale * (t - target)^T V^{-1} (t - target) = critical_value.
// The starting point is the head of problem.initial_guess; the budget is max_evals
// (problem.max_iterations is echoed only). The multiplier is recovered from stationarity.
BoundarySolution locate_boundary_slsqp(const BoundaryProblem& p, const SlsqpOptions& opt = {});
