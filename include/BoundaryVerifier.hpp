#pragma once
#include "BoundaryProblem.hpp"
#include <optional>

// Statistics of the two-sample T^2 test that define the CRB.
struct BoundaryStatistics {
    double K = 0.0;              // scaling factor
    int df1 = 0;                 // numerator degrees of freedom (= dimension)
    double F_crit = 0.0;         // critical F value
    Eigen::VectorXd mean_diff;
    Eigen::MatrixXd S_pool;      // pooled variance-covariance matrix
};

// Same statistics the problem was built from.
BoundaryStatistics statistics_from_problem(const BoundaryProblem& p);

struct VerifierOptions {
    // Decimal places for the equality check. When unset the solution's
    // tolerance is used as a digit count (rounded half up, so 1e-9 -> 0).
    std::optional<int> digits;
};

// floor(tolerance + 0.5), clamped to [-400, 400].
int rounding_digits(double tolerance);

// Rounds to the decimal with the given number of places that is nearest the
// stored double (ties to the even last digit), so 0.15 -> 0.1 at one place.
// Negative digits round to tens, hundreds, ...; digits < -400 give 0 and
// digits past double precision return x unchanged.
double round_to_digits(double x, int digits);

// K (t - mean_diff)^T S_pool^{-1} (t - mean_diff) over the first df1 coordinates.
double boundary_statistic(const BoundarySolution& sol, const BoundaryStatistics& st);

// Sets sol.on_boundary; nothing else in sol is touched.
// Throws MalformedHandoff on inconsistent shapes, SingularMatrix if S_pool is singular.
void check_point_location(BoundarySolution& sol,
                          const BoundaryStatistics& st,
                          const VerifierOptions& opt = {});
