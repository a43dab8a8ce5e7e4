#include "BoundaryVerifier.hpp"
#include "BoundaryErrors.hpp"
#include "LinearAlgebra.hpp"
#include <cfloat>
#include <algorithm>
#include <cmath>

namespace {

constexpr int kMaxDigits = 400;

void validate_handoff(const BoundarySolution& sol, const BoundaryStatistics& st) {
    if (st.df1 < 1) {
        throw MalformedHandoff("statistics: df1 must be a positive integer.");
    }
    if (!std::isfinite(st.K) || !std::isfinite(st.F_crit)) {
        throw MalformedHandoff("statistics: K and F_crit must be finite.");
    }
    if (st.mean_diff.size() != st.df1) {
        throw MalformedHandoff("statistics: mean_diff must have length df1.");
    }
    if (st.S_pool.rows() != st.df1 || st.S_pool.cols() != st.df1) {
        throw MalformedHandoff("statistics: S_pool must be a df1 x df1 matrix.");
    }
    if (sol.points.size() != st.df1 + 1) {
        throw MalformedHandoff("solution: points must have length (df1 + 1).");
    }
    if (!std::isfinite(sol.tolerance) || sol.tolerance < 0.0) {
        throw MalformedHandoff("solution: tolerance must be a non-negative finite value.");
    }
}

}

BoundaryStatistics statistics_from_problem(const BoundaryProblem& p) {
    return {p.scale, p.dimension, p.critical_value, p.target, p.covariance};
}

int rounding_digits(double tolerance) {
    // Past +-kMaxDigits a comparison is either unrounded or at zero.
    if (!(tolerance < kMaxDigits)) return kMaxDigits;
    if (!(tolerance > -kMaxDigits)) return -kMaxDigits;
    return static_cast<int>(std::floor(tolerance + 0.5));
}

double round_to_digits(double x, int digits) {
    if (!std::isfinite(x) || x == 0.0 || digits > kMaxDigits) return x;
    if (digits < -kMaxDigits) return 0.0;
    if (digits == 0) return std::nearbyint(x);

    const double sign = x < 0.0 ? -1.0 : 1.0;
    const double ax = std::abs(x);
    // Beyond double precision there is nothing left to round.
    const int magnitude = static_cast<int>(std::floor(std::log10(ax))) + 1;
    if (digits + magnitude > DBL_DIG) return x;

    // Candidates either side of ax; keep the one nearer the stored double,
    // ties to the even last digit.
    double lower = 0.0, upper = 0.0, scaled_floor = 0.0;
    if (digits > 0) {
        // 10^digits is split so subnormal inputs do not overflow the scale.
        const int head = std::min(digits, DBL_MAX_10_EXP);
        const double p_head = std::pow(10.0, head);
        const double p_tail = std::pow(10.0, digits - head);
        const double scaled = ax * p_head * p_tail;
        scaled_floor = std::floor(scaled);
        lower = scaled_floor / p_tail / p_head;
        upper = std::ceil(scaled) / p_tail / p_head;
    } else {
        // |x| below a tenth of the rounding unit
        if (digits + magnitude < 0 || -digits > DBL_MAX_10_EXP) return sign * 0.0;
        const double p10 = std::pow(10.0, -digits);
        scaled_floor = std::floor(ax / p10);
        lower = scaled_floor * p10;
        upper = std::ceil(ax / p10) * p10;
    }
    const double du = upper - ax;
    const double dl = ax - lower;
    const bool take_upper = du < dl || (du == dl && std::fmod(scaled_floor, 2.0) == 1.0);
    return sign * (take_upper ? upper : lower);
}

double boundary_statistic(const BoundarySolution& sol, const BoundaryStatistics& st) {
    validate_handoff(sol, st);
    const Eigen::MatrixXd precision = LinearAlgebra::invert(st.S_pool, "pooled covariance");
    const Eigen::VectorXd diff = sol.points.head(st.df1) - st.mean_diff;
    return st.K * LinearAlgebra::quadratic_form(diff, precision);
}

void check_point_location(BoundarySolution& sol,
                          const BoundaryStatistics& st,
                          const VerifierOptions& opt)
{
    const double kdvd = boundary_statistic(sol, st);
    const int digits = opt.digits ? *opt.digits : rounding_digits(sol.tolerance);
    sol.on_boundary = round_to_digits(kdvd, digits) == round_to_digits(st.F_crit, digits);
}
