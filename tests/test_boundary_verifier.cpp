#include <gtest/gtest.h>
#include "BoundaryErrors.hpp"
#include "BoundaryVerifier.hpp"
#include "NewtonRaphson.hpp"
#include <cmath>
#include <limits>

namespace {

BoundaryStatistics unit_statistics(double F_crit) {
    BoundaryStatistics st;
    st.K = 1.0;
    st.df1 = 1;
    st.F_crit = F_crit;
    st.mean_diff = Eigen::VectorXd::Zero(1);
    st.S_pool = Eigen::MatrixXd::Identity(1, 1);
    return st;
}

BoundarySolution solution_at(double t, double tolerance = 1e-9) {
    BoundarySolution sol;
    sol.points.resize(2);
    sol.points << t, 0.5;
    sol.converged = true;
    sol.iterations = 7;
    sol.max_iterations = 100;
    sol.tolerance = tolerance;
    return sol;
}

BoundaryProblem solved_problem() {
    BoundaryProblem p;
    p.dimension = 2;
    p.scale = 1.0;
    p.target.resize(2);
    p.target << 3.0, 1.5;
    p.covariance.resize(2, 2);
    p.covariance << 4.0, 0.5,
                    0.5, 1.0;
    p.critical_value = 1.0;
    p.initial_guess.resize(3);
    p.initial_guess << 4.0, 2.5, 2.0;
    return p;
}

}

TEST(BoundaryVerifierTest, SolverOutputLiesOnBoundary) {
    const BoundaryProblem p = solved_problem();
    BoundarySolution sol = locate_boundary_nr(p);
    ASSERT_FALSE(sol.on_boundary.has_value());

    check_point_location(sol, statistics_from_problem(p));
    ASSERT_TRUE(sol.on_boundary.has_value());
    EXPECT_TRUE(*sol.on_boundary);
}

TEST(BoundaryVerifierTest, TargetItselfIsNotOnBoundary) {
    const BoundaryProblem p = solved_problem();
    BoundarySolution sol = locate_boundary_nr(p);
    sol.points.head(2) = p.target;

    check_point_location(sol, statistics_from_problem(p));
    ASSERT_TRUE(sol.on_boundary.has_value());
    EXPECT_FALSE(*sol.on_boundary);
}

TEST(BoundaryVerifierTest, IsIdempotentAndTouchesOnlyTheFlag) {
    const BoundaryProblem p = solved_problem();
    BoundarySolution sol = locate_boundary_nr(p);
    const BoundarySolution before = sol;
    const BoundaryStatistics st = statistics_from_problem(p);

    check_point_location(sol, st);
    const bool first = sol.on_boundary.value();
    check_point_location(sol, st);
    EXPECT_EQ(sol.on_boundary.value(), first);

    EXPECT_TRUE(sol.points == before.points);
    EXPECT_EQ(sol.converged, before.converged);
    EXPECT_EQ(sol.iterations, before.iterations);
    EXPECT_EQ(sol.max_iterations, before.max_iterations);
    EXPECT_EQ(sol.tolerance, before.tolerance);
}

TEST(BoundaryVerifierTest, BoundaryStatisticAtSolution) {
    const BoundaryProblem p = solved_problem();
    const BoundarySolution sol = locate_boundary_nr(p);
    EXPECT_NEAR(boundary_statistic(sol, statistics_from_problem(p)), 1.0, 1e-12);
}

TEST(BoundaryVerifierTest, DigitsComeFromToleranceRoundedHalfUp) {
    EXPECT_EQ(rounding_digits(1e-9), 0);
    EXPECT_EQ(rounding_digits(0.4), 0);
    EXPECT_EQ(rounding_digits(0.5), 1);
    EXPECT_EQ(rounding_digits(2.0), 2);
    EXPECT_EQ(rounding_digits(3.7), 4);
}

TEST(BoundaryVerifierTest, RoundingTiesToEven) {
    EXPECT_EQ(round_to_digits(2.5, 0), 2.0);
    EXPECT_EQ(round_to_digits(3.5, 0), 4.0);
    EXPECT_EQ(round_to_digits(-2.5, 0), -2.0);
    EXPECT_DOUBLE_EQ(round_to_digits(2.65719, 2), 2.66);
    EXPECT_DOUBLE_EQ(round_to_digits(1234.5, -2), 1200.0);
    EXPECT_EQ(round_to_digits(0.0, 3), 0.0);
    EXPECT_DOUBLE_EQ(round_to_digits(1.0 / 3.0, 20), 1.0 / 3.0);
}

TEST(BoundaryVerifierTest, RoundingPicksNearestStoredDecimal) {
    // 0.15 and 0.35 are stored just below the halfway point.
    EXPECT_DOUBLE_EQ(round_to_digits(0.15, 1), 0.1);
    EXPECT_DOUBLE_EQ(round_to_digits(0.35, 1), 0.3);
    EXPECT_DOUBLE_EQ(round_to_digits(-0.15, 1), -0.1);
    EXPECT_DOUBLE_EQ(round_to_digits(0.125, 2), 0.12);
    EXPECT_DOUBLE_EQ(round_to_digits(0.375, 2), 0.38);
    EXPECT_DOUBLE_EQ(round_to_digits(2500.0, -3), 2000.0);
    EXPECT_DOUBLE_EQ(round_to_digits(3500.0, -3), 4000.0);
}

TEST(BoundaryVerifierTest, ExtremeDigitCountsAreClamped) {
    EXPECT_EQ(rounding_digits(1e10), 400);
    EXPECT_EQ(rounding_digits(1e300), 400);
    EXPECT_EQ(rounding_digits(-1e10), -400);
    EXPECT_EQ(round_to_digits(1.0, std::numeric_limits<int>::max()), 1.0);
    EXPECT_EQ(round_to_digits(1.0, std::numeric_limits<int>::min()), 0.0);
    EXPECT_EQ(round_to_digits(1e-300, -400), 0.0);
    EXPECT_EQ(round_to_digits(1.7e308, -309), 0.0);
    EXPECT_TRUE(std::isfinite(round_to_digits(1.25e-310, 312)));
    EXPECT_EQ(round_to_digits(123.0, -401), 0.0);
}

TEST(BoundaryVerifierTest, HugeToleranceComparesUnrounded) {
    // kdvd = 1 exactly at t = 1 with K = 1, S_pool = 1.
    BoundarySolution sol = solution_at(1.0, 1e10);
    check_point_location(sol, unit_statistics(1.0));
    EXPECT_TRUE(sol.on_boundary.value());

    sol = solution_at(1.0 + 1e-12, 1e10);
    check_point_location(sol, unit_statistics(1.0));
    EXPECT_FALSE(sol.on_boundary.value());
}

TEST(BoundaryVerifierTest, VeryNegativeDigitsRoundEverythingToZero) {
    VerifierOptions opt;
    opt.digits = -400;
    BoundarySolution sol = solution_at(1.0);
    check_point_location(sol, unit_statistics(5.0), opt);
    EXPECT_TRUE(sol.on_boundary.value());
}

TEST(BoundaryVerifierTest, ToleranceAsDigitCountIsCoarse) {
    // kdvd = 1.2 against F.crit = 1.4: equal at 0 decimals, different at 1.
    BoundarySolution sol = solution_at(std::sqrt(1.2));
    check_point_location(sol, unit_statistics(1.4));
    EXPECT_TRUE(sol.on_boundary.value());

    VerifierOptions opt;
    opt.digits = 1;
    check_point_location(sol, unit_statistics(1.4), opt);
    EXPECT_FALSE(sol.on_boundary.value());
}

TEST(BoundaryVerifierTest, ToleranceOfTwoComparesTwoDecimals) {
    BoundarySolution sol = solution_at(std::sqrt(2.6572), 2.0);
    check_point_location(sol, unit_statistics(2.6571966));
    EXPECT_TRUE(sol.on_boundary.value());

    sol = solution_at(std::sqrt(2.649), 2.0);
    check_point_location(sol, unit_statistics(2.6571966));
    EXPECT_FALSE(sol.on_boundary.value());
}

TEST(BoundaryVerifierTest, MalformedHandoffIsRejected) {
    BoundarySolution sol = solution_at(1.0);

    BoundaryStatistics st = unit_statistics(1.0);
    st.df1 = 0;
    EXPECT_THROW(check_point_location(sol, st), MalformedHandoff);

    st = unit_statistics(1.0);
    st.mean_diff = Eigen::VectorXd::Zero(2);
    EXPECT_THROW(check_point_location(sol, st), MalformedHandoff);

    st = unit_statistics(1.0);
    st.S_pool = Eigen::MatrixXd::Identity(2, 2);
    EXPECT_THROW(check_point_location(sol, st), MalformedHandoff);

    st = unit_statistics(std::nan(""));
    EXPECT_THROW(check_point_location(sol, st), MalformedHandoff);

    BoundarySolution short_sol = sol;
    short_sol.points = Eigen::VectorXd::Ones(1);
    EXPECT_THROW(check_point_location(short_sol, unit_statistics(1.0)), MalformedHandoff);

    BoundarySolution bad_tol = sol;
    bad_tol.tolerance = -1.0;
    EXPECT_THROW(check_point_location(bad_tol, unit_statistics(1.0)), MalformedHandoff);

    EXPECT_FALSE(sol.on_boundary.has_value());
}

TEST(BoundaryVerifierTest, SingularPooledCovarianceThrows) {
    BoundarySolution sol = solution_at(1.0);
    BoundaryStatistics st = unit_statistics(1.0);
    st.S_pool(0, 0) = 0.0;
    EXPECT_THROW(check_point_location(sol, st), SingularMatrix);
    EXPECT_FALSE(sol.on_boundary.has_value());
}

TEST(BoundaryVerifierTest, StatisticsFromProblem) {
    const BoundaryProblem p = solved_problem();
    const BoundaryStatistics st = statistics_from_problem(p);
    EXPECT_EQ(st.df1, 2);
    EXPECT_EQ(st.K, p.scale);
    EXPECT_EQ(st.F_crit, p.critical_value);
    EXPECT_EQ(st.mean_diff, p.target);
    EXPECT_EQ(st.S_pool, p.covariance);
}
