#pragma once
#include "BoundaryVerifier.hpp"
#include <Eigen/Dense>

// Two-sample Hotelling T^2 test for small samples.
struct TwoSampleT2 {
    using Vec = Eigen::VectorXd;
    using Mat = Eigen::MatrixXd;

    int n_ref = 0;
    int n_test = 0;
    int df1 = 0;          // number of time points
    int df2 = 0;          // n_ref + n_test - df1 - 1
    double alpha = 0.05;
    double K = 0.0;       // n1 n2 / (n1 + n2) * df2 / ((n1 + n2 - 2) df1)
    double T2 = 0.0;
    double F = 0.0;
    double F_crit = 0.0;  // (1 - alpha) quantile of F(df1, df2)
    double p_F = 0.0;

    Vec mean_ref;
    Vec mean_test;
    Vec mean_diff;        // mean_test - mean_ref
    Mat cov_ref;
    Mat cov_test;
    Mat S_pool;

    BoundaryStatistics statistics() const;
};

// Rows are units (tablets), columns are time points.
// Throws InvalidInput on inconsistent shapes or alpha outside (0, 1),
// SingularMatrix if the pooled covariance cannot be inverted.
TwoSampleT2 two_sample_t2(const Eigen::MatrixXd& reference,
                          const Eigen::MatrixXd& test,
                          double alpha = 0.05);
