#include "HotellingT2.hpp"
#include "BoundaryErrors.hpp"
#include "LinearAlgebra.hpp"
#include <boost/math/distributions/fisher_f.hpp>

namespace {

Eigen::MatrixXd sample_covariance(const Eigen::MatrixXd& X, const Eigen::VectorXd& mean) {
    const Eigen::MatrixXd centered = X.rowwise() - mean.transpose();
    return (centered.transpose() * centered) / static_cast<double>(X.rows() - 1);
}

}

BoundaryStatistics TwoSampleT2::statistics() const {
    return {K, df1, F_crit, mean_diff, S_pool};
}

TwoSampleT2 two_sample_t2(const Eigen::MatrixXd& reference,
                          const Eigen::MatrixXd& test,
                          double alpha)
{
    if (reference.cols() < 1 || reference.cols() != test.cols()) {
        throw InvalidInput("two_sample_t2: both groups need the same, non-zero number of columns.");
    }
    if (reference.rows() < 2 || test.rows() < 2) {
        throw InvalidInput("two_sample_t2: each group needs at least two rows.");
    }
    if (!reference.allFinite() || !test.allFinite()) {
        throw InvalidInput("two_sample_t2: data must be finite.");
    }
    if (!(alpha > 0.0 && alpha < 1.0)) {
        throw InvalidInput("two_sample_t2: alpha must lie in (0, 1).");
    }

    TwoSampleT2 r;
    r.n_ref = static_cast<int>(reference.rows());
    r.n_test = static_cast<int>(test.rows());
    r.df1 = static_cast<int>(reference.cols());
    r.df2 = r.n_ref + r.n_test - r.df1 - 1;
    if (r.df2 < 1) {
        throw InvalidInput("two_sample_t2: too few rows for the number of time points (df2 < 1).");
    }
    r.alpha = alpha;

    const double n1 = r.n_ref;
    const double n2 = r.n_test;

    r.mean_ref = reference.colwise().mean().transpose();
    r.mean_test = test.colwise().mean().transpose();
    r.mean_diff = r.mean_test - r.mean_ref;
    r.cov_ref = sample_covariance(reference, r.mean_ref);
    r.cov_test = sample_covariance(test, r.mean_test);
    r.S_pool = ((n1 - 1.0) * r.cov_ref + (n2 - 1.0) * r.cov_test) / (n1 + n2 - 2.0);

    const Eigen::MatrixXd precision = LinearAlgebra::invert(r.S_pool, "pooled covariance");
    const double dm2 = LinearAlgebra::quadratic_form(r.mean_diff, precision);

    const double hm = n1 * n2 / (n1 + n2);
    r.K = hm * r.df2 / ((n1 + n2 - 2.0) * r.df1);
    r.T2 = hm * dm2;
    r.F = r.df2 / ((n1 + n2 - 2.0) * r.df1) * r.T2;

    const boost::math::fisher_f dist(r.df1, r.df2);
    r.F_crit = boost::math::quantile(dist, 1.0 - alpha);
    r.p_F = boost::math::cdf(boost::math::complement(dist, r.F));
    return r;
}
