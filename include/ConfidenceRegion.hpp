#pragma once
#include "BoundaryProblem.hpp"
#include "BoundaryVerifier.hpp"
#include <Eigen/Dense>
#include <optional>

// Ellipsoidal confidence region { t : scale * (t - center)^T V^{-1} (t - center) <= critical_value }.
class ConfidenceRegion {
public:
    using Vec = Eigen::VectorXd;
    using Mat = Eigen::MatrixXd;

    // Stationary point of t^T V^{-1} t on the bound with its Lagrange multiplier.
    struct BoundaryPoint {
        Vec t;
        double lambda;
    };

    ConfidenceRegion(Vec center, Mat covariance, double scale, double critical_value);

    static ConfidenceRegion from_problem(const BoundaryProblem& p);
    static ConfidenceRegion from_statistics(const BoundaryStatistics& st);

    const Vec& center() const noexcept { return center_; }
    const Mat& covariance() const noexcept { return cov_; }
    double scale() const noexcept { return scale_; }
    double critical_value() const noexcept { return crit_; }
    int dim() const noexcept { return static_cast<int>(center_.size()); }

    // V^{-1}, computed on first use (throws SingularMatrix).
    const Mat& precision() const;

    // scale * (t - center)^T V^{-1} (t - center)
    double kdvd(const Vec& t) const;
    bool contains(const Vec& t) const { return kdvd(t) <= crit_; }

    // Multivariate statistical distance sqrt(x^T V^{-1} x).
    double msd(const Vec& x) const;

    // Closed-form stationary points on the ray through the origin and the center:
    //   t = center * (1 +- 1/s),  lambda = (1 +- s) / scale,  s = sqrt(scale * msd(center)^2 / critical_value).
    // far_point() maximizes the MSD on the bound, near_point() minimizes it.
    // Throws InvalidInput if the center is zero or scale / critical_value is not positive.
    BoundaryPoint far_point() const;
    BoundaryPoint near_point() const;

    // Mirror of t through the center, i.e. the point on the other side of the bound.
    Vec opposite_point(const Vec& t) const;

private:
    Vec center_;
    Mat cov_;
    double scale_;
    double crit_;
    mutable std::optional<Mat> prec_;

    double ray_ratio() const;   // s
};
