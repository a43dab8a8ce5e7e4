#include "ConfidenceRegion.hpp"
#include "BoundaryErrors.hpp"
#include "LinearAlgebra.hpp"
#include <cmath>

ConfidenceRegion::ConfidenceRegion(Vec center, Mat covariance, double scale, double critical_value)
    : center_(std::move(center)), cov_(std::move(covariance)), scale_(scale), crit_(critical_value)
{
    if (center_.size() == 0) {
        throw InvalidInput("ConfidenceRegion: center must not be empty.");
    }
    if (cov_.rows() != center_.size() || cov_.cols() != center_.size()) {
        throw InvalidInput("ConfidenceRegion: covariance must be square and match the center.");
    }
    if (!std::isfinite(scale_) || scale_ < 0.0) {
        throw InvalidInput("ConfidenceRegion: scale must be a non-negative finite value.");
    }
    if (!std::isfinite(crit_) || crit_ < 0.0) {
        throw InvalidInput("ConfidenceRegion: critical value must be a non-negative finite value.");
    }
}

ConfidenceRegion ConfidenceRegion::from_problem(const BoundaryProblem& p) {
    return ConfidenceRegion(p.target, p.covariance, p.scale, p.critical_value);
}

ConfidenceRegion ConfidenceRegion::from_statistics(const BoundaryStatistics& st) {
    return ConfidenceRegion(st.mean_diff, st.S_pool, st.K, st.F_crit);
}

const ConfidenceRegion::Mat& ConfidenceRegion::precision() const {
    if (!prec_) prec_.emplace(LinearAlgebra::invert(cov_, "covariance"));
    return *prec_;
}

double ConfidenceRegion::kdvd(const Vec& t) const {
    if (t.size() != center_.size()) {
        throw InvalidInput("ConfidenceRegion::kdvd: point has wrong dimension.");
    }
    return scale_ * LinearAlgebra::quadratic_form(t - center_, precision());
}

double ConfidenceRegion::msd(const Vec& x) const {
    if (x.size() != center_.size()) {
        throw InvalidInput("ConfidenceRegion::msd: point has wrong dimension.");
    }
    return std::sqrt(LinearAlgebra::quadratic_form(x, precision()));
}

double ConfidenceRegion::ray_ratio() const {
    if (!(scale_ > 0.0) || !(crit_ > 0.0)) {
        throw InvalidInput("ConfidenceRegion: closed-form points need positive scale and critical value.");
    }
    const double q = LinearAlgebra::quadratic_form(center_, precision());
    if (!(q > 0.0)) {
        throw InvalidInput("ConfidenceRegion: closed-form points need a non-zero center.");
    }
    return std::sqrt(scale_ * q / crit_);
}

ConfidenceRegion::BoundaryPoint ConfidenceRegion::far_point() const {
    const double s = ray_ratio();
    return {center_ * (1.0 + 1.0 / s), (1.0 + s) / scale_};
}

ConfidenceRegion::BoundaryPoint ConfidenceRegion::near_point() const {
    const double s = ray_ratio();
    return {center_ * (1.0 - 1.0 / s), (1.0 - s) / scale_};
}

ConfidenceRegion::Vec ConfidenceRegion::opposite_point(const Vec& t) const {
    if (t.size() != center_.size()) {
        throw InvalidInput("ConfidenceRegion::opposite_point: point has wrong dimension.");
    }
    return 2.0 * center_ - t;
}
