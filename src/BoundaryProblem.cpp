#include "BoundaryProblem.hpp"
#include "BoundaryErrors.hpp"
#include <cmath>

void validate_problem(const BoundaryProblem& p) {
    if (p.dimension < 1) {
        throw InvalidInput("dimension: must be a positive integer.");
    }
    if (!std::isfinite(p.scale) || p.scale < 0.0) {
        throw InvalidInput("scale: must be a non-negative finite value.");
    }
    if (p.target.size() != p.dimension) {
        throw InvalidInput("target: must be a vector of length dimension.");
    }
    if (!p.target.allFinite()) {
        throw InvalidInput("target: entries must be finite.");
    }
    if (p.covariance.rows() != p.dimension || p.covariance.cols() != p.dimension) {
        throw InvalidInput("covariance: must be a matrix of dimensions dimension x dimension.");
    }
    if (!p.covariance.allFinite()) {
        throw InvalidInput("covariance: entries must be finite.");
    }
    if (!std::isfinite(p.critical_value) || p.critical_value < 0.0) {
        throw InvalidInput("critical_value: must be a non-negative finite value.");
    }
    if (p.initial_guess.size() != p.dimension + 1) {
        throw InvalidInput("initial_guess: must be a vector of length (dimension + 1).");
    }
    if (!p.initial_guess.allFinite()) {
        throw InvalidInput("initial_guess: entries must be finite.");
    }
    if (p.max_iterations < 0) {
        throw InvalidInput("max_iterations: must be a non-negative integer.");
    }
    if (!std::isfinite(p.tolerance) || p.tolerance < 0.0) {
        throw InvalidInput("tolerance: must be a non-negative finite value.");
    }
}

namespace {

void require_points(const BoundarySolution& sol) {
    if (sol.points.size() < 1) {
        throw MalformedHandoff("solution: points is empty.");
    }
}

}

Eigen::VectorXd BoundarySolution::location() const {
    require_points(*this);
    return points.head(dimension());
}

double BoundarySolution::lambda() const {
    require_points(*this);
    return points[dimension()];
}
