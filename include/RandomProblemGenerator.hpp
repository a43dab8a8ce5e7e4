#pragma once
#include "BoundaryProblem.hpp"
#include <cstdint>
#include <random>
#include <vector>

// Seeded boundary problems with SPD covariance V = Q diag(λ) Q^T, λ ~ logU([lambda_min, lambda_max]).
// The initial guess is a closed-form stationary point, perturbed entrywise by a relative factor.
class RandomProblemGenerator {
public:
    enum class Side { Far, Near };

    struct Options {
        int d = 2;                     // dimension
        double target_scale = 1.0;     // target ~ U([-target_scale, target_scale]^d)
        double lambda_min = 0.25;
        double lambda_max = 4.0;
        double scale_min = 0.5;        // scale ~ U([scale_min, scale_max])
        double scale_max = 2.0;
        double crit_min = 0.5;         // critical value ~ U([crit_min, crit_max])
        double crit_max = 4.0;
        Side side = Side::Far;
        double perturbation = 0.05;    // relative, per entry of the initial guess
        int max_iterations = 100;
        double tolerance = 1e-9;
        uint64_t seed = 42ULL;
    };

    explicit RandomProblemGenerator(Options opts);

    BoundaryProblem generate();
    std::vector<BoundaryProblem> generate(int count);

private:
    using Vec = Eigen::VectorXd;
    using Mat = Eigen::MatrixXd;

    Options opts_;
    std::mt19937_64 rng_;

    Vec sample_target();
    Mat random_rotation(int d);
    Mat spd_from_loguniform_spectrum();
    double uniform(double lo, double hi);
};
