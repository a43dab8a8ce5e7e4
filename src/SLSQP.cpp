#include "SLSQP.hpp"
#include "BoundaryErrors.hpp"
#include "LinearAlgebra.hpp"
#include <iostream>
#include <vector>

namespace {

struct SlsqpData {
    const BoundaryProblem* problem;
    const Eigen::MatrixXd* precision;
    double sign;     // +1 minimize, -1 maximize
    int evals;
};

double objective(unsigned n, const double* x, double* grad, void* data) {
    auto* d = static_cast<SlsqpData*>(data);
    ++d->evals;
    Eigen::Map<const Eigen::VectorXd> t(x, n);
    const Eigen::VectorXd At = (*d->precision) * t;
    if (grad) {
        Eigen::Map<Eigen::VectorXd> g(grad, n);
        g = d->sign * 2.0 * At;
    }
    return d->sign * t.dot(At);
}

// h(t) = scale * (t - target)^T A (t - target) - critical_value
double boundary_constraint(unsigned n, const double* x, double* grad, void* data) {
    auto* d = static_cast<SlsqpData*>(data);
    const BoundaryProblem& p = *d->problem;
    Eigen::Map<const Eigen::VectorXd> t(x, n);
    const Eigen::VectorXd Ad = (*d->precision) * (t - p.target);
    if (grad) {
        Eigen::Map<Eigen::VectorXd> g(grad, n);
        g = 2.0 * p.scale * Ad;
    }
    return p.scale * (t - p.target).dot(Ad) - p.critical_value;
}

// Least-squares λ from A t = λ k A (t - target).
double recover_multiplier(const Eigen::VectorXd& t, const BoundaryProblem& p, const Eigen::MatrixXd& A) {
    const Eigen::VectorXd At = A * t;
    const Eigen::VectorXd kAd = p.scale * (A * (t - p.target));
    const double denom = kAd.squaredNorm();
    return denom > 0.0 ? At.dot(kAd) / denom : 0.0;
}

}

BoundarySolution locate_boundary_slsqp(const BoundaryProblem& p, const SlsqpOptions& opt) {
    validate_problem(p);
    if (opt.max_evals < 1) {
        throw InvalidInput("SlsqpOptions: max_evals must be positive.");
    }
    const Eigen::MatrixXd A = LinearAlgebra::invert(p.covariance, "covariance");
    const int n = p.dimension;

    SlsqpData data{&p, &A, opt.maximize ? -1.0 : 1.0, 0};

    nlopt::opt opti(nlopt::LD_SLSQP, static_cast<unsigned>(n));
    opti.set_min_objective(objective, &data);
    opti.add_equality_constraint(boundary_constraint, &data, opt.constraint_tol);
    opti.set_maxeval(opt.max_evals);
    opti.set_xtol_rel(opt.rel_tol);
    opti.set_xtol_abs(opt.abs_tol);

    std::vector<double> x(p.initial_guess.data(), p.initial_guess.data() + n);

    double fval = 0.0;
    nlopt::result status = nlopt::FAILURE;
    bool converged = false;
    try {
        status = opti.optimize(x, fval);
        converged = status > 0 && status != nlopt::MAXEVAL_REACHED && status != nlopt::MAXTIME_REACHED;
    } catch (const nlopt::roundoff_limited&) {
        // x holds the last iterate; reported as not converged
        converged = false;
    }

    if (!converged && opt.warn) {
        std::cerr << "Warning: the SLSQP search did not converge (status " << static_cast<int>(status)
                  << ", " << data.evals << " evaluations).\n";
    }

    Eigen::VectorXd t = Eigen::Map<const Eigen::VectorXd>(x.data(), n);
    BoundarySolution sol;
    sol.points.resize(n + 1);
    sol.points.head(n) = t;
    sol.points[n] = recover_multiplier(t, p, A);
    sol.converged = converged;
    sol.iterations = data.evals;
    sol.max_iterations = p.max_iterations;
    sol.tolerance = p.tolerance;
    return sol;
}
