#include "BoundaryLocator.hpp"

const char* solver_name(SolverKind solver) noexcept {
    switch (solver) {
        case SolverKind::NewtonRaphson: return "Newton-Raphson";
        case SolverKind::SLSQP:         return "SLSQP";
    }
    return "unknown";
}

BoundarySolution locate_boundary(const BoundaryProblem& p, SolverKind solver, bool warn) {
    switch (solver) {
        case SolverKind::NewtonRaphson: {
            NROptions o; o.warn = warn;
            return locate_boundary_nr(p, o);
        }
        case SolverKind::SLSQP: {
            SlsqpOptions o; o.warn = warn;
            return locate_boundary_slsqp(p, o);
        }
    }
    return locate_boundary_nr(p);
}

BoundarySolution locate_verified_boundary(const BoundaryProblem& p, SolverKind solver, bool warn) {
    BoundarySolution sol = locate_boundary(p, solver, warn);
    check_point_location(sol, statistics_from_problem(p));
    return sol;
}
