#pragma once
#include "BoundaryProblem.hpp"
#include "BoundaryVerifier.hpp"
#include "NewtonRaphson.hpp"
#include "SLSQP.hpp"

enum class SolverKind { NewtonRaphson, SLSQP };

const char* solver_name(SolverKind solver) noexcept;

BoundarySolution locate_boundary(const BoundaryProblem& p, SolverKind solver, bool warn = true);

// locate_boundary followed by check_point_location against the problem's own statistics.
BoundarySolution locate_verified_boundary(const BoundaryProblem& p, SolverKind solver, bool warn = true);
