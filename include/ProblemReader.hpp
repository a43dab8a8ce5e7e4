#pragma once
#include "BoundaryProblem.hpp"
#include <istream>
#include <string>

/**
 * Reads a boundary problem in the format:
 *   dimension n
 *   scale k
 *   critical_value c
 *   target d_1 ... d_n
 *   covariance v_11 v_12 ... v_nn      (row-major, n*n values)
 *   initial_guess y_1 ... y_{n+1}      (optional, defaults to all ones)
 *   max_iterations m                   (optional, default 100)
 *   tolerance tol                      (optional, default 1e-9)
 * One key per line, '#' starts a comment. All values are read as reals;
 * dimension and max_iterations must be integer-valued.
 * Throws InvalidInput naming the offending key, std::runtime_error if the file cannot be opened.
 */
BoundaryProblem parse_problem(std::istream& in);
BoundaryProblem read_problem(const std::string& path);

// Single-token conversions used by the reader; the whole token must be consumed.
// Both throw InvalidInput prefixed with key.
double parse_real(const std::string& key, const std::string& token);
int parse_integer(const std::string& key, const std::string& token);
