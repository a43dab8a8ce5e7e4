#pragma once
#include <Eigen/Dense>

namespace LinearAlgebra {

using Vec = Eigen::VectorXd;
using Mat = Eigen::MatrixXd;

// 1-norm reciprocal condition estimate from a partial-pivot LU.
// Returns 0 for matrices with non-finite entries.
double reciprocal_condition(const Mat& M);

// Inverse of a square matrix. Throws SingularMatrix when M is singular or
// rcond(M) < machine epsilon, InvalidInput when M is empty or not square.
// `what` names the matrix in error messages.
Mat invert(const Mat& M, const char* what = "matrix");

// x^T Minv x, evaluated on the symmetric part of Minv.
double quadratic_form(const Vec& x, const Mat& Minv);

}
