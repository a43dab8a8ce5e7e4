#include "LinearAlgebra.hpp"
#include "BoundaryErrors.hpp"
#include <Eigen/LU>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

double LinearAlgebra::reciprocal_condition(const Mat& M) {
    if (M.rows() == 0 || M.rows() != M.cols()) {
        throw InvalidInput("reciprocal_condition: matrix must be square and non-empty.");
    }
    if (!M.allFinite()) return 0.0;
    Eigen::PartialPivLU<Mat> lu(M);
    const double rc = lu.rcond();
    return std::isfinite(rc) ? rc : 0.0;
}

LinearAlgebra::Mat LinearAlgebra::invert(const Mat& M, const char* what) {
    if (M.rows() == 0 || M.rows() != M.cols()) {
        throw InvalidInput(std::string("invert: ") + what + " must be square and non-empty.");
    }
    if (!M.allFinite()) {
        throw SingularMatrix(std::string("invert: ") + what + " has non-finite entries.");
    }

    Eigen::PartialPivLU<Mat> lu(M);
    // Same threshold R's solve() applies (tol = .Machine$double.eps).
    const double rc = lu.rcond();
    if (!(rc >= std::numeric_limits<double>::epsilon())) {
        std::ostringstream msg;
        msg << "invert: " << what
            << " is computationally singular (reciprocal condition number = " << rc << ").";
        throw SingularMatrix(msg.str());
    }
    Mat inv = lu.inverse();
    if (!inv.allFinite()) {
        throw SingularMatrix(std::string("invert: ") + what + " inverse is not finite.");
    }
    return inv;
}

double LinearAlgebra::quadratic_form(const Vec& x, const Mat& Minv) {
    if (Minv.rows() != Minv.cols() || Minv.rows() != x.size()) {
        throw InvalidInput("quadratic_form: vector length and matrix dimensions disagree.");
    }
    // Inversion leaves tiny asymmetries; x^T M x only sees the symmetric part.
    const Mat sym = 0.5 * (Minv + Minv.transpose());
    return x.dot(sym * x);
}
