#pragma once
#include <stdexcept>
#include <string>

// Malformed problem fields: wrong lengths, non-square or mis-sized matrices,
// negative scale or critical value, non-integer counts.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// Covariance, pooled covariance or bordered Hessian not numerically invertible.
class SingularMatrix : public std::runtime_error {
public:
    explicit SingularMatrix(const std::string& what) : std::runtime_error(what) {}
};

// Solution or statistics handed to the verifier have inconsistent shapes.
class MalformedHandoff : public std::invalid_argument {
public:
    explicit MalformedHandoff(const std::string& what) : std::invalid_argument(what) {}
};
