#pragma once

#include <Eigen/Dense>
#include <vector>
#include <string>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace modalqc {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// Squared-norm tolerance per channel below which a shape is considered zero
constexpr double DEGENERATE_NORM_TOL = 1e-24;

// Candidate and reference shapes have different channel counts
class ShapeMismatchError : public std::invalid_argument {
public:
    explicit ShapeMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Shape has (near) zero norm, MAC is undefined
class DegenerateShapeError : public std::invalid_argument {
public:
    explicit DegenerateShapeError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Too few points, or a singular design, for the requested fit
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what)
        : std::runtime_error(what) {}
};

}  // namespace modalqc
