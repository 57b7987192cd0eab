#pragma once

#include "../core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace pickassoc {

// Array shape, outermost dimension first; {} is a scalar
using Shape = std::vector<Eigen::Index>;

// "()", "(3,)", "(2, 2)"
std::string shapeToString(const Shape& shape);

/**
 * Parameter shape gate
 *
 * Throws ShapeError:
 *   The parameter 'weights' should have the shape of (3,), but got (2,)
 */
void checkShape(const Shape& actual, const Shape& expected, const std::string& name);

inline void checkShape(double, const Shape& expected, const std::string& name) {
    checkShape(Shape{}, expected, name);
}

inline void checkShape(const Eigen::VectorXd& param, const Shape& expected,
                       const std::string& name) {
    checkShape(Shape{param.size()}, expected, name);
}

inline void checkShape(const Eigen::MatrixXd& param, const Shape& expected,
                       const std::string& name) {
    checkShape(Shape{param.rows(), param.cols()}, expected, name);
}

// Stack of equally sized matrices, shape (k, rows, cols)
void checkShape(const std::vector<Eigen::MatrixXd>& param, const Shape& expected,
                const std::string& name);

/**
 * Sample matrix gate
 *
 * Converts X to double and checks it. n_components < 0 or n_features < 0
 * disables the respective check.
 *   - no samples and n_components > 0:  CardinalityError
 *   - no samples otherwise:             std::invalid_argument
 *   - non-finite values:                std::invalid_argument
 *   - fewer samples than components:    CardinalityError
 *   - column count != n_features:       CardinalityError
 */
template <typename Derived>
Eigen::MatrixXd checkX(const Eigen::MatrixBase<Derived>& X,
                       Eigen::Index n_components = -1,
                       Eigen::Index n_features = -1) {
    Eigen::MatrixXd out = X.derived().template cast<double>();
    
    if (out.rows() == 0) {
        if (n_components > 0) {
            throw CardinalityError("Expected n_samples >= n_components but got n_components = " +
                                   std::to_string(n_components) + ", n_samples = 0");
        }
        throw std::invalid_argument("Found array with 0 sample(s) while a minimum of 1 is required");
    }
    if (!out.allFinite()) {
        throw std::invalid_argument("Input X contains NaN or infinity");
    }
    if (n_components >= 0 && out.rows() < n_components) {
        throw CardinalityError("Expected n_samples >= n_components but got n_components = " +
                               std::to_string(n_components) + ", n_samples = " +
                               std::to_string(out.rows()));
    }
    if (n_features >= 0 && out.cols() != n_features) {
        throw CardinalityError("Expected the input data X have " + std::to_string(n_features) +
                               " features, but got " + std::to_string(out.cols()) +
                               " features");
    }
    return out;
}

} // namespace pickassoc
