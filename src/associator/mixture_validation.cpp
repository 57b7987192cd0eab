#include "pickassoc/associator/mixture_validation.hpp"
#include <sstream>

namespace pickassoc {

std::string shapeToString(const Shape& shape) {
    std::ostringstream ss;
    ss << "(";
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) ss << ", ";
        ss << shape[i];
    }
    if (shape.size() == 1) ss << ",";
    ss << ")";
    return ss.str();
}

void checkShape(const Shape& actual, const Shape& expected, const std::string& name) {
    if (actual != expected) {
        throw ShapeError("The parameter '" + name + "' should have the shape of " +
                         shapeToString(expected) + ", but got " + shapeToString(actual));
    }
}

void checkShape(const std::vector<Eigen::MatrixXd>& param, const Shape& expected,
                const std::string& name) {
    Shape actual{static_cast<Eigen::Index>(param.size())};
    if (!param.empty()) {
        actual.push_back(param.front().rows());
        actual.push_back(param.front().cols());
        for (const auto& m : param) {
            if (m.rows() != param.front().rows() || m.cols() != param.front().cols()) {
                throw ShapeError("The parameter '" + name +
                                 "' should have the shape of " + shapeToString(expected) +
                                 ", but its matrices differ in size");
            }
        }
    }
    checkShape(actual, expected, name);
}

} // namespace pickassoc
