#pragma once

#include <stdexcept>
#include <string>

namespace pickassoc {

// Malformed peak detection options (negative distance, unknown edge mode, ...)
class DetectionConfigError : public std::invalid_argument {
public:
    explicit DetectionConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

// A mixture parameter array does not have its declared shape
class ShapeError : public std::invalid_argument {
public:
    explicit ShapeError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Too few samples for the requested components, or a feature count mismatch
class CardinalityError : public std::invalid_argument {
public:
    explicit CardinalityError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace pickassoc
