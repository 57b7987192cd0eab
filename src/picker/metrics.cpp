#include "pickassoc/picker/metrics.hpp"
#include <stdexcept>
#include <string>

namespace pickassoc {

DetectionMetrics calcMetrics(size_t nTP, size_t nP, size_t nT) {
    DetectionMetrics m;
    m.precision = nP > 0 ? static_cast<double>(nTP) / nP : 0.0;
    m.recall = nT > 0 ? static_cast<double>(nTP) / nT : 0.0;
    
    double sum = m.precision + m.recall;
    m.f1 = sum > 0 ? 2.0 * m.precision * m.recall / sum : 0.0;
    return m;
}

ExponentialAverage::ExponentialAverage(double alpha)
    : alpha_(alpha)
    , value_(0)
    , count_(0)
{
    if (!(alpha >= 0.0 && alpha <= 1.0)) {
        throw std::invalid_argument("ExponentialAverage: alpha must be in [0, 1], got " +
                                    std::to_string(alpha));
    }
}

double ExponentialAverage::update(double x) {
    if (count_ == 0) {
        value_ = x;
    } else {
        value_ = alpha_ * value_ + (1.0 - alpha_) * x;
    }
    count_++;
    return value_;
}

double LinearAverage::update(double x) {
    count_++;
    value_ += (x - value_) / static_cast<double>(count_);
    return value_;
}

} // namespace pickassoc
