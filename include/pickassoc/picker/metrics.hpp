#pragma once

#include <cstddef>

namespace pickassoc {

/**
 * DetectionMetrics - Precision / recall / F1 of a pick set
 */
struct DetectionMetrics {
    double precision;
    double recall;
    double f1;
    
    DetectionMetrics() : precision(0), recall(0), f1(0) {}
};

// nTP: true positives, nP: picks reported, nT: true arrivals.
// A zero denominator gives 0 for that quantity.
DetectionMetrics calcMetrics(size_t nTP, size_t nP, size_t nT);

/**
 * ExponentialAverage - Running exponential smoothing
 *
 * value = alpha * value + (1 - alpha) * x, seeded with the first sample.
 */
class ExponentialAverage {
public:
    explicit ExponentialAverage(double alpha = 0.9);
    
    double update(double x);
    double value() const { return value_; }
    double alpha() const { return alpha_; }
    bool empty() const { return count_ == 0; }
    void reset() { value_ = 0; count_ = 0; }

private:
    double alpha_;
    double value_;
    size_t count_;
};

/**
 * LinearAverage - Running arithmetic mean
 */
class LinearAverage {
public:
    LinearAverage() : value_(0), count_(0) {}
    
    double update(double x);
    double value() const { return value_; }
    size_t count() const { return count_; }
    void reset() { value_ = 0; count_ = 0; }

private:
    double value_;
    size_t count_;
};

} // namespace pickassoc
