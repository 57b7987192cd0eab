/**
 * Unit tests for pick metrics and running averages
 */

#include "test_framework.hpp"
#include "pickassoc/picker/metrics.hpp"
#include <stdexcept>

using namespace pickassoc;
using namespace pickassoc::test;

TEST(Metrics, PrecisionRecallF1) {
    auto m = calcMetrics(6, 10, 8);
    ASSERT_NEAR(m.precision, 0.6, 1e-12);
    ASSERT_NEAR(m.recall, 0.75, 1e-12);
    ASSERT_NEAR(m.f1, 2 * 0.6 * 0.75 / (0.6 + 0.75), 1e-12);
}

TEST(Metrics, ZeroDenominators) {
    auto none = calcMetrics(0, 0, 0);
    ASSERT_NEAR(none.precision, 0.0, 1e-12);
    ASSERT_NEAR(none.recall, 0.0, 1e-12);
    ASSERT_NEAR(none.f1, 0.0, 1e-12);
    
    auto no_truth = calcMetrics(0, 5, 0);
    ASSERT_NEAR(no_truth.precision, 0.0, 1e-12);
    ASSERT_NEAR(no_truth.recall, 0.0, 1e-12);
}

TEST(Metrics, ExponentialAverage) {
    ExponentialAverage ema(0.9);
    ASSERT_TRUE(ema.empty());
    ASSERT_NEAR(ema.update(10.0), 10.0, 1e-12);
    ASSERT_NEAR(ema.update(20.0), 11.0, 1e-9);
    ASSERT_FALSE(ema.empty());
    
    ema.reset();
    ASSERT_TRUE(ema.empty());
    ASSERT_NEAR(ema.update(3.0), 3.0, 1e-12);
}

TEST(Metrics, ExponentialAverageAlphaBounds) {
    ExponentialAverage follow(0.0);
    follow.update(10.0);
    ASSERT_NEAR(follow.update(20.0), 20.0, 1e-12);
    
    ASSERT_THROW(ExponentialAverage(1.5), std::invalid_argument);
    ASSERT_THROW(ExponentialAverage(-0.1), std::invalid_argument);
}

TEST(Metrics, LinearAverage) {
    LinearAverage lma;
    for (int i = 1; i <= 5; i++) lma.update(i);
    ASSERT_NEAR(lma.value(), 3.0, 1e-12);
    ASSERT_EQ(lma.count(), 5u);
    
    lma.reset();
    ASSERT_EQ(lma.count(), 0u);
    ASSERT_NEAR(lma.update(4.0), 4.0, 1e-12);
}
