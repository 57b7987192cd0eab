/**
 * Unit tests for mixture input gates
 */

#include "test_framework.hpp"
#include "pickassoc/associator/mixture_validation.hpp"
#include <limits>

using namespace pickassoc;
using namespace pickassoc::test;

TEST(MixtureValidation, ShapeNames) {
    ASSERT_EQ(shapeToString({}), "()");
    ASSERT_EQ(shapeToString({3}), "(3,)");
    ASSERT_EQ(shapeToString({2, 2}), "(2, 2)");
    ASSERT_EQ(shapeToString({4, 3, 3}), "(4, 3, 3)");
}

TEST(MixtureValidation, MatchingShapesPass) {
    ASSERT_NO_THROW(checkShape(Eigen::VectorXd::Zero(3).eval(), {3}, "weights"));
    ASSERT_NO_THROW(checkShape(Eigen::MatrixXd::Zero(2, 4).eval(), {2, 4}, "centers"));
    ASSERT_NO_THROW(checkShape(1.5, {}, "reg"));
    
    std::vector<Eigen::MatrixXd> covs(2, Eigen::MatrixXd::Identity(2, 2));
    ASSERT_NO_THROW(checkShape(covs, {2, 2, 2}, "covariances"));
}

TEST(MixtureValidation, VectorMismatchMessage) {
    Eigen::VectorXd weights = Eigen::VectorXd::Ones(2);
    ASSERT_THROW_MSG(checkShape(weights, {3}, "weights"), ShapeError,
                     "The parameter 'weights' should have the shape of (3,), but got (2,)");
}

TEST(MixtureValidation, MatrixMismatchMessage) {
    Eigen::MatrixXd centers = Eigen::MatrixXd::Zero(3, 2);
    ASSERT_THROW_MSG(checkShape(centers, {3, 4}, "centers"), ShapeError,
                     "should have the shape of (3, 4), but got (3, 2)");
}

TEST(MixtureValidation, ScalarMismatch) {
    ASSERT_THROW_MSG(checkShape(2.0, {1}, "tol"), ShapeError, "got ()");
}

TEST(MixtureValidation, StackMismatch) {
    std::vector<Eigen::MatrixXd> covs(3, Eigen::MatrixXd::Identity(2, 2));
    ASSERT_THROW_MSG(checkShape(covs, {2, 2, 2}, "covariances"), ShapeError, "got (3, 2, 2)");
    
    covs[1] = Eigen::MatrixXd::Identity(3, 3);
    ASSERT_THROW(checkShape(covs, {3, 2, 2}, "covariances"), ShapeError);
    
    std::vector<Eigen::MatrixXd> empty;
    ASSERT_THROW_MSG(checkShape(empty, {1, 2, 2}, "covariances"), ShapeError, "got (0,)");
}

TEST(MixtureValidation, ShapeErrorIsInvalidArgument) {
    ASSERT_THROW(checkShape(Eigen::VectorXd::Zero(1).eval(), {2}, "w"), std::invalid_argument);
}

TEST(MixtureValidation, CheckXAcceptsAndConverts) {
    Eigen::MatrixXf Xf = Eigen::MatrixXf::Ones(5, 2);
    Eigen::MatrixXd X = checkX(Xf, 3, 2);
    ASSERT_EQ(X.rows(), 5);
    ASSERT_NEAR(X(4, 1), 1.0, 1e-12);
    
    Eigen::MatrixXi Xi = Eigen::MatrixXi::Constant(5, 2, 3);
    ASSERT_NEAR(checkX(Xi)(0, 0), 3.0, 1e-12);
}

TEST(MixtureValidation, CheckXTooFewSamples) {
    Eigen::MatrixXd X = Eigen::MatrixXd::Zero(3, 2);
    ASSERT_THROW_MSG(checkX(X, 5, 2), CardinalityError,
                     "Expected n_samples >= n_components but got n_components = 5, n_samples = 3");
}

TEST(MixtureValidation, CheckXFeatureCount) {
    Eigen::MatrixXd X = Eigen::MatrixXd::Zero(6, 3);
    ASSERT_THROW_MSG(checkX(X, 2, 5), CardinalityError,
                     "Expected the input data X have 5 features, but got 3 features");
}

TEST(MixtureValidation, CheckXDisabledChecks) {
    Eigen::MatrixXd X = Eigen::MatrixXd::Zero(5, 2);
    ASSERT_NO_THROW(checkX(X));
    ASSERT_NO_THROW(checkX(X, -1, 2));
    ASSERT_NO_THROW(checkX(X, 5, -1));
}

TEST(MixtureValidation, CheckXRejectsEmptyAndNonFinite) {
    Eigen::MatrixXd empty(0, 2);
    ASSERT_THROW(checkX(empty), std::invalid_argument);
    ASSERT_THROW_MSG(checkX(empty, 2, 2), CardinalityError,
                     "n_components = 2, n_samples = 0");
    
    Eigen::MatrixXd X = Eigen::MatrixXd::Zero(3, 2);
    X(1, 1) = std::numeric_limits<double>::quiet_NaN();
    ASSERT_THROW(checkX(X), std::invalid_argument);
}
