#include "pickassoc/associator/covariance_model.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pickassoc {

// ============================================================================
// CovarianceModel
// ============================================================================

void CovarianceModel::ensurePositiveDefinite(Eigen::MatrixXd& cov, double min_variance) {
    // Symmetrize first; accumulated round-off breaks the eigen solver's assumption
    cov = 0.5 * (cov + cov.transpose());
    
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov);
    if (solver.info() != Eigen::Success) {
        cov = Eigen::MatrixXd::Identity(cov.rows(), cov.cols()) * std::max(min_variance, 1.0);
        return;
    }
    
    Eigen::VectorXd eigenvalues = solver.eigenvalues();
    bool needs_fix = false;
    for (Eigen::Index i = 0; i < eigenvalues.size(); i++) {
        if (!(eigenvalues(i) >= min_variance)) {
            eigenvalues(i) = min_variance;
            needs_fix = true;
        }
    }
    if (needs_fix) {
        cov = solver.eigenvectors() * eigenvalues.asDiagonal() *
              solver.eigenvectors().transpose();
    }
}

Eigen::MatrixXd CovarianceModel::weightedCovariance(const Eigen::MatrixXd& residuals,
                                                    const Eigen::VectorXd& weights,
                                                    const Eigen::VectorXd& scales) {
    const Eigen::Index f = residuals.cols();
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(f, f);
    
    double total = weights.sum() + 10 * std::numeric_limits<double>::epsilon();
    for (Eigen::Index i = 0; i < residuals.rows(); i++) {
        Eigen::VectorXd r = residuals.row(i).transpose();
        r(0) /= std::sqrt(scales(i));
        cov.noalias() += weights(i) * r * r.transpose();
    }
    return cov / total;
}

// ============================================================================
// Strategies
// ============================================================================

Eigen::MatrixXd FullCovariance::estimate(const Eigen::MatrixXd& residuals,
                                         const Eigen::VectorXd& weights,
                                         const Eigen::VectorXd& scales,
                                         double reg_covar) const {
    Eigen::MatrixXd cov = weightedCovariance(residuals, weights, scales);
    cov.diagonal().array() += reg_covar;
    ensurePositiveDefinite(cov, std::max(reg_covar, 1e-12));
    return cov;
}

Eigen::MatrixXd DiagonalCovariance::estimate(const Eigen::MatrixXd& residuals,
                                             const Eigen::VectorXd& weights,
                                             const Eigen::VectorXd& scales,
                                             double reg_covar) const {
    Eigen::VectorXd var = weightedCovariance(residuals, weights, scales).diagonal();
    var.array() += reg_covar;
    var = var.cwiseMax(std::max(reg_covar, 1e-12));
    return var.asDiagonal();
}

TravelTimeCovariance::TravelTimeCovariance(double reference_distance_km, double s_phase_factor)
    : reference_distance_(reference_distance_km)
    , s_phase_factor_(s_phase_factor)
{
    if (!(reference_distance_ > 0) || !(s_phase_factor_ > 0)) {
        throw std::invalid_argument("TravelTimeCovariance: parameters must be > 0");
    }
}

double TravelTimeCovariance::observationScale(double distance_km, PhaseType phase) const {
    double scale = 1.0 + std::max(0.0, distance_km) / reference_distance_;
    if (isSPhase(phase)) scale *= s_phase_factor_;
    return scale;
}

CovarianceModelPtr makeCovarianceModel(const std::string& type, double vp, double vs) {
    if (type == "full") return std::make_shared<FullCovariance>();
    if (type == "diag") return std::make_shared<DiagonalCovariance>();
    if (type == "travel_time") {
        if (!(vp > 0) || !(vs > 0)) {
            throw std::invalid_argument("makeCovarianceModel: velocities must be > 0");
        }
        return std::make_shared<TravelTimeCovariance>(100.0, vp / vs);
    }
    throw std::invalid_argument("makeCovarianceModel: unknown covariance type '" + type + "'");
}

} // namespace pickassoc
