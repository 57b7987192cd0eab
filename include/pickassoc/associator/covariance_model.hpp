#pragma once

#include "../core/types.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace pickassoc {

/**
 * CovarianceModel - Feature covariance of one mixture component
 *
 * Feature 0 is always pick time. A pick's covariance is the component
 * covariance with the time variance multiplied by observationScale() and
 * the time covariances by its square root, so every pick of a component
 * shares one Cholesky factor.
 */
class CovarianceModel {
public:
    virtual ~CovarianceModel() = default;
    
    /**
     * residuals: (n, f) observed minus predicted features
     * weights:   (n) responsibility times pick weight
     * scales:    (n) observationScale() of each pick
     */
    virtual Eigen::MatrixXd estimate(const Eigen::MatrixXd& residuals,
                                     const Eigen::VectorXd& weights,
                                     const Eigen::VectorXd& scales,
                                     double reg_covar) const = 0;
    
    // Time variance multiplier of a pick at distance_km from the source
    virtual double observationScale(double /*distance_km*/, PhaseType /*phase*/) const {
        return 1.0;
    }
    
    virtual std::string name() const = 0;
    
    // Clamp eigenvalues to at least min_variance
    static void ensurePositiveDefinite(Eigen::MatrixXd& cov, double min_variance);

protected:
    // Weighted covariance of residuals with the time column divided by sqrt(scale)
    static Eigen::MatrixXd weightedCovariance(const Eigen::MatrixXd& residuals,
                                              const Eigen::VectorXd& weights,
                                              const Eigen::VectorXd& scales);
};

using CovarianceModelPtr = std::shared_ptr<CovarianceModel>;

class FullCovariance : public CovarianceModel {
public:
    Eigen::MatrixXd estimate(const Eigen::MatrixXd& residuals, const Eigen::VectorXd& weights,
                             const Eigen::VectorXd& scales, double reg_covar) const override;
    std::string name() const override { return "full"; }
};

// Independent features
class DiagonalCovariance : public CovarianceModel {
public:
    Eigen::MatrixXd estimate(const Eigen::MatrixXd& residuals, const Eigen::VectorXd& weights,
                             const Eigen::VectorXd& scales, double reg_covar) const override;
    std::string name() const override { return "diag"; }
};

/**
 * TravelTimeCovariance - Pick time uncertainty grows with distance
 *
 *   scale = (1 + distance / reference_distance) * (S ? s_phase_factor : 1)
 */
class TravelTimeCovariance : public FullCovariance {
public:
    explicit TravelTimeCovariance(double reference_distance_km = 100.0,
                                  double s_phase_factor = 1.75);
    
    double observationScale(double distance_km, PhaseType phase) const override;
    std::string name() const override { return "travel_time"; }

private:
    double reference_distance_;
    double s_phase_factor_;
};

// "full", "diag" or "travel_time"; throws std::invalid_argument otherwise
CovarianceModelPtr makeCovarianceModel(const std::string& type, double vp = 6.0,
                                       double vs = 6.0 / 1.75);

} // namespace pickassoc
