#pragma once

#include "association_config.hpp"
#include "covariance_model.hpp"
#include "mixture_validation.hpp"
#include "pick_features.hpp"
#include "travel_time.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace pickassoc {

/**
 * MixtureParameters - Full parameter set of a k-component mixture
 *
 * weights:     (k)
 * centers:     (k, dims + 1), location then origin time in Unix seconds
 * magnitudes:  (k), only read when amplitude is enabled
 * covariances: (k, f, f)
 */
struct MixtureParameters {
    Eigen::VectorXd weights;
    Eigen::MatrixXd centers;
    Eigen::VectorXd magnitudes;
    std::vector<Eigen::MatrixXd> covariances;
};

/**
 * EventHypothesis - One fitted mixture component
 */
struct EventHypothesis {
    Eigen::VectorXd location;       // Configured dims (km)
    double origin_seconds;          // Unix seconds
    std::string origin_time;        // YYYY-MM-DDTHH:MM:SS.mmm
    double magnitude;               // NaN without amplitude
    Eigen::MatrixXd covariance;     // (f, f)
    double weight;
    size_t pick_count;              // Picks whose most likely component is this one
    double time_rms;                // Responsibility weighted time residual (s)
    
    EventHypothesis()
        : origin_seconds(0), magnitude(0), weight(0), pick_count(0), time_rms(0) {}
};

/**
 * AssociationResult - Output of GaussianMixtureAssociator::fit
 */
struct AssociationResult {
    std::vector<EventHypothesis> events;
    std::vector<int> assignments;          // Most likely component per pick
    Eigen::MatrixXd responsibilities;      // (n, k), rows sum to 1
    MixtureParameters parameters;
    double log_likelihood;                 // Mean per pick
    int iterations;
    bool converged;
    size_t n_samples;
    size_t n_parameters;
    
    AssociationResult()
        : log_likelihood(0), iterations(0), converged(false), n_samples(0), n_parameters(0) {}
    
    // Bayesian information criterion; lower is better
    double bic() const;
};

/**
 * GaussianMixtureAssociator - Groups picks into events with EM
 *
 * Each component is an event hypothesis with location, origin time and
 * (optionally) magnitude. A component predicts for pick i
 *   time      = t0 + travelTime(location, station_i, phase_i)
 *   amplitude = AmplitudeModel::predict(magnitude, distance_i)
 * and the pick features are scored against that prediction with the
 * component covariance. The M-step refines location and origin time with
 * damped weighted Gauss-Newton steps.
 *
 * Inputs pass two gates before any numeric work: checkX() on the samples
 * and checkParameters() on an explicit initial parameter set.
 */
class GaussianMixtureAssociator {
public:
    explicit GaussianMixtureAssociator(const AssociationConfig& config);
    GaussianMixtureAssociator(const AssociationConfig& config,
                              TravelTimeModelPtr travel_time,
                              CovarianceModelPtr covariance);
    
    /**
     * data:          (n, f) pick features, time column in Unix seconds
     * locations:     (n, dims) station coordinates
     * phase_types:   n labels, "p" or "s" (any case)
     * phase_weights: (n) pick weights in [0, inf); empty means all 1
     */
    template <typename Derived>
    AssociationResult fit(const Eigen::MatrixBase<Derived>& data,
                          const Eigen::MatrixXd& locations,
                          const std::vector<std::string>& phase_types,
                          const Eigen::VectorXd& phase_weights = Eigen::VectorXd(),
                          const std::optional<MixtureParameters>& initial = std::nullopt) const {
        Eigen::MatrixXd X = checkX(data, config_.n_components, config_.nFeatures());
        return fitChecked(X, locations, phase_types, phase_weights, initial);
    }
    
    AssociationResult fit(const PickFeatures& features,
                          const std::optional<MixtureParameters>& initial = std::nullopt) const;
    
    // Throws ShapeError unless params matches the configured k, dims and features
    void checkParameters(const MixtureParameters& params) const;
    
    const AssociationConfig& config() const { return config_; }
    const TravelTimeModel& travelTimeModel() const { return *travel_time_; }
    const CovarianceModel& covarianceModel() const { return *covariance_; }

private:
    struct Component;
    struct Observations;
    
    AssociationConfig config_;
    TravelTimeModelPtr travel_time_;
    CovarianceModelPtr covariance_;
    
    AssociationResult fitChecked(const Eigen::MatrixXd& X,
                                 const Eigen::MatrixXd& locations,
                                 const std::vector<std::string>& phase_types,
                                 const Eigen::VectorXd& phase_weights,
                                 const std::optional<MixtureParameters>& initial) const;
    
    std::vector<Component> initialize(const Observations& obs) const;
    std::vector<Component> fromParameters(const MixtureParameters& params,
                                          const Observations& obs) const;
    
    // Mean log-likelihood; fills resp (n, k)
    double expectation(const std::vector<Component>& comps, const Observations& obs,
                       Eigen::MatrixXd& resp) const;
    void maximization(std::vector<Component>& comps, const Observations& obs,
                      const Eigen::MatrixXd& resp) const;
    
    void updateLocation(Component& comp, const Observations& obs,
                        const Eigen::VectorXd& w) const;
    Eigen::VectorXd sourceDistances(const Component& comp, const Observations& obs) const;
    Eigen::MatrixXd residuals(const Component& comp, const Observations& obs,
                              Eigen::VectorXd& distances) const;
    
    AssociationResult buildResult(const std::vector<Component>& comps,
                                  const Observations& obs,
                                  const Eigen::MatrixXd& resp) const;
};

} // namespace pickassoc
