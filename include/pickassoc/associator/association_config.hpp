#pragma once

#include "../core/config.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pickassoc {

/**
 * AmplitudeModel - Predicted log10 amplitude of a pick
 *
 *   log10(A) = c0 + c1 * (M - 3.5) + c2 * r + c3 * log10(r)
 *
 * r is the hypocentral distance in km (floored at min_distance).
 */
struct AmplitudeModel {
    double c0 = 1.08;
    double c1 = 0.93;
    double c2 = 0.0;
    double c3 = -1.68;
    double min_distance = 0.1;
    
    double predict(double magnitude, double distance_km) const;
    
    // Magnitude that reproduces log_amp exactly at distance_km
    double invert(double log_amp, double distance_km) const;
};

/**
 * AssociationConfig - Options shared by the pick feature converter and the
 * Gaussian mixture associator
 *
 * Built once, then validate()d; both consumers validate again on
 * construction so a hand-filled struct cannot slip through.
 */
struct AssociationConfig {
    std::vector<std::string> dims;   // Station coordinate columns, in order
    bool use_amplitude;              // Adds the log10 amplitude feature
    
    int n_components;                // Event hypotheses to fit
    int max_iter;                    // EM iteration cap
    double tol;                      // Convergence on mean log-likelihood change
    double reg_covar;                // Added to covariance diagonals
    int gauss_newton_steps;          // Location updates per M-step
    
    double vp;                       // km/s
    double vs;                       // km/s
    std::string covariance_type;     // full | diag | travel_time
    
    // Optional (min, max) per dimension; empty means unbounded
    std::vector<std::pair<double, double>> bounds;
    
    AmplitudeModel amplitude;
    bool verbose;
    
    AssociationConfig();
    
    int nFeatures() const { return use_amplitude ? 2 : 1; }
    int nDims() const { return static_cast<int>(dims.size()); }
    
    // Throws std::invalid_argument naming the offending option
    void validate() const;
    
    // [association] dims, use_amplitude, n_components, max_iter, tol,
    // reg_covar, gauss_newton_steps, vel_p, vel_s, covariance_type, verbose,
    // bounds (min1, max1, min2, max2, ...), amp_c0..amp_c3
    static AssociationConfig fromConfig(const Config& config,
                                        const std::string& section = "association");
};

} // namespace pickassoc
