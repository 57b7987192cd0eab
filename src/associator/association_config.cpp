#include "pickassoc/associator/association_config.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace pickassoc {

double AmplitudeModel::predict(double magnitude, double distance_km) const {
    double r = std::max(distance_km, min_distance);
    return c0 + c1 * (magnitude - 3.5) + c2 * r + c3 * std::log10(r);
}

double AmplitudeModel::invert(double log_amp, double distance_km) const {
    double r = std::max(distance_km, min_distance);
    return 3.5 + (log_amp - c0 - c2 * r - c3 * std::log10(r)) / c1;
}

AssociationConfig::AssociationConfig()
    : dims{"x(km)", "y(km)", "z(km)"}
    , use_amplitude(true)
    , n_components(1)
    , max_iter(100)
    , tol(1e-3)
    , reg_covar(1e-6)
    , gauss_newton_steps(3)
    , vp(6.0)
    , vs(6.0 / 1.75)
    , covariance_type("full")
    , verbose(false)
{
}

void AssociationConfig::validate() const {
    if (dims.empty()) {
        throw std::invalid_argument("AssociationConfig: dims must name at least one coordinate column");
    }
    std::set<std::string> unique(dims.begin(), dims.end());
    if (unique.size() != dims.size()) {
        throw std::invalid_argument("AssociationConfig: dims contains duplicate columns");
    }
    if (n_components < 1) {
        throw std::invalid_argument("AssociationConfig: n_components must be >= 1, got " +
                                    std::to_string(n_components));
    }
    if (max_iter < 1) {
        throw std::invalid_argument("AssociationConfig: max_iter must be >= 1, got " +
                                    std::to_string(max_iter));
    }
    if (!(tol >= 0) || !std::isfinite(tol)) {
        throw std::invalid_argument("AssociationConfig: tol must be a finite value >= 0");
    }
    if (!(reg_covar >= 0) || !std::isfinite(reg_covar)) {
        throw std::invalid_argument("AssociationConfig: reg_covar must be a finite value >= 0");
    }
    if (gauss_newton_steps < 1) {
        throw std::invalid_argument("AssociationConfig: gauss_newton_steps must be >= 1");
    }
    if (!(vp > 0) || !(vs > 0)) {
        throw std::invalid_argument("AssociationConfig: velocities must be > 0");
    }
    if (covariance_type != "full" && covariance_type != "diag" &&
        covariance_type != "travel_time") {
        throw std::invalid_argument("AssociationConfig: covariance_type must be full, diag "
                                    "or travel_time, got '" + covariance_type + "'");
    }
    if (!bounds.empty()) {
        if (bounds.size() != dims.size()) {
            throw std::invalid_argument("AssociationConfig: bounds has " +
                                        std::to_string(bounds.size()) + " ranges for " +
                                        std::to_string(dims.size()) + " dims");
        }
        for (size_t i = 0; i < bounds.size(); i++) {
            if (!(bounds[i].first <= bounds[i].second)) {
                throw std::invalid_argument("AssociationConfig: empty bounds for " + dims[i]);
            }
        }
    }
    if (!(amplitude.c1 != 0) || !std::isfinite(amplitude.c1)) {
        throw std::invalid_argument("AssociationConfig: amplitude coefficient c1 must be non-zero");
    }
    if (!(amplitude.min_distance > 0)) {
        throw std::invalid_argument("AssociationConfig: amplitude min_distance must be > 0");
    }
}

AssociationConfig AssociationConfig::fromConfig(const Config& config,
                                                const std::string& section) {
    AssociationConfig cfg;
    const std::string p = section.empty() ? "" : section + ".";
    
    auto dims = config.getStringList(p + "dims");
    if (!dims.empty()) cfg.dims = dims;
    
    cfg.use_amplitude = config.getBool(p + "use_amplitude", cfg.use_amplitude);
    cfg.n_components = config.getInt(p + "n_components", cfg.n_components);
    cfg.max_iter = config.getInt(p + "max_iter", cfg.max_iter);
    cfg.tol = config.getDouble(p + "tol", cfg.tol);
    cfg.reg_covar = config.getDouble(p + "reg_covar", cfg.reg_covar);
    cfg.gauss_newton_steps = config.getInt(p + "gauss_newton_steps", cfg.gauss_newton_steps);
    cfg.vp = config.getDouble(p + "vel_p", cfg.vp);
    cfg.vs = config.getDouble(p + "vel_s", cfg.vp / 1.75);
    cfg.covariance_type = config.getString(p + "covariance_type", cfg.covariance_type);
    cfg.verbose = config.getBool(p + "verbose", cfg.verbose);
    
    cfg.amplitude.c0 = config.getDouble(p + "amp_c0", cfg.amplitude.c0);
    cfg.amplitude.c1 = config.getDouble(p + "amp_c1", cfg.amplitude.c1);
    cfg.amplitude.c2 = config.getDouble(p + "amp_c2", cfg.amplitude.c2);
    cfg.amplitude.c3 = config.getDouble(p + "amp_c3", cfg.amplitude.c3);
    
    if (config.has(p + "bounds")) {
        auto values = config.getDoubleList(p + "bounds");
        if (values.empty() || values.size() % 2 != 0) {
            throw std::invalid_argument("AssociationConfig: bounds must list min, max pairs");
        }
        for (size_t i = 0; i + 1 < values.size(); i += 2) {
            cfg.bounds.emplace_back(values[i], values[i + 1]);
        }
    }
    
    cfg.validate();
    return cfg;
}

} // namespace pickassoc
