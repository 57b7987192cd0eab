#include "pickassoc/associator/travel_time.hpp"
#include <cmath>
#include <stdexcept>

namespace pickassoc {

// ============================================================================
// TravelTimeModel
// ============================================================================

Eigen::VectorXd TravelTimeModel::gradient(const Eigen::VectorXd& event,
                                          const Eigen::VectorXd& station,
                                          PhaseType phase) const {
    const double h = 0.01;  // km
    Eigen::VectorXd grad(event.size());
    Eigen::VectorXd probe = event;
    
    for (Eigen::Index i = 0; i < event.size(); i++) {
        probe(i) = event(i) + h;
        double t_plus = travelTime(probe, station, phase);
        probe(i) = event(i) - h;
        double t_minus = travelTime(probe, station, phase);
        probe(i) = event(i);
        grad(i) = (t_plus - t_minus) / (2 * h);
    }
    return grad;
}

// ============================================================================
// HomogeneousTravelTime
// ============================================================================

HomogeneousTravelTime::HomogeneousTravelTime(double vp, double vs)
    : vp_(vp)
    , vs_(vs)
{
    if (!(vp_ > 0) || !(vs_ > 0)) {
        throw std::invalid_argument("HomogeneousTravelTime: velocities must be > 0");
    }
}

double HomogeneousTravelTime::travelTime(const Eigen::VectorXd& event,
                                         const Eigen::VectorXd& station,
                                         PhaseType phase) const {
    return (event - station).norm() / velocity(phase);
}

Eigen::VectorXd HomogeneousTravelTime::gradient(const Eigen::VectorXd& event,
                                                const Eigen::VectorXd& station,
                                                PhaseType phase) const {
    Eigen::VectorXd diff = event - station;
    double dist = diff.norm();
    if (dist < 1e-9) {
        return Eigen::VectorXd::Zero(event.size());
    }
    return diff / (dist * velocity(phase));
}

// ============================================================================
// LayeredTravelTime
// ============================================================================

LayeredTravelTime::LayeredTravelTime(const VelocityModel1D& model, int depth_axis)
    : model_(model)
    , depth_axis_(depth_axis)
{
    if (model_.empty()) {
        throw std::invalid_argument("LayeredTravelTime: velocity model has no layers");
    }
}

int LayeredTravelTime::depthAxis(Eigen::Index n_dims) const {
    if (depth_axis_ >= 0) {
        return depth_axis_ < n_dims ? depth_axis_ : -1;
    }
    return n_dims >= 3 ? 2 : -1;
}

double LayeredTravelTime::travelTime(const Eigen::VectorXd& event,
                                     const Eigen::VectorXd& station,
                                     PhaseType phase) const {
    const int z = depthAxis(event.size());
    
    double horizontal = 0;
    for (Eigen::Index i = 0; i < event.size(); i++) {
        if (i == z) continue;
        double d = event(i) - station(i);
        horizontal += d * d;
    }
    double depth = z >= 0 ? event(z) - station(z) : 0.0;
    
    return model_.travelTime(std::sqrt(horizontal), depth, phase);
}

} // namespace pickassoc
