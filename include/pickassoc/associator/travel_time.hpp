#pragma once

#include "../core/types.hpp"
#include "../core/velocity_model.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace pickassoc {

/**
 * TravelTimeModel - Source-to-station travel time in configured coordinates
 *
 * event and station are points in the same coordinate space (km). The
 * default gradient() uses central differences; override it where an
 * analytic form exists.
 */
class TravelTimeModel {
public:
    virtual ~TravelTimeModel() = default;
    
    virtual double travelTime(const Eigen::VectorXd& event,
                              const Eigen::VectorXd& station,
                              PhaseType phase) const = 0;
    
    // d(travel time)/d(event coordinates)
    virtual Eigen::VectorXd gradient(const Eigen::VectorXd& event,
                                     const Eigen::VectorXd& station,
                                     PhaseType phase) const;
    
    virtual std::string name() const = 0;
};

using TravelTimeModelPtr = std::shared_ptr<TravelTimeModel>;

// Straight ray in a constant velocity medium
class HomogeneousTravelTime : public TravelTimeModel {
public:
    HomogeneousTravelTime(double vp, double vs);
    
    double travelTime(const Eigen::VectorXd& event, const Eigen::VectorXd& station,
                      PhaseType phase) const override;
    Eigen::VectorXd gradient(const Eigen::VectorXd& event, const Eigen::VectorXd& station,
                             PhaseType phase) const override;
    std::string name() const override { return "Homogeneous"; }
    
    double vp() const { return vp_; }
    double vs() const { return vs_; }

private:
    double vp_;
    double vs_;
    
    double velocity(PhaseType phase) const { return isSPhase(phase) ? vs_ : vp_; }
};

/**
 * LayeredTravelTime - 1D velocity model travel times
 *
 * depth_axis selects the coordinate that points down (km); the others are
 * horizontal. A negative axis picks the third coordinate when there is
 * one, otherwise all coordinates are horizontal.
 */
class LayeredTravelTime : public TravelTimeModel {
public:
    explicit LayeredTravelTime(const VelocityModel1D& model, int depth_axis = -1);
    
    double travelTime(const Eigen::VectorXd& event, const Eigen::VectorXd& station,
                      PhaseType phase) const override;
    std::string name() const override { return "Layered(" + model_.name() + ")"; }
    
    const VelocityModel1D& model() const { return model_; }

private:
    VelocityModel1D model_;
    int depth_axis_;
    
    int depthAxis(Eigen::Index n_dims) const;
};

} // namespace pickassoc
