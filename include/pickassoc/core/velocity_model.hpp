#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace pickassoc {

/**
 * Layer in a 1D velocity model
 */
struct VelocityLayer {
    double top_depth;     // km
    double thickness;     // km (0 for halfspace)
    double vp;            // P velocity (km/s)
    double vs;            // S velocity (km/s)
    
    VelocityLayer() : top_depth(0), thickness(0), vp(6.0), vs(6.0 / 1.75) {}
    
    VelocityLayer(double depth, double thick, double vp_, double vs_)
        : top_depth(depth), thickness(thick), vp(vp_), vs(vs_) {}
    
    double bottom() const { return thickness > 0 ? top_depth + thickness : 1e9; }
    double vpvs() const { return vs > 0 ? vp / vs : 1.75; }
};

/**
 * VelocityModel1D - 1D layered velocity model
 *
 * Travel times use a straight ray with the vertically averaged slowness
 * between the surface and the source depth.
 */
class VelocityModel1D {
public:
    VelocityModel1D() = default;
    explicit VelocityModel1D(const std::string& name) : name_(name) {}
    
    void addLayer(double depth, double thickness, double vp, double vs) {
        layers_.emplace_back(depth, thickness, vp, vs);
        std::sort(layers_.begin(), layers_.end(),
            [](const VelocityLayer& a, const VelocityLayer& b) {
                return a.top_depth < b.top_depth;
            });
    }
    
    const std::string& name() const { return name_; }
    const std::vector<VelocityLayer>& layers() const { return layers_; }
    size_t layerCount() const { return layers_.size(); }
    bool empty() const { return layers_.empty(); }
    
    double vpAt(double depth) const { return layerAt(depth).vp; }
    double vsAt(double depth) const { return layerAt(depth).vs; }
    
    // Average velocity of the column [0, depth] for the given phase
    double averageVelocity(double depth, PhaseType phase) const;
    
    // distance: epicentral (km), depth: source depth below the receiver (km)
    double travelTime(double distance, double depth, PhaseType phase) const;
    
    // Format: top_depth thickness vp vs, one layer per line
    bool loadFromFile(const std::string& filename);
    
    // Standard models
    static VelocityModel1D homogeneous(double vp, double vs);
    static VelocityModel1D iasp91();
    static VelocityModel1D simpleThreeLayer();

private:
    std::string name_;
    std::vector<VelocityLayer> layers_;
    
    const VelocityLayer& layerAt(double depth) const;
};

} // namespace pickassoc
