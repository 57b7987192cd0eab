#include "pickassoc/core/velocity_model.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <cmath>

namespace pickassoc {

const VelocityLayer& VelocityModel1D::layerAt(double depth) const {
    static const VelocityLayer default_layer;
    if (layers_.empty()) return default_layer;
    
    for (const auto& layer : layers_) {
        if (depth >= layer.top_depth && depth < layer.bottom()) {
            return layer;
        }
    }
    return depth < layers_.front().top_depth ? layers_.front() : layers_.back();
}

double VelocityModel1D::averageVelocity(double depth, PhaseType phase) const {
    bool is_p = !isSPhase(phase);
    
    if (depth <= 0 || layers_.empty()) {
        const VelocityLayer& top = layerAt(0.0);
        return is_p ? top.vp : top.vs;
    }
    
    // Harmonic average: total thickness over summed vertical slowness
    double slowness = 0;
    double z = 0;
    while (z < depth) {
        const VelocityLayer& layer = layerAt(z);
        double z_next = std::min(depth, layer.bottom());
        if (z_next <= z) break;
        double v = is_p ? layer.vp : layer.vs;
        slowness += (z_next - z) / v;
        z = z_next;
    }
    
    if (slowness <= 0) {
        const VelocityLayer& top = layerAt(0.0);
        return is_p ? top.vp : top.vs;
    }
    return z / slowness;
}

double VelocityModel1D::travelTime(double distance, double depth, PhaseType phase) const {
    double velocity = averageVelocity(std::max(0.0, depth), phase);
    
    // Hypocentral distance
    double hypo_dist = std::sqrt(distance * distance + depth * depth);
    
    return hypo_dist / velocity;
}

bool VelocityModel1D::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "VelocityModel1D: Failed to open " << filename << std::endl;
        return false;
    }
    
    layers_.clear();
    std::string line;
    
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        
        std::istringstream iss(line);
        double depth, thickness, vp, vs;
        if (!(iss >> depth >> thickness >> vp >> vs)) continue;
        if (vp <= 0 || vs <= 0) {
            std::cerr << "VelocityModel1D: Skipping layer with non-positive velocity at depth "
                      << depth << std::endl;
            continue;
        }
        
        addLayer(depth, thickness, vp, vs);
    }
    
    std::cout << "VelocityModel1D: Loaded " << layers_.size()
              << " layers from " << filename << std::endl;
    return !layers_.empty();
}

VelocityModel1D VelocityModel1D::homogeneous(double vp, double vs) {
    VelocityModel1D model("Homogeneous");
    model.addLayer(0.0, 0.0, vp, vs);
    return model;
}

VelocityModel1D VelocityModel1D::iasp91() {
    VelocityModel1D model("IASP91");
    
    // Simplified IASP91 crust and upper mantle
    model.addLayer(0.0, 20.0, 5.80, 3.36);
    model.addLayer(20.0, 15.0, 6.50, 3.75);
    model.addLayer(35.0, 77.5, 8.04, 4.47);
    model.addLayer(112.5, 0.0, 8.05, 4.50);
    
    return model;
}

VelocityModel1D VelocityModel1D::simpleThreeLayer() {
    VelocityModel1D model("Simple3Layer");
    
    model.addLayer(0.0, 15.0, 5.50, 3.18);   // Sediments + upper crust
    model.addLayer(15.0, 20.0, 6.30, 3.64);  // Lower crust
    model.addLayer(35.0, 0.0, 8.00, 4.62);   // Mantle halfspace
    
    return model;
}

} // namespace pickassoc
