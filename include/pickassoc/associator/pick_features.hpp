#pragma once

#include "association_config.hpp"
#include "../core/station.hpp"
#include "../picker/pick_extractor.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace pickassoc {

/**
 * PickRow - One pick as it arrives at the associator
 *
 * id is the composite "{station}_{phase}" key, timestamp is text.
 */
struct PickRow {
    std::string id;
    std::string timestamp;
    std::string type;
    std::optional<double> prob;
    std::optional<double> amp;
    
    PickRow() = default;
    PickRow(const std::string& id_, const std::string& ts, const std::string& type_,
            std::optional<double> prob_ = std::nullopt,
            std::optional<double> amp_ = std::nullopt)
        : id(id_), timestamp(ts), type(type_), prob(prob_), amp(amp_) {}
    
    // Composite id from the extractor's station id and phase type
    static PickRow fromPickRecord(const PickRecord& pick);
};

/**
 * PickFeatures - Mixture inputs, one row per kept pick
 *
 * data:          (n, 1) time in Unix seconds, or (n, 2) with log10(amp * 100)
 * locations:     (n, dims) station coordinates in configured order
 * phase_weights: (n, 1) pick probability, 1.0 when absent
 * pick_index:    row of the input pick list each feature row came from
 */
struct PickFeatures {
    Eigen::MatrixXd data;
    Eigen::MatrixXd locations;
    std::vector<std::string> phase_types;
    Eigen::MatrixXd phase_weights;
    std::vector<size_t> pick_index;
    std::vector<std::string> station_ids;
    
    size_t size() const { return pick_index.size(); }
    bool empty() const { return pick_index.empty(); }
};

/**
 * PickFeatureConverter - Joins picks with station coordinates
 *
 * Picks whose station is unknown, lacks a configured coordinate, whose
 * timestamp cannot be parsed, or (with amplitude enabled) whose amplitude
 * is missing or not positive are dropped without error. Row order follows
 * the input order.
 */
class PickFeatureConverter {
public:
    explicit PickFeatureConverter(const AssociationConfig& config);
    
    PickFeatures convert(const std::vector<PickRow>& picks,
                         const StationTable& stations) const;
    
    const AssociationConfig& config() const { return config_; }

private:
    AssociationConfig config_;
};

// Lowercase a phase label ("P" -> "p")
std::string normalizePhaseLabel(const std::string& type);

} // namespace pickassoc
