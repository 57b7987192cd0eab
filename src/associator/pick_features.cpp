#include "pickassoc/associator/pick_features.hpp"
#include "pickassoc/core/timestamp.hpp"
#include <cctype>
#include <cmath>
#include <iostream>

namespace pickassoc {

PickRow PickRow::fromPickRecord(const PickRecord& pick) {
    PickRow row;
    row.id = pick.station_id + "_" + pick.phase_type;
    row.timestamp = pick.phase_time;
    row.type = pick.phase_type;
    row.prob = pick.phase_score;
    row.amp = pick.phase_amp;
    return row;
}

std::string normalizePhaseLabel(const std::string& type) {
    std::string out = type;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

PickFeatureConverter::PickFeatureConverter(const AssociationConfig& config)
    : config_(config)
{
    config_.validate();
}

PickFeatures PickFeatureConverter::convert(const std::vector<PickRow>& picks,
                                           const StationTable& stations) const {
    const int n_dims = config_.nDims();
    const int n_features = config_.nFeatures();
    
    std::vector<size_t> kept;
    std::vector<const StationRecord*> kept_stations;
    std::vector<double> times;
    std::vector<double> amps;
    kept.reserve(picks.size());
    
    size_t unknown_station = 0;
    size_t bad_time = 0;
    size_t bad_amp = 0;
    
    for (size_t i = 0; i < picks.size(); i++) {
        const PickRow& pick = picks[i];
        
        const StationRecord* sta = stations.match(pick.id);
        if (!sta || !sta->hasAll(config_.dims)) {
            unknown_station++;
            continue;
        }
        
        auto t = parseTimestamp(pick.timestamp);
        if (!t) {
            bad_time++;
            continue;
        }
        
        double log_amp = 0;
        if (config_.use_amplitude) {
            if (!pick.amp || !(*pick.amp > 0) || !std::isfinite(*pick.amp)) {
                bad_amp++;
                continue;
            }
            log_amp = std::log10(*pick.amp * 100.0);
        }
        
        kept.push_back(i);
        kept_stations.push_back(sta);
        times.push_back(toSeconds(*t));
        amps.push_back(log_amp);
    }
    
    const Eigen::Index n = static_cast<Eigen::Index>(kept.size());
    PickFeatures out;
    out.data.resize(n, n_features);
    out.locations.resize(n, n_dims);
    out.phase_weights.resize(n, 1);
    out.pick_index = kept;
    out.phase_types.reserve(kept.size());
    out.station_ids.reserve(kept.size());
    
    for (Eigen::Index r = 0; r < n; r++) {
        const PickRow& pick = picks[kept[r]];
        const StationRecord* sta = kept_stations[r];
        
        out.data(r, 0) = times[r];
        if (n_features > 1) out.data(r, 1) = amps[r];
        
        for (int d = 0; d < n_dims; d++) {
            out.locations(r, d) = sta->coordinates.at(config_.dims[d]);
        }
        
        out.phase_types.push_back(normalizePhaseLabel(pick.type));
        out.phase_weights(r, 0) = pick.prob ? *pick.prob : 1.0;
        out.station_ids.push_back(sta->id);
    }
    
    if (config_.verbose && n < static_cast<Eigen::Index>(picks.size())) {
        std::cout << "PickFeatureConverter: kept " << n << " of " << picks.size()
                  << " picks (" << unknown_station << " unknown station, "
                  << bad_time << " bad timestamp, " << bad_amp << " bad amplitude)"
                  << std::endl;
    }
    
    return out;
}

} // namespace pickassoc
