#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pickassoc {

/**
 * StationRecord - Station identifier plus named coordinate columns
 *
 * Coordinates are keyed by their column label ("x(km)", "y(km)", ...) so
 * the association layer can select and order dimensions by configuration.
 */
struct StationRecord {
    std::string id;
    std::map<std::string, double> coordinates;
    
    StationRecord() = default;
    StationRecord(const std::string& id_, std::map<std::string, double> coords)
        : id(id_), coordinates(std::move(coords)) {}
    
    std::optional<double> coordinate(const std::string& label) const {
        auto it = coordinates.find(label);
        if (it == coordinates.end()) return std::nullopt;
        return it->second;
    }
    
    bool hasAll(const std::vector<std::string>& labels) const {
        for (const auto& l : labels) {
            if (coordinates.count(l) == 0) return false;
        }
        return true;
    }
};

// "{station}_{phase}" -> "{station}"; ids without a phase suffix are returned unchanged
inline std::string bareStationId(const std::string& composite_id) {
    auto pos = composite_id.rfind('_');
    return pos == std::string::npos ? composite_id : composite_id.substr(0, pos);
}

/**
 * StationTable - Read-only station coordinates keyed by identifier
 *
 * Rows may be keyed by the composite pick identifier ("STA1_P") or by the
 * bare station code ("STA1"); match() tries the exact key first.
 */
class StationTable {
public:
    void addStation(const StationRecord& station) { stations_[station.id] = station; }
    
    const StationRecord* find(const std::string& id) const {
        auto it = stations_.find(id);
        return it != stations_.end() ? &it->second : nullptr;
    }
    
    const StationRecord* match(const std::string& pick_id) const {
        if (const StationRecord* sta = find(pick_id)) return sta;
        return find(bareStationId(pick_id));
    }
    
    const std::map<std::string, StationRecord>& stations() const { return stations_; }
    size_t size() const { return stations_.size(); }
    bool empty() const { return stations_.empty(); }
    
    // Load from file
    //   # id x(km) y(km) z(km)
    //   STA1 0.0 0.0 -0.5
    // Without a "# id ..." header the columns are x(km), y(km), z(km).
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

private:
    std::map<std::string, StationRecord> stations_;
};

} // namespace pickassoc
