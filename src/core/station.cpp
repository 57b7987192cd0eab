#include "pickassoc/core/station.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace pickassoc {

bool StationTable::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "StationTable: Failed to open station file: " << filename << std::endl;
        return false;
    }
    
    std::vector<std::string> labels = {"x(km)", "y(km)", "z(km)"};
    std::string line;
    int line_num = 0;
    size_t loaded = 0;
    
    while (std::getline(file, line)) {
        line_num++;
        if (line.empty()) continue;
        
        if (line[0] == '#') {
            // Header naming the coordinate columns
            std::istringstream hdr(line.substr(1));
            std::string first;
            if (hdr >> first && first == "id") {
                labels.clear();
                std::string label;
                while (hdr >> label) labels.push_back(label);
            }
            continue;
        }
        
        std::istringstream iss(line);
        StationRecord sta;
        if (!(iss >> sta.id)) continue;
        
        bool ok = true;
        for (const auto& label : labels) {
            double value;
            if (!(iss >> value)) {
                ok = false;
                break;
            }
            sta.coordinates[label] = value;
        }
        
        if (!ok) {
            std::cerr << "StationTable: Parse error at line " << line_num << std::endl;
            continue;
        }
        
        addStation(sta);
        loaded++;
    }
    
    std::cout << "StationTable: Loaded " << loaded << " stations from "
              << filename << std::endl;
    return true;
}

bool StationTable::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    // Column set is the union over all stations; rows lacking a column are not written
    std::set<std::string> labels;
    for (const auto& [id, sta] : stations_) {
        for (const auto& [label, value] : sta.coordinates) labels.insert(label);
    }
    
    file << "# id";
    for (const auto& label : labels) file << " " << label;
    file << "\n";
    
    file << std::setprecision(10);
    for (const auto& [id, sta] : stations_) {
        if (sta.coordinates.size() != labels.size()) continue;
        file << id;
        for (const auto& label : labels) file << " " << sta.coordinates.at(label);
        file << "\n";
    }
    
    return true;
}

} // namespace pickassoc
