#include "pickassoc/core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pickassoc {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool parseDouble(const std::string& text, double& out) {
    std::string t = trim(text);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (errno != 0 || end != t.c_str() + t.size()) return false;
    out = v;
    return true;
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> result;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

} // namespace

void Config::parseLine(const std::string& raw, std::string& section) {
    std::string line = trim(raw);
    
    // Skip empty lines and comments
    if (line.empty() || line[0] == '#' || line[0] == ';') return;
    
    if (line.front() == '[' && line.back() == ']') {
        section = trim(line.substr(1, line.size() - 2));
        return;
    }
    
    auto pos = line.find('=');
    if (pos == std::string::npos) return;
    
    std::string key = trim(line.substr(0, pos));
    std::string value = trim(line.substr(pos + 1));
    if (key.empty()) return;
    
    values_[section.empty() ? key : section + "." + key] = value;
}

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Config: Could not open config file: " << filename << std::endl;
        return false;
    }
    
    std::string line;
    std::string section;
    while (std::getline(file, line)) {
        parseLine(line, section);
    }
    
    std::cout << "Config: Loaded " << values_.size() << " keys from "
              << filename << std::endl;
    return true;
}

bool Config::loadFromString(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    std::string section;
    while (std::getline(iss, line)) {
        parseLine(line, section);
    }
    return true;
}

bool Config::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) return false;
    
    // Unsectioned keys first, a later [section] header would capture them
    for (const auto& [key, value] : values_) {
        if (key.find('.') == std::string::npos) {
            file << key << " = " << value << "\n";
        }
    }
    
    std::string current_section;
    for (const auto& [key, value] : values_) {
        auto pos = key.find('.');
        if (pos == std::string::npos) continue;
        std::string section = key.substr(0, pos);
        
        if (section != current_section) {
            file << "\n[" << section << "]\n";
            current_section = section;
        }
        file << key.substr(pos + 1) << " = " << value << "\n";
    }
    return true;
}

std::string Config::getString(const std::string& key, const std::string& default_val) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : default_val;
}

int Config::getInt(const std::string& key, int default_val) const {
    double v;
    auto it = values_.find(key);
    if (it == values_.end() || !parseDouble(it->second, v)) return default_val;
    if (v != std::floor(v)) return default_val;
    return static_cast<int>(v);
}

double Config::getDouble(const std::string& key, double default_val) const {
    double v;
    auto it = values_.find(key);
    if (it == values_.end() || !parseDouble(it->second, v)) return default_val;
    return v;
}

bool Config::getBool(const std::string& key, bool default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    return default_val;
}

std::vector<std::string> Config::getStringList(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return {};
    return splitList(it->second);
}

std::vector<double> Config::getDoubleList(const std::string& key) const {
    std::vector<double> result;
    for (const auto& item : getStringList(key)) {
        double v;
        if (!parseDouble(item, v)) return {};
        result.push_back(v);
    }
    return result;
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    values_[key] = oss.str();
}

} // namespace pickassoc
