#pragma once

#include <string>
#include <map>
#include <vector>

namespace pickassoc {

/**
 * Config - INI-style key/value store
 *
 *   # comment
 *   [association]
 *   dims = x(km), y(km), z(km)
 *   use_amplitude = true
 *
 * Keys inside a section are stored as "section.key". Values stay text until
 * read through a typed getter; a value that does not parse as the requested
 * type yields the supplied default.
 */
class Config {
public:
    Config() = default;
    
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& text);
    bool saveToFile(const std::string& filename) const;
    
    // Getters
    std::string getString(const std::string& key, const std::string& default_val = "") const;
    int getInt(const std::string& key, int default_val = 0) const;
    double getDouble(const std::string& key, double default_val = 0.0) const;
    bool getBool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> getStringList(const std::string& key) const;
    std::vector<double> getDoubleList(const std::string& key) const;
    
    // Setters
    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    void set(const std::string& key, const char* value) { values_[key] = value; }
    void set(const std::string& key, int value) { values_[key] = std::to_string(value); }
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value) { values_[key] = value ? "true" : "false"; }
    
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    
    const std::map<std::string, std::string>& all() const { return values_; }

private:
    std::map<std::string, std::string> values_;
    
    void parseLine(const std::string& raw, std::string& section);
};

} // namespace pickassoc
