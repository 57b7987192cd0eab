#include "pickassoc/picker/peak_detector.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>

namespace pickassoc {

EdgeMode parseEdgeMode(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (s == "rising") return EdgeMode::Rising;
    if (s == "falling") return EdgeMode::Falling;
    if (s == "both") return EdgeMode::Both;
    if (s == "none" || s.empty()) return EdgeMode::None;
    
    throw DetectionConfigError("Unknown edge mode '" + name +
                               "', expected rising, falling, both or none");
}

std::string edgeModeToString(EdgeMode mode) {
    switch (mode) {
        case EdgeMode::Rising: return "rising";
        case EdgeMode::Falling: return "falling";
        case EdgeMode::Both: return "both";
        default: return "none";
    }
}

void PeakDetectorOptions::validate() const {
    if (mpd < 0) {
        throw DetectionConfigError("Minimum peak distance (mpd) must be >= 0, got " +
                                   std::to_string(mpd));
    }
    if (!std::isfinite(threshold) || threshold < 0) {
        throw DetectionConfigError("Peak threshold must be a finite value >= 0, got " +
                                   std::to_string(threshold));
    }
    if (mph && !std::isfinite(*mph)) {
        throw DetectionConfigError("Minimum peak height (mph) must be finite");
    }
}

PeakResult detectPeaks(const std::vector<double>& input, const PeakDetectorOptions& options) {
    options.validate();
    
    PeakResult result;
    const size_t n = input.size();
    if (n < 3) {
        return result;
    }
    
    const double inf = std::numeric_limits<double>::infinity();
    
    std::vector<double> x(input);
    std::optional<double> mph = options.mph;
    if (options.valley) {
        for (auto& v : x) v = -v;
        if (mph) mph = -*mph;
    }
    
    // First differences; any difference touching a NaN becomes +inf so the
    // sample after a gap never looks like a falling edge
    std::vector<double> dx(n - 1);
    for (size_t i = 0; i + 1 < n; i++) {
        dx[i] = x[i + 1] - x[i];
        if (std::isnan(dx[i])) dx[i] = inf;
    }
    
    std::vector<bool> is_nan(n, false);
    bool any_nan = false;
    for (size_t i = 0; i < n; i++) {
        if (std::isnan(x[i])) {
            is_nan[i] = true;
            any_nan = true;
            x[i] = inf;
        }
    }
    
    // Candidate extrema by edge policy
    std::vector<size_t> ind;
    for (size_t i = 1; i + 1 < n; i++) {
        double before = dx[i - 1];
        double after = dx[i];
        
        bool hit = false;
        switch (options.edge) {
            case EdgeMode::None:
                hit = after < 0 && before > 0;
                break;
            case EdgeMode::Rising:
                hit = after <= 0 && before > 0;
                break;
            case EdgeMode::Falling:
                hit = after < 0 && before >= 0;
                break;
            case EdgeMode::Both:
                hit = (after <= 0 && before > 0) || (after < 0 && before >= 0);
                break;
        }
        if (!hit) continue;
        
        if (any_nan && (is_nan[i] || is_nan[i - 1] || is_nan[i + 1])) continue;
        
        ind.push_back(i);
    }
    
    if (!ind.empty() && mph) {
        ind.erase(std::remove_if(ind.begin(), ind.end(),
                                 [&](size_t i) { return x[i] < *mph; }),
                  ind.end());
    }
    
    if (!ind.empty() && options.threshold > 0) {
        ind.erase(std::remove_if(ind.begin(), ind.end(),
                                 [&](size_t i) {
                                     double rise = std::min(x[i] - x[i - 1], x[i] - x[i + 1]);
                                     return rise < options.threshold;
                                 }),
                  ind.end());
    }
    
    if (ind.size() > 1 && options.mpd > 1) {
        const size_t mpd = static_cast<size_t>(options.mpd);
        
        // Visit order: tallest first, earlier index first among equals
        std::vector<size_t> order(ind.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](size_t a, size_t b) { return x[ind[a]] > x[ind[b]]; });
        
        std::vector<bool> removed(ind.size(), false);
        for (size_t k : order) {
            if (removed[k]) continue;
            double height = x[ind[k]];
            
            // ind is ascending, so the window is contiguous around k
            for (size_t j = k; j-- > 0 && ind[k] - ind[j] <= mpd; ) {
                if (!options.keep_same_height || height > x[ind[j]]) removed[j] = true;
            }
            for (size_t j = k + 1; j < ind.size() && ind[j] - ind[k] <= mpd; j++) {
                if (!options.keep_same_height || height > x[ind[j]]) removed[j] = true;
            }
        }
        
        std::vector<size_t> kept;
        kept.reserve(ind.size());
        for (size_t k = 0; k < ind.size(); k++) {
            if (!removed[k]) kept.push_back(ind[k]);
        }
        ind.swap(kept);
    }
    
    result.indices = ind;
    result.amplitudes.reserve(ind.size());
    for (size_t i : ind) {
        result.amplitudes.push_back(input[i]);
    }
    
    return result;
}

PeakResult detectPeaks(const std::vector<float>& x, const PeakDetectorOptions& options) {
    return detectPeaks(std::vector<double>(x.begin(), x.end()), options);
}

} // namespace pickassoc
