#pragma once

#include "../core/types.hpp"
#include "../core/errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pickassoc {

/**
 * EdgeMode - Which edge of a flat-topped peak is reported
 */
enum class EdgeMode {
    None,       // Flat tops are discarded
    Rising,     // First sample of the plateau
    Falling,    // Last sample of the plateau
    Both        // Both ends
};

// "rising" | "falling" | "both" | "none" (case-insensitive), throws DetectionConfigError
EdgeMode parseEdgeMode(const std::string& name);
std::string edgeModeToString(EdgeMode mode);

/**
 * PeakDetectorOptions - Filtering rules for detectPeaks()
 */
struct PeakDetectorOptions {
    std::optional<double> mph;   // Minimum peak height (raw amplitude)
    int mpd;                     // Minimum peak distance in samples
    double threshold;            // Minimum rise above both neighbours
    EdgeMode edge;
    bool valley;                 // Detect minima instead of maxima
    bool keep_same_height;       // Keep equal-height peaks inside the mpd window
    
    PeakDetectorOptions()
        : mpd(1), threshold(0), edge(EdgeMode::Rising),
          valley(false), keep_same_height(false) {}
    
    // Throws DetectionConfigError on a malformed combination
    void validate() const;
};

/**
 * PeakResult - Peak indices (ascending) and the input values at them
 */
struct PeakResult {
    std::vector<size_t> indices;
    std::vector<double> amplitudes;
    
    size_t size() const { return indices.size(); }
    bool empty() const { return indices.empty(); }
};

/**
 * Detect local maxima (or minima with valley=true) in a score sequence.
 *
 * Sequences shorter than 3 samples give an empty result. NaN samples and
 * their immediate neighbours never produce a peak. The first and last
 * samples are never peaks.
 *
 * mpd suppression walks the peaks from tallest to shortest; each surviving
 * peak removes all other peaks within mpd samples on either side. When two
 * peaks have the same height the earlier index is processed first.
 */
PeakResult detectPeaks(const std::vector<double>& x,
                       const PeakDetectorOptions& options = PeakDetectorOptions());

// Float overload for prediction tensor slices
PeakResult detectPeaks(const std::vector<float>& x,
                       const PeakDetectorOptions& options = PeakDetectorOptions());

} // namespace pickassoc
