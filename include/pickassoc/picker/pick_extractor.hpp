#pragma once

#include "peak_detector.hpp"
#include "../core/config.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pickassoc {

/**
 * Tensor4D - Dense float array indexed (batch, time, station, channel)
 *
 * Used for detector output (channel 0 = noise, 1.. = phases) and for the
 * matching waveform window (channel = component).
 */
class Tensor4D {
public:
    Tensor4D() : nb_(0), nt_(0), ns_(0), nc_(0) {}
    Tensor4D(size_t batch, size_t time, size_t stations, size_t channels, float fill = 0.0f)
        : nb_(batch), nt_(time), ns_(stations), nc_(channels),
          data_(batch * time * stations * channels, fill) {}
    
    // Wrap row-major data, throws std::invalid_argument on a size mismatch
    static Tensor4D fromData(std::vector<float> data, size_t batch, size_t time,
                             size_t stations, size_t channels);
    
    size_t batchSize() const { return nb_; }
    size_t timeSamples() const { return nt_; }
    size_t stationCount() const { return ns_; }
    size_t channelCount() const { return nc_; }
    bool empty() const { return data_.empty(); }
    
    float operator()(size_t b, size_t t, size_t s, size_t c) const { return data_[offset(b, t, s, c)]; }
    float& operator()(size_t b, size_t t, size_t s, size_t c) { return data_[offset(b, t, s, c)]; }
    
    // Time series of one (batch, station, channel)
    std::vector<float> slice(size_t b, size_t s, size_t c) const;
    
    const std::vector<float>& data() const { return data_; }

private:
    size_t nb_, nt_, ns_, nc_;
    std::vector<float> data_;
    
    size_t offset(size_t b, size_t t, size_t s, size_t c) const {
        return ((b * nt_ + t) * ns_ + s) * nc_ + c;
    }
};

using PredictionTensor = Tensor4D;
using WaveformTensor = Tensor4D;

/**
 * PickRecord - One detected phase arrival
 */
struct PickRecord {
    std::string file_name;
    std::string station_id;
    std::string begin_time;       // YYYY-MM-DDTHH:MM:SS.mmm
    size_t phase_index;           // Sample offset from begin_time
    std::string phase_time;       // begin_time + phase_index * dt
    double phase_score;           // Peak probability
    std::string phase_type;       // "P", "S", ...
    double dt;                    // Sampling interval (s)
    std::optional<double> phase_amp;  // Peak waveform amplitude near the pick
    
    PickRecord() : phase_index(0), phase_score(0), dt(0) {}
};

/**
 * PickExtractorOptions - Peak filters and channel naming
 */
struct PickExtractorOptions {
    double dt;                            // Sampling interval (s)
    std::vector<std::string> phases;      // Name of channel 1, 2, ...
    std::map<std::string, double> mph;    // Minimum probability per phase
    double default_mph;                   // For phases missing from mph
    int mpd;                              // Minimum pick distance (samples)
    bool use_amplitude;                   // Attach waveform amplitudes
    double amplitude_pre;                 // Window before the pick (s)
    double amplitude_post;                // Window after the pick (s)
    
    PickExtractorOptions()
        : dt(0.01), phases{"P", "S"}, default_mph(0.3), mpd(50),
          use_amplitude(false), amplitude_pre(1.0), amplitude_post(4.0) {}
    
    double mphFor(const std::string& phase) const {
        auto it = mph.find(phase);
        return it != mph.end() ? it->second : default_mph;
    }
    
    // Throws std::invalid_argument (DetectionConfigError for peak filters)
    void validate() const;
    
    // Reads [picker] dt, phases, mph, mpd, use_amplitude, amplitude_pre, amplitude_post.
    // mph is either one value for every phase or one value per phase.
    static PickExtractorOptions fromConfig(const Config& config,
                                           const std::string& section = "picker");
};

// Strip the NUL padding of fixed-width byte fields (HDF5/NumPy "S" strings)
std::string decodeName(const std::string& raw);

// Zero-padded four digit placeholder, e.g. 7 -> "0007"
std::string placeholderName(size_t index);

/**
 * PickExtractor - Turn phase probability curves into PickRecords
 *
 * Each (batch, station, phase channel) slice is scanned independently with
 * detectPeaks(); the noise channel is never scanned. Records are returned
 * ordered by batch, station, channel and sample index.
 */
class PickExtractor {
public:
    PickExtractor();
    explicit PickExtractor(const PickExtractorOptions& options);
    
    // file_names / begin_times: one per batch item; station_ids: one row of
    // station slots per batch item. Empty lists select the defaults
    // ("%04d" batch index, "%04d" batch index, zero epoch).
    std::vector<PickRecord> extract(
        const PredictionTensor& predictions,
        const std::vector<std::string>& file_names = {},
        const std::vector<std::string>& begin_times = {},
        const std::vector<std::vector<std::string>>& station_ids = {},
        const WaveformTensor* waveforms = nullptr) const;
    
    const PickExtractorOptions& options() const { return options_; }

private:
    PickExtractorOptions options_;
    
    std::vector<PickRecord> extractSlice(
        const PredictionTensor& predictions, size_t batch, size_t station,
        const std::string& file_name, const std::string& begin_time,
        const std::string& station_id, const WaveformTensor* waveforms) const;
    
    double pickAmplitude(const WaveformTensor& waveforms, size_t batch,
                         size_t station, size_t index) const;
};

} // namespace pickassoc
