#include "pickassoc/picker/pick_extractor.hpp"
#include "pickassoc/core/timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace pickassoc {

// ============================================================================
// Tensor4D
// ============================================================================

Tensor4D Tensor4D::fromData(std::vector<float> data, size_t batch, size_t time,
                            size_t stations, size_t channels) {
    if (data.size() != batch * time * stations * channels) {
        throw std::invalid_argument(
            "Tensor4D: data has " + std::to_string(data.size()) +
            " values, expected " + std::to_string(batch) + "x" + std::to_string(time) +
            "x" + std::to_string(stations) + "x" + std::to_string(channels));
    }
    Tensor4D t;
    t.nb_ = batch;
    t.nt_ = time;
    t.ns_ = stations;
    t.nc_ = channels;
    t.data_ = std::move(data);
    return t;
}

std::vector<float> Tensor4D::slice(size_t b, size_t s, size_t c) const {
    std::vector<float> out(nt_);
    for (size_t t = 0; t < nt_; t++) {
        out[t] = data_[offset(b, t, s, c)];
    }
    return out;
}

// ============================================================================
// PickExtractorOptions
// ============================================================================

void PickExtractorOptions::validate() const {
    if (!(dt > 0) || !std::isfinite(dt)) {
        throw std::invalid_argument("PickExtractor: sampling interval dt must be > 0");
    }
    if (phases.empty()) {
        throw std::invalid_argument("PickExtractor: at least one phase name is required");
    }
    if (mpd < 0) {
        throw DetectionConfigError("PickExtractor: mpd must be >= 0, got " +
                                   std::to_string(mpd));
    }
    if (!std::isfinite(default_mph)) {
        throw DetectionConfigError("PickExtractor: mph must be finite");
    }
    for (const auto& [phase, value] : mph) {
        if (!std::isfinite(value)) {
            throw DetectionConfigError("PickExtractor: mph for phase " + phase +
                                       " must be finite");
        }
    }
    if (amplitude_pre < 0 || amplitude_post < 0) {
        throw std::invalid_argument("PickExtractor: amplitude window must be >= 0");
    }
}

PickExtractorOptions PickExtractorOptions::fromConfig(const Config& config,
                                                      const std::string& section) {
    PickExtractorOptions opts;
    const std::string p = section.empty() ? "" : section + ".";
    
    opts.dt = config.getDouble(p + "dt", opts.dt);
    opts.mpd = config.getInt(p + "mpd", opts.mpd);
    opts.use_amplitude = config.getBool(p + "use_amplitude", opts.use_amplitude);
    opts.amplitude_pre = config.getDouble(p + "amplitude_pre", opts.amplitude_pre);
    opts.amplitude_post = config.getDouble(p + "amplitude_post", opts.amplitude_post);
    
    auto phases = config.getStringList(p + "phases");
    if (!phases.empty()) opts.phases = phases;
    
    auto mph = config.getDoubleList(p + "mph");
    if (mph.size() == 1) {
        opts.default_mph = mph[0];
    } else if (!mph.empty()) {
        if (mph.size() != opts.phases.size()) {
            throw std::invalid_argument(
                "PickExtractor: " + std::to_string(mph.size()) +
                " mph values given for " + std::to_string(opts.phases.size()) + " phases");
        }
        for (size_t i = 0; i < mph.size(); i++) {
            opts.mph[opts.phases[i]] = mph[i];
        }
    }
    
    opts.validate();
    return opts;
}

// ============================================================================
// Helpers
// ============================================================================

std::string decodeName(const std::string& raw) {
    auto end = raw.find('\0');
    std::string name = end == std::string::npos ? raw : raw.substr(0, end);
    while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) {
        name.pop_back();
    }
    return name;
}

std::string placeholderName(size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04zu", index);
    return buf;
}

// ============================================================================
// PickExtractor
// ============================================================================

PickExtractor::PickExtractor()
    : PickExtractor(PickExtractorOptions())
{
}

PickExtractor::PickExtractor(const PickExtractorOptions& options)
    : options_(options)
{
    options_.validate();
}

std::vector<PickRecord> PickExtractor::extract(
    const PredictionTensor& predictions,
    const std::vector<std::string>& file_names,
    const std::vector<std::string>& begin_times,
    const std::vector<std::vector<std::string>>& station_ids,
    const WaveformTensor* waveforms) const
{
    std::vector<PickRecord> picks;
    
    const size_t nb = predictions.batchSize();
    const size_t ns = predictions.stationCount();
    const size_t nc = predictions.channelCount();
    
    if (predictions.empty()) {
        return picks;
    }
    if (nc - 1 > options_.phases.size()) {
        throw std::invalid_argument(
            "PickExtractor: tensor has " + std::to_string(nc - 1) +
            " phase channels but only " + std::to_string(options_.phases.size()) +
            " phase names are configured");
    }
    if (!file_names.empty() && file_names.size() != nb) {
        throw std::invalid_argument("PickExtractor: expected " + std::to_string(nb) +
                                    " file names, got " + std::to_string(file_names.size()));
    }
    if (!begin_times.empty() && begin_times.size() != nb) {
        throw std::invalid_argument("PickExtractor: expected " + std::to_string(nb) +
                                    " begin times, got " + std::to_string(begin_times.size()));
    }
    if (!station_ids.empty() && station_ids.size() != nb) {
        throw std::invalid_argument("PickExtractor: expected station ids for " +
                                    std::to_string(nb) + " batch items, got " +
                                    std::to_string(station_ids.size()));
    }
    if (options_.use_amplitude) {
        if (!waveforms) {
            throw std::invalid_argument("PickExtractor: use_amplitude requires waveforms");
        }
        if (waveforms->batchSize() != nb || waveforms->timeSamples() != predictions.timeSamples() ||
            waveforms->stationCount() != ns) {
            throw std::invalid_argument(
                "PickExtractor: waveform tensor does not match the prediction tensor "
                "in batch, time or station dimension");
        }
    }
    
    for (size_t b = 0; b < nb; b++) {
        std::string file_name = file_names.empty() ? "" : decodeName(file_names[b]);
        if (file_name.empty()) file_name = placeholderName(b);
        
        std::string begin_time = epochTimestamp();
        if (!begin_times.empty() && !begin_times[b].empty()) {
            // Normalise to UTC millisecond text, offsets are folded in
            begin_time = calcTimestamp(decodeName(begin_times[b]), 0.0);
        }
        
        for (size_t s = 0; s < ns; s++) {
            std::string station_id;
            if (!station_ids.empty() && s < station_ids[b].size()) {
                station_id = decodeName(station_ids[b][s]);
            }
            if (station_id.empty()) station_id = placeholderName(b);
            
            auto slice_picks = extractSlice(predictions, b, s, file_name, begin_time,
                                            station_id, waveforms);
            picks.insert(picks.end(),
                         std::make_move_iterator(slice_picks.begin()),
                         std::make_move_iterator(slice_picks.end()));
        }
    }
    
    return picks;
}

std::vector<PickRecord> PickExtractor::extractSlice(
    const PredictionTensor& predictions, size_t batch, size_t station,
    const std::string& file_name, const std::string& begin_time,
    const std::string& station_id, const WaveformTensor* waveforms) const
{
    std::vector<PickRecord> picks;
    
    for (size_t c = 1; c < predictions.channelCount(); c++) {
        const std::string& phase = options_.phases[c - 1];
        
        PeakDetectorOptions peak_opts;
        peak_opts.mph = options_.mphFor(phase);
        peak_opts.mpd = options_.mpd;
        
        PeakResult peaks = detectPeaks(predictions.slice(batch, station, c), peak_opts);
        
        for (size_t k = 0; k < peaks.size(); k++) {
            PickRecord pick;
            pick.file_name = file_name;
            pick.station_id = station_id;
            pick.begin_time = begin_time;
            pick.phase_index = peaks.indices[k];
            pick.phase_time = calcTimestamp(begin_time, pick.phase_index * options_.dt);
            pick.phase_score = peaks.amplitudes[k];
            pick.phase_type = phase;
            pick.dt = options_.dt;
            
            if (options_.use_amplitude && waveforms) {
                pick.phase_amp = pickAmplitude(*waveforms, batch, station, pick.phase_index);
            }
            
            picks.push_back(std::move(pick));
        }
    }
    
    return picks;
}

double PickExtractor::pickAmplitude(const WaveformTensor& waveforms, size_t batch,
                                    size_t station, size_t index) const {
    const size_t pre = static_cast<size_t>(std::lround(options_.amplitude_pre / options_.dt));
    const size_t post = static_cast<size_t>(std::lround(options_.amplitude_post / options_.dt));
    
    size_t t0 = index > pre ? index - pre : 0;
    size_t t1 = std::min(waveforms.timeSamples(), index + post);
    
    double amp = 0;
    for (size_t t = t0; t < t1; t++) {
        for (size_t c = 0; c < waveforms.channelCount(); c++) {
            amp = std::max(amp, static_cast<double>(std::abs(waveforms(batch, t, station, c))));
        }
    }
    return amp;
}

} // namespace pickassoc
