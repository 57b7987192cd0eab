/**
 * End-to-end tests: probability tensor -> picks -> features -> events
 */

#include "test_framework.hpp"
#include "pickassoc/associator/gaussian_mixture.hpp"
#include "pickassoc/associator/pick_features.hpp"
#include "pickassoc/core/timestamp.hpp"
#include "pickassoc/picker/pick_extractor.hpp"
#include <algorithm>
#include <cmath>

using namespace pickassoc;
using namespace pickassoc::test;

namespace {

const char* kBeginTime = "2019-07-06T02:15:00.000";
const double kDt = 0.01;

struct Scenario {
    StationTable stations;
    std::vector<std::string> station_ids;
    PredictionTensor predictions;
    WaveformTensor waveforms;
};

struct SourceSpec {
    double x, y;
    double origin;       // Seconds after kBeginTime
    double magnitude;
};

void addBump(PredictionTensor& preds, size_t s, size_t c, double center) {
    for (size_t t = 0; t < preds.timeSamples(); t++) {
        double d = static_cast<double>(t) - center;
        preds(0, t, s, c) += static_cast<float>(0.95 * std::exp(-d * d / (2 * 15.0 * 15.0)));
    }
}

// Six stations ringing the source region, one batch item
Scenario buildScenario(const std::vector<SourceSpec>& sources) {
    const std::vector<std::pair<double, double>> coords = {
        {0.0, 0.0}, {40.0, 0.0}, {0.0, 35.0}, {40.0, 35.0}, {20.0, -10.0}, {-10.0, 20.0}};
    const size_t nt = 8000;
    
    Scenario sc;
    sc.predictions = PredictionTensor(1, nt, coords.size(), 3);
    sc.waveforms = WaveformTensor(1, nt, coords.size(), 3, 0.0f);
    
    HomogeneousTravelTime tt(6.0, 6.0 / 1.75);
    AmplitudeModel amp;
    
    for (size_t s = 0; s < coords.size(); s++) {
        std::string id = "XX.S" + std::to_string(s);
        sc.station_ids.push_back(id);
        sc.stations.addStation(StationRecord(id, {{"x(km)", coords[s].first},
                                                  {"y(km)", coords[s].second}}));
        
        Eigen::Vector2d sta(coords[s].first, coords[s].second);
        for (const auto& src : sources) {
            Eigen::Vector2d ev(src.x, src.y);
            double dist = (ev - sta).norm();
            float peak = static_cast<float>(std::pow(10.0, amp.predict(src.magnitude, dist)) / 100.0);
            
            double p_idx = std::round((src.origin + tt.travelTime(ev, sta, PhaseType::P)) / kDt);
            double s_idx = std::round((src.origin + tt.travelTime(ev, sta, PhaseType::S)) / kDt);
            addBump(sc.predictions, s, 1, p_idx);
            addBump(sc.predictions, s, 2, s_idx);
            
            sc.waveforms(0, static_cast<size_t>(p_idx) + 20, s, 2) = peak;
            sc.waveforms(0, static_cast<size_t>(s_idx) + 20, s, 0) = -peak;
        }
        for (size_t t = 0; t < nt; t++) {
            sc.predictions(0, t, s, 0) = std::max(0.0f, 1.0f - sc.predictions(0, t, s, 1) -
                                                             sc.predictions(0, t, s, 2));
        }
    }
    return sc;
}

std::vector<PickRow> extractRows(const Scenario& sc) {
    PickExtractorOptions opts;
    opts.dt = kDt;
    opts.use_amplitude = true;
    
    auto picks = PickExtractor(opts).extract(sc.predictions, {"scenario"}, {kBeginTime},
                                             {sc.station_ids}, &sc.waveforms);
    std::vector<PickRow> rows;
    for (const auto& pick : picks) rows.push_back(PickRow::fromPickRecord(pick));
    return rows;
}

AssociationConfig planarConfig(int n_components) {
    AssociationConfig cfg;
    cfg.dims = {"x(km)", "y(km)"};
    cfg.n_components = n_components;
    cfg.max_iter = 300;
    cfg.tol = 1e-6;
    return cfg;
}

} // namespace

TEST(Integration, SingleEventPipeline) {
    SourceSpec src{15.0, 12.0, 10.0, 3.2};
    Scenario sc = buildScenario({src});
    
    auto rows = extractRows(sc);
    ASSERT_EQ(rows.size(), 12u);
    ASSERT_EQ(rows[0].id, "XX.S0_P");
    ASSERT_TRUE(rows[0].amp.has_value());
    
    AssociationConfig cfg = planarConfig(1);
    auto features = PickFeatureConverter(cfg).convert(rows, sc.stations);
    ASSERT_EQ(features.size(), 12u);
    
    auto result = GaussianMixtureAssociator(cfg).fit(features);
    ASSERT_EQ(result.events.size(), 1u);
    
    const auto& ev = result.events[0];
    double expected_origin = toSeconds(*parseTimestamp(kBeginTime)) + src.origin;
    ASSERT_NEAR(ev.origin_seconds, expected_origin, 0.1);
    ASSERT_NEAR(ev.location(0), src.x, 1.0);
    ASSERT_NEAR(ev.location(1), src.y, 1.0);
    ASSERT_NEAR(ev.magnitude, src.magnitude, 0.1);
    ASSERT_EQ(ev.pick_count, 12u);
}

TEST(Integration, TwoEventPipeline) {
    SourceSpec first{10.0, 10.0, 5.0, 3.0};
    SourceSpec second{30.0, 25.0, 40.0, 3.8};
    Scenario sc = buildScenario({first, second});
    
    auto rows = extractRows(sc);
    ASSERT_EQ(rows.size(), 24u);
    
    AssociationConfig cfg = planarConfig(2);
    auto features = PickFeatureConverter(cfg).convert(rows, sc.stations);
    auto result = GaussianMixtureAssociator(cfg).fit(features);
    
    ASSERT_EQ(result.events.size(), 2u);
    
    // Picks before 30 s belong to the first event, the rest to the second
    double split = toSeconds(*parseTimestamp(kBeginTime)) + 30.0;
    int early = -1;
    int late = -1;
    for (size_t i = 0; i < features.size(); i++) {
        int& label = features.data(static_cast<Eigen::Index>(i), 0) < split ? early : late;
        if (label < 0) label = result.assignments[i];
        ASSERT_EQ(result.assignments[i], label);
    }
    ASSERT_NE(early, late);
    
    ASSERT_NEAR(result.events[early].magnitude, first.magnitude, 0.2);
    ASSERT_NEAR(result.events[late].magnitude, second.magnitude, 0.2);
    ASSERT_EQ(result.events[early].pick_count, 12u);
}

TEST(Integration, UnknownStationsAreDropped) {
    Scenario sc = buildScenario({SourceSpec{15.0, 12.0, 10.0, 3.2}});
    auto rows = extractRows(sc);
    
    StationTable partial;
    for (const auto& id : {"XX.S0", "XX.S1", "XX.S2"}) {
        partial.addStation(*sc.stations.find(id));
    }
    
    auto features = PickFeatureConverter(planarConfig(1)).convert(rows, partial);
    ASSERT_EQ(features.size(), 6u);
    ASSERT_EQ(features.station_ids.back(), "XX.S2");
}
