#include "pickassoc/associator/gaussian_mixture.hpp"
#include "pickassoc/core/timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace pickassoc {

namespace {

constexpr double kMinWeight = 1e-10;
constexpr double kMinComponentMass = 1e-6;
constexpr double kLog2Pi = 1.8378770664093453;

double logSumExp(const Eigen::RowVectorXd& row) {
    double max_val = row.maxCoeff();
    if (!std::isfinite(max_val)) return max_val;
    return max_val + std::log((row.array() - max_val).exp().sum());
}

} // namespace

// ============================================================================
// Internal state
// ============================================================================

struct GaussianMixtureAssociator::Component {
    Eigen::VectorXd location;
    double t0;              // Seconds relative to Observations::t_ref
    double magnitude;
    Eigen::MatrixXd cov;
    double weight;
};

struct GaussianMixtureAssociator::Observations {
    Eigen::VectorXd time;           // Seconds relative to t_ref
    Eigen::VectorXd log_amp;        // Empty without amplitude
    Eigen::MatrixXd stations;       // (n, dims)
    std::vector<PhaseType> phases;
    Eigen::VectorXd weights;
    double t_ref;
    
    Eigen::Index size() const { return time.size(); }
    Eigen::VectorXd station(Eigen::Index i) const { return stations.row(i).transpose(); }
};

double AssociationResult::bic() const {
    double n = static_cast<double>(n_samples);
    return -2.0 * log_likelihood * n + static_cast<double>(n_parameters) * std::log(n);
}

// ============================================================================
// Construction
// ============================================================================

GaussianMixtureAssociator::GaussianMixtureAssociator(const AssociationConfig& config)
    : config_(config)
{
    config_.validate();
    travel_time_ = std::make_shared<HomogeneousTravelTime>(config_.vp, config_.vs);
    covariance_ = makeCovarianceModel(config_.covariance_type, config_.vp, config_.vs);
}

GaussianMixtureAssociator::GaussianMixtureAssociator(const AssociationConfig& config,
                                                     TravelTimeModelPtr travel_time,
                                                     CovarianceModelPtr covariance)
    : config_(config)
    , travel_time_(std::move(travel_time))
    , covariance_(std::move(covariance))
{
    config_.validate();
    if (!travel_time_ || !covariance_) {
        throw std::invalid_argument("GaussianMixtureAssociator: null travel time or covariance model");
    }
}

void GaussianMixtureAssociator::checkParameters(const MixtureParameters& params) const {
    const Eigen::Index k = config_.n_components;
    const Eigen::Index d = config_.nDims();
    const Eigen::Index f = config_.nFeatures();
    
    checkShape(params.weights, {k}, "weights");
    checkShape(params.centers, {k, d + 1}, "centers");
    if (config_.use_amplitude) {
        checkShape(params.magnitudes, {k}, "magnitudes");
    }
    checkShape(params.covariances, {k, f, f}, "covariances");
    
    if (!params.weights.allFinite() || params.weights.minCoeff() < 0 ||
        !(params.weights.sum() > 0)) {
        throw std::invalid_argument("The parameter 'weights' should be non-negative with a positive sum");
    }
    if (!params.centers.allFinite()) {
        throw std::invalid_argument("The parameter 'centers' contains NaN or infinity");
    }
    if (config_.use_amplitude && !params.magnitudes.allFinite()) {
        throw std::invalid_argument("The parameter 'magnitudes' contains NaN or infinity");
    }
    for (const auto& cov : params.covariances) {
        Eigen::LLT<Eigen::MatrixXd> llt(cov);
        if (!cov.allFinite() || !cov.isApprox(cov.transpose()) || llt.info() != Eigen::Success) {
            throw std::invalid_argument("The parameter 'covariances' should be symmetric, positive-definite");
        }
    }
}

AssociationResult GaussianMixtureAssociator::fit(const PickFeatures& features,
                                                 const std::optional<MixtureParameters>& initial) const {
    Eigen::VectorXd weights;
    if (features.phase_weights.cols() > 0) {
        weights = features.phase_weights.col(0);
    }
    return fit(features.data, features.locations, features.phase_types, weights, initial);
}

// ============================================================================
// EM driver
// ============================================================================

AssociationResult GaussianMixtureAssociator::fitChecked(
        const Eigen::MatrixXd& X,
        const Eigen::MatrixXd& locations,
        const std::vector<std::string>& phase_types,
        const Eigen::VectorXd& phase_weights,
        const std::optional<MixtureParameters>& initial) const {
    
    if (initial) {
        checkParameters(*initial);
    }
    
    const Eigen::Index n = X.rows();
    checkShape(locations, {n, static_cast<Eigen::Index>(config_.nDims())}, "locations");
    if (!locations.allFinite()) {
        throw std::invalid_argument("GaussianMixtureAssociator: station locations contain NaN or infinity");
    }
    if (static_cast<Eigen::Index>(phase_types.size()) != n) {
        throw std::invalid_argument("GaussianMixtureAssociator: " + std::to_string(phase_types.size()) +
                                    " phase types for " + std::to_string(n) + " picks");
    }
    
    Observations obs;
    obs.t_ref = X.col(0).minCoeff();
    obs.time = (X.col(0).array() - obs.t_ref).matrix();
    if (config_.use_amplitude) obs.log_amp = X.col(1);
    obs.stations = locations;
    
    obs.phases.reserve(phase_types.size());
    for (const auto& label : phase_types) {
        PhaseType pt = stringToPhaseType(label);
        if (pt == PhaseType::Unknown) {
            throw std::invalid_argument("GaussianMixtureAssociator: unsupported phase type '" + label + "'");
        }
        obs.phases.push_back(pt);
    }
    
    if (phase_weights.size() == 0) {
        obs.weights = Eigen::VectorXd::Ones(n);
    } else {
        checkShape(phase_weights, {n}, "phase_weights");
        if (!phase_weights.allFinite() || phase_weights.minCoeff() < 0 ||
            !(phase_weights.sum() > 0)) {
            throw std::invalid_argument("GaussianMixtureAssociator: phase weights must be "
                                        "non-negative with a positive sum");
        }
        obs.weights = phase_weights;
    }
    
    std::vector<Component> comps = initial ? fromParameters(*initial, obs) : initialize(obs);
    
    Eigen::MatrixXd resp;
    double prev = -std::numeric_limits<double>::infinity();
    double change = std::numeric_limits<double>::infinity();
    double ll = prev;
    bool converged = false;
    int iter = 1;
    
    for (; iter <= config_.max_iter; iter++) {
        ll = expectation(comps, obs, resp);
        if (config_.verbose) {
            std::cout << "GaussianMixtureAssociator: iteration " << iter
                      << ", log-likelihood " << ll << std::endl;
        }
        if (iter > 1) {
            change = ll - prev;
            if (std::abs(change) < config_.tol) {
                converged = true;
                break;
            }
        }
        prev = ll;
        maximization(comps, obs, resp);
    }
    
    if (!converged) {
        ll = expectation(comps, obs, resp);
        iter = config_.max_iter;
        std::cerr << "GaussianMixtureAssociator: did not converge after " << config_.max_iter
                  << " iterations (last change " << change
                  << "); try a larger max_iter or tol" << std::endl;
    }
    
    AssociationResult result = buildResult(comps, obs, resp);
    result.log_likelihood = ll;
    result.iterations = iter;
    result.converged = converged;
    
    if (config_.verbose) {
        std::cout << "GaussianMixtureAssociator: " << n << " picks, "
                  << comps.size() << " components, " << iter << " iterations"
                  << (converged ? "" : " (not converged)") << std::endl;
    }
    return result;
}

// ============================================================================
// Initialization
// ============================================================================

std::vector<GaussianMixtureAssociator::Component>
GaussianMixtureAssociator::initialize(const Observations& obs) const {
    const Eigen::Index n = obs.size();
    const int k = config_.n_components;
    const int f = config_.nFeatures();
    
    Eigen::VectorXd centroid = obs.stations.colwise().mean().transpose();
    for (size_t d = 0; d < config_.bounds.size(); d++) {
        centroid(d) = std::min(std::max(centroid(d), config_.bounds[d].first),
                               config_.bounds[d].second);
    }
    
    std::vector<Eigen::Index> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), Eigen::Index(0));
    std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
        return obs.time(a) < obs.time(b);
    });
    
    double span = obs.time.maxCoeff() - obs.time.minCoeff();
    double sigma_t = std::max(1.0, span / (2.0 * k));
    
    double magnitude = 0;
    if (config_.use_amplitude) {
        double sum = 0;
        for (Eigen::Index i = 0; i < n; i++) {
            double dist = (centroid - obs.station(i)).norm();
            sum += config_.amplitude.invert(obs.log_amp(i), dist);
        }
        magnitude = sum / static_cast<double>(n);
    }
    
    std::vector<Component> comps(static_cast<size_t>(k));
    for (int c = 0; c < k; c++) {
        double q = (c + 0.5) / k;
        Eigen::Index idx = order[static_cast<size_t>(std::llround(q * static_cast<double>(n - 1)))];
        
        Component& comp = comps[c];
        comp.location = centroid;
        comp.t0 = obs.time(idx) - travel_time_->travelTime(centroid, obs.station(idx), obs.phases[idx]);
        comp.magnitude = magnitude;
        comp.cov = Eigen::MatrixXd::Identity(f, f);
        comp.cov(0, 0) = sigma_t * sigma_t;
        comp.weight = 1.0 / k;
    }
    return comps;
}

std::vector<GaussianMixtureAssociator::Component>
GaussianMixtureAssociator::fromParameters(const MixtureParameters& params,
                                          const Observations& obs) const {
    const int k = config_.n_components;
    const int d = config_.nDims();
    double total = params.weights.sum();
    
    std::vector<Component> comps(static_cast<size_t>(k));
    for (int c = 0; c < k; c++) {
        Component& comp = comps[c];
        comp.location = params.centers.row(c).head(d).transpose();
        comp.t0 = params.centers(c, d) - obs.t_ref;
        comp.magnitude = config_.use_amplitude ? params.magnitudes(c) : 0.0;
        comp.cov = params.covariances[c];
        comp.weight = std::max(params.weights(c) / total, kMinWeight);
    }
    return comps;
}

// ============================================================================
// E-step
// ============================================================================

Eigen::VectorXd GaussianMixtureAssociator::sourceDistances(const Component& comp,
                                                           const Observations& obs) const {
    Eigen::VectorXd distances(obs.size());
    for (Eigen::Index i = 0; i < obs.size(); i++) {
        distances(i) = (comp.location - obs.station(i)).norm();
    }
    return distances;
}

Eigen::MatrixXd GaussianMixtureAssociator::residuals(const Component& comp,
                                                     const Observations& obs,
                                                     Eigen::VectorXd& distances) const {
    const Eigen::Index n = obs.size();
    Eigen::MatrixXd res(n, config_.nFeatures());
    distances = sourceDistances(comp, obs);
    
    for (Eigen::Index i = 0; i < n; i++) {
        Eigen::VectorXd sta = obs.station(i);
        double tt = travel_time_->travelTime(comp.location, sta, obs.phases[i]);
        res(i, 0) = obs.time(i) - (comp.t0 + tt);
        if (config_.use_amplitude) {
            res(i, 1) = obs.log_amp(i) - config_.amplitude.predict(comp.magnitude, distances(i));
        }
    }
    return res;
}

double GaussianMixtureAssociator::expectation(const std::vector<Component>& comps,
                                              const Observations& obs,
                                              Eigen::MatrixXd& resp) const {
    const Eigen::Index n = obs.size();
    const Eigen::Index k = static_cast<Eigen::Index>(comps.size());
    const double f = static_cast<double>(config_.nFeatures());
    
    Eigen::MatrixXd log_prob(n, k);
    for (Eigen::Index c = 0; c < k; c++) {
        const Component& comp = comps[c];
        
        Eigen::MatrixXd cov = comp.cov;
        Eigen::LLT<Eigen::MatrixXd> llt(cov);
        if (llt.info() != Eigen::Success) {
            CovarianceModel::ensurePositiveDefinite(cov, std::max(config_.reg_covar, 1e-12));
            llt.compute(cov);
        }
        Eigen::MatrixXd L = llt.matrixL();
        double log_det = 2.0 * L.diagonal().array().log().sum();
        
        Eigen::VectorXd dist;
        Eigen::MatrixXd res = residuals(comp, obs, dist);
        
        for (Eigen::Index i = 0; i < n; i++) {
            double s = covariance_->observationScale(dist(i), obs.phases[i]);
            Eigen::VectorXd r = res.row(i).transpose();
            r(0) /= std::sqrt(s);
            Eigen::VectorXd y = llt.matrixL().solve(r);
            log_prob(i, c) = std::log(comp.weight)
                           - 0.5 * (f * kLog2Pi + log_det + std::log(s) + y.squaredNorm());
        }
    }
    
    resp.resize(n, k);
    Eigen::VectorXd log_norm(n);
    for (Eigen::Index i = 0; i < n; i++) {
        log_norm(i) = logSumExp(log_prob.row(i));
        resp.row(i) = (log_prob.row(i).array() - log_norm(i)).exp().matrix();
    }
    return log_norm.mean();
}

// ============================================================================
// M-step
// ============================================================================

void GaussianMixtureAssociator::maximization(std::vector<Component>& comps,
                                             const Observations& obs,
                                             const Eigen::MatrixXd& resp) const {
    const Eigen::Index k = static_cast<Eigen::Index>(comps.size());
    
    Eigen::MatrixXd R = (resp.array().colwise() * obs.weights.array()).matrix();
    Eigen::VectorXd nk = R.colwise().sum().transpose();
    nk.array() += 10 * std::numeric_limits<double>::epsilon();
    
    Eigen::VectorXd pi = (nk / nk.sum()).cwiseMax(kMinWeight);
    pi /= pi.sum();
    
    for (Eigen::Index c = 0; c < k; c++) {
        Component& comp = comps[c];
        comp.weight = pi(c);
        if (nk(c) < kMinComponentMass) continue;
        
        const Component previous = comp;
        Eigen::VectorXd w = R.col(c);
        
        updateLocation(comp, obs, w);
        
        if (config_.use_amplitude) {
            Eigen::VectorXd dist = sourceDistances(comp, obs);
            double num = 0;
            for (Eigen::Index i = 0; i < obs.size(); i++) {
                num += w(i) * config_.amplitude.invert(obs.log_amp(i), dist(i));
            }
            comp.magnitude = num / nk(c);
        }
        
        Eigen::VectorXd dist;
        Eigen::MatrixXd res = residuals(comp, obs, dist);
        Eigen::VectorXd scales(obs.size());
        for (Eigen::Index i = 0; i < obs.size(); i++) {
            scales(i) = covariance_->observationScale(dist(i), obs.phases[i]);
        }
        comp.cov = covariance_->estimate(res, w, scales, config_.reg_covar);
        
        if (!comp.location.allFinite() || !std::isfinite(comp.t0) ||
            !std::isfinite(comp.magnitude) || !comp.cov.allFinite()) {
            std::cerr << "GaussianMixtureAssociator: component " << c
                      << " update not finite, keeping previous parameters" << std::endl;
            comp = previous;
            comp.weight = pi(c);
        }
    }
}

void GaussianMixtureAssociator::updateLocation(Component& comp, const Observations& obs,
                                               const Eigen::VectorXd& w) const {
    const Eigen::Index n = obs.size();
    const Eigen::Index d = comp.location.size();
    const Eigen::Index m = d + 1;
    
    double var_t = std::max(comp.cov(0, 0), 1e-12);
    
    // Weighted time residual cost at (location, t0)
    auto cost = [&](const Eigen::VectorXd& loc, double t0, const Eigen::VectorXd& W) {
        double sum = 0;
        for (Eigen::Index i = 0; i < n; i++) {
            double r = obs.time(i) - t0 - travel_time_->travelTime(loc, obs.station(i), obs.phases[i]);
            sum += W(i) * r * r;
        }
        return sum;
    };
    
    for (int step = 0; step < config_.gauss_newton_steps; step++) {
        Eigen::MatrixXd G(n, m);
        Eigen::VectorXd r(n);
        Eigen::VectorXd W(n);
        
        for (Eigen::Index i = 0; i < n; i++) {
            Eigen::VectorXd sta = obs.station(i);
            double dist = (comp.location - sta).norm();
            double s = covariance_->observationScale(dist, obs.phases[i]);
            
            G.row(i).head(d) = travel_time_->gradient(comp.location, sta, obs.phases[i]).transpose();
            G(i, d) = 1.0;
            r(i) = obs.time(i) - comp.t0 - travel_time_->travelTime(comp.location, sta, obs.phases[i]);
            W(i) = w(i) / (s * var_t);
        }
        
        // (G'WG + lambda*I) dm = G'Wr
        Eigen::MatrixXd GtWG = G.transpose() * W.asDiagonal() * G;
        double lambda = 1e-3 * GtWG.diagonal().mean() + 1e-9;
        GtWG.diagonal().array() += lambda;
        Eigen::VectorXd dm = GtWG.ldlt().solve(G.transpose() * W.asDiagonal() * r);
        if (!dm.allFinite()) break;
        
        double current = cost(comp.location, comp.t0, W);
        double scale = 1.0;
        bool improved = false;
        Eigen::VectorXd loc;
        double t0 = comp.t0;
        
        for (int halving = 0; halving < 6; halving++, scale *= 0.5) {
            loc = comp.location + scale * dm.head(d);
            for (size_t b = 0; b < config_.bounds.size(); b++) {
                loc(b) = std::min(std::max(loc(b), config_.bounds[b].first), config_.bounds[b].second);
            }
            t0 = comp.t0 + scale * dm(d);
            if (cost(loc, t0, W) <= current) {
                improved = true;
                break;
            }
        }
        if (!improved) break;
        
        comp.location = loc;
        comp.t0 = t0;
        if (scale * dm.norm() < 1e-6) break;
    }
}

// ============================================================================
// Result
// ============================================================================

AssociationResult GaussianMixtureAssociator::buildResult(const std::vector<Component>& comps,
                                                         const Observations& obs,
                                                         const Eigen::MatrixXd& resp) const {
    const Eigen::Index n = obs.size();
    const Eigen::Index k = static_cast<Eigen::Index>(comps.size());
    const Eigen::Index d = config_.nDims();
    const Eigen::Index f = config_.nFeatures();
    
    AssociationResult result;
    result.responsibilities = resp;
    result.n_samples = static_cast<size_t>(n);
    
    result.assignments.resize(static_cast<size_t>(n));
    for (Eigen::Index i = 0; i < n; i++) {
        Eigen::Index best;
        resp.row(i).maxCoeff(&best);
        result.assignments[i] = static_cast<int>(best);
    }
    
    MixtureParameters& params = result.parameters;
    params.weights.resize(k);
    params.centers.resize(k, d + 1);
    params.magnitudes.resize(k);
    
    for (Eigen::Index c = 0; c < k; c++) {
        const Component& comp = comps[c];
        
        EventHypothesis ev;
        ev.location = comp.location;
        ev.origin_seconds = comp.t0 + obs.t_ref;
        ev.origin_time = fromSeconds(ev.origin_seconds);
        ev.magnitude = config_.use_amplitude ? comp.magnitude
                                             : std::numeric_limits<double>::quiet_NaN();
        ev.covariance = comp.cov;
        ev.weight = comp.weight;
        ev.pick_count = static_cast<size_t>(
            std::count(result.assignments.begin(), result.assignments.end(), static_cast<int>(c)));
        
        Eigen::VectorXd dist;
        Eigen::MatrixXd res = residuals(comp, obs, dist);
        double mass = resp.col(c).sum();
        ev.time_rms = mass > 0
            ? std::sqrt((resp.col(c).array() * res.col(0).array().square()).sum() / mass)
            : 0.0;
        
        result.events.push_back(ev);
        
        params.weights(c) = comp.weight;
        params.centers.row(c).head(d) = comp.location.transpose();
        params.centers(c, d) = ev.origin_seconds;
        params.magnitudes(c) = comp.magnitude;
        params.covariances.push_back(comp.cov);
    }
    
    Eigen::Index cov_params = covariance_->name() == "diag" ? f : f * (f + 1) / 2;
    Eigen::Index per_component = (d + 1) + (config_.use_amplitude ? 1 : 0) + cov_params;
    result.n_parameters = static_cast<size_t>(k * per_component + (k - 1));
    return result;
}

} // namespace pickassoc
