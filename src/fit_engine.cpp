#include "zscan/zscan.hpp"
#include <Eigen/Dense>
#include <glog/logging.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace zscan {

FitError::FitError(const std::string& message, FitResult partial)
    : Error(message), partial_(std::move(partial)) {}

namespace analysis {

namespace {

// kOffset is the per-curve baseline offset, local to one stage
enum Param { kDeltaPhi0 = 0, kQ0, kZ0, kRayleighRange, kOffset, kParamCount };

using Vector = std::array<double, kParamCount>;
using ModelFunction = ModelGradient (*)(double, const ZscanParameters&);

// Peak-valley transmittance per unit phase for a small aperture
constexpr double kPeakValleyPerPhase = 0.406;
// Peak-valley separation in Rayleigh ranges
constexpr double kPeakValleySeparation = 1.7;
// Largest series argument at focus for an initial guess
constexpr double kMaxInitialSeriesArgument = 0.95;

ZscanParameters toParameters(const Vector& p) {
    return ZscanParameters{p[kDeltaPhi0], p[kQ0], p[kZ0], p[kRayleighRange]};
}

Vector toVector(const ZscanParameters& params) {
    return Vector{params.delta_phi0, params.q0, params.z0, params.rayleigh_range, 0.0};
}

double gradientComponent(const ModelGradient& g, int param) {
    switch (param) {
        case kDeltaPhi0: return g.d_delta_phi0;
        case kQ0: return g.d_q0;
        case kZ0: return g.d_z0;
        case kRayleighRange: return g.d_rayleigh_range;
        default: return 1.0;
    }
}

/// Gaussian prior on one parameter, appended as a pseudo-observation
struct Prior {
    int param;
    double center;
    double sigma;
};

struct Stage {
    const char* name;
    ModelFunction model;
    std::vector<CurvePoint> points;
    std::array<bool, kParamCount> free;
    std::vector<Prior> priors;
};

enum class StageFailure { None, Divergence, IllConditioned };

struct StageOutcome {
    Vector params;
    Vector std_errors;
    double rss = 0.0;
    int iterations = 0;
    bool converged = false;
    bool q0_out_of_range = false;
    StageFailure failure = StageFailure::None;
    std::string message;
};

bool withinDomain(const Vector& p, const FitConfig& config) {
    return withinOpenApertureDomain(p[kQ0]) && p[kRayleighRange] > 0.0 &&
           std::abs(p[kOffset]) <= config.max_baseline_offset;
}

class LeastSquaresProblem {
public:
    explicit LeastSquaresProblem(const Stage& stage) : stage_(stage) {
        for (int j = 0; j < kParamCount; ++j) {
            if (stage.free[j]) {
                free_.push_back(j);
            }
        }
        rows_ = static_cast<int>(stage.points.size() + stage.priors.size());
    }

    int rows() const { return rows_; }
    int freeCount() const { return static_cast<int>(free_.size()); }
    const std::vector<int>& freeParams() const { return free_; }

    /// Fills residuals and Jacobian, returns the data RSS (priors excluded)
    double evaluate(const Vector& p, Eigen::VectorXd& r, Eigen::MatrixXd& J) const {
        r.resize(rows_);
        J.resize(rows_, freeCount());
        const ZscanParameters params = toParameters(p);
        double rss = 0.0;

        int row = 0;
        for (const auto& point : stage_.points) {
            const ModelGradient g = stage_.model(point.position, params);
            r(row) = point.transmittance - g.value - p[kOffset];
            rss += r(row) * r(row);
            for (int k = 0; k < freeCount(); ++k) {
                J(row, k) = gradientComponent(g, free_[k]);
            }
            ++row;
        }
        for (const auto& prior : stage_.priors) {
            r(row) = (prior.center - p[prior.param]) / prior.sigma;
            for (int k = 0; k < freeCount(); ++k) {
                J(row, k) = free_[k] == prior.param ? 1.0 / prior.sigma : 0.0;
            }
            ++row;
        }
        return rss;
    }

private:
    const Stage& stage_;
    std::vector<int> free_;
    int rows_;
};

StageOutcome runStage(const Stage& stage, const Vector& initial, const FitConfig& config) {
    StageOutcome outcome;
    outcome.params = initial;
    outcome.std_errors.fill(0.0);

    LeastSquaresProblem problem(stage);
    const int k = problem.freeCount();
    const auto& free = problem.freeParams();

    Eigen::VectorXd r;
    Eigen::MatrixXd J;
    Vector p = initial;
    double rss = problem.evaluate(p, r, J);
    double cost = r.squaredNorm();

    if (!std::isfinite(cost)) {
        outcome.failure = StageFailure::Divergence;
        outcome.message = std::string(stage.name) + ": model undefined at the initial guess";
        outcome.rss = rss;
        return outcome;
    }
    if (problem.rows() <= k) {
        outcome.failure = StageFailure::IllConditioned;
        outcome.message = std::string(stage.name) + ": " + std::to_string(stage.points.size()) +
                          " points for " + std::to_string(k) + " free parameters";
        outcome.rss = rss;
        return outcome;
    }

    double lambda = config.lambda_init;
    bool converged = k == 0 || cost == 0.0;
    int iter = 0;

    // Levenberg-Marquardt iterations
    while (!converged && iter < config.max_iterations) {
        ++iter;

        Eigen::MatrixXd hessian = J.transpose() * J;
        Eigen::VectorXd gradient = J.transpose() * r;

        // Add damping term
        for (int i = 0; i < k; ++i) {
            hessian(i, i) *= (1.0 + lambda);
        }

        Eigen::VectorXd dp = hessian.ldlt().solve(gradient);
        if (!dp.allFinite()) {
            lambda *= config.lambda_factor;
            continue;
        }

        Vector p_new = p;
        double p_norm = 0.0;
        for (int i = 0; i < k; ++i) {
            p_new[free[i]] += dp(i);
            p_norm += p[free[i]] * p[free[i]];
        }
        const bool small_step = dp.norm() <= config.step_tolerance * (std::sqrt(p_norm) + config.step_tolerance);

        // Steps leaving the model domain are rejected, never clamped
        if (!withinDomain(p_new, config)) {
            lambda *= config.lambda_factor;
            converged = small_step;
            continue;
        }

        Eigen::VectorXd r_new;
        Eigen::MatrixXd J_new;
        const double rss_new = problem.evaluate(p_new, r_new, J_new);
        const double cost_new = r_new.squaredNorm();

        if (std::isfinite(cost_new) && cost_new < cost) {
            const double improvement = cost - cost_new;
            converged = cost_new == 0.0 || improvement <= config.tolerance * cost;
            p = p_new;
            r = std::move(r_new);
            J = std::move(J_new);
            rss = rss_new;
            cost = cost_new;
            lambda /= config.lambda_factor;
        } else {
            lambda *= config.lambda_factor;
            converged = small_step;
        }

        VLOG(2) << stage.name << " iteration " << iter << ": rss=" << rss << " lambda=" << lambda;
    }

    outcome.params = p;
    outcome.rss = rss;
    outcome.iterations = iter;
    outcome.converged = converged;

    if (!converged) {
        outcome.std_errors.fill(std::numeric_limits<double>::quiet_NaN());
        outcome.failure = StageFailure::Divergence;
        outcome.message = std::string(stage.name) + ": no convergence within " +
                          std::to_string(config.max_iterations) + " iterations (rss " + std::to_string(rss) + ")";
        return outcome;
    }
    if (k == 0) {
        return outcome;
    }

    // Covariance from the Jacobian at the solution
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(J, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& s = svd.singularValues();
    if (s.size() < k || s(0) == 0.0 || s(k - 1) <= config.singular_tolerance * s(0)) {
        outcome.std_errors.fill(std::numeric_limits<double>::quiet_NaN());
        outcome.failure = StageFailure::IllConditioned;
        outcome.message = std::string(stage.name) + ": singular Jacobian, parameter covariance undefined";
        return outcome;
    }

    const double variance = cost / (problem.rows() - k);
    const Eigen::MatrixXd& V = svd.matrixV();
    for (int i = 0; i < k; ++i) {
        double c = 0.0;
        for (int j = 0; j < k; ++j) {
            c += V(i, j) * V(i, j) / (s(j) * s(j));
        }
        outcome.std_errors[free[i]] = std::sqrt(variance * c);
    }

    // Optimum for q0 beyond the model domain: the undamped step leaves it
    for (int i = 0; i < k; ++i) {
        if (free[i] == kQ0) {
            const Eigen::VectorXd gauss_newton = svd.solve(r);
            outcome.q0_out_of_range = !withinOpenApertureDomain(p[kQ0] + gauss_newton(i));
        }
    }

    return outcome;
}

// Centered moving average over the defined points
std::vector<double> smooth(const std::vector<CurvePoint>& points, int window) {
    const int n = static_cast<int>(points.size());
    const int half = std::max(0, window / 2);
    std::vector<double> out(n);
    for (int i = 0; i < n; ++i) {
        const int lo = std::max(0, i - half);
        const int hi = std::min(n - 1, i + half);
        double sum = 0.0;
        for (int j = lo; j <= hi; ++j) {
            sum += points[j].transmittance;
        }
        out[i] = sum / (hi - lo + 1);
    }
    return out;
}

std::size_t farthestFromUnity(const std::vector<double>& values) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (std::abs(values[i] - 1.0) > std::abs(values[best] - 1.0)) {
            best = i;
        }
    }
    return best;
}

// Points inside the configured position window
std::vector<CurvePoint> fitWindow(const std::vector<CurvePoint>& points, const FitConfig& config) {
    std::vector<CurvePoint> kept;
    kept.reserve(points.size());
    for (const auto& point : points) {
        if (config.window_start_mm && point.position < *config.window_start_mm) {
            continue;
        }
        if (config.window_end_mm && point.position > *config.window_end_mm) {
            continue;
        }
        kept.push_back(point);
    }
    return kept;
}

// q0 whose on-axis open-aperture transmittance equals the given value, by bisection
double invertOpenApertureDepth(double transmittance) {
    const auto focal = [](double q0) { return openApertureTransmittance(0.0, {0.0, q0, 0.0, 1.0}); };
    double lo = -kMaxInitialSeriesArgument / kAbsorptionScale;
    double hi = kMaxInitialSeriesArgument / kAbsorptionScale;
    if (transmittance >= focal(lo)) {
        return lo;
    }
    if (transmittance <= focal(hi)) {
        return hi;
    }
    for (int i = 0; i < 100; ++i) {
        const double mid = 0.5 * (lo + hi);
        if (focal(mid) > transmittance) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

double openApertureSignal(const std::vector<CurvePoint>& points, int window) {
    if (points.empty()) {
        return 0.0;
    }
    const auto smoothed = smooth(points, window);
    return std::abs(smoothed[farthestFromUnity(smoothed)] - 1.0);
}

void applyStage(FitResult& result, const StageOutcome& outcome, const Stage& stage, StageSummary& summary) {
    ParameterEstimate* estimates[kOffset] = {
        &result.delta_phi0, &result.q0, &result.z0, &result.rayleigh_range
    };
    for (int j = 0; j < kOffset; ++j) {
        if (stage.free[j]) {
            estimates[j]->value = outcome.params[j];
            estimates[j]->std_error = outcome.std_errors[j];
            estimates[j]->fixed = false;
        }
    }
    summary.baseline_offset = {outcome.params[kOffset], stage.free[kOffset] ? outcome.std_errors[kOffset] : 0.0,
                               !stage.free[kOffset]};
    summary.rss = outcome.rss;
    summary.iterations = outcome.iterations;
    summary.converged = outcome.converged;
    summary.points = stage.points.size();
    summary.focal_position = outcome.params[kZ0];
    summary.rayleigh_range = outcome.params[kRayleighRange];

    result.rss = result.open_aperture.rss + result.closed_aperture.rss;
    result.iterations = result.open_aperture.iterations + result.closed_aperture.iterations;
    result.q0_out_of_range = result.q0_out_of_range || outcome.q0_out_of_range;
}

void throwOnFailure(const StageOutcome& outcome, const FitResult& partial) {
    switch (outcome.failure) {
        case StageFailure::None:
            return;
        case StageFailure::Divergence:
            throw FitDivergenceError(outcome.message, partial);
        case StageFailure::IllConditioned:
            throw IllConditionedError(outcome.message, partial);
    }
}

} // namespace

ZscanParameters estimateInitialGuess(const CurvePair& curves, double wavelength_nm, const FitConfig& config) {
    const auto open = fitWindow(curves.open_aperture.validPoints(), config);
    const auto closed = fitWindow(curves.closed_aperture.validPoints(), config);
    if (open.empty() || closed.empty()) {
        throw std::invalid_argument("Normalized curves have no defined points inside the fit window");
    }

    ZscanParameters guess{0.0, 0.0, 0.0, 0.0};

    // Open aperture: z0 at the extremum, q0 from the depth there
    const auto open_smoothed = smooth(open, config.smoothing_window);
    const std::size_t open_extremum = farthestFromUnity(open_smoothed);
    const bool open_signal = std::abs(open_smoothed[open_extremum] - 1.0) >= config.open_aperture_signal_threshold;
    if (open_signal) {
        guess.q0 = invertOpenApertureDepth(open_smoothed[open_extremum]);
    }

    // Closed aperture: peak-valley difference and separation
    const auto closed_smoothed = smooth(closed, config.smoothing_window);
    const auto minmax = std::minmax_element(closed_smoothed.begin(), closed_smoothed.end());
    const std::size_t valley = static_cast<std::size_t>(minmax.first - closed_smoothed.begin());
    const std::size_t peak = static_cast<std::size_t>(minmax.second - closed_smoothed.begin());
    const double delta_tpv = *minmax.second - *minmax.first;
    const double valley_pos = closed[valley].position;
    const double peak_pos = closed[peak].position;
    guess.delta_phi0 = (valley_pos < peak_pos ? 1.0 : -1.0) * delta_tpv / kPeakValleyPerPhase;

    guess.z0 = open_signal ? open[open_extremum].position : 0.5 * (valley_pos + peak_pos);

    const double span = std::abs(closed.back().position - closed.front().position);
    if (config.rayleigh_range_mm && *config.rayleigh_range_mm > 0.0) {
        guess.rayleigh_range = *config.rayleigh_range_mm;
    } else if (config.beam_waist_um && *config.beam_waist_um > 0.0 && wavelength_nm > 0.0) {
        const double w0 = *config.beam_waist_um * 1e-6;
        guess.rayleigh_range = M_PI * w0 * w0 / (wavelength_nm * 1e-9) * 1e3;
    } else if (peak != valley) {
        guess.rayleigh_range = std::abs(peak_pos - valley_pos) / kPeakValleySeparation;
    } else {
        guess.rayleigh_range = span / 10.0;
    }
    if (!(guess.rayleigh_range > 0.0)) {
        guess.rayleigh_range = span > 0.0 ? span / 10.0 : 1.0;
    }

    return guess;
}

FitResult fitCurves(const CurvePair& curves, const ZscanParameters& initial, const FitConfig& config) {
    const Vector start = toVector(initial);
    if (!withinDomain(start, config)) {
        throw std::invalid_argument("Initial guess outside the model domain (|2^(3/2) q0| < 1, zR > 0)");
    }

    FitResult result;
    result.delta_phi0 = {initial.delta_phi0, 0.0, true};
    result.q0 = {initial.q0, 0.0, true};
    result.z0 = {initial.z0, 0.0, true};
    result.rayleigh_range = {initial.rayleigh_range, 0.0, true};

    // Stage 1: open aperture resolves the shared focal geometry
    Stage open{"open-aperture stage", &openApertureGradient, fitWindow(curves.open_aperture.validPoints(), config),
               {}, {}};
    const bool geometry_from_open =
        openApertureSignal(open.points, config.smoothing_window) >= config.open_aperture_signal_threshold;
    open.free[kQ0] = true;
    open.free[kZ0] = geometry_from_open;
    open.free[kRayleighRange] = geometry_from_open && config.fit_rayleigh_range;
    open.free[kOffset] = config.fit_baseline_offset;
    result.geometry_source = geometry_from_open ? GeometrySource::OpenAperture : GeometrySource::ClosedAperture;

    const StageOutcome open_outcome = runStage(open, start, config);
    applyStage(result, open_outcome, open, result.open_aperture);
    VLOG(1) << open.name << ": rss=" << open_outcome.rss << " iterations=" << open_outcome.iterations
            << " q0=" << open_outcome.params[kQ0] << " z0=" << open_outcome.params[kZ0];
    throwOnFailure(open_outcome, result);

    // Stage 2: closed aperture under the resolved geometry, q0 held
    Stage closed{"closed-aperture stage", &closedApertureGradient,
                 fitWindow(curves.closed_aperture.validPoints(), config), {}, {}};
    closed.free[kDeltaPhi0] = true;
    closed.free[kOffset] = config.fit_baseline_offset;
    if (!geometry_from_open) {
        closed.free[kZ0] = true;
        closed.free[kRayleighRange] = config.fit_rayleigh_range;
    } else if (config.focal_constraint == FocalConstraint::Loose) {
        const double zr = open_outcome.params[kRayleighRange];
        const double floor = config.loose_prior_floor * zr;
        closed.free[kZ0] = true;
        closed.priors.push_back({kZ0, open_outcome.params[kZ0], std::max(open_outcome.std_errors[kZ0], floor)});
        if (open.free[kRayleighRange]) {
            closed.free[kRayleighRange] = true;
            closed.priors.push_back({kRayleighRange, zr,
                                     std::max(open_outcome.std_errors[kRayleighRange], floor)});
        }
    }

    Vector closed_start = open_outcome.params;
    closed_start[kOffset] = 0.0;
    const StageOutcome closed_outcome = runStage(closed, closed_start, config);
    applyStage(result, closed_outcome, closed, result.closed_aperture);
    result.converged = result.open_aperture.converged && result.closed_aperture.converged;
    VLOG(1) << closed.name << ": rss=" << closed_outcome.rss << " iterations=" << closed_outcome.iterations
            << " delta_phi0=" << closed_outcome.params[kDeltaPhi0] << " z0=" << closed_outcome.params[kZ0];
    throwOnFailure(closed_outcome, result);

    return result;
}

} // namespace analysis

} // namespace zscan
