#include "zscan/config.hpp"
#include <cmath>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace zscan {

namespace {

std::optional<double> optionalNumber(const json& j, const char* key, const std::optional<double>& fallback) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (it->is_null()) {
        return std::nullopt;
    }
    return it->get<double>();
}

FocalConstraint focalConstraintFromString(const std::string& name) {
    if (name == "fixed") {
        return FocalConstraint::Fixed;
    }
    if (name == "loose") {
        return FocalConstraint::Loose;
    }
    throw ConfigError("Unknown focal constraint '" + name + "', expected 'fixed' or 'loose'");
}

const char* toString(FocalConstraint constraint) {
    return constraint == FocalConstraint::Loose ? "loose" : "fixed";
}

const char* toString(GeometrySource source) {
    return source == GeometrySource::ClosedAperture ? "closed_aperture" : "open_aperture";
}

// NaN and infinities have no JSON form
json number(double value) {
    return std::isfinite(value) ? json(value) : json(nullptr);
}

} // namespace

void to_json(json& j, const NormalizationConfig& config) {
    j = json{
        {"baseline_fraction", config.baseline_fraction},
        {"max_zero_reference_fraction", config.max_zero_reference_fraction},
        {"reference_floor", config.reference_floor},
        {"empty_noise_threshold", config.empty_noise_threshold}
    };
}

void from_json(const json& j, NormalizationConfig& config) {
    config.baseline_fraction = j.value("baseline_fraction", config.baseline_fraction);
    config.max_zero_reference_fraction = j.value("max_zero_reference_fraction", config.max_zero_reference_fraction);
    config.reference_floor = j.value("reference_floor", config.reference_floor);
    config.empty_noise_threshold = j.value("empty_noise_threshold", config.empty_noise_threshold);
}

void to_json(json& j, const FitConfig& config) {
    j = json{
        {"max_iterations", config.max_iterations},
        {"tolerance", config.tolerance},
        {"step_tolerance", config.step_tolerance},
        {"lambda_init", config.lambda_init},
        {"lambda_factor", config.lambda_factor},
        {"singular_tolerance", config.singular_tolerance},
        {"focal_constraint", toString(config.focal_constraint)},
        {"loose_prior_floor", config.loose_prior_floor},
        {"fit_rayleigh_range", config.fit_rayleigh_range},
        {"rayleigh_range_mm", config.rayleigh_range_mm ? json(*config.rayleigh_range_mm) : json(nullptr)},
        {"beam_waist_um", config.beam_waist_um ? json(*config.beam_waist_um) : json(nullptr)},
        {"open_aperture_signal_threshold", config.open_aperture_signal_threshold},
        {"smoothing_window", config.smoothing_window},
        {"fit_baseline_offset", config.fit_baseline_offset},
        {"max_baseline_offset", config.max_baseline_offset},
        {"window_start_mm", config.window_start_mm ? json(*config.window_start_mm) : json(nullptr)},
        {"window_end_mm", config.window_end_mm ? json(*config.window_end_mm) : json(nullptr)}
    };
}

void from_json(const json& j, FitConfig& config) {
    config.max_iterations = j.value("max_iterations", config.max_iterations);
    config.tolerance = j.value("tolerance", config.tolerance);
    config.step_tolerance = j.value("step_tolerance", config.step_tolerance);
    config.lambda_init = j.value("lambda_init", config.lambda_init);
    config.lambda_factor = j.value("lambda_factor", config.lambda_factor);
    config.singular_tolerance = j.value("singular_tolerance", config.singular_tolerance);
    if (j.contains("focal_constraint")) {
        config.focal_constraint = focalConstraintFromString(j.at("focal_constraint").get<std::string>());
    }
    config.loose_prior_floor = j.value("loose_prior_floor", config.loose_prior_floor);
    config.fit_rayleigh_range = j.value("fit_rayleigh_range", config.fit_rayleigh_range);
    config.rayleigh_range_mm = optionalNumber(j, "rayleigh_range_mm", config.rayleigh_range_mm);
    config.beam_waist_um = optionalNumber(j, "beam_waist_um", config.beam_waist_um);
    config.open_aperture_signal_threshold =
        j.value("open_aperture_signal_threshold", config.open_aperture_signal_threshold);
    config.smoothing_window = j.value("smoothing_window", config.smoothing_window);
    config.fit_baseline_offset = j.value("fit_baseline_offset", config.fit_baseline_offset);
    config.max_baseline_offset = j.value("max_baseline_offset", config.max_baseline_offset);
    config.window_start_mm = optionalNumber(j, "window_start_mm", config.window_start_mm);
    config.window_end_mm = optionalNumber(j, "window_end_mm", config.window_end_mm);
}

void to_json(json& j, const BatchConfig& config) {
    j = json{
        {"max_relative_std_error", config.max_relative_std_error},
        {"relative_error_floor", config.relative_error_floor},
        {"threads", config.threads}
    };
}

void from_json(const json& j, BatchConfig& config) {
    config.max_relative_std_error = j.value("max_relative_std_error", config.max_relative_std_error);
    config.relative_error_floor = j.value("relative_error_floor", config.relative_error_floor);
    config.threads = j.value("threads", config.threads);
}

void to_json(json& j, const PhysicalConstants& constants) {
    j = json{
        {"sample_length_m", constants.sample_length_m},
        {"linear_transmittance", constants.linear_transmittance},
        {"peak_irradiance", constants.peak_irradiance},
        {"wavelength_m", constants.wavelength_m}
    };
}

void from_json(const json& j, PhysicalConstants& constants) {
    constants.sample_length_m = j.value("sample_length_m", constants.sample_length_m);
    constants.linear_transmittance = j.value("linear_transmittance", constants.linear_transmittance);
    constants.peak_irradiance = j.value("peak_irradiance", constants.peak_irradiance);
    constants.wavelength_m = j.value("wavelength_m", constants.wavelength_m);
}

void to_json(json& j, const RunConfiguration& config) {
    j = json{
        {"constants", config.constants},
        {"normalization", config.analysis.normalization},
        {"fit", config.analysis.fit},
        {"batch", config.analysis.batch}
    };
}

void from_json(const json& j, RunConfiguration& config) {
    if (!j.is_object()) {
        throw ConfigError("Run configuration must be a JSON object");
    }
    if (j.contains("constants")) {
        j.at("constants").get_to(config.constants);
    }
    if (j.contains("normalization")) {
        j.at("normalization").get_to(config.analysis.normalization);
    }
    if (j.contains("fit")) {
        j.at("fit").get_to(config.analysis.fit);
    }
    if (j.contains("batch")) {
        j.at("batch").get_to(config.analysis.batch);
    }
    analysis::validateConfig(config.analysis);
}

namespace analysis {

void validateConfig(const AnalysisConfig& config) {
    const NormalizationConfig& normalization = config.normalization;
    if (!(normalization.baseline_fraction > 0.0 && normalization.baseline_fraction <= 0.5)) {
        throw ConfigError("normalization.baseline_fraction must be in (0, 0.5]");
    }
    if (!(normalization.max_zero_reference_fraction >= 0.0 && normalization.max_zero_reference_fraction <= 1.0)) {
        throw ConfigError("normalization.max_zero_reference_fraction must be in [0, 1]");
    }
    if (!(normalization.reference_floor >= 0.0) || !(normalization.empty_noise_threshold >= 0.0)) {
        throw ConfigError("normalization thresholds must not be negative");
    }

    const FitConfig& fit = config.fit;
    if (fit.max_iterations <= 0) {
        throw ConfigError("fit.max_iterations must be positive");
    }
    if (!(fit.lambda_init > 0.0)) {
        throw ConfigError("fit.lambda_init must be positive");
    }
    if (!(fit.lambda_factor > 1.0)) {
        throw ConfigError("fit.lambda_factor must be greater than 1");
    }
    if (!(fit.tolerance >= 0.0) || !(fit.step_tolerance >= 0.0) || !(fit.singular_tolerance >= 0.0)) {
        throw ConfigError("fit tolerances must not be negative");
    }
    if (fit.smoothing_window < 1) {
        throw ConfigError("fit.smoothing_window must be at least 1");
    }
    if (!(fit.max_baseline_offset > 0.0)) {
        throw ConfigError("fit.max_baseline_offset must be positive");
    }
    if (fit.window_start_mm && fit.window_end_mm && !(*fit.window_start_mm < *fit.window_end_mm)) {
        throw ConfigError("fit.window_start_mm must be below fit.window_end_mm");
    }

    if (config.batch.threads < 0) {
        throw ConfigError("batch.threads must not be negative");
    }
    if (!(config.batch.max_relative_std_error > 0.0)) {
        throw ConfigError("batch.max_relative_std_error must be positive");
    }
}

} // namespace analysis

RunConfiguration parseRunConfiguration(const std::string& text) {
    try {
        return json::parse(text).get<RunConfiguration>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid run configuration: ") + e.what());
    }
}

RunConfiguration loadRunConfiguration(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Could not open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseRunConfiguration(buffer.str());
}

void to_json(json& j, const ParameterEstimate& estimate) {
    j = json{
        {"value", number(estimate.value)},
        {"std_error", number(estimate.std_error)},
        {"fixed", estimate.fixed}
    };
}

void to_json(json& j, const StageSummary& summary) {
    j = json{
        {"rss", number(summary.rss)},
        {"iterations", summary.iterations},
        {"converged", summary.converged},
        {"points", summary.points},
        {"focal_position", number(summary.focal_position)},
        {"rayleigh_range", number(summary.rayleigh_range)},
        {"baseline_offset", summary.baseline_offset}
    };
}

void to_json(json& j, const DerivedQuantities& derived) {
    j = json{
        {"n2", number(derived.n2)},
        {"n2_error", number(derived.n2_error)},
        {"beta", number(derived.beta)},
        {"beta_error", number(derived.beta_error)},
        {"effective_length", number(derived.effective_length)}
    };
}

void to_json(json& j, const FitResult& result) {
    j = json{
        {"delta_phi0", result.delta_phi0},
        {"q0", result.q0},
        {"z0", result.z0},
        {"rayleigh_range", result.rayleigh_range},
        {"rss", number(result.rss)},
        {"iterations", result.iterations},
        {"converged", result.converged},
        {"q0_out_of_range", result.q0_out_of_range},
        {"geometry_source", toString(result.geometry_source)},
        {"open_aperture", result.open_aperture},
        {"closed_aperture", result.closed_aperture}
    };
    if (result.derived) {
        j["derived"] = *result.derived;
    }
}

void to_json(json& j, const BatchResult& batch) {
    json results = json::array();
    for (const auto& [key, entry] : batch.results) {
        results.push_back({
            {"code", key.code},
            {"concentration", key.concentration},
            {"wavelength_nm", key.wavelength_nm},
            {"source", entry.source},
            {"reliable", entry.reliable},
            {"reasons", entry.reasons},
            {"result", entry.result}
        });
    }

    json errors = json::array();
    for (const auto& error : batch.errors) {
        errors.push_back({
            {"source", error.source},
            {"kind", toString(error.kind)},
            {"message", error.message}
        });
    }

    j = json{
        {"results", results},
        {"errors", errors},
        {"cancelled", batch.cancelled}
    };
}

} // namespace zscan
