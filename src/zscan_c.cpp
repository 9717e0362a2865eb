#include "zscan/zscan.h"
#include "zscan/zscan.hpp"
#include <new>
#include <string>

namespace {

zscan::AnalysisConfig toAnalysisConfig(const ZscanConfig& config) {
    zscan::AnalysisConfig analysis;
    if (config.rayleigh_range_mm > 0.0) {
        analysis.fit.rayleigh_range_mm = config.rayleigh_range_mm;
    }
    analysis.fit.focal_constraint =
        config.loose_focal_constraint ? zscan::FocalConstraint::Loose : zscan::FocalConstraint::Fixed;
    if (config.max_iterations > 0) {
        analysis.fit.max_iterations = config.max_iterations;
    }
    return analysis;
}

zscan::PhysicalConstants toConstants(const ZscanConfig& config) {
    zscan::PhysicalConstants constants;
    constants.sample_length_m = config.sample_length_m;
    constants.linear_transmittance = config.linear_transmittance;
    constants.peak_irradiance = config.peak_irradiance;
    constants.wavelength_m = config.wavelength_m;
    return constants;
}

void copyResult(const zscan::FitResult& fit, ZscanFitResult* result) {
    result->delta_phi0 = fit.delta_phi0.value;
    result->delta_phi0_error = fit.delta_phi0.std_error;
    result->q0 = fit.q0.value;
    result->q0_error = fit.q0.std_error;
    result->z0 = fit.z0.value;
    result->z0_error = fit.z0.std_error;
    result->rayleigh_range = fit.rayleigh_range.value;
    result->rayleigh_range_error = fit.rayleigh_range.std_error;

    const zscan::DerivedQuantities derived = fit.derived.value_or(zscan::DerivedQuantities{0.0, 0.0, 0.0, 0.0, 0.0});
    result->n2 = derived.n2;
    result->n2_error = derived.n2_error;
    result->beta = derived.beta;
    result->beta_error = derived.beta_error;
    result->effective_length = derived.effective_length;

    result->rss = fit.rss;
    result->iterations = fit.iterations;
    result->converged = fit.converged ? 1 : 0;
    result->q0_out_of_range = fit.q0_out_of_range ? 1 : 0;
}

// Partial estimate with n2 and beta derived the same way as for a batch entry
void copyPartial(const zscan::FitError& error, const zscan::PhysicalConstants& constants, ZscanFitResult* result) {
    zscan::FitResult partial = error.partial();
    partial.derived = zscan::analysis::deriveNonlinearCoefficients(partial, constants);
    copyResult(partial, result);
}

ZscanStatus fitRecord(const char* text, const ZscanConfig& config, ZscanFitResult* result) {
    const zscan::MeasurementRecord record = zscan::analysis::parseRecord(text);
    zscan::PhysicalConstants constants = toConstants(config);
    if (constants.wavelength_m == 0.0) {
        constants.wavelength_m = record.wavelength_nm * 1e-9;
    }
    try {
        const auto fit = zscan::analysis::fit(record, constants, toAnalysisConfig(config));
        copyResult(fit, result);
        return ZSCAN_OK;
    } catch (const zscan::FitDivergenceError& e) {
        copyPartial(e, constants, result);
        return ZSCAN_FIT_DIVERGED;
    } catch (const zscan::IllConditionedError& e) {
        copyPartial(e, constants, result);
        return ZSCAN_FIT_ILL_CONDITIONED;
    }
}

} // namespace

extern "C" {

ZscanConfig* zscan_create_config(double sample_length_m, double linear_transmittance, double peak_irradiance) {
    auto config = new (std::nothrow) ZscanConfig;
    if (!config) {
        return nullptr;
    }
    config->sample_length_m = sample_length_m;
    config->linear_transmittance = linear_transmittance;
    config->peak_irradiance = peak_irradiance;
    config->wavelength_m = 0.0;
    config->rayleigh_range_mm = 0.0;
    config->loose_focal_constraint = 0;
    config->max_iterations = zscan::FitConfig{}.max_iterations;
    return config;
}

void zscan_destroy_config(ZscanConfig* config) {
    delete config;
}

ZscanStatus zscan_fit_text(const char* text, const ZscanConfig* config, ZscanFitResult* result) {
    if (!text || !config || !result) {
        return ZSCAN_INVALID_ARGUMENT;
    }

    try {
        return fitRecord(text, *config, result);
    } catch (const zscan::ParseError&) {
        return ZSCAN_PARSE_ERROR;
    } catch (const zscan::NormalizationError&) {
        return ZSCAN_NORMALIZATION_ERROR;
    } catch (const zscan::InvalidConstantsError&) {
        return ZSCAN_INVALID_CONSTANTS;
    } catch (const zscan::ConfigError&) {
        return ZSCAN_INVALID_ARGUMENT;
    } catch (const std::invalid_argument&) {
        return ZSCAN_INVALID_ARGUMENT;
    } catch (const std::exception&) {
        return ZSCAN_INTERNAL_ERROR;
    }
}

const char* zscan_status_string(ZscanStatus status) {
    switch (status) {
        case ZSCAN_OK: return "ok";
        case ZSCAN_INVALID_ARGUMENT: return "invalid argument";
        case ZSCAN_PARSE_ERROR: return "parse error";
        case ZSCAN_NORMALIZATION_ERROR: return "normalization error";
        case ZSCAN_FIT_DIVERGED: return "fit diverged";
        case ZSCAN_FIT_ILL_CONDITIONED: return "fit ill-conditioned";
        case ZSCAN_INVALID_CONSTANTS: return "invalid constants";
        case ZSCAN_INTERNAL_ERROR: return "internal error";
    }
    return "unknown status";
}

double zscan_fused_silica_n2(double wavelength_m) {
    try {
        return zscan::analysis::fusedSilicaN2(wavelength_m);
    } catch (const zscan::InvalidConstantsError&) {
        return -1.0;
    }
}

double zscan_effective_length(double length_m, double linear_transmittance) {
    try {
        return zscan::analysis::effectiveLength(length_m, linear_transmittance);
    } catch (const zscan::InvalidConstantsError&) {
        return -1.0;
    }
}

} // extern "C"
