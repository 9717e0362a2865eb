#include "zscan/zscan.hpp"
#include <cmath>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace zscan {
namespace analysis {

namespace {

void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw InvalidConstantsError(std::string(name) + " must be positive and finite, got " + std::to_string(value));
    }
}

} // namespace

void validateConstants(const PhysicalConstants& constants, bool require_wavelength) {
    requirePositive(constants.sample_length_m, "Sample length");
    requirePositive(constants.peak_irradiance, "Peak irradiance");
    if (!(constants.linear_transmittance > 0.0 && constants.linear_transmittance <= 1.0)) {
        throw InvalidConstantsError("Linear transmittance must be in (0, 1], got " +
                                    std::to_string(constants.linear_transmittance));
    }
    if (require_wavelength || constants.wavelength_m != 0.0) {
        requirePositive(constants.wavelength_m, "Wavelength");
    }
}

double effectiveLength(double length_m, double linear_transmittance) {
    requirePositive(length_m, "Sample length");
    if (!(linear_transmittance > 0.0 && linear_transmittance <= 1.0)) {
        throw InvalidConstantsError("Linear transmittance must be in (0, 1], got " +
                                    std::to_string(linear_transmittance));
    }
    // alpha = -ln(T) / L, L_eff = (1 - exp(-alpha L)) / alpha = L (1 - T) / -ln(T)
    const double alpha_length = -std::log(linear_transmittance);
    if (alpha_length < 1e-12) {
        return length_m;
    }
    return length_m * (1.0 - linear_transmittance) / alpha_length;
}

DerivedQuantities deriveNonlinearCoefficients(const FitResult& result, const PhysicalConstants& constants) {
    validateConstants(constants, true);

    const double l_eff = effectiveLength(constants.sample_length_m, constants.linear_transmittance);
    const double phase_scale = constants.wavelength_m / (2.0 * M_PI * l_eff * constants.peak_irradiance);
    const double absorption_scale = 2.0 * std::sqrt(2.0) / (l_eff * constants.peak_irradiance);

    return DerivedQuantities{
        result.delta_phi0.value * phase_scale,
        result.delta_phi0.std_error * phase_scale,
        result.q0.value * absorption_scale,
        result.q0.std_error * absorption_scale,
        l_eff
    };
}

double fusedSilicaN2(double wavelength_m) {
    requirePositive(wavelength_m, "Wavelength");
    return 2.8203e-20 - 3e-27 / wavelength_m + 2e-33 / (wavelength_m * wavelength_m);
}

double calibratePeakIrradiance(const FitResult& reference, double wavelength_m,
                               double reference_length_m, double reference_n2) {
    requirePositive(wavelength_m, "Wavelength");
    requirePositive(reference_length_m, "Reference length");
    requirePositive(reference_n2, "Reference n2");
    if (!(reference.delta_phi0.value > 0.0)) {
        throw InvalidConstantsError("Reference phase shift must be positive, got " +
                                    std::to_string(reference.delta_phi0.value));
    }
    return reference.delta_phi0.value * wavelength_m / (2.0 * M_PI * reference_length_m * reference_n2);
}

} // namespace analysis
} // namespace zscan
