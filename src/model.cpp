#include "zscan/zscan.hpp"
#include <cmath>
#include <limits>

namespace zscan {

ZscanParameters FitResult::parameters() const {
    return ZscanParameters{delta_phi0.value, q0.value, z0.value, rayleigh_range.value};
}

namespace analysis {

namespace {

constexpr int kMaxSeriesTerms = 5000;
constexpr double kSeriesCutoff = 1e-16;

struct SeriesValue {
    double value;
    double derivative;
};

// Sum_{m>=0} (-q)^m / (m+1)^{3/2} and its derivative in q, for |q| < 1
SeriesValue absorptionSeries(double q) {
    double value = 0.0;
    double derivative = 0.0;
    double previous_power = 0.0;   // (-q)^(m-1)
    double power = 1.0;            // (-q)^m
    for (int m = 0; m < kMaxSeriesTerms; ++m) {
        const double weight = 1.0 / ((m + 1) * std::sqrt(m + 1.0));
        const double term = power * weight;
        const double d_term = m > 0 ? -m * previous_power * weight : 0.0;
        value += term;
        derivative += d_term;
        if (m > 0 && std::abs(term) < kSeriesCutoff && std::abs(d_term) < kSeriesCutoff) {
            break;
        }
        previous_power = power;
        power *= -q;
    }
    return {value, derivative};
}

ModelGradient undefinedGradient() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return {nan, nan, nan, nan, nan};
}

} // namespace

bool withinOpenApertureDomain(double q0) {
    return std::abs(kAbsorptionScale * q0) < 1.0;
}

ModelGradient openApertureGradient(double z, const ZscanParameters& params) {
    if (!withinOpenApertureDomain(params.q0) || !(params.rayleigh_range > 0.0)) {
        return undefinedGradient();
    }

    // On-axis absorption beta*I0*L_eff = 2^(3/2) q0
    const double x = (z - params.z0) / params.rayleigh_range;
    const double s = 1.0 + x * x;
    const double q_focus = kAbsorptionScale * params.q0;
    const SeriesValue series = absorptionSeries(q_focus / s);

    const double d_x = series.derivative * q_focus * (-2.0 * x) / (s * s);
    return ModelGradient{
        series.value,
        0.0,
        series.derivative * kAbsorptionScale / s,
        -d_x / params.rayleigh_range,
        -d_x * x / params.rayleigh_range
    };
}

ModelGradient closedApertureGradient(double z, const ZscanParameters& params) {
    if (!(params.rayleigh_range > 0.0)) {
        return undefinedGradient();
    }

    const double x = (z - params.z0) / params.rayleigh_range;
    const double x2 = x * x;
    // (x^2 + 1)(x^2 + 9) >= 9, no singularity at focus
    const double denominator = (x2 + 1.0) * (x2 + 9.0);
    const double numerator = 4.0 * x * params.delta_phi0 - (x2 + 3.0) * params.q0;

    const double d_numerator = 4.0 * params.delta_phi0 - 2.0 * x * params.q0;
    const double d_denominator = 4.0 * x2 * x + 20.0 * x;
    const double d_x = (d_numerator * denominator - numerator * d_denominator) / (denominator * denominator);

    return ModelGradient{
        1.0 + numerator / denominator,
        4.0 * x / denominator,
        -(x2 + 3.0) / denominator,
        -d_x / params.rayleigh_range,
        -d_x * x / params.rayleigh_range
    };
}

double openApertureTransmittance(double z, const ZscanParameters& params) {
    return openApertureGradient(z, params).value;
}

double closedApertureTransmittance(double z, const ZscanParameters& params) {
    return closedApertureGradient(z, params).value;
}

} // namespace analysis

} // namespace zscan
