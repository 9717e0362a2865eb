#include "zscan/zscan.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace zscan {

std::vector<CurvePoint> NormalizedCurve::validPoints() const {
    std::vector<CurvePoint> valid;
    valid.reserve(points.size());
    std::copy_if(points.begin(), points.end(), std::back_inserter(valid),
                 [](const CurvePoint& p) { return std::isfinite(p.transmittance); });
    return valid;
}

namespace analysis {

namespace {

NormalizedCurve normalizeChannel(ChannelRole channel, const std::vector<double>& positions,
                                 const std::vector<double>& ratios, std::size_t baseline_count) {
    const std::size_t n = ratios.size();

    // Far field: the first and last baseline_count samples
    double sum = 0.0;
    std::size_t count = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (i >= baseline_count && i < n - baseline_count) {
            continue;
        }
        if (std::isfinite(ratios[i])) {
            sum += ratios[i];
            ++count;
        }
    }
    if (count == 0) {
        throw NormalizationError(std::string("No defined far-field samples on ") + toString(channel));
    }
    const double baseline = sum / count;
    if (baseline == 0.0 || !std::isfinite(baseline)) {
        throw NormalizationError(std::string("Zero far-field level on ") + toString(channel));
    }

    NormalizedCurve curve{channel, {}, baseline};
    curve.points.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        curve.points.push_back({positions[i], ratios[i] / baseline});
    }
    return curve;
}

} // namespace

CurvePair normalize(const MeasurementRecord& record, const NormalizationConfig& config) {
    if (!(config.baseline_fraction > 0.0 && config.baseline_fraction <= 0.5)) {
        throw ConfigError("normalization.baseline_fraction must be in (0, 0.5]");
    }

    const std::size_t n = record.samples.size();
    const std::size_t closed_slot = record.roles.slotOf(ChannelRole::ClosedAperture);
    const std::size_t reference_slot = record.roles.slotOf(ChannelRole::Reference);
    const std::size_t open_slot = record.roles.slotOf(ChannelRole::OpenAperture);
    const std::size_t empty_slot = record.roles.slotOf(ChannelRole::Empty);

    // A live empty channel means the role table does not match the wiring
    for (const auto& sample : record.samples) {
        const double v = sample.volts[empty_slot];
        if (std::abs(v) > config.empty_noise_threshold) {
            throw NormalizationError("Empty channel CH" + std::to_string(empty_slot + 1) + " carries " +
                                     std::to_string(v) + " V at index " + std::to_string(sample.index) +
                                     "; channel roles do not match the signals");
        }
    }

    std::vector<double> positions(n);
    std::vector<double> closed(n);
    std::vector<double> open(n);
    std::size_t zero_reference = 0;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    for (std::size_t i = 0; i < n; ++i) {
        const auto& volts = record.samples[i].volts;
        positions[i] = positionAt(record, i);
        const double reference = volts[reference_slot];
        if (std::abs(reference) <= config.reference_floor) {
            ++zero_reference;
            closed[i] = nan;
            open[i] = nan;
        } else {
            closed[i] = volts[closed_slot] / reference;
            open[i] = volts[open_slot] / reference;
        }
    }

    const double zero_fraction = static_cast<double>(zero_reference) / n;
    if (zero_fraction > config.max_zero_reference_fraction) {
        throw NormalizationError("Reference channel is zero for " + std::to_string(zero_reference) + " of " +
                                 std::to_string(n) + " samples");
    }
    if (zero_reference > 0) {
        LOG(WARNING) << record.code << ": dropped " << zero_reference << " of " << n
                     << " samples with zero reference";
    }

    const std::size_t baseline_count = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::floor(config.baseline_fraction * n)));

    return CurvePair{
        normalizeChannel(ChannelRole::ClosedAperture, positions, closed, baseline_count),
        normalizeChannel(ChannelRole::OpenAperture, positions, open, baseline_count)
    };
}

} // namespace analysis

} // namespace zscan
