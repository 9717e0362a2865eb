#include "zscan/zscan.hpp"
#include <glog/logging.h>
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace zscan {

bool ResultKey::operator<(const ResultKey& other) const {
    return std::tie(code, concentration, wavelength_nm) <
           std::tie(other.code, other.concentration, other.wavelength_nm);
}

const BatchEntry* BatchResult::find(const std::string& code, double concentration, double wavelength_nm) const {
    const auto it = results.find(ResultKey{code, concentration, wavelength_nm});
    return it == results.end() ? nullptr : &it->second;
}

std::size_t BatchResult::unreliableCount() const {
    std::size_t count = 0;
    for (const auto& [key, entry] : results) {
        if (!entry.reliable) {
            ++count;
        }
    }
    return count;
}

const char* toString(RecordErrorKind kind) {
    switch (kind) {
        case RecordErrorKind::Load: return "load";
        case RecordErrorKind::Parse: return "parse";
        case RecordErrorKind::Normalization: return "normalization";
        case RecordErrorKind::Fit: return "fit";
        case RecordErrorKind::Duplicate: return "duplicate";
        case RecordErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

namespace analysis {

namespace {

PhysicalConstants withRecordWavelength(const PhysicalConstants& constants, const MeasurementRecord& record) {
    PhysicalConstants resolved = constants;
    if (resolved.wavelength_m == 0.0) {
        resolved.wavelength_m = record.wavelength_nm * 1e-9;
    }
    return resolved;
}

/// Result slot written by exactly one worker
struct Outcome {
    std::optional<ResultKey> key;
    std::optional<BatchEntry> entry;
    std::optional<RecordError> error;
};

Outcome failed(const std::string& source, RecordErrorKind kind, const std::string& message) {
    Outcome outcome;
    outcome.error = RecordError{source, kind, message};
    return outcome;
}

void checkReliability(BatchEntry& entry, const BatchConfig& config) {
    const FitResult& result = entry.result;
    if (result.q0_out_of_range) {
        entry.reliable = false;
        entry.reasons.push_back("q0 optimum lies outside the open-aperture model domain");
    }

    const std::pair<const char*, const ParameterEstimate*> estimates[] = {
        {"delta_phi0", &result.delta_phi0},
        {"q0", &result.q0},
        {"z0", &result.z0},
        {"rayleigh_range", &result.rayleigh_range},
    };
    for (const auto& [name, estimate] : estimates) {
        if (estimate->fixed || std::abs(estimate->value) < config.relative_error_floor) {
            continue;
        }
        const double relative = estimate->std_error / std::abs(estimate->value);
        if (!(relative <= config.max_relative_std_error)) {
            std::ostringstream reason;
            reason << "relative standard error of " << name << " is " << relative;
            entry.reliable = false;
            entry.reasons.push_back(reason.str());
        }
    }
}

Outcome processRecord(const MeasurementRecord& record, const std::string& source,
                      const PhysicalConstants& constants, const AnalysisConfig& config) {
    Outcome outcome;
    outcome.key = ResultKey{record.code, record.concentration, record.wavelength_nm};

    BatchEntry entry;
    entry.source = source;
    try {
        entry.result = fit(record, constants, config);
    } catch (const NormalizationError& e) {
        return failed(source, RecordErrorKind::Normalization, e.what());
    } catch (const FitError& e) {
        // Best-effort estimate, kept and flagged
        entry.result = e.partial();
        entry.result.derived = deriveNonlinearCoefficients(entry.result, withRecordWavelength(constants, record));
        entry.reliable = false;
        entry.reasons.push_back(e.what());
    } catch (const InvalidConstantsError&) {
        throw;
    } catch (const std::exception& e) {
        return failed(source, RecordErrorKind::Fit, e.what());
    }

    checkReliability(entry, config.batch);
    outcome.entry = std::move(entry);
    return outcome;
}

Outcome processSource(const std::string& source, const RecordLoader& loader,
                      const PhysicalConstants& constants, const AnalysisConfig& config) {
    std::string text;
    try {
        text = loader(source);
    } catch (const std::exception& e) {
        return failed(source, RecordErrorKind::Load, e.what());
    }

    try {
        const MeasurementRecord record = parseRecord(text);
        return processRecord(record, source, constants, config);
    } catch (const ParseError& e) {
        return failed(source, RecordErrorKind::Parse, e.what());
    }
}

/// Runs task(i) for every index on the OpenMP workers, one slot per index
template <typename Task>
std::vector<Outcome> runParallel(int count, const BatchConfig& config, const CancellationToken* cancel,
                                 const std::vector<std::string>& sources, Task task) {
    std::vector<Outcome> outcomes(count);
    std::vector<std::string> constants_errors(count);

#ifdef _OPENMP
    const int threads = config.threads > 0 ? config.threads : omp_get_max_threads();
#pragma omp parallel for schedule(dynamic) num_threads(threads)
#endif
    for (int i = 0; i < count; ++i) {
        if (cancel && cancel->cancelled()) {
            outcomes[i] = failed(sources[i], RecordErrorKind::Cancelled, "Batch cancelled before this record");
            continue;
        }
        // Exceptions must not leave the parallel region
        try {
            outcomes[i] = task(i);
        } catch (const InvalidConstantsError& e) {
            constants_errors[i] = e.what();
        }
    }

    for (const auto& message : constants_errors) {
        if (!message.empty()) {
            throw InvalidConstantsError(message);
        }
    }
    return outcomes;
}

BatchResult merge(std::vector<Outcome>& outcomes) {
    BatchResult batch;
    for (auto& outcome : outcomes) {
        if (outcome.error) {
            batch.cancelled = batch.cancelled || outcome.error->kind == RecordErrorKind::Cancelled;
            LOG(WARNING) << outcome.error->source << ": " << toString(outcome.error->kind) << " error: "
                         << outcome.error->message;
            batch.errors.push_back(std::move(*outcome.error));
            continue;
        }

        const ResultKey& key = *outcome.key;
        BatchEntry& entry = *outcome.entry;
        const auto existing = batch.results.find(key);
        if (existing != batch.results.end()) {
            std::ostringstream message;
            message << "Duplicate result for " << key.code << " at " << key.concentration << " % and "
                    << key.wavelength_nm << " nm, first produced by " << existing->second.source;
            LOG(WARNING) << entry.source << ": " << message.str();
            batch.errors.push_back(RecordError{entry.source, RecordErrorKind::Duplicate, message.str()});
            continue;
        }
        if (!entry.reliable) {
            LOG(WARNING) << entry.source << ": unreliable fit: " << entry.reasons.front();
        }
        batch.results.emplace(key, std::move(entry));
    }

    VLOG(1) << "Batch finished: " << batch.results.size() << " results (" << batch.unreliableCount()
            << " unreliable), " << batch.errors.size() << " errors";
    return batch;
}

} // namespace

FitResult fit(const MeasurementRecord& record, const PhysicalConstants& constants, const AnalysisConfig& config) {
    validateConfig(config);
    const PhysicalConstants resolved = withRecordWavelength(constants, record);
    validateConstants(resolved, true);

    const CurvePair curves = normalize(record, config.normalization);
    const ZscanParameters initial = estimateInitialGuess(curves, record.wavelength_nm, config.fit);
    VLOG(1) << record.code << " " << record.concentration << " % " << record.wavelength_nm
            << " nm: initial delta_phi0=" << initial.delta_phi0 << " q0=" << initial.q0 << " z0=" << initial.z0
            << " zR=" << initial.rayleigh_range;

    FitResult result = fitCurves(curves, initial, config.fit);
    result.derived = deriveNonlinearCoefficients(result, resolved);
    return result;
}

BatchResult runBatch(const std::vector<MeasurementRecord>& records, const PhysicalConstants& constants,
                     const AnalysisConfig& config, const CancellationToken* cancel) {
    validateConstants(constants, false);
    validateConfig(config);

    std::vector<std::string> sources;
    sources.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        sources.push_back("record " + std::to_string(i));
    }

    auto outcomes = runParallel(static_cast<int>(records.size()), config.batch, cancel, sources,
                                [&](int i) { return processRecord(records[i], sources[i], constants, config); });
    return merge(outcomes);
}

BatchResult runBatch(const std::vector<std::string>& sources, const RecordLoader& loader,
                     const PhysicalConstants& constants, const AnalysisConfig& config,
                     const CancellationToken* cancel) {
    validateConstants(constants, false);
    validateConfig(config);
    if (!loader) {
        throw std::invalid_argument("Record loader is empty");
    }

    auto outcomes = runParallel(static_cast<int>(sources.size()), config.batch, cancel, sources,
                                [&](int i) { return processSource(sources[i], loader, constants, config); });
    return merge(outcomes);
}

} // namespace analysis

} // namespace zscan
