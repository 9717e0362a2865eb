#pragma once

#include "zscan/zscan.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace zscan {

/**
 * @brief Everything a batch run needs besides the scan files
 */
struct RunConfiguration {
    AnalysisConfig analysis;
    PhysicalConstants constants;
};

/**
 * @brief Read a run configuration from a JSON file
 *
 * The file holds optional "constants", "normalization", "fit" and "batch"
 * objects. Missing sections and keys keep their defaults.
 *
 * @param path JSON file
 * @return Run configuration
 * @throws ConfigError if the file cannot be read or a value has the wrong type
 */
RunConfiguration loadRunConfiguration(const std::string& path);

/**
 * @brief Parse a run configuration from JSON text
 * @throws ConfigError on malformed JSON or a value of the wrong type
 */
RunConfiguration parseRunConfiguration(const std::string& text);

void to_json(nlohmann::json& j, const NormalizationConfig& config);
void from_json(const nlohmann::json& j, NormalizationConfig& config);
void to_json(nlohmann::json& j, const FitConfig& config);
void from_json(const nlohmann::json& j, FitConfig& config);
void to_json(nlohmann::json& j, const BatchConfig& config);
void from_json(const nlohmann::json& j, BatchConfig& config);
void to_json(nlohmann::json& j, const PhysicalConstants& constants);
void from_json(const nlohmann::json& j, PhysicalConstants& constants);
void to_json(nlohmann::json& j, const RunConfiguration& config);
void from_json(const nlohmann::json& j, RunConfiguration& config);

void to_json(nlohmann::json& j, const ParameterEstimate& estimate);
void to_json(nlohmann::json& j, const StageSummary& summary);
void to_json(nlohmann::json& j, const DerivedQuantities& derived);
void to_json(nlohmann::json& j, const FitResult& result);
void to_json(nlohmann::json& j, const BatchResult& batch);

} // namespace zscan
