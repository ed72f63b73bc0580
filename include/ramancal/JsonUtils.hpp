#pragma once
#include "Calibrator.hpp"
#include "Spectrum.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ramancal {

nlohmann::json load_json(const std::string& path);

/* replace ${VAR} in every string value by the environment variable */
void expand_env(nlohmann::json& j);

/**
 * Build and validate a CalibrationConfig from camelCase keys.  The two
 * residual thresholds are required, everything else has a default.
 * Reference tables are a table name ("neon", "acetonitrile") or an
 * array of numbers.
 */
CalibrationConfig calibration_config_from_json(const nlohmann::json& j);

nlohmann::json to_json(const CalibrationConfig& config);

/**
 * Manifest: either an array of entries or {"samples": [...]}; each entry
 * has "sample", "excitation", "emission" and an optional "name".
 * Relative paths are resolved against `base_dir`.
 */
std::vector<ManifestEntry> manifest_from_json(const nlohmann::json& j,
                                              const std::string&    base_dir = {});

/* load_json + expand_env + manifest_from_json, relative to the file */
std::vector<ManifestEntry> load_manifest(const std::string& path);

} // namespace ramancal
