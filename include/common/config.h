#pragma once

#include "common/types.h"
#include <string>

namespace tally {
namespace common {

/**
 * @file config.h
 * @brief Loading RuntimeConfig from flat JSON files
 *
 * Config files are small flat objects, for example:
 * @code
 * { "log_level": "debug", "json_logs": true, "max_compute_units": 50000 }
 * @endcode
 * Unknown keys are ignored and missing keys keep their defaults.
 */

// Minimal JSON value extraction; nested objects are searched by key only
std::string extract_json_string(const std::string &json, const std::string &key,
                                const std::string &default_value = "");
uint64_t extract_json_uint64(const std::string &json, const std::string &key,
                             uint64_t default_value = 0);
double extract_json_double(const std::string &json, const std::string &key,
                           double default_value = 0.0);
bool extract_json_bool(const std::string &json, const std::string &key,
                       bool default_value = false);

/// Overlay the fields present in @p json onto @p base
RuntimeConfig parse_config_json(const std::string &json,
                                const RuntimeConfig &base = RuntimeConfig());

/// Read and parse a config file; fails if the file cannot be read
Result<RuntimeConfig> load_config_file(const std::string &path,
                                       const RuntimeConfig &base = RuntimeConfig());

/// Check field ranges (known log level, non-zero budget, positive threshold)
Result<bool> validate_config(const RuntimeConfig &config);

/// Push log level and format into the global Logger
void apply_logging_config(const RuntimeConfig &config);

} // namespace common
} // namespace tally
