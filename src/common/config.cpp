#include "common/config.h"
#include "common/logging.h"
#include <cctype>
#include <fstream>
#include <sstream>

namespace tally {
namespace common {

namespace {

// Returns the position right after the ':' following "key", or npos
size_t find_value_start(const std::string &json, const std::string &key) {
  std::string search_key = "\"" + key + "\"";
  size_t key_pos = json.find(search_key);
  if (key_pos == std::string::npos)
    return std::string::npos;

  size_t colon_pos = json.find(":", key_pos + search_key.size());
  if (colon_pos == std::string::npos)
    return std::string::npos;

  size_t value_start = colon_pos + 1;
  while (value_start < json.length() &&
         std::isspace(static_cast<unsigned char>(json[value_start]))) {
    value_start++;
  }
  return value_start;
}

std::string extract_json_token(const std::string &json, const std::string &key) {
  size_t value_start = find_value_start(json, key);
  if (value_start == std::string::npos)
    return "";

  size_t value_end = value_start;
  while (value_end < json.length() && json[value_end] != ',' &&
         json[value_end] != '}' && json[value_end] != '\n' &&
         !std::isspace(static_cast<unsigned char>(json[value_end]))) {
    value_end++;
  }
  return json.substr(value_start, value_end - value_start);
}

} // namespace

std::string extract_json_string(const std::string &json, const std::string &key,
                                const std::string &default_value) {
  size_t value_start = find_value_start(json, key);
  if (value_start == std::string::npos || value_start >= json.length() ||
      json[value_start] != '"')
    return default_value;

  size_t end_quote = json.find("\"", value_start + 1);
  if (end_quote == std::string::npos)
    return default_value;

  return json.substr(value_start + 1, end_quote - value_start - 1);
}

uint64_t extract_json_uint64(const std::string &json, const std::string &key,
                             uint64_t default_value) {
  std::string token = extract_json_token(json, key);
  if (token.empty() || !std::isdigit(static_cast<unsigned char>(token[0])))
    return default_value;

  try {
    return std::stoull(token);
  } catch (const std::exception &) {
    return default_value;
  }
}

double extract_json_double(const std::string &json, const std::string &key,
                           double default_value) {
  std::string token = extract_json_token(json, key);
  if (token.empty())
    return default_value;

  try {
    return std::stod(token);
  } catch (const std::exception &) {
    return default_value;
  }
}

bool extract_json_bool(const std::string &json, const std::string &key,
                       bool default_value) {
  std::string token = extract_json_token(json, key);
  if (token == "true")
    return true;
  if (token == "false")
    return false;
  return default_value;
}

RuntimeConfig parse_config_json(const std::string &json,
                                const RuntimeConfig &base) {
  RuntimeConfig config = base;

  config.log_level = extract_json_string(json, "log_level", config.log_level);
  config.json_logs = extract_json_bool(json, "json_logs", config.json_logs);

  config.max_compute_units =
      extract_json_uint64(json, "max_compute_units", config.max_compute_units);
  config.instruction_base_cost = extract_json_uint64(
      json, "instruction_base_cost", config.instruction_base_cost);
  config.invoke_cost =
      extract_json_uint64(json, "invoke_cost", config.invoke_cost);

  config.lamports_per_byte_year = extract_json_uint64(
      json, "lamports_per_byte_year", config.lamports_per_byte_year);
  config.exemption_threshold = extract_json_double(
      json, "exemption_threshold", config.exemption_threshold);

  config.payer_funding =
      extract_json_uint64(json, "payer_funding", config.payer_funding);
  config.initial_value =
      extract_json_uint64(json, "initial_value", config.initial_value);
  config.increments =
      extract_json_uint64(json, "increments", config.increments);

  return config;
}

Result<RuntimeConfig> load_config_file(const std::string &path,
                                       const RuntimeConfig &base) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return make_error(std::string("Cannot open config file: ") + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  RuntimeConfig config = parse_config_json(buffer.str(), base);
  config.config_file_path = path;

  LOG_DEBUG("config", "Loaded configuration from ", path);
  return Result<RuntimeConfig>(config);
}

Result<bool> validate_config(const RuntimeConfig &config) {
  if (!parse_log_level(config.log_level)) {
    return make_error(std::string("Unknown log level: ") + config.log_level);
  }
  if (config.max_compute_units == 0) {
    return make_error(std::string("max_compute_units must be greater than zero"));
  }
  if (config.exemption_threshold <= 0.0) {
    return make_error(std::string("exemption_threshold must be positive"));
  }
  return Result<bool>(true);
}

void apply_logging_config(const RuntimeConfig &config) {
  auto level = parse_log_level(config.log_level);
  if (level) {
    Logger::instance().set_level(*level);
  } else {
    LOG_WARN("config", "Unknown log level '", config.log_level,
             "', keeping current level");
  }
  Logger::instance().set_json_format(config.json_logs);
}

} // namespace common
} // namespace tally
