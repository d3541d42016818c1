#ifndef RANDSTREAM_RUNTIME_OPTIONS_HPP
#define RANDSTREAM_RUNTIME_OPTIONS_HPP

#include "randstream/job_config.hpp"
#include "utilities/logger.h"

#include <cstdint>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace randstream {

/**
 * @brief Defaults for the command line, resolved from a YAML file and the
 * environment. Command-line flags override these.
 *
 * YAML keys: jobs, chunk_size (number or size string), log_level, log_file,
 * progress. Environment: RANDSTREAM_JOBS, RANDSTREAM_CHUNK_SIZE,
 * RANDSTREAM_LOG_LEVEL, RANDSTREAM_LOG_FILE.
 */
struct RuntimeOptions {
  std::optional<unsigned> jobs;
  uint64_t chunkSize = DEFAULT_CHUNK_SIZE;
  LogLevel logLevel = LogLevel::INFO;
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  bool progress = true;
};

/// Path of the configuration file: $RANDSTREAM_CONFIG or "randstream.yaml".
std::string configPath();

/**
 * @brief Merge the keys of a parsed YAML document into @p opts.
 * @throw ConfigurationError On a value of the wrong type or range.
 */
void applyConfigNode(const YAML::Node &node, RuntimeOptions &opts);

/// Merge RANDSTREAM_* environment variables into @p opts.
/// @throw ConfigurationError On a malformed value.
void applyEnvironment(RuntimeOptions &opts);

/**
 * @brief Load defaults from @p path (skipped if the file does not exist),
 * then the environment.
 * @throw ConfigurationError If the file exists but cannot be parsed.
 */
RuntimeOptions loadRuntimeOptions(const std::string &path);

/// loadRuntimeOptions(configPath()).
RuntimeOptions loadRuntimeOptions();

} // namespace randstream

#endif // RANDSTREAM_RUNTIME_OPTIONS_HPP
