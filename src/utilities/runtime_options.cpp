#include "utilities/runtime_options.hpp"
#include "randstream/errors.hpp"
#include "utilities/size_utils.hpp"

#include <cstdlib> // For std::getenv
#include <filesystem>
#include <stdexcept>

namespace randstream {

namespace {

unsigned parseJobs(const std::string &text, const std::string &origin) {
  unsigned long value = 0;
  try {
    size_t used = 0;
    value = std::stoul(text, &used);
    if (used != text.size()) {
      throw std::invalid_argument(text);
    }
  } catch (const std::logic_error &) {
    throw ConfigurationError(origin + ": '" + text + "' is not a job count");
  }
  if (value == 0 || value > 4096) {
    throw ConfigurationError(origin + ": job count must be between 1 and "
                                      "4096, got " +
                             text);
  }
  return static_cast<unsigned>(value);
}

LogLevel parseLevel(const std::string &text, const std::string &origin) {
  try {
    return Logger::levelFromString(text);
  } catch (const std::invalid_argument &e) {
    throw ConfigurationError(origin + ": " + e.what());
  }
}

} // namespace

std::string configPath() {
  const char *env = std::getenv("RANDSTREAM_CONFIG");
  if (env && env[0] != '\0') {
    return env;
  }
  return "randstream.yaml";
}

void applyConfigNode(const YAML::Node &node, RuntimeOptions &opts) {
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsMap()) {
    throw ConfigurationError("configuration must be a YAML mapping");
  }
  try {
    if (node["jobs"])
      opts.jobs = parseJobs(node["jobs"].as<std::string>(), "jobs");
    if (node["chunk_size"])
      opts.chunkSize = parse_size(node["chunk_size"].as<std::string>());
    if (node["log_level"])
      opts.logLevel =
          parseLevel(node["log_level"].as<std::string>(), "log_level");
    if (node["log_file"])
      opts.logFile = node["log_file"].as<std::string>();
    if (node["progress"])
      opts.progress = node["progress"].as<bool>();
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(std::string("invalid configuration value: ") +
                             e.what());
  }
  if (opts.chunkSize == 0) {
    throw ConfigurationError("chunk_size must be greater than zero");
  }
}

void applyEnvironment(RuntimeOptions &opts) {
  if (const char *env = std::getenv("RANDSTREAM_JOBS"))
    opts.jobs = parseJobs(env, "RANDSTREAM_JOBS");
  if (const char *env = std::getenv("RANDSTREAM_CHUNK_SIZE")) {
    opts.chunkSize = parse_size(env);
    if (opts.chunkSize == 0) {
      throw ConfigurationError(
          "RANDSTREAM_CHUNK_SIZE must be greater than zero");
    }
  }
  if (const char *env = std::getenv("RANDSTREAM_LOG_LEVEL"))
    opts.logLevel = parseLevel(env, "RANDSTREAM_LOG_LEVEL");
  if (const char *env = std::getenv("RANDSTREAM_LOG_FILE"))
    opts.logFile = env;
}

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  RuntimeOptions opts;
  if (!path.empty() && std::filesystem::exists(path)) {
    YAML::Node node;
    try {
      node = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
      throw ConfigurationError("cannot parse " + path + ": " + e.what());
    }
    applyConfigNode(node, opts);
  }
  applyEnvironment(opts);
  return opts;
}

RuntimeOptions loadRuntimeOptions() { return loadRuntimeOptions(configPath()); }

} // namespace randstream
