#ifndef RANDSTREAM_CLI_HPP
#define RANDSTREAM_CLI_HPP

#include "utilities/runtime_options.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace randstream {

/// Process exit codes of the randstream executable.
enum class ExitCode : int {
  Success = 0,
  Usage = 1,
  Configuration = 2,
  Format = 3,
  Corruption = 4,
  IO = 5,
  Other = 6,
};

/// Bad command line. Reported with the usage text.
class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &message)
      : std::runtime_error(message) {}
};

enum class Command { None, Generate, Validate, Help, Version };

/**
 * @brief Parsed command line. Unset optionals fall back to RuntimeOptions.
 */
struct CliArgs {
  Command command = Command::None;
  int verbosity = 0; ///< +1 per -v, -1 per -q
  std::optional<std::string> path;
  std::optional<uint64_t> size;
  std::optional<std::string> seedHex;
  std::optional<unsigned> jobs;
  std::optional<uint64_t> chunkSize;
  bool noTruncate = false;
  bool noProgress = false;
};

/**
 * @brief Parse argv.
 * @throw UsageError On unknown options, missing values or a missing
 *        sub-command.
 * @throw ConfigurationError On malformed sizes or job counts.
 */
CliArgs parse_cli(const std::vector<std::string> &args);

/// Usage text printed by --help and on usage errors.
std::string usage_text();

/// Log level for the base level and the -v/-q count.
LogLevel effective_log_level(LogLevel base, int verbosity);

/**
 * @brief Execute a parsed command line.
 *
 * Every error is logged, printed on stderr and turned into an ExitCode.
 */
int run_cli(const CliArgs &args, const RuntimeOptions &options);

/// Entry point used by main(): load options, parse, run.
int cli_main(int argc, char **argv);

} // namespace randstream

#endif // RANDSTREAM_CLI_HPP
