#include "randstream/cli.hpp"
#include "randstream/byte_io.hpp"
#include "randstream/engine.hpp"
#include "randstream/errors.hpp"
#include "randstream/stream_header.hpp"
#include "randstream/work_partitioner.hpp"
#include "utilities/seed_utils.hpp"
#include "utilities/size_utils.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <unistd.h> // For isatty, STDIN_FILENO, STDOUT_FILENO

namespace randstream {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char *VERSION_STRING = "randstream 1.0.0";

// Single-line progress meter on stderr, redrawn at most 10 times a second.
class ProgressMeter {
public:
  ProgressMeter() : start_(Clock::now()), last_draw_(start_) {}

  void update(uint64_t processed, uint64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (processed < total && now - last_draw_ < std::chrono::milliseconds(100)) {
      return;
    }
    last_draw_ = now;
    double percent =
        total == 0 ? 100.0
                   : 100.0 * static_cast<double>(processed) /
                         static_cast<double>(total);
    std::fprintf(stderr, "\r[%s] %s / %s (%5.1f%%) %s    ",
                 format_duration(now - start_).c_str(),
                 format_size(processed).c_str(), format_size(total).c_str(),
                 percent, format_throughput(processed, now - start_).c_str());
    std::fflush(stderr);
    drawn_ = true;
  }

  void finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
      std::fputc('\n', stderr);
      drawn_ = false;
    }
  }

private:
  std::mutex mutex_;
  Clock::time_point start_;
  Clock::time_point last_draw_;
  bool drawn_ = false;
};

bool takesValue(const std::string &name) {
  return name == "--size" || name == "-s" || name == "--seed" || name == "-S" ||
         name == "--jobs" || name == "-j" || name == "--chunk-size" ||
         name == "-c";
}

unsigned parseJobCount(const std::string &text) {
  unsigned long value = 0;
  try {
    size_t used = 0;
    value = std::stoul(text, &used);
    if (used != text.size()) {
      throw std::invalid_argument(text);
    }
  } catch (const std::logic_error &) {
    throw ConfigurationError("'" + text + "' is not a job count");
  }
  if (value == 0 || value > 4096) {
    throw ConfigurationError("job count must be between 1 and 4096, got " +
                             text);
  }
  return static_cast<unsigned>(value);
}

// Applies one verbosity flag; returns false if @p arg is not one.
bool applyVerbosity(const std::string &arg, CliArgs &out) {
  if (arg == "--verbose") {
    ++out.verbosity;
    return true;
  }
  if (arg == "--quiet") {
    --out.verbosity;
    return true;
  }
  if (arg.size() >= 2 && arg[0] == '-' &&
      (arg[1] == 'v' || arg[1] == 'q')) {
    for (size_t i = 1; i < arg.size(); ++i) {
      if (arg[i] != arg[1]) {
        return false;
      }
    }
    int count = static_cast<int>(arg.size() - 1);
    out.verbosity += arg[1] == 'v' ? count : -count;
    return true;
  }
  return false;
}

std::vector<uint8_t> resolveSeed(const CliArgs &args) {
  if (args.seedHex) {
    return parse_seed_hex(*args.seedHex);
  }
  std::vector<uint8_t> seed = generate_seed(GENERATED_SEED_SIZE);
  // The user needs the seed to regenerate the stream later.
  std::cerr << "seed: " << seed_to_hex(seed) << std::endl;
  Logger::getInstance().log(LogLevel::INFO,
                            "Generated seed " + seed_to_hex(seed));
  return seed;
}

uint64_t resolveStreamSize(const CliArgs &args, size_t seed_size,
                           uint64_t chunk_size) {
  if (args.size) {
    return *args.size;
  }
  if (args.path) {
    std::optional<uint64_t> capacity = deviceCapacity(*args.path);
    if (capacity && *capacity > 0) {
      uint64_t size = WorkPartitioner::logicalSizeForCapacity(
          *capacity, StreamHeader::encodedSize(seed_size), chunk_size);
      Logger::getInstance().log(
          LogLevel::DEBUG, "Filling " + *args.path + " (" +
                               std::to_string(*capacity) + " bytes) with a " +
                               std::to_string(size) + " byte stream");
      return size;
    }
  }
  throw ConfigurationError(
      "size can't be determined, use --size to provide a stream size");
}

ProgressCallback makeProgress(bool enabled,
                              std::shared_ptr<ProgressMeter> &meter) {
  if (!enabled || !::isatty(STDERR_FILENO)) {
    return {};
  }
  meter = std::make_shared<ProgressMeter>();
  std::shared_ptr<ProgressMeter> shared = meter;
  return [shared](uint64_t processed, uint64_t total) {
    shared->update(processed, total);
  };
}

int runGenerate(const CliArgs &args, const RuntimeOptions &options) {
  auto start = Clock::now();

  JobConfiguration config;
  config.jobs = args.jobs.value_or(
      options.jobs.value_or(JobConfiguration::defaultJobs()));
  config.stream.chunk_size = args.chunkSize.value_or(options.chunkSize);
  config.stream.seed = resolveSeed(args);
  config.stream.total_size = resolveStreamSize(
      args, config.stream.seed.size(), config.stream.chunk_size);
  config.validate();

  std::unique_ptr<ByteSink> sink;
  if (args.path) {
    sink = std::make_unique<FileSink>(*args.path, !args.noTruncate);
  } else {
    sink = std::make_unique<FileSink>(STDOUT_FILENO, false);
  }

  std::shared_ptr<ProgressMeter> meter;
  ProgressCallback progress =
      makeProgress(options.progress && !args.noProgress, meter);
  uint64_t written = 0;
  try {
    written = run_generate(config, *sink, progress);
  } catch (...) {
    if (meter)
      meter->finish();
    throw;
  }
  if (meter)
    meter->finish();

  auto elapsed = Clock::now() - start;
  Logger::getInstance().log(LogLevel::INFO,
                            "Generated " + format_size(written) + " in " +
                                format_duration(elapsed) + " (" +
                                format_throughput(written, elapsed) + ")");
  return static_cast<int>(ExitCode::Success);
}

int runValidate(const CliArgs &args, const RuntimeOptions &options) {
  auto start = Clock::now();

  // Only the worker count comes from the command line; the header describes
  // the stream.
  JobConfiguration config;
  config.jobs = args.jobs.value_or(
      options.jobs.value_or(JobConfiguration::defaultJobs()));

  std::unique_ptr<ByteSource> source;
  if (args.path) {
    source = std::make_unique<FileSource>(*args.path);
  } else {
    source = std::make_unique<FileSource>(STDIN_FILENO, false);
  }

  uint64_t validated = 0;
  std::shared_ptr<ProgressMeter> meter;
  ProgressCallback display =
      makeProgress(options.progress && !args.noProgress, meter);
  ProgressCallback progress = [&validated, display](uint64_t processed,
                                                    uint64_t total) {
    validated = processed;
    if (display)
      display(processed, total);
  };
  try {
    run_validate(config, *source, progress);
  } catch (...) {
    if (meter)
      meter->finish();
    throw;
  }
  if (meter)
    meter->finish();

  auto elapsed = Clock::now() - start;
  Logger::getInstance().log(LogLevel::INFO,
                            "Validated " + format_size(validated) + " in " +
                                format_duration(elapsed) + " (" +
                                format_throughput(validated, elapsed) + ")");
  return static_cast<int>(ExitCode::Success);
}

int report(ExitCode code, const std::string &message) {
  Logger &log = Logger::getInstance();
  // A console logger would print the same failure a second time.
  if (!log.isConsoleOnly()) {
    log.log(LogLevel::ERROR, message);
  }
  std::cerr << "randstream: " << message << std::endl;
  return static_cast<int>(code);
}

} // namespace

std::string usage_text() {
  return "Usage: randstream [-v|-q] <command> [options] [PATH]\n"
         "\n"
         "Commands:\n"
         "  generate (write)   Write a random stream to PATH or stdout\n"
         "  validate (read)    Check a stream read from PATH or stdin\n"
         "\n"
         "Generate options:\n"
         "  -s, --size SZ         Stream size (default: size of PATH)\n"
         "  -S, --seed HEX        Seed (default: random, printed)\n"
         "  -j, --jobs N          Worker threads (default: all cores)\n"
         "  -c, --chunk-size SZ   Payload bytes per chunk (default: 32k)\n"
         "  -t, --no-truncate     Do not truncate PATH first\n"
         "  -n, --no-progress     Hide the progress meter\n"
         "\n"
         "Validate options:\n"
         "  -j, --jobs N          Worker threads (default: all cores)\n"
         "  -n, --no-progress     Hide the progress meter\n"
         "\n"
         "Global options:\n"
         "  -v, --verbose         More logging (repeat for trace)\n"
         "  -q, --quiet           Less logging (repeat for errors only)\n"
         "  -h, --help            Show this help\n"
         "  -V, --version         Show the version\n"
         "\n"
         "Sizes accept K, M, G, T, P (1024-based), KiB.., and KB.. "
         "(1000-based).\n";
}

LogLevel effective_log_level(LogLevel base, int verbosity) {
  int level = static_cast<int>(base) - verbosity;
  if (level < static_cast<int>(TRACE))
    level = TRACE;
  if (level > static_cast<int>(FATAL))
    level = FATAL;
  return static_cast<LogLevel>(level);
}

CliArgs parse_cli(const std::vector<std::string> &args) {
  CliArgs out;
  size_t i = 0;

  for (; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (applyVerbosity(arg, out))
      continue;
    if (arg == "-h" || arg == "--help") {
      out.command = Command::Help;
      return out;
    }
    if (arg == "-V" || arg == "--version") {
      out.command = Command::Version;
      return out;
    }
    if (arg == "generate" || arg == "write") {
      out.command = Command::Generate;
    } else if (arg == "validate" || arg == "read") {
      out.command = Command::Validate;
    } else if (!arg.empty() && arg[0] == '-') {
      throw UsageError("unknown option " + arg);
    } else {
      throw UsageError("unknown command " + arg);
    }
    ++i;
    break;
  }
  if (out.command == Command::None) {
    throw UsageError("missing command");
  }

  const bool generate = out.command == Command::Generate;
  for (; i < args.size(); ++i) {
    std::string arg = args[i];
    if (applyVerbosity(arg, out))
      continue;
    if (arg == "-h" || arg == "--help") {
      out.command = Command::Help;
      return out;
    }
    if (arg.empty() || arg[0] != '-' || arg == "-") {
      if (out.path) {
        throw UsageError("unexpected argument " + arg);
      }
      out.path = arg;
      continue;
    }

    std::optional<std::string> value;
    size_t eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
    }
    if (takesValue(arg) && !value) {
      if (i + 1 >= args.size()) {
        throw UsageError("option " + arg + " requires a value");
      }
      value = args[++i];
    } else if (!takesValue(arg) && value) {
      throw UsageError("option " + arg + " does not take a value");
    }

    if (arg == "--jobs" || arg == "-j") {
      out.jobs = parseJobCount(*value);
    } else if (arg == "--no-progress" || arg == "-n") {
      out.noProgress = true;
    } else if (generate && (arg == "--size" || arg == "-s")) {
      out.size = parse_size(*value);
    } else if (generate && (arg == "--seed" || arg == "-S")) {
      out.seedHex = *value;
    } else if (generate && (arg == "--chunk-size" || arg == "-c")) {
      out.chunkSize = parse_size(*value);
    } else if (generate && (arg == "--no-truncate" || arg == "-t")) {
      out.noTruncate = true;
    } else {
      throw UsageError("unknown option " + arg + " for " +
                       (generate ? "generate" : "validate"));
    }
  }
  if (out.path && *out.path == "-") {
    out.path.reset();
  }
  return out;
}

int run_cli(const CliArgs &args, const RuntimeOptions &options) {
  try {
    switch (args.command) {
    case Command::Generate:
      return runGenerate(args, options);
    case Command::Validate:
      return runValidate(args, options);
    case Command::Help:
      std::cout << usage_text();
      return static_cast<int>(ExitCode::Success);
    case Command::Version:
      std::cout << VERSION_STRING << std::endl;
      return static_cast<int>(ExitCode::Success);
    case Command::None:
      break;
    }
    std::cerr << usage_text();
    return static_cast<int>(ExitCode::Usage);
  } catch (const ConfigurationError &e) {
    return report(ExitCode::Configuration, e.what());
  } catch (const FormatError &e) {
    return report(ExitCode::Format, e.what());
  } catch (const CorruptionError &e) {
    return report(ExitCode::Corruption, e.what());
  } catch (const IOError &e) {
    return report(ExitCode::IO, e.what());
  } catch (const std::exception &e) {
    return report(ExitCode::Other, e.what());
  }
}

int cli_main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  CliArgs parsed;
  RuntimeOptions options;
  try {
    options = loadRuntimeOptions();
    parsed = parse_cli(args);
  } catch (const UsageError &e) {
    std::cerr << "randstream: " << e.what() << "\n\n" << usage_text();
    return static_cast<int>(ExitCode::Usage);
  } catch (const ConfigurationError &e) {
    std::cerr << "randstream: " << e.what() << std::endl;
    return static_cast<int>(ExitCode::Configuration);
  }

  Logger::init(options.logFile,
               effective_log_level(options.logLevel, parsed.verbosity));
  return run_cli(parsed, options);
}

} // namespace randstream
