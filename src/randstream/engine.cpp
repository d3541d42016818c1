#include "randstream/engine.hpp"
#include "randstream/byte_expander.hpp"
#include "randstream/completion_sink.hpp"
#include "randstream/errors.hpp"
#include "randstream/parallel_executor.hpp"
#include "randstream/stream_header.hpp"
#include "randstream/work_partitioner.hpp"
#include "utilities/logger.h"

#include <string>
#include <utility>
#include <vector>

namespace randstream {

namespace {

void logParameters(const char *mode, const StreamParameters &params,
                   unsigned jobs, uint64_t chunks) {
  Logger &log = Logger::getInstance();
  log.log(LogLevel::DEBUG, std::string(mode) + ": stream size " +
                               std::to_string(params.total_size) +
                               ", chunk size " +
                               std::to_string(params.chunk_size) + ", " +
                               std::to_string(chunks) + " chunks");
  log.log(LogLevel::DEBUG, std::string(mode) + ": seed length " +
                               std::to_string(params.seed.size()) +
                               ", jobs " + std::to_string(jobs));
}

} // namespace

size_t default_window(unsigned jobs) {
  size_t window = static_cast<size_t>(jobs) * 4;
  return window < 2 ? 2 : window;
}

uint64_t run_generate(const JobConfiguration &config, ByteSink &sink,
                      ProgressCallback progress) {
  config.validate();

  const std::vector<uint8_t> header = StreamHeader::encode(config.stream);
  WorkPartitioner partitioner(config.stream.total_size,
                              config.stream.chunk_size);
  logParameters("generate", config.stream, config.jobs,
                partitioner.chunkCount());

  ByteExpander expander(config.stream.seed);
  CompletionSink completed(partitioner.chunkCount(),
                           default_window(config.jobs));
  DescriptorQueue queue(partitioner);
  ParallelExecutor executor(expander, config.jobs);
  executor.start(queue, completed);

  // On any exception the executor destructor cancels and joins the workers.
  OrderedEmitter emitter(completed, partitioner, std::move(progress));
  uint64_t written = emitter.emitGenerate(header, sink);
  executor.join();

  Logger::getInstance().log(LogLevel::DEBUG,
                            "generate: wrote " + std::to_string(written) +
                                " bytes");
  return written;
}

void run_validate(const std::optional<JobConfiguration> &config,
                  ByteSource &source, ProgressCallback progress) {
  unsigned jobs = JobConfiguration::defaultJobs();
  if (config) {
    if (config->jobs == 0) {
      throw ConfigurationError("job count must be at least 1");
    }
    jobs = config->jobs;
  }

  const StreamParameters params = StreamHeader::read(source);
  if (config && !config->stream.seed.empty() && !(config->stream == params)) {
    throw ConfigurationError(
        "supplied stream parameters do not match the stream header");
  }

  const uint64_t header_size = StreamHeader::encodedSize(params.seed.size());
  WorkPartitioner partitioner(params.total_size, params.chunk_size);
  logParameters("validate", params, jobs, partitioner.chunkCount());

  ByteExpander expander(params.seed);
  CompletionSink completed(partitioner.chunkCount(), default_window(jobs));
  DescriptorQueue queue(partitioner);
  ParallelExecutor executor(expander, jobs);
  executor.start(queue, completed);

  OrderedEmitter emitter(completed, partitioner, std::move(progress));
  emitter.emitValidate(header_size, source);
  executor.join();
}

} // namespace randstream
