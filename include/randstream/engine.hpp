#ifndef RANDSTREAM_ENGINE_HPP
#define RANDSTREAM_ENGINE_HPP

#include "randstream/byte_io.hpp"
#include "randstream/job_config.hpp"
#include "randstream/ordered_emitter.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace randstream {

/// Completion-buffer window used for @p jobs workers.
size_t default_window(unsigned jobs);

/**
 * @brief Generate the stream described by @p config into @p sink.
 *
 * Writes the header followed by every framed chunk. The bytes produced are
 * the same for every value of config.jobs.
 *
 * @return Number of bytes written, header included.
 * @throw ConfigurationError If @p config is invalid. Nothing is written.
 * @throw IOError If the sink fails. Output written so far is left as is.
 */
uint64_t run_generate(const JobConfiguration &config, ByteSink &sink,
                      ProgressCallback progress = {});

/**
 * @brief Validate a stream read from @p source.
 *
 * The stream header is read first and drives the validation. If @p config
 * is given, its worker count is used; when it also carries a seed, its
 * stream parameters must match the header. A configuration with an empty
 * seed therefore only selects the worker count.
 *
 * @throw FormatError If the header is missing, truncated or unsupported.
 * @throw ConfigurationError If @p config disagrees with the header.
 * @throw CorruptionError At the first byte that differs from the expected
 *        stream, or where the input ends early.
 * @throw IOError If reading fails.
 */
void run_validate(const std::optional<JobConfiguration> &config,
                  ByteSource &source, ProgressCallback progress = {});

} // namespace randstream

#endif // RANDSTREAM_ENGINE_HPP
