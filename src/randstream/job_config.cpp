#include "randstream/job_config.hpp"
#include "randstream/errors.hpp"

#include <string>
#include <thread>

namespace randstream {

void StreamParameters::validate() const {
  if (seed.empty()) {
    throw ConfigurationError("seed must not be empty");
  }
  if (seed.size() > MAX_SEED_SIZE) {
    throw ConfigurationError("seed is " + std::to_string(seed.size()) +
                             " bytes long, the maximum is " +
                             std::to_string(MAX_SEED_SIZE));
  }
  if (total_size == 0) {
    throw ConfigurationError("stream size must be greater than zero");
  }
  if (chunk_size == 0) {
    throw ConfigurationError("chunk size must be greater than zero");
  }
}

void JobConfiguration::validate() const {
  stream.validate();
  if (jobs == 0) {
    throw ConfigurationError("job count must be at least 1");
  }
}

unsigned JobConfiguration::defaultJobs() {
  unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : n;
}

} // namespace randstream
