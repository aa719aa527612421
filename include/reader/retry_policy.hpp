#ifndef CHUNKVAULT_READER_RETRY_POLICY_HPP
#define CHUNKVAULT_READER_RETRY_POLICY_HPP

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <boost/log/trivial.hpp>
#include "core/errors.hpp"

namespace chunkvault::reader {

// Bounded retries with a linearly increasing delay: attempt k that fails
// with a TransientError is followed by a pause of k * base_delay.
struct RetryPolicy {
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  int max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  // Replaced in tests to avoid real pauses
  Sleeper sleeper{[](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }};

  std::chrono::milliseconds delay_after(int attempt) const { return base_delay * attempt; }

  // Runs operation until it succeeds, a non-transient error escapes, or
  // max_attempts transient failures have occurred, in which case
  // RetryExhaustedError is thrown with the chunk index and attempt count.
  template <typename Operation>
  auto run(int chunk_index, const std::string& description, Operation&& operation) const
      -> decltype(operation()) {
    if (max_attempts < 1) {
      throw core::ConfigurationError("retry policy needs at least one attempt");
    }

    for (int attempt = 1;; ++attempt) {
      try {
        return operation();
      }
      catch (const core::TransientError& e) {
        if (attempt >= max_attempts) {
          BOOST_LOG_TRIVIAL(error) << "Retry: " << description << " of chunk " << chunk_index
                                   << " failed after " << attempt << " attempts: " << e.what();
          throw core::RetryExhaustedError(chunk_index, attempt, description, e.what());
        }

        auto delay = delay_after(attempt);
        BOOST_LOG_TRIVIAL(warning) << "Retry: " << description << " of chunk " << chunk_index
                                   << " failed (attempt " << attempt << "/" << max_attempts
                                   << "), retrying in " << delay.count() << "ms: " << e.what();
        if (sleeper) {
          sleeper(delay);
        }
      }
    }
  }
};

} // namespace chunkvault::reader

#endif // CHUNKVAULT_READER_RETRY_POLICY_HPP
