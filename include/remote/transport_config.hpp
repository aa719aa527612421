#ifndef CHUNKVAULT_REMOTE_TRANSPORT_CONFIG_HPP
#define CHUNKVAULT_REMOTE_TRANSPORT_CONFIG_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace chunkvault::remote {

// Shared settings for every remote byte-range request. Built once and
// injected into the fetchers.
struct TransportConfig {
  // Ceiling against a stalled transfer of a multi-gigabyte chunk
  std::chrono::seconds timeout{std::chrono::minutes(30)};
  std::vector<std::pair<std::string, std::string>> headers{
    {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36"},
    {"Accept", "*/*"},
    {"Accept-Encoding", "identity"}
  };
  bool verify_peer{true};
  std::size_t read_buffer_size{64 * 1024};
};

} // namespace chunkvault::remote

#endif // CHUNKVAULT_REMOTE_TRANSPORT_CONFIG_HPP
