#pragma once

#include <string>

namespace chunkvault {
namespace remote {

// Parts of an access location needed to issue a request
struct Url {
  std::string scheme;
  std::string host;
  std::string port;
  // Path and query for http(s), filesystem path for file
  std::string target;

  bool is_secure() const { return scheme == "https"; }

  // Parses http://, https:// and file:// locations. Throws TransferError on anything else.
  static Url parse(const std::string& location);
};

// Value of a Range header for length bytes at offset, open-ended when length <= 0
std::string format_range_header(long long offset, long long length);

} // namespace remote
} // namespace chunkvault
