#include "remote/url.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace chunkvault {
namespace remote {

Url Url::parse(const std::string& location) {
  size_t scheme_end = location.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw core::TransferError("Invalid location, missing scheme: " + location);
  }

  Url url;
  url.scheme = location.substr(0, scheme_end);
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::string rest = location.substr(scheme_end + 3);

  if (url.scheme == "file") {
    // file:///abs/path has an empty authority
    if (rest.empty() || rest.front() != '/') {
      throw core::TransferError("Invalid file location: " + location);
    }
    url.target = rest;
    return url;
  }

  if (url.scheme != "http" && url.scheme != "https") {
    throw core::TransferError("Unsupported location scheme: " + url.scheme);
  }

  size_t path_start = rest.find_first_of("/?");
  std::string authority = rest.substr(0, path_start);
  url.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
  if (url.target.front() == '?') {
    url.target = "/" + url.target;
  }

  // Drop userinfo, credentials travel in the query for signed URLs
  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    url.host = authority.substr(0, colon);
    url.port = authority.substr(colon + 1);
  } else {
    url.host = authority;
  }

  if (url.host.empty()) {
    throw core::TransferError("Invalid location, missing host: " + location);
  }
  if (url.port.empty()) {
    url.port = url.is_secure() ? "443" : "80";
  }
  if (!std::all_of(url.port.begin(), url.port.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw core::TransferError("Invalid port in location: " + location);
  }

  return url;
}

std::string format_range_header(long long offset, long long length) {
  if (length > 0) {
    return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
  }
  return "bytes=" + std::to_string(offset) + "-";
}

} // namespace remote
} // namespace chunkvault
