#include "remote/range_fetcher.hpp"
#include "remote/url.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace remote {

//==============================================
// FILE RANGE FETCHER
//==============================================

io::ByteSourcePtr FileRangeFetcher::open(const std::string& location, int64_t offset, int64_t length) {
  Url url = Url::parse(location);
  if (url.scheme != "file") {
    throw core::TransferError("File fetcher: unsupported location " + location);
  }

  std::filesystem::path path(url.target);
  std::error_code ec;
  auto size = static_cast<int64_t>(std::filesystem::file_size(path, ec));
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File fetcher: Cannot stat " << path.string() << ": " << ec.message();
    throw core::TransferError("File fetcher: cannot open " + path.string() + ": " + ec.message());
  }

  // Equivalent of an unsatisfiable range response
  if (offset < 0 || offset > size || (length > 0 && offset + length > size)) {
    throw core::TransferError("File fetcher: range " + format_range_header(offset, length) +
                              " not satisfiable for " + std::to_string(size) + " bytes");
  }

  int64_t bounded = length > 0 ? length : size - offset;
  BOOST_LOG_TRIVIAL(debug) << "File fetcher: Opening " << path.string() << " "
                           << format_range_header(offset, bounded);
  return std::make_unique<io::FileSectionSource>(path, offset, bounded);
}


//==============================================
// SCHEME RANGE FETCHER
//==============================================

void SchemeRangeFetcher::register_scheme(const std::string& scheme, RangeFetcher& fetcher) {
  fetchers_[scheme] = &fetcher;
}

io::ByteSourcePtr SchemeRangeFetcher::open(const std::string& location, int64_t offset, int64_t length) {
  Url url = Url::parse(location);
  auto it = fetchers_.find(url.scheme);
  if (it == fetchers_.end()) {
    throw core::TransferError("No fetcher registered for scheme: " + url.scheme);
  }
  return it->second->open(location, offset, length);
}

} // namespace remote
} // namespace chunkvault
