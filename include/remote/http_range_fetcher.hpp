#ifndef CHUNKVAULT_REMOTE_HTTP_RANGE_FETCHER_HPP
#define CHUNKVAULT_REMOTE_HTTP_RANGE_FETCHER_HPP

#include <memory>
#include <string>
#include <boost/asio/ssl/context.hpp>
#include "remote/range_fetcher.hpp"
#include "remote/transport_config.hpp"

namespace chunkvault {
namespace remote {

/**
 * Bounded HTTP(S) GET of a byte range at a resolved location.
 *
 * Sends "Range: bytes=<offset>-<offset+length-1>" with the configured
 * headers and accepts 206 Partial Content or 200 OK. On a 200 response the
 * leading offset bytes are discarded, so the returned source always starts
 * at the requested offset and ends after length bytes. Every other status
 * is a TransferError. The whole exchange, body included, runs under the
 * configured timeout.
 *
 * Sources returned by open() refer to this fetcher's TLS context and must
 * not outlive it.
 */
class HttpRangeFetcher : public RangeFetcher {
public:
  explicit HttpRangeFetcher(TransportConfig config = TransportConfig{});
  ~HttpRangeFetcher() override;

  HttpRangeFetcher(const HttpRangeFetcher&) = delete;
  HttpRangeFetcher& operator=(const HttpRangeFetcher&) = delete;

  io::ByteSourcePtr open(const std::string& location, int64_t offset, int64_t length) override;

  const TransportConfig& config() const { return config_; }

private:
  TransportConfig config_;
  boost::asio::ssl::context ssl_context_;
};

} // namespace remote
} // namespace chunkvault

#endif // CHUNKVAULT_REMOTE_HTTP_RANGE_FETCHER_HPP
