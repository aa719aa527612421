#include "remote/http_range_fetcher.hpp"
#include "remote/url.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <limits>
#include <vector>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace remote {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

// Location without the query string, which carries signed credentials
std::string printable(const Url& url) {
  std::string path = url.target.substr(0, url.target.find('?'));
  return url.scheme + "://" + url.host + ":" + url.port + path;
}

} // namespace

//==============================================
// HTTP BODY SOURCE
//==============================================

// Response body of one range request, read incrementally from the socket
class HttpBodySource : public io::ByteSource {
public:
  HttpBodySource(const TransportConfig& config, ssl::context& ssl_context,
                 const Url& url, int64_t offset, int64_t length)
    : url_(url)
    , remaining_(length > 0 ? length : -1)
    , scratch_(config.read_buffer_size == 0 ? 8192 : config.read_buffer_size) {
    parser_.body_limit((std::numeric_limits<std::uint64_t>::max)());

    if (url_.is_secure()) {
      secure_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(io_context_, ssl_context);
      // SNI is required by most object stores
      if (!SSL_set_tlsext_host_name(secure_->native_handle(), url_.host.c_str())) {
        throw core::TransferError("Failed to set TLS server name for " + url_.host);
      }
      if (config.verify_peer) {
        secure_->set_verify_callback(ssl::host_name_verification(url_.host));
      }
      beast::get_lowest_layer(*secure_).expires_after(config.timeout);
      connect(beast::get_lowest_layer(*secure_));
      check(run([this](auto handler) {
        secure_->async_handshake(ssl::stream_base::client, std::move(handler));
      }), "TLS handshake");
      exchange(*secure_, config, offset, length);
    } else {
      plain_ = std::make_unique<beast::tcp_stream>(io_context_);
      plain_->expires_after(config.timeout);
      connect(*plain_);
      exchange(*plain_, config, offset, length);
    }
  }

  ~HttpBodySource() override {
    close();
  }

  std::size_t read(char* buffer, std::size_t size) override {
    if (closed_) {
      throw core::TransferError("Read after close of " + printable(url_));
    }
    if (remaining_ == 0 || size == 0) {
      return 0;
    }

    while (true) {
      if (parser_.is_done()) {
        if (remaining_ > 0 || skip_ > 0) {
          BOOST_LOG_TRIVIAL(error) << "HTTP fetcher: Body of " << printable(url_) << " ended with "
                                   << remaining_ << " bytes outstanding";
          throw core::TransferError("Response body ended early from " + printable(url_));
        }
        return 0;
      }

      // Discarded prefix of a full-content response goes to scratch space
      char* target = buffer;
      std::size_t want = size;
      if (skip_ > 0) {
        target = scratch_.data();
        want = static_cast<std::size_t>(std::min<int64_t>(skip_, static_cast<int64_t>(scratch_.size())));
      } else if (remaining_ > 0) {
        want = static_cast<std::size_t>(std::min<int64_t>(static_cast<int64_t>(size), remaining_));
      }

      parser_.get().body().data = target;
      parser_.get().body().size = want;

      boost::system::error_code ec;
      if (secure_) {
        ec = read_some(*secure_);
      } else {
        ec = read_some(*plain_);
      }
      if (ec == http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "HTTP fetcher: Body read from " << printable(url_)
                                 << " failed: " << ec.message();
        throw core::TransferError("Body read from " + printable(url_) + " failed: " + ec.message());
      }

      std::size_t count = want - parser_.get().body().size;
      if (count == 0) {
        continue;
      }

      if (skip_ > 0) {
        skip_ -= static_cast<int64_t>(count);
        continue;
      }

      if (remaining_ > 0) {
        remaining_ -= static_cast<int64_t>(count);
      }
      return count;
    }
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;

    boost::system::error_code ec;
    tcp::socket& socket = secure_ ? beast::get_lowest_layer(*secure_).socket()
                                  : plain_->socket();
    if (socket.is_open()) {
      socket.shutdown(tcp::socket::shutdown_both, ec);
      socket.close(ec);
    }
    BOOST_LOG_TRIVIAL(trace) << "HTTP fetcher: Closed connection to " << printable(url_);
  }

private:
  Url url_;
  net::io_context io_context_;
  std::unique_ptr<beast::tcp_stream> plain_;
  std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure_;
  beast::flat_buffer buffer_;
  http::response_parser<http::buffer_body> parser_;
  int64_t skip_{0};
  int64_t remaining_;
  std::vector<char> scratch_;
  bool closed_{false};

  // Runs one asynchronous operation to completion on the private io_context.
  // The stream's expiry cancels it once the transport timeout passes.
  template <typename Initiate>
  boost::system::error_code run(Initiate&& initiate) {
    boost::system::error_code result = net::error::would_block;
    initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
    io_context_.restart();
    io_context_.run();
    return result;
  }

  void check(const boost::system::error_code& ec, const std::string& step) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP fetcher: " << step << " with " << printable(url_)
                               << " failed: " << ec.message();
      throw core::TransferError(step + " with " + printable(url_) + " failed: " + ec.message());
    }
  }

  void connect(beast::tcp_stream& stream) {
    tcp::resolver resolver(io_context_);
    tcp::resolver::results_type endpoints;

    check(run([&](auto handler) {
      resolver.async_resolve(url_.host, url_.port,
        [&endpoints, handler](boost::system::error_code ec, tcp::resolver::results_type results) mutable {
          endpoints = results;
          handler(ec);
        });
    }), "Resolve");

    check(run([&](auto handler) {
      stream.async_connect(endpoints, std::move(handler));
    }), "Connect");
  }

  template <typename Stream>
  void exchange(Stream& stream, const TransportConfig& config, int64_t offset, int64_t length) {
    http::request<http::empty_body> request{http::verb::get, url_.target, 11};
    request.set(http::field::host, url_.host);
    for (const auto& [name, value] : config.headers) {
      request.set(name, value);
    }
    request.set(http::field::range, format_range_header(offset, length));

    BOOST_LOG_TRIVIAL(debug) << "HTTP fetcher: GET " << printable(url_) << " "
                             << format_range_header(offset, length);

    check(run([&](auto handler) {
      http::async_write(stream, request, std::move(handler));
    }), "Request");

    check(run([&](auto handler) {
      http::async_read_header(stream, buffer_, parser_, std::move(handler));
    }), "Response header");

    const unsigned status = parser_.get().result_int();
    if (status == static_cast<unsigned>(http::status::partial_content)) {
      skip_ = 0;
    } else if (status == static_cast<unsigned>(http::status::ok)) {
      // Backend ignored the range and sent the whole object
      skip_ = offset;
    } else {
      BOOST_LOG_TRIVIAL(error) << "HTTP fetcher: Unexpected status " << status
                               << " from " << printable(url_);
      throw core::TransferError("HTTP request failed with status " + std::to_string(status) +
                                ", URL: " + printable(url_));
    }

    BOOST_LOG_TRIVIAL(debug) << "HTTP fetcher: Status " << status << " from " << printable(url_);
  }

  template <typename Stream>
  boost::system::error_code read_some(Stream& stream) {
    return run([&](auto handler) {
      http::async_read_some(stream, buffer_, parser_, std::move(handler));
    });
  }
};


//==============================================
// HTTP RANGE FETCHER
//==============================================

HttpRangeFetcher::HttpRangeFetcher(TransportConfig config)
  : config_(std::move(config))
  , ssl_context_(ssl::context::tls_client) {
  if (config_.verify_peer) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(ssl::verify_peer);
  } else {
    ssl_context_.set_verify_mode(ssl::verify_none);
  }
  BOOST_LOG_TRIVIAL(info) << "HTTP fetcher: Initialized with timeout of "
                          << config_.timeout.count() << "s";
}

HttpRangeFetcher::~HttpRangeFetcher() = default;

io::ByteSourcePtr HttpRangeFetcher::open(const std::string& location, int64_t offset, int64_t length) {
  Url url = Url::parse(location);
  if (url.scheme != "http" && url.scheme != "https") {
    throw core::TransferError("HTTP fetcher: unsupported location scheme " + url.scheme);
  }
  if (offset < 0) {
    throw core::TransferError("HTTP fetcher: negative offset " + std::to_string(offset));
  }

  try {
    return std::make_unique<HttpBodySource>(config_, ssl_context_, url, offset, length);
  }
  catch (const core::TransferError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP fetcher: Failed to open " << printable(url) << ": " << e.what();
    throw core::TransferError("Failed to open " + printable(url) + ": " + e.what());
  }
}

} // namespace remote
} // namespace chunkvault
