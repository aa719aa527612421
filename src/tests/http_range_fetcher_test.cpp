#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "remote/http_range_fetcher.hpp"
#include "core/errors.hpp"
#include "test_utils.hpp"

using namespace chunkvault;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Blocking HTTP/1.1 server on the loopback interface, one connection at a time.
//   /missing  404
//   /full     200 with the whole object, Range ignored
//   /short    206 with half of the requested range
//   /stall    accepts the request and answers nothing for 1.5s
//   otherwise 206 with the requested range
class RangeServer {
public:
  struct Received {
    std::string target;
    std::string range;
    std::string user_agent;
    std::string accept_encoding;
  };

  explicit RangeServer(std::string object)
    : object_(std::move(object))
    , acceptor_(io_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { serve(); });
  }

  ~RangeServer() {
    stopping_ = true;
    // Wake the blocking accept
    net::io_context io;
    tcp::socket wake(io);
    boost::system::error_code ec;
    wake.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
    thread_.join();
  }

  std::string location(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path + "?X-Signature=secret";
  }

  std::vector<Received> received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

private:
  std::string object_;
  net::io_context io_;
  tcp::acceptor acceptor_;
  unsigned short port_{0};
  std::atomic<bool> stopping_{false};
  std::thread thread_;
  std::mutex mutex_;
  std::vector<Received> received_;

  void serve() {
    while (!stopping_) {
      tcp::socket socket(io_);
      boost::system::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec || stopping_) {
        break;
      }
      handle(socket);
    }
  }

  void handle(tcp::socket& socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    boost::system::error_code ec;
    http::read(socket, buffer, request, ec);
    if (ec) {
      return;
    }

    std::string target(request.target());
    target = target.substr(0, target.find('?'));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      received_.push_back({target, std::string(request[http::field::range]),
                           std::string(request[http::field::user_agent]),
                           std::string(request[http::field::accept_encoding])});
    }

    if (target == "/stall") {
      std::this_thread::sleep_for(std::chrono::milliseconds(1500));
      return;
    }

    http::response<http::string_body> response;
    response.version(11);
    if (target == "/missing") {
      response.result(http::status::not_found);
      response.body() = "no such object";
    } else if (target == "/full") {
      response.result(http::status::ok);
      response.body() = object_;
    } else {
      // "bytes=<first>-<last>"
      std::string range(request[http::field::range]);
      std::size_t dash = range.find('-');
      std::size_t first = std::stoull(range.substr(6, dash - 6));
      std::size_t last = std::stoull(range.substr(dash + 1));

      response.result(http::status::partial_content);
      response.set(http::field::content_range, range.substr(6) + "/" + std::to_string(object_.size()));
      response.body() = object_.substr(first, last - first + 1);
      if (target == "/short") {
        response.body().resize(response.body().size() / 2);
      }
    }
    response.prepare_payload();
    http::write(socket, response, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }
};

class HttpRangeFetcherTest : public ::testing::Test {
protected:
  std::string object;
  std::unique_ptr<RangeServer> server;
  remote::TransportConfig config;

  void SetUp() override {
    init_logging(boost::log::trivial::fatal);
    object = make_payload(5000);
    server = std::make_unique<RangeServer>(object);
    config.timeout = std::chrono::seconds(5);
  }

  void TearDown() override {
    server.reset();
  }
};

TEST_F(HttpRangeFetcherTest, PartialContentIsReturnedAsIs) {
  remote::HttpRangeFetcher fetcher(config);

  auto source = fetcher.open(server->location("/objects/chunk0"), 1000, 700);
  EXPECT_EQ(read_all(*source, 128), object.substr(1000, 700));
  source->close();

  auto received = server->received();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].target, "/objects/chunk0");
  EXPECT_EQ(received[0].range, "bytes=1000-1699");
}

TEST_F(HttpRangeFetcherTest, ConfiguredHeadersAreSent) {
  config.headers = {{"User-Agent", "chunkvault-test"}, {"Accept-Encoding", "identity"}};
  remote::HttpRangeFetcher fetcher(config);

  auto source = fetcher.open(server->location("/chunk"), 0, 10);
  EXPECT_EQ(read_all(*source), object.substr(0, 10));

  auto received = server->received();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].user_agent, "chunkvault-test");
  EXPECT_EQ(received[0].accept_encoding, "identity");
}

TEST_F(HttpRangeFetcherTest, FullContentResponseSkipsLeadingBytes) {
  // Small buffer so the discarded prefix spans many reads
  config.read_buffer_size = 16;
  remote::HttpRangeFetcher fetcher(config);

  auto source = fetcher.open(server->location("/full"), 2500, 300);
  EXPECT_EQ(read_all(*source, 64), object.substr(2500, 300));
}

TEST_F(HttpRangeFetcherTest, UnexpectedStatusIsTransferError) {
  remote::HttpRangeFetcher fetcher(config);

  try {
    fetcher.open(server->location("/missing"), 0, 10);
    FAIL() << "Expected TransferError";
  } catch (const core::TransferError& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("404"), std::string::npos);
    // Signed query strings stay out of error messages
    EXPECT_EQ(message.find("secret"), std::string::npos);
  }
}

TEST_F(HttpRangeFetcherTest, BodyEndingEarlyIsTransferError) {
  remote::HttpRangeFetcher fetcher(config);

  auto source = fetcher.open(server->location("/short"), 0, 400);
  EXPECT_THROW(read_all(*source), core::TransferError);
}

TEST_F(HttpRangeFetcherTest, StalledServerTimesOut) {
  config.timeout = std::chrono::seconds(1);
  remote::HttpRangeFetcher fetcher(config);

  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(fetcher.open(server->location("/stall"), 0, 10), core::TransferError);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST_F(HttpRangeFetcherTest, RefusedConnectionIsTransferError) {
  unsigned short port;
  {
    net::io_context io;
    tcp::acceptor closed(io, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = closed.local_endpoint().port();
  }
  remote::HttpRangeFetcher fetcher(config);

  EXPECT_THROW(fetcher.open("http://127.0.0.1:" + std::to_string(port) + "/chunk", 0, 10),
               core::TransferError);
}

TEST_F(HttpRangeFetcherTest, RejectsNonHttpLocations) {
  remote::HttpRangeFetcher fetcher(config);
  EXPECT_THROW(fetcher.open("file:///tmp/chunk", 0, 10), core::TransferError);
  EXPECT_THROW(fetcher.open(server->location("/chunk"), -1, 10), core::TransferError);
}

TEST_F(HttpRangeFetcherTest, ReadAfterCloseFails) {
  remote::HttpRangeFetcher fetcher(config);
  auto source = fetcher.open(server->location("/chunk"), 0, 100);
  source->close();
  source->close();

  char buffer[8];
  EXPECT_THROW(source->read(buffer, sizeof(buffer)), core::TransferError);
}
