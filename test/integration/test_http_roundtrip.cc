/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "streamhttp/streamhttp.hpp"
#include "test/utils/test_utils.hpp"

using namespace streamhttp;
using namespace streamhttp::test;
using namespace std::chrono_literals;

namespace net = boost::asio;
namespace beast_http = boost::beast::http;
using tcp = net::ip::tcp;
using beast_http::verb;

namespace {

constexpr const char* kToken = "qawsedrftgyhujikolp";
constexpr std::chrono::milliseconds kSucceedTimeout{1000};
constexpr std::chrono::milliseconds kFailTimeout{100};
constexpr std::chrono::milliseconds kResponseDelay{200};
constexpr std::size_t kLeadBytes = 4 * 1024;

/**
 * @brief Loopback /ping-pong server, one thread per connection
 *
 * HEAD, GET and DELETE answer with a fixed payload; other methods echo the
 * request body. Without with_content_length=1 the body is chunked. Only the
 * first kLeadBytes go out at once; the rest follows after kResponseDelay.
 */
class PingPongServer {
 public:
  explicit PingPongServer(std::string payload) : payload_(std::move(payload)), acceptor_(ioc_) {
    tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), 0);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
    accept_thread_ = std::thread([this]() { accept_loop(); });
  }

  ~PingPongServer() {
    stopping_.store(true);
    // Unblock accept() with a throwaway connection
    boost::system::error_code ec;
    net::io_context ioc;
    tcp::socket poke(ioc);
    poke.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& t : sessions_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  uint16_t port() const { return port_; }

 private:
  void accept_loop() {
    for (;;) {
      auto socket = std::make_shared<tcp::socket>(ioc_);
      boost::system::error_code ec;
      acceptor_.accept(*socket, ec);
      if (stopping_.load()) {
        return;
      }
      if (ec) {
        continue;
      }
      std::lock_guard<std::mutex> lock(mutex_);
      sessions_.emplace_back([this, socket]() { serve(*socket); });
    }
  }

  void serve(tcp::socket& socket) {
    boost::system::error_code ec;
    boost::beast::flat_buffer buffer;
    beast_http::request_parser<beast_http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    beast_http::read(socket, buffer, parser, ec);
    if (ec) {
      return;
    }
    const auto& req = parser.get();

    std::string body;
    switch (req.method()) {
      case verb::head:
      case verb::get:
      case verb::delete_:
        body = payload_;
        break;
      default:
        body = req.body();
        break;
    }

    std::string authorization(req[beast_http::field::authorization]);
    if (authorization != std::string("Bearer ") + kToken) {
      beast_http::response<beast_http::string_body> res{beast_http::status::unauthorized, req.version()};
      res.set(beast_http::field::content_type, "text/plain; charset=utf-8");
      res.body() = "Unauthorized\n";
      res.prepare_payload();
      res.keep_alive(false);
      beast_http::write(socket, res, ec);
      socket.shutdown(tcp::socket::shutdown_both, ec);
      return;
    }

    boost::system::error_code url_ec;
    auto url = http::Url::parse("http://127.0.0.1" + std::string(req.target()), url_ec);
    bool with_content_length = !url_ec && url.query_value("with_content_length").value_or("0") == "1";

    beast_http::response<beast_http::buffer_body> res{beast_http::status::ok, req.version()};
    res.set(beast_http::field::content_type, "application/octet-stream");
    res.keep_alive(false);
    if (with_content_length) {
      res.content_length(body.size());
    } else if (req.method() != verb::head) {
      res.chunked(true);
    }

    res.body().data = nullptr;
    res.body().more = req.method() != verb::head;
    beast_http::response_serializer<beast_http::buffer_body> sr{res};
    beast_http::write_header(socket, sr, ec);
    if (ec || req.method() == verb::head) {
      socket.shutdown(tcp::socket::shutdown_both, ec);
      return;
    }

    // Everything past the lead is held back, so the client always waits on
    // bytes that have not been sent yet
    const std::size_t lead = std::min(kLeadBytes, body.size());
    if (!write_body(socket, sr, res, body.data(), lead)) {
      return;
    }
    std::this_thread::sleep_for(kResponseDelay);
    if (!write_body(socket, sr, res, body.data() + lead, body.size() - lead)) {
      return;
    }

    res.body().data = nullptr;
    res.body().size = 0;
    res.body().more = false;
    beast_http::write(socket, sr, ec);
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }

  static bool write_body(tcp::socket& socket, beast_http::response_serializer<beast_http::buffer_body>& sr,
                         beast_http::response<beast_http::buffer_body>& res, char* data, std::size_t size) {
    const std::size_t chunk = 64 * 1024;
    for (std::size_t offset = 0; offset < size; offset += chunk) {
      res.body().data = data + offset;
      res.body().size = std::min(chunk, size - offset);
      res.body().more = true;
      boost::system::error_code ec;
      beast_http::write(socket, sr, ec);
      if (ec == beast_http::error::need_buffer) {
        ec = {};
      }
      if (ec) {
        return false;
      }
    }
    return true;
  }

  std::string payload_;
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::atomic<bool> stopping_{false};
  std::thread accept_thread_;
  std::mutex mutex_;
  std::vector<std::thread> sessions_;
};

}  // namespace

/**
 * @brief End-to-end requests through BeastTransport against a loopback server
 */
class HttpRoundTripTest : public BaseTest {
 protected:
  static void SetUpTestSuite() {
    payload_ = new std::string(TestUtils::generateRandomData(4 * 1024 * 1024, 7));
    server_ = new PingPongServer(*payload_);
  }

  static void TearDownTestSuite() {
    delete server_;
    server_ = nullptr;
    delete payload_;
    payload_ = nullptr;
  }

  client::ExecutionResult run(verb method, std::chrono::milliseconds timeout, bool with_content_length,
                              stream::BufferSink& sink) {
    std::shared_ptr<interface::TransportInterface> transport = http_transport().build();

    std::shared_ptr<interface::ByteSourceInterface> body;
    if (method != verb::head && method != verb::get && method != verb::delete_) {
      body = std::make_shared<stream::BufferSource>(*payload_);
    }

    auto options = request_options()
                       .timeout(timeout)
                       .modifier([with_content_length](http::Request& request) {
                         request.set_header("Authorization", std::string("Bearer ") + kToken);
                         request.url().add_query("with_content_length", with_content_length ? "1" : "0");
                       })
                       .build();

    std::string url = "http://127.0.0.1:" + std::to_string(server_->port()) + "/ping-pong";
    return do_request(transport, concurrency::CancellationSignal::create(), method, url, body, &sink, options);
  }

  void expect_success(verb method, std::chrono::milliseconds timeout, bool with_content_length) {
    stream::BufferSink sink;
    auto result = run(method, timeout, with_content_length, sink);

    ASSERT_TRUE(result.ok()) << result.fault.message();
    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->status_code(), 200u);
    if (method == verb::head) {
      EXPECT_EQ(sink.size(), 0u);
    } else {
      EXPECT_EQ(sink.size(), payload_->size());
      EXPECT_TRUE(sink.str() == *payload_);
    }
  }

  void expect_failure(verb method, std::chrono::milliseconds timeout, bool with_content_length) {
    stream::BufferSink sink;
    auto result = run(method, timeout, with_content_length, sink);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.fault, ErrorCode::Canceled) << result.fault.message();
    EXPECT_LE(sink.size(), kLeadBytes);
  }

  static std::string* payload_;
  static PingPongServer* server_;
};

std::string* HttpRoundTripTest::payload_ = nullptr;
PingPongServer* HttpRoundTripTest::server_ = nullptr;

TEST_F(HttpRoundTripTest, HeadWithContentLength) { expect_success(verb::head, kSucceedTimeout, true); }

TEST_F(HttpRoundTripTest, GetWithContentLength) { expect_success(verb::get, kSucceedTimeout, true); }

TEST_F(HttpRoundTripTest, Get) { expect_success(verb::get, kSucceedTimeout, false); }

TEST_F(HttpRoundTripTest, GetWithFailTimeout) { expect_failure(verb::get, kFailTimeout, false); }

TEST_F(HttpRoundTripTest, Delete) { expect_success(verb::delete_, kSucceedTimeout, false); }

TEST_F(HttpRoundTripTest, PostWithContentLength) { expect_success(verb::post, kSucceedTimeout, true); }

TEST_F(HttpRoundTripTest, Post) { expect_success(verb::post, kSucceedTimeout, false); }

TEST_F(HttpRoundTripTest, PostWithFailTimeout) { expect_failure(verb::post, kFailTimeout, false); }

TEST_F(HttpRoundTripTest, PostWithoutTimeout) { expect_success(verb::post, 0ms, false); }

TEST_F(HttpRoundTripTest, MissingTokenIsUnauthorized) {
  std::shared_ptr<interface::TransportInterface> transport = http_transport().build();
  stream::BufferSink sink;
  std::string url = "http://127.0.0.1:" + std::to_string(server_->port()) + "/ping-pong";

  auto options = request_options().timeout(kSucceedTimeout).build();
  auto result = do_request(transport, nullptr, verb::get, url, nullptr, &sink, options);

  ASSERT_TRUE(result.ok()) << result.fault.message();
  EXPECT_EQ(result.response->status_code(), 401u);
  EXPECT_EQ(sink.str(), "Unauthorized\n");
}

TEST_F(HttpRoundTripTest, HttpsIsRejected) {
  std::shared_ptr<interface::TransportInterface> transport = http_transport().build();
  stream::BufferSink sink;
  std::string url = "https://127.0.0.1:" + std::to_string(server_->port()) + "/ping-pong";

  auto result = do_request(transport, nullptr, verb::get, url, nullptr, &sink);

  EXPECT_EQ(result.fault, ErrorCode::UnsupportedScheme);
  EXPECT_FALSE(result.response.has_value());
}
