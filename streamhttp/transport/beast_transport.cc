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

#include "streamhttp/transport/beast_transport.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <chrono>
#include <limits>
#include <string>
#include <vector>

#include "streamhttp/base/error_codes.hpp"
#include "streamhttp/common/constants.hpp"
#include "streamhttp/common/error_handler.hpp"
#include "streamhttp/common/logger.hpp"

namespace streamhttp {
namespace transport {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace beast_http = boost::beast::http;
using tcp = net::ip::tcp;

/**
 * @brief State of one HTTP exchange, shared by perform() and the response body
 */
struct Connection {
  net::io_context ioc;
  beast::tcp_stream stream{ioc};
  beast::flat_buffer buffer;
  beast_http::response_parser<beast_http::buffer_body> parser;

  std::shared_ptr<concurrency::CancellationSignal> signal;
  concurrency::CancellationSignal::HandlerId handler_id = 0;
  std::atomic<bool> canceled{false};

  ~Connection() {
    if (signal && handler_id != 0) {
      signal->remove_handler(handler_id);
    }
  }

  // Runs the private context on the calling thread until no work is left
  void run() {
    ioc.restart();
    ioc.run();
  }

  void cancel() {
    canceled.store(true);
    // The handler lives in ioc, so it only runs while this object is alive
    Connection* self = this;
    net::post(ioc, [self]() { self->stream.cancel(); });
  }

  void close() {
    boost::system::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    stream.socket().close(ignored);
  }
};

namespace {

/**
 * @brief Pulls the response body straight from the connection
 */
class ResponseBodySource : public interface::ByteSourceInterface {
 public:
  explicit ResponseBodySource(std::shared_ptr<Connection> conn) : conn_(std::move(conn)) {}

  ~ResponseBodySource() override { close(); }

  std::size_t read_some(net::mutable_buffer buffer, boost::system::error_code& ec) override {
    ec.clear();
    if (!conn_) {
      ec = net::error::bad_descriptor;
      return 0;
    }
    if (conn_->canceled.load()) {
      ec = make_error_code(ErrorCode::Canceled);
      return 0;
    }
    if (conn_->parser.is_done()) {
      ec = net::error::eof;
      return 0;
    }

    auto& body = conn_->parser.get().body();
    body.data = buffer.data();
    body.size = buffer.size();

    boost::system::error_code op_ec;
    beast_http::async_read(conn_->stream, conn_->buffer, conn_->parser,
                           [&op_ec](const boost::system::error_code& e, std::size_t) { op_ec = e; });
    conn_->run();

    if (op_ec == beast_http::error::need_buffer) {
      op_ec.clear();
    }
    std::size_t n = buffer.size() - body.size;

    if (op_ec) {
      ec = conn_->canceled.load() ? make_error_code(ErrorCode::Canceled) : op_ec;
      return n;
    }
    if (conn_->canceled.load()) {
      ec = make_error_code(ErrorCode::Canceled);
    } else if (conn_->parser.is_done()) {
      ec = net::error::eof;
    }
    return n;
  }

  void close() override {
    if (conn_) {
      conn_->close();
      conn_.reset();
    }
  }

 private:
  std::shared_ptr<Connection> conn_;
};

}  // namespace

BeastTransport::BeastTransport(const config::TransportConfig& cfg) : cfg_(cfg) {
  if (!cfg_.is_valid()) {
    cfg_.validate_and_clamp();
  }
}

std::optional<http::Response> BeastTransport::perform(http::Request& request, boost::system::error_code& ec) {
  ec.clear();
  const http::Url& url = request.url();

  if (url.scheme() != "http") {
    ec = make_error_code(ErrorCode::UnsupportedScheme);
    STREAMHTTP_LOG_ERROR("beast_transport", "perform", "Unsupported scheme: " + url.scheme());
    common::error_reporting::report_transport_error("beast_transport", "perform", ec);
    return std::nullopt;
  }

  auto conn = std::make_shared<Connection>();
  conn->parser.header_limit(cfg_.header_limit);
  conn->parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

  if (request.signal()) {
    conn->signal = request.signal();
    std::weak_ptr<Connection> weak_conn = conn;
    conn->handler_id = conn->signal->add_handler([weak_conn]() {
      if (auto c = weak_conn.lock()) {
        c->cancel();
      }
    });
  }

  STREAMHTTP_LOG_DEBUG("beast_transport", "perform", request.method_string() + " " + url.to_string());

  connect(*conn, url, ec);
  if (!ec) {
    send_request(*conn, request, ec);
  }
  if (ec) {
    conn->close();
    STREAMHTTP_LOG_ERROR("beast_transport", "perform", "Request failed: " + ec.message());
    common::error_reporting::report_transport_error("beast_transport", "perform", ec);
    return std::nullopt;
  }

  auto response = receive_header(conn, request, ec);
  if (ec) {
    conn->close();
    STREAMHTTP_LOG_ERROR("beast_transport", "receive_header", "Response failed: " + ec.message());
    common::error_reporting::report_transport_error("beast_transport", "receive_header", ec);
    return std::nullopt;
  }
  return response;
}

void BeastTransport::connect(Connection& conn, const http::Url& url, boost::system::error_code& ec) {
  if (conn.canceled.load()) {
    ec = make_error_code(ErrorCode::Canceled);
    return;
  }

  tcp::resolver resolver(conn.ioc);
  tcp::resolver::results_type endpoints;
  boost::system::error_code op_ec;
  resolver.async_resolve(url.host(), std::to_string(url.port()),
                         [&op_ec, &endpoints](const boost::system::error_code& e, tcp::resolver::results_type r) {
                           op_ec = e;
                           endpoints = std::move(r);
                         });
  conn.run();
  if (op_ec || conn.canceled.load()) {
    ec = conn.canceled.load() ? make_error_code(ErrorCode::Canceled) : op_ec;
    return;
  }

  conn.stream.expires_after(std::chrono::milliseconds(cfg_.connection_timeout_ms));
  conn.stream.async_connect(endpoints,
                            [&op_ec](const boost::system::error_code& e, const tcp::endpoint&) { op_ec = e; });
  conn.run();
  conn.stream.expires_never();

  if (op_ec || conn.canceled.load()) {
    ec = conn.canceled.load() ? make_error_code(ErrorCode::Canceled) : op_ec;
  }
}

void BeastTransport::send_request(Connection& conn, http::Request& request, boost::system::error_code& ec) {
  beast_http::request<beast_http::buffer_body> req{request.method(), request.url().target(),
                                                   common::constants::HTTP_VERSION};
  for (const auto& field : request.headers()) {
    req.insert(field.name_string(), field.value());
  }
  if (req.find(beast_http::field::host) == req.end()) {
    req.set(beast_http::field::host, request.url().host_header());
  }
  if (req.find(beast_http::field::user_agent) == req.end()) {
    req.set(beast_http::field::user_agent, cfg_.user_agent);
  }

  const auto& body = request.body();
  bool explicit_length = req.find(beast_http::field::content_length) != req.end();
  if (body) {
    if (!explicit_length) {
      if (request.content_length()) {
        req.content_length(*request.content_length());
      } else {
        req.chunked(true);
      }
    }
  } else if (!explicit_length && (request.method() == beast_http::verb::post ||
                                  request.method() == beast_http::verb::put ||
                                  request.method() == beast_http::verb::patch)) {
    req.content_length(0);
  }
  req.body().data = nullptr;
  req.body().size = 0;
  req.body().more = static_cast<bool>(body);

  beast_http::request_serializer<beast_http::buffer_body> sr{req};
  boost::system::error_code op_ec;

  if (conn.canceled.load()) {
    ec = make_error_code(ErrorCode::Canceled);
    return;
  }
  beast_http::async_write_header(conn.stream, sr, [&op_ec](const boost::system::error_code& e, std::size_t) {
    op_ec = e;
  });
  conn.run();
  if (op_ec || conn.canceled.load()) {
    ec = conn.canceled.load() ? make_error_code(ErrorCode::Canceled) : op_ec;
    return;
  }

  if (!body) {
    return;
  }

  std::vector<char> chunk(common::constants::DEFAULT_CHUNK_SIZE);
  for (;;) {
    boost::system::error_code read_ec;
    std::size_t n = body->read_some(net::buffer(chunk), read_ec);
    bool last = read_ec == net::error::eof;
    if (read_ec && !last) {
      ec = read_ec;
      return;
    }
    if (n == 0 && !last) {
      continue;
    }

    req.body().data = n > 0 ? chunk.data() : nullptr;
    req.body().size = n;
    req.body().more = !last;

    if (conn.canceled.load()) {
      ec = make_error_code(ErrorCode::Canceled);
      return;
    }
    beast_http::async_write(conn.stream, sr, [&op_ec](const boost::system::error_code& e, std::size_t) {
      op_ec = e;
    });
    conn.run();
    if (op_ec == beast_http::error::need_buffer) {
      op_ec.clear();
    }
    if (op_ec || conn.canceled.load()) {
      ec = conn.canceled.load() ? make_error_code(ErrorCode::Canceled) : op_ec;
      return;
    }
    if (last) {
      return;
    }
  }
}

std::optional<http::Response> BeastTransport::receive_header(const std::shared_ptr<Connection>& conn,
                                                             const http::Request& request,
                                                             boost::system::error_code& ec) {
  if (request.method() == beast_http::verb::head) {
    conn->parser.skip(true);
  }

  boost::system::error_code op_ec;
  beast_http::async_read_header(conn->stream, conn->buffer, conn->parser,
                                [&op_ec](const boost::system::error_code& e, std::size_t) { op_ec = e; });
  conn->run();
  if (op_ec || conn->canceled.load()) {
    ec = conn->canceled.load() ? make_error_code(ErrorCode::Canceled) : op_ec;
    return std::nullopt;
  }

  const auto& header = conn->parser.get();
  http::Response response(header.result_int(), std::string(header.reason()));
  for (const auto& field : header.base()) {
    response.headers().insert(field.name_string(), field.value());
  }
  response.set_body(std::make_shared<ResponseBodySource>(conn));

  STREAMHTTP_LOG_DEBUG("beast_transport", "receive_header",
                       "Status " + std::to_string(response.status_code()) + " from " + request.url().host_header());
  return response;
}

}  // namespace transport
}  // namespace streamhttp
