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

#pragma once

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/verb.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "streamhttp/base/visibility.hpp"
#include "streamhttp/concurrency/cancellation_signal.hpp"
#include "streamhttp/http/url.hpp"
#include "streamhttp/interface/ibyte_stream.hpp"

namespace streamhttp {
namespace http {

namespace beast_http = boost::beast::http;

/**
 * @brief Outgoing request handed to a transport
 *
 * The body is streamed by the transport. When its length is known the
 * transport sends a Content-Length header, otherwise a chunked body.
 */
class STREAMHTTP_API Request {
 public:
  Request(beast_http::verb method, Url url);

  beast_http::verb method() const { return method_; }
  std::string method_string() const;
  void set_method(beast_http::verb method) { method_ = method; }

  Url& url() { return url_; }
  const Url& url() const { return url_; }

  beast_http::fields& headers() { return headers_; }
  const beast_http::fields& headers() const { return headers_; }

  void set_header(beast_http::field name, const std::string& value);
  void set_header(const std::string& name, const std::string& value);
  std::optional<std::string> header(const std::string& name) const;

  const std::shared_ptr<interface::ByteSourceInterface>& body() const { return body_; }

  /**
   * @brief Attach a body; the content length is taken from the source's size hint
   */
  void set_body(std::shared_ptr<interface::ByteSourceInterface> body);

  std::optional<std::uint64_t> content_length() const { return content_length_; }

  /**
   * @brief Override the body length; nullopt forces a chunked body
   */
  void set_content_length(std::optional<std::uint64_t> length) { content_length_ = length; }

  const std::shared_ptr<concurrency::CancellationSignal>& signal() const { return signal_; }
  void set_signal(std::shared_ptr<concurrency::CancellationSignal> signal) { signal_ = std::move(signal); }

 private:
  beast_http::verb method_;
  Url url_;
  beast_http::fields headers_;
  std::shared_ptr<interface::ByteSourceInterface> body_;
  std::optional<std::uint64_t> content_length_;
  std::shared_ptr<concurrency::CancellationSignal> signal_;
};

/**
 * @brief Response returned by a transport, body still unread
 */
class STREAMHTTP_API Response {
 public:
  Response() = default;
  Response(unsigned status, std::string reason);

  unsigned status_code() const { return status_; }
  const std::string& reason() const { return reason_; }

  beast_http::fields& headers() { return headers_; }
  const beast_http::fields& headers() const { return headers_; }

  void set_header(beast_http::field name, const std::string& value);
  std::optional<std::string> header(const std::string& name) const;

  /**
   * @brief Raw declared Content-Length, if the header is present
   */
  std::optional<std::string> content_length() const;

  const std::shared_ptr<interface::ByteSourceInterface>& body() const { return body_; }
  void set_body(std::shared_ptr<interface::ByteSourceInterface> body) { body_ = std::move(body); }

  /**
   * @brief Close and release the body together with its connection
   */
  void close_body();

 private:
  unsigned status_ = 0;
  std::string reason_;
  beast_http::fields headers_;
  std::shared_ptr<interface::ByteSourceInterface> body_;
};

}  // namespace http
}  // namespace streamhttp
