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

#include "streamhttp/http/message.hpp"

namespace streamhttp {
namespace http {

Request::Request(beast_http::verb method, Url url) : method_(method), url_(std::move(url)) {}

std::string Request::method_string() const { return std::string(beast_http::to_string(method_)); }

void Request::set_header(beast_http::field name, const std::string& value) { headers_.set(name, value); }

void Request::set_header(const std::string& name, const std::string& value) { headers_.set(name, value); }

std::optional<std::string> Request::header(const std::string& name) const {
  auto it = headers_.find(name);
  if (it == headers_.end()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

void Request::set_body(std::shared_ptr<interface::ByteSourceInterface> body) {
  body_ = std::move(body);
  content_length_ = body_ ? body_->size() : std::optional<std::uint64_t>{};
}

Response::Response(unsigned status, std::string reason) : status_(status), reason_(std::move(reason)) {}

void Response::set_header(beast_http::field name, const std::string& value) { headers_.set(name, value); }

std::optional<std::string> Response::header(const std::string& name) const {
  auto it = headers_.find(name);
  if (it == headers_.end()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

std::optional<std::string> Response::content_length() const {
  auto it = headers_.find(beast_http::field::content_length);
  if (it == headers_.end()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

void Response::close_body() {
  if (body_) {
    body_->close();
    body_.reset();
  }
}

}  // namespace http
}  // namespace streamhttp
