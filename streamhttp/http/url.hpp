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

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "streamhttp/base/visibility.hpp"

namespace streamhttp {
namespace http {

/**
 * @brief Parsed absolute http(s) URL
 *
 * Query parameters keep their order and are stored decoded; target()
 * re-encodes them. Fragments are dropped. User info is rejected.
 */
class STREAMHTTP_API Url {
 public:
  using QueryParam = std::pair<std::string, std::string>;

  Url() = default;

  /**
   * @brief Parse an absolute URL
   *
   * Sets ErrorCode::InvalidUrl for malformed input and
   * ErrorCode::UnsupportedScheme for schemes other than http and https.
   */
  static Url parse(const std::string& text, boost::system::error_code& ec);

  const std::string& scheme() const { return scheme_; }
  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }
  const std::string& path() const { return path_; }
  const std::vector<QueryParam>& query() const { return query_; }

  bool is_default_port() const;

  void set_path(const std::string& path);

  /**
   * @brief Append a query parameter, keeping existing ones with the same key
   */
  void add_query(const std::string& key, const std::string& value);

  /**
   * @brief Replace every parameter named key with a single one
   */
  void set_query(const std::string& key, const std::string& value);

  void remove_query(const std::string& key);
  std::optional<std::string> query_value(const std::string& key) const;

  /**
   * @brief Request target: encoded path plus encoded query
   */
  std::string target() const;

  /**
   * @brief Value for the Host header (port only when not the default)
   */
  std::string host_header() const;

  std::string to_string() const;

 private:
  std::string scheme_;
  std::string host_;
  uint16_t port_ = 0;
  std::string path_ = "/";
  std::vector<QueryParam> query_;
};

/**
 * @brief Percent-encode everything outside the RFC 3986 unreserved set
 */
STREAMHTTP_API std::string url_encode(const std::string& text);

/**
 * @brief Decode %XX escapes and '+' as space; invalid escapes are kept as-is
 */
STREAMHTTP_API std::string url_decode(const std::string& text);

}  // namespace http
}  // namespace streamhttp
