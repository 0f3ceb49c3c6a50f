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

#include "streamhttp/http/url.hpp"

#include <algorithm>
#include <cctype>

#include "streamhttp/base/error_codes.hpp"
#include "streamhttp/common/constants.hpp"

namespace streamhttp {
namespace http {

namespace {

bool is_unreserved(unsigned char c) { return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~'; }

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Path characters that may stay literal besides the unreserved set
bool is_path_char(unsigned char c) {
  return is_unreserved(c) || c == '/' || c == ':' || c == '@' || c == '!' || c == '$' || c == '&' || c == '\'' ||
         c == '(' || c == ')' || c == '*' || c == '+' || c == ',' || c == ';' || c == '=' || c == '%';
}

std::vector<Url::QueryParam> parse_query(const std::string& text) {
  std::vector<Url::QueryParam> params;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('&', start);
    if (end == std::string::npos) end = text.size();
    std::string pair = text.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        params.emplace_back(url_decode(pair), "");
      } else {
        params.emplace_back(url_decode(pair.substr(0, eq)), url_decode(pair.substr(eq + 1)));
      }
    }
    start = end + 1;
  }
  return params;
}

}  // namespace

std::string url_encode(const std::string& text) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (is_unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string url_decode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size()) {
      int hi = hex_value(text[i + 1]);
      int lo = hex_value(text[i + 2]);
      if (hi < 0 || lo < 0) {
        out.push_back(c);
      } else {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
      }
    } else {
      out.push_back(c);
    }
  }
  return out;
}

Url Url::parse(const std::string& text, boost::system::error_code& ec) {
  ec.clear();
  Url url;

  size_t scheme_end = text.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    ec = make_error_code(ErrorCode::InvalidUrl);
    return Url{};
  }
  url.scheme_ = to_lower(text.substr(0, scheme_end));
  if (url.scheme_ == "http") {
    url.port_ = common::constants::DEFAULT_HTTP_PORT;
  } else if (url.scheme_ == "https") {
    url.port_ = common::constants::DEFAULT_HTTPS_PORT;
  } else {
    ec = make_error_code(ErrorCode::UnsupportedScheme);
    return Url{};
  }

  std::string rest = text.substr(scheme_end + 3);
  size_t fragment = rest.find('#');
  if (fragment != std::string::npos) {
    rest.erase(fragment);
  }

  size_t authority_end = rest.find_first_of("/?");
  std::string authority = rest.substr(0, authority_end);
  std::string remainder = authority_end == std::string::npos ? std::string() : rest.substr(authority_end);

  if (authority.empty() || authority.find('@') != std::string::npos) {
    ec = make_error_code(ErrorCode::InvalidUrl);
    return Url{};
  }

  std::string port_text;
  if (authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return Url{};
    }
    url.host_ = authority.substr(1, close - 1);
    std::string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        ec = make_error_code(ErrorCode::InvalidUrl);
        return Url{};
      }
      port_text = after.substr(1);
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      url.host_ = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
      if (port_text.empty()) {
        ec = make_error_code(ErrorCode::InvalidUrl);
        return Url{};
      }
    } else {
      url.host_ = authority;
    }
  }

  if (url.host_.empty() || url.host_.size() > common::constants::MAX_HOSTNAME_LENGTH) {
    ec = make_error_code(ErrorCode::InvalidUrl);
    return Url{};
  }

  if (!port_text.empty()) {
    if (port_text.size() > 5 || !std::all_of(port_text.begin(), port_text.end(),
                                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return Url{};
    }
    unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 65535) {
      ec = make_error_code(ErrorCode::InvalidUrl);
      return Url{};
    }
    url.port_ = static_cast<uint16_t>(port);
  }

  size_t query_start = remainder.find('?');
  std::string path = remainder.substr(0, query_start);
  if (!std::all_of(path.begin(), path.end(), [](unsigned char c) { return is_path_char(c); })) {
    ec = make_error_code(ErrorCode::InvalidUrl);
    return Url{};
  }
  url.path_ = path.empty() ? "/" : path;
  if (query_start != std::string::npos) {
    url.query_ = parse_query(remainder.substr(query_start + 1));
  }
  return url;
}

bool Url::is_default_port() const {
  return (scheme_ == "http" && port_ == common::constants::DEFAULT_HTTP_PORT) ||
         (scheme_ == "https" && port_ == common::constants::DEFAULT_HTTPS_PORT);
}

void Url::set_path(const std::string& path) {
  if (path.empty() || path.front() != '/') {
    path_ = "/" + path;
  } else {
    path_ = path;
  }
}

void Url::add_query(const std::string& key, const std::string& value) { query_.emplace_back(key, value); }

void Url::set_query(const std::string& key, const std::string& value) {
  remove_query(key);
  query_.emplace_back(key, value);
}

void Url::remove_query(const std::string& key) {
  query_.erase(std::remove_if(query_.begin(), query_.end(), [&key](const QueryParam& p) { return p.first == key; }),
               query_.end());
}

std::optional<std::string> Url::query_value(const std::string& key) const {
  for (const auto& param : query_) {
    if (param.first == key) {
      return param.second;
    }
  }
  return std::nullopt;
}

std::string Url::target() const {
  std::string result = path_;
  for (size_t i = 0; i < query_.size(); ++i) {
    result += (i == 0) ? '?' : '&';
    result += url_encode(query_[i].first);
    result += '=';
    result += url_encode(query_[i].second);
  }
  return result;
}

std::string Url::host_header() const {
  std::string host = host_.find(':') != std::string::npos ? "[" + host_ + "]" : host_;
  if (!is_default_port()) {
    host += ":" + std::to_string(port_);
  }
  return host;
}

std::string Url::to_string() const { return scheme_ + "://" + host_header() + target(); }

}  // namespace http
}  // namespace streamhttp
