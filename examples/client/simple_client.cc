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

#include <exception>
#include <iostream>
#include <string>

#include "streamhttp/streamhttp.hpp"

using namespace streamhttp;
namespace beast_http = boost::beast::http;

int main(int argc, char** argv) {
  std::string url = (argc > 1) ? argv[1] : std::string("http://httpbin.org/anything");
  long timeout_ms = 500;
  if (argc > 2) {
    try {
      timeout_ms = std::stol(argv[2]);
    } catch (const std::exception& e) {
      std::cerr << "[client] invalid timeout '" << argv[2] << "': " << e.what() << std::endl;
      return 2;
    }
  }

  common::Logger::instance().set_level(common::LogLevel::INFO);

  std::shared_ptr<interface::TransportInterface> transport = http_transport().build();

  auto options = request_options()
                     .modifier([](http::Request& req) {
                       req.set_header(beast_http::field::content_type, "application/x-www-form-urlencoded");
                       req.set_header(beast_http::field::authorization, "Bearer qawsedrftgyhujikolp");
                       req.url().set_query("param", "pvalue");
                     })
                     .timeout(std::chrono::milliseconds(timeout_ms))
                     .build();

  auto body = std::make_shared<stream::BufferSource>(std::string("form=fvalue"));
  stream::BufferSink sink;

  auto result = do_request(transport, nullptr, beast_http::verb::post, url, body, &sink, options);
  if (!result.response) {
    std::cerr << "[client] request failed: " << result.fault.message() << std::endl;
    return 1;
  }

  std::cout << "[client] status=" << result.response->status_code() << " " << result.response->reason() << std::endl;
  std::cout << sink.str() << std::endl;
  if (result.fault) {
    std::cerr << "[client] body error: " << result.fault.message() << std::endl;
    return 1;
  }
  return 0;
}
