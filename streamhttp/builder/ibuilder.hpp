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

#include <memory>

namespace streamhttp {
namespace builder {

/**
 * @brief Generic Builder interface for fluent API pattern
 *
 * @tparam T The product type that this builder creates
 */
template <typename T>
class BuilderInterface {
 public:
  virtual ~BuilderInterface() = default;

  /**
   * @brief Build and return the configured product
   */
  virtual std::unique_ptr<T> build() = 0;
};

}  // namespace builder
}  // namespace streamhttp
