/**
 * Copyright 2023 KUMAZAKI Hiroki
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

#ifndef STRUCTSY_CHECKSUM_HPP
#define STRUCTSY_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace structsy {

static constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;

// 64-bit FNV-1a. Stable across builds, unlike std::hash.
uint64_t Fnv1a(const void* data, size_t length,
               uint64_t seed = kFnvOffsetBasis);

inline uint64_t Fnv1a(std::string_view data, uint64_t seed = kFnvOffsetBasis) {
  return Fnv1a(data.data(), data.size(), seed);
}

}  // namespace structsy

#endif  // STRUCTSY_CHECKSUM_HPP
