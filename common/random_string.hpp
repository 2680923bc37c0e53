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

#ifndef STRUCTSY_RANDOM_STRING_HPP
#define STRUCTSY_RANDOM_STRING_HPP

#include <cstddef>
#include <random>
#include <string>
#include <string_view>

namespace structsy {

inline std::random_device seed_gen;
inline std::mt19937 device_random(seed_gen());

inline std::string RandomString(size_t len = 16) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  std::string ret;
  ret.reserve(len);
  for (size_t i = 0; i < len; ++i) {
    ret.push_back(alphanum[device_random() % (sizeof(alphanum) - 1)]);
  }
  return ret;
}

// A fresh file name for one test case, e.g. "store_test-Ab3x....db".
inline std::string RandomStorePath(std::string_view prefix) {
  return std::string(prefix) + "-" + RandomString() + ".db";
}

}  // namespace structsy

#endif  // STRUCTSY_RANDOM_STRING_HPP
