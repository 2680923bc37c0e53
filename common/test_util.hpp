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

#ifndef STRUCTSY_TEST_UTIL_HPP
#define STRUCTSY_TEST_UTIL_HPP

#include <cstdio>
#include <string>

#include "common/decoder.hpp"
#include "common/encoder.hpp"
#include "gtest/gtest.h"

#define ASSERT_SUCCESS(x) ASSERT_EQ(Status::kSuccess, x)
#define EXPECT_SUCCESS(x) EXPECT_EQ(Status::kSuccess, x)
#define ASSERT_FAIL(x) ASSERT_NE(Status::kSuccess, x)
#define EXPECT_FAIL(x) EXPECT_NE(Status::kSuccess, x)

template <typename T>
void SerializeDeserializeTest(const T& c) {
  std::string encoded = structsy::Encode(c);
  structsy::StatusOr<T> another = structsy::Decode<T>(encoded);
  ASSERT_TRUE(another.HasValue());
  ASSERT_EQ(c, another.Value());
}

// Removes a store file together with its write-ahead log.
inline void RemoveStoreFiles(const std::string& path) {
  std::remove(path.c_str());
  std::remove((path + ".wal").c_str());
}

#endif  // STRUCTSY_TEST_UTIL_HPP
