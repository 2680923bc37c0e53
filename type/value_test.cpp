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

#include "type/value.hpp"

#include <cmath>
#include <limits>
#include <string>

#include "gtest/gtest.h"
#include "type/record.hpp"

namespace structsy {

TEST(ValueTest, Construct) {
  EXPECT_TRUE(Value().IsNull());
  EXPECT_EQ(Value(1).Kind(), ValueKind::kInteger);
  EXPECT_EQ(Value(static_cast<int64_t>(1)).Kind(), ValueKind::kInteger);
  EXPECT_EQ(Value(static_cast<uint64_t>(1)).Kind(), ValueKind::kUnsigned);
  EXPECT_EQ(Value(1.5).Kind(), ValueKind::kFloat);
  EXPECT_EQ(Value(true).Kind(), ValueKind::kBool);
  EXPECT_EQ(Value("text").Kind(), ValueKind::kString);
  EXPECT_EQ(Value::Bytes("raw").Kind(), ValueKind::kBytes);
  EXPECT_EQ(Value(Rid(1, 2, 3, 4)).Kind(), ValueKind::kRid);
  EXPECT_EQ(Value(Record({Value(1)})).Kind(), ValueKind::kRecord);
  EXPECT_EQ(Value::List({Value(1), Value(2)}).Elements().size(), 2);
}

TEST(ValueTest, NumericCompare) {
  EXPECT_EQ(Value(1), Value(static_cast<uint64_t>(1)));
  EXPECT_LT(Value(-1), Value(static_cast<uint64_t>(0)));
  EXPECT_LT(Value(1), Value(1.5));
  EXPECT_LT(Value(2.5), Value(3));
  EXPECT_EQ(Value(2.0), Value(2));
  const __int128 huge = static_cast<__int128>(1) << 100;
  EXPECT_LT(Value(std::numeric_limits<int64_t>::max()), Value::Integer(huge));
  EXPECT_LT(Value::Integer(-huge), Value(std::numeric_limits<int64_t>::min()));
}

TEST(ValueTest, NanSortsLast) {
  const Value nan(std::nan(""));
  EXPECT_LT(Value(std::numeric_limits<double>::infinity()), nan);
  EXPECT_EQ(nan, Value(std::nan("")));
}

TEST(ValueTest, OtherKinds) {
  EXPECT_LT(Value("abc"), Value("abd"));
  EXPECT_EQ(Value("abc"), Value::Bytes("abc"));
  EXPECT_LT(Value(false), Value(true));
  EXPECT_LT(Value(Rid(1, 2, 3, 4)), Value(Rid(1, 2, 4, 0)));
  EXPECT_LT(Value::List({Value(1)}), Value::List({Value(1), Value(0)}));
  EXPECT_LT(Value(1), Value());
}

TEST(ValueTest, DebugString) {
  EXPECT_EQ(Value::Integer(-(static_cast<__int128>(1) << 70)).AsDebugString(),
            "-1180591620717411303424");
  EXPECT_EQ(Value("a").AsDebugString(), "\"a\"");
  EXPECT_EQ(Value::List({Value(1), Value()}).AsDebugString(), "[1, null]");
  EXPECT_EQ(Value(Rid(1, 2, 3, 4)).AsDebugString(), "1:2:3:4");
}

TEST(ValueTest, RecordRoundTrip) {
  Record rec({Value("name"), Value(3)});
  Value wrapped(rec);
  EXPECT_EQ(wrapped.AsRecord(), rec);
}

TEST(RidTest, StringForm) {
  const Rid rid(3, 17, 5, 9);
  EXPECT_EQ(rid.ToString(), "3:17:5:9");
  StatusOr<Rid> parsed = Rid::FromString("3:17:5:9");
  ASSERT_TRUE(parsed.HasValue());
  EXPECT_EQ(parsed.Value(), rid);
  EXPECT_EQ(Rid::FromString("3:17:5").GetStatus(), Status::kInvalidId);
  EXPECT_EQ(Rid::FromString("3:x:5:1").GetStatus(), Status::kInvalidId);
  EXPECT_EQ(Rid::FromString("3:1:70000:1").GetStatus(), Status::kInvalidId);
}

TEST(RidTest, Serialize) {
  const Rid rid(3, 1ULL << 40, 5, 9);
  const std::string bytes = rid.Serialize();
  EXPECT_EQ(bytes.size(), Rid::Size());
  StatusOr<Rid> back = Rid::Deserialize(bytes);
  ASSERT_TRUE(back.HasValue());
  EXPECT_EQ(back.Value(), rid);
  EXPECT_EQ(Rid::Deserialize("short").GetStatus(), Status::kBackingStoreError);
}

}  // namespace structsy
