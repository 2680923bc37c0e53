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

#include "index/index.hpp"

#include <memory>
#include <string>
#include <vector>

#include "common/random_string.hpp"
#include "common/test_util.hpp"
#include "gtest/gtest.h"
#include "page/page_manager.hpp"
#include "transaction/snapshot.hpp"
#include "transaction/transaction.hpp"
#include "transaction/transaction_manager.hpp"
#include "type/key_codec.hpp"
#include "type/value.hpp"

namespace structsy {

class IndexTest : public ::testing::Test {
 protected:
  void SetUp() override {
    filename_ = RandomStorePath("index_test");
    pm_ = std::make_unique<PageManager>(filename_, Options());
    ASSERT_SUCCESS(pm_->Open());
    tm_ = std::make_unique<TransactionManager>(pm_.get(), pm_->RecoveredLSN());
  }

  void TearDown() override {
    tm_.reset();
    pm_.reset();
    RemoveStoreFiles(filename_);
  }

  std::shared_ptr<Transaction> Begin() {
    StatusOr<std::shared_ptr<Transaction>> txn = tm_->Begin();
    EXPECT_TRUE(txn.HasValue());
    return txn.HasValue() ? txn.Value() : nullptr;
  }

  static std::string Key(int64_t v) {
    StatusOr<std::string> key = EncodeKey(FieldType(FieldKind::kI64), Value(v));
    EXPECT_TRUE(key.HasValue());
    return key.Value();
  }

  static Rid RidOf(int n) { return {1, 2, static_cast<slot_t>(n), 0}; }

  static std::vector<Rid> RidsIn(IndexScanIterator it) {
    std::vector<Rid> ret;
    for (; it.IsValid(); ++it) {
      StatusOr<Rid> rid = it.GetRid();
      EXPECT_TRUE(rid.HasValue());
      ret.push_back(rid.Value());
    }
    EXPECT_SUCCESS(it.GetStatus());
    return ret;
  }

  std::string filename_;
  std::unique_ptr<PageManager> pm_;
  std::unique_ptr<TransactionManager> tm_;
};

TEST_F(IndexTest, CreateRejectsNone) {
  auto txn = Begin();
  EXPECT_EQ(Index::Create(*txn, "bad", IndexMode::kNone, 0).GetStatus(),
            Status::kInvalidArgument);
}

TEST_F(IndexTest, ExclusiveRejectsSecondOwner) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Index, idx,
                        Index::Create(*txn, "id", IndexMode::kExclusive, 0));
  ASSERT_SUCCESS(idx.Put(*txn, Key(10), RidOf(1)));
  // Same owner again is accepted.
  ASSERT_SUCCESS(idx.Put(*txn, Key(10), RidOf(1)));
  EXPECT_EQ(idx.Put(*txn, Key(10), RidOf(2)), Status::kDuplicates);
  EXPECT_SUCCESS(idx.CheckUnique(*txn, Key(10), RidOf(1)));
  EXPECT_EQ(idx.CheckUnique(*txn, Key(10), RidOf(2)), Status::kDuplicates);
  EXPECT_SUCCESS(idx.CheckUnique(*txn, Key(11), RidOf(2)));

  EXPECT_EQ(idx.Remove(*txn, Key(10), RidOf(2)), Status::kNotExists);
  ASSERT_SUCCESS(idx.Remove(*txn, Key(10), RidOf(1)));
  ASSERT_SUCCESS(idx.Put(*txn, Key(10), RidOf(2)));
  ASSERT_SUCCESS_AND_EQ(idx.Point(*txn, Key(10)), std::vector<Rid>{RidOf(2)});
}

TEST_F(IndexTest, ClusterKeepsInsertionOrder) {
  Index idx;
  {
    auto txn = Begin();
    ASSIGN_OR_ASSERT_FAIL(Index, created,
                          Index::Create(*txn, "age", IndexMode::kCluster, 1));
    idx = created;
    ASSERT_SUCCESS(idx.Put(*txn, Key(30), RidOf(3)));
    ASSERT_SUCCESS(idx.Put(*txn, Key(30), RidOf(1)));
    ASSERT_SUCCESS(idx.Put(*txn, Key(20), RidOf(9)));
    ASSERT_SUCCESS(txn->PreCommit());
  }
  {
    auto txn = Begin();
    ASSERT_SUCCESS(idx.Put(*txn, Key(30), RidOf(2)));
    ASSERT_SUCCESS(txn->PreCommit());
  }
  auto snapshot = tm_->TakeSnapshot();
  ASSERT_SUCCESS_AND_EQ(idx.Point(*snapshot, Key(30)),
                        (std::vector<Rid>{RidOf(3), RidOf(1), RidOf(2)}));
  EXPECT_EQ(RidsIn(idx.Scan(*snapshot, KeyRange::All())),
            (std::vector<Rid>{RidOf(9), RidOf(3), RidOf(1), RidOf(2)}));
  EXPECT_EQ(RidsIn(idx.Scan(*snapshot, KeyRange::All(), false)),
            (std::vector<Rid>{RidOf(2), RidOf(1), RidOf(3), RidOf(9)}));
}

TEST_F(IndexTest, ClusterRemoveTakesOneEntry) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Index, idx,
                        Index::Create(*txn, "tag", IndexMode::kCluster, 0));
  for (int i = 0; i < 5; ++i) {
    ASSERT_SUCCESS(idx.Put(*txn, Key(7), RidOf(i)));
  }
  ASSERT_SUCCESS(idx.Remove(*txn, Key(7), RidOf(2)));
  EXPECT_EQ(idx.Remove(*txn, Key(7), RidOf(2)), Status::kNotExists);
  EXPECT_EQ(idx.Remove(*txn, Key(8), RidOf(1)), Status::kNotExists);
  ASSERT_SUCCESS_AND_EQ(
      idx.Point(*txn, Key(7)),
      (std::vector<Rid>{RidOf(0), RidOf(1), RidOf(3), RidOf(4)}));
  EXPECT_SUCCESS(idx.CheckUnique(*txn, Key(7), RidOf(9)));
}

TEST_F(IndexTest, ClusterRangeHonoursBounds) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Index, idx,
                        Index::Create(*txn, "n", IndexMode::kCluster, 0));
  for (int i = 0; i < 10; ++i) {
    ASSERT_SUCCESS(idx.Put(*txn, Key(i), RidOf(i * 2)));
    ASSERT_SUCCESS(idx.Put(*txn, Key(i), RidOf(i * 2 + 1)));
  }
  KeyRange range;
  range.lower = KeyBound{Key(3), false};
  range.upper = KeyBound{Key(5), true};
  EXPECT_EQ(RidsIn(idx.Scan(*txn, range)),
            (std::vector<Rid>{RidOf(8), RidOf(9), RidOf(10), RidOf(11)}));
  range.lower->inclusive = true;
  range.upper->inclusive = false;
  EXPECT_EQ(RidsIn(idx.Scan(*txn, range)),
            (std::vector<Rid>{RidOf(6), RidOf(7), RidOf(8), RidOf(9)}));

  IndexScanIterator it = idx.Scan(*txn, KeyRange::Point(Key(4)));
  ASSERT_TRUE(it.IsValid());
  EXPECT_EQ(it.Key(), Key(4));
}

TEST_F(IndexTest, SerializeDeserialize) {
  SerializeDeserializeTest(Index("by_name", IndexMode::kExclusive, 3, 12));
  SerializeDeserializeTest(Index("by_age", IndexMode::kCluster, 0, 1));
}

}  // namespace structsy
