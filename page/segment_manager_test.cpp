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

#include "page/segment_manager.hpp"

#include <memory>
#include <string>
#include <vector>

#include "common/random_string.hpp"
#include "common/test_util.hpp"
#include "gtest/gtest.h"
#include "page/page.hpp"
#include "page/page_manager.hpp"
#include "transaction/snapshot.hpp"
#include "transaction/transaction.hpp"
#include "transaction/transaction_manager.hpp"

namespace structsy {

class SegmentManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    filename_ = RandomStorePath("segment_manager_test");
    Reset();
  }

  void Reset() {
    sm_.reset();
    tm_.reset();
    pm_.reset();
    pm_ = std::make_unique<PageManager>(filename_, Options());
    ASSERT_SUCCESS(pm_->Open());
    tm_ = std::make_unique<TransactionManager>(pm_.get(), pm_->RecoveredLSN());
    sm_ = std::make_unique<SegmentManager>();
    ASSERT_SUCCESS(sm_->Load(*tm_->TakeSnapshot()));
  }

  void TearDown() override {
    sm_.reset();
    tm_.reset();
    pm_.reset();
    RemoveStoreFiles(filename_);
  }

  std::shared_ptr<Transaction> Begin() { return tm_->Begin().Value(); }

  Rid Store(Transaction& txn, type_id_t type, std::string_view payload) {
    StatusOr<Rid> rid = sm_->AllocateSlot(txn, type, payload.size());
    EXPECT_TRUE(rid.HasValue());
    EXPECT_SUCCESS(sm_->WriteSlot(txn, rid.Value(), payload));
    return rid.Value();
  }

  std::string filename_;
  std::unique_ptr<PageManager> pm_;
  std::unique_ptr<TransactionManager> tm_;
  std::unique_ptr<SegmentManager> sm_;
};

TEST_F(SegmentManagerTest, StoreAndRead) {
  auto txn = Begin();
  const Rid rid = Store(*txn, 3, "payload");
  EXPECT_EQ(rid.type_id, 3);
  ASSIGN_OR_ASSERT_FAIL(SlotView, mine, sm_->ReadSlot(*txn, rid));
  EXPECT_EQ(mine.payload, "payload");
  ASSERT_SUCCESS(txn->PreCommit());

  auto snapshot = tm_->TakeSnapshot();
  ASSIGN_OR_ASSERT_FAIL(SlotView, view, sm_->ReadSlot(*snapshot, rid));
  EXPECT_EQ(view.payload, "payload");
}

TEST_F(SegmentManagerTest, SegmentsAreHomogeneous) {
  auto txn = Begin();
  const Rid a = Store(*txn, 1, "a");
  const Rid b = Store(*txn, 2, "b");
  const Rid c = Store(*txn, 1, "c");
  const Rid big = Store(*txn, 1, std::string(500, 'x'));
  EXPECT_NE(a.page_id, b.page_id);
  EXPECT_EQ(a.page_id, c.page_id);
  EXPECT_NE(a.page_id, big.page_id);
  EXPECT_EQ(sm_->SegmentsOf(1).size(), 2);
  EXPECT_EQ(sm_->SegmentsOf(2).size(), 1);
  EXPECT_TRUE(sm_->SegmentsOf(9).empty());
}

TEST_F(SegmentManagerTest, TooBig) {
  auto txn = Begin();
  EXPECT_EQ(sm_->AllocateSlot(*txn, 1, SegmentPage::MaxPayloadSize() + 1)
                .GetStatus(),
            Status::kTooBigData);
}

TEST_F(SegmentManagerTest, WrongTypeIsInvalid) {
  auto txn = Begin();
  const Rid rid = Store(*txn, 1, "a");
  Rid wrong = rid;
  wrong.type_id = 2;
  EXPECT_EQ(sm_->ReadSlot(*txn, wrong).GetStatus(), Status::kInvalidId);
  Rid header = rid;
  header.page_id = 0;
  EXPECT_EQ(sm_->ReadSlot(*txn, header).GetStatus(), Status::kInvalidId);
  Rid beyond = rid;
  beyond.page_id = 1000;
  EXPECT_EQ(sm_->ReadSlot(*txn, beyond).GetStatus(), Status::kInvalidId);
}

TEST_F(SegmentManagerTest, StaleRidNeverResolves) {
  auto txn = Begin();
  const Rid keep = Store(*txn, 1, "keep");
  const Rid old = Store(*txn, 1, "old");
  ASSERT_SUCCESS(sm_->FreeSlot(*txn, old));
  EXPECT_EQ(sm_->ReadSlot(*txn, old).GetStatus(), Status::kNotExists);
  EXPECT_EQ(sm_->WriteSlot(*txn, old, "x"), Status::kInvalidId);
  EXPECT_EQ(sm_->FreeSlot(*txn, old), Status::kInvalidId);

  const Rid reused = Store(*txn, 1, "new");
  EXPECT_EQ(reused.page_id, old.page_id);
  EXPECT_EQ(reused.slot, old.slot);
  EXPECT_NE(reused.generation, old.generation);
  EXPECT_EQ(sm_->ReadSlot(*txn, old).GetStatus(), Status::kNotExists);
  ASSIGN_OR_ASSERT_FAIL(SlotView, view, sm_->ReadSlot(*txn, keep));
  EXPECT_EQ(view.payload, "keep");
}

TEST_F(SegmentManagerTest, EmptySegmentIsRecycled) {
  Rid old;
  {
    auto txn = Begin();
    old = Store(*txn, 1, "only");
    ASSERT_SUCCESS(txn->PreCommit());
  }
  {
    auto txn = Begin();
    ASSERT_SUCCESS(sm_->FreeSlot(*txn, old));
    ASSIGN_OR_ASSERT_FAIL(PageRef, page, txn->GetPage(old.page_id));
    EXPECT_EQ(page->Type(), PageType::kFreePage);
    ASSERT_SUCCESS(txn->PreCommit());
  }
  auto txn = Begin();
  EXPECT_EQ(sm_->ReadSlot(*txn, old).GetStatus(), Status::kNotExists);
  // The recycled page serves another type without reviving the old Rid.
  const Rid other = Store(*txn, 2, "other");
  EXPECT_EQ(other.page_id, old.page_id);
  EXPECT_LT(old.generation, other.generation);
  EXPECT_EQ(sm_->ReadSlot(*txn, old).GetStatus(), Status::kInvalidId);
}

TEST_F(SegmentManagerTest, RolledBackFillKeepsSegmentAvailable) {
  Rid first;
  {
    auto txn = Begin();
    first = Store(*txn, 1, "a");
    ASSERT_SUCCESS(txn->PreCommit());
  }
  {
    auto txn = Begin();
    Rid rid = first;
    for (int i = 0; i < 4096 && rid.page_id == first.page_id; ++i) {
      rid = Store(*txn, 1, "b");
    }
    ASSERT_NE(rid.page_id, first.page_id);
    txn->Abort();
  }
  auto txn = Begin();
  const Rid again = Store(*txn, 1, "c");
  EXPECT_EQ(again.page_id, first.page_id);
  EXPECT_NE(again.slot, first.slot);
}

TEST_F(SegmentManagerTest, LoadRebuildsDirectory) {
  {
    auto txn = Begin();
    Store(*txn, 4, "a");
    Store(*txn, 5, std::string(100, 'b'));
    ASSERT_SUCCESS(txn->PreCommit());
  }
  Reset();
  EXPECT_EQ(sm_->SegmentsOf(4).size(), 1);
  EXPECT_EQ(sm_->SegmentsOf(5).size(), 1);
  auto txn = Begin();
  const Rid next = Store(*txn, 4, "c");
  EXPECT_EQ(next.page_id, sm_->SegmentsOf(4).front());
}

TEST_F(SegmentManagerTest, FillManySegments) {
  auto txn = Begin();
  std::vector<Rid> rids;
  for (int i = 0; i < 3000; ++i) {
    rids.push_back(Store(*txn, 1, std::to_string(i)));
  }
  EXPECT_LT(1, sm_->SegmentsOf(1).size());
  ASSERT_SUCCESS(txn->PreCommit());
  auto snapshot = tm_->TakeSnapshot();
  for (int i = 0; i < 3000; ++i) {
    ASSIGN_OR_ASSERT_FAIL(SlotView, view, sm_->ReadSlot(*snapshot, rids[i]));
    ASSERT_EQ(view.payload, std::to_string(i));
  }
}

}  // namespace structsy
