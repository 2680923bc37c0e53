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

#include "table/table.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/random_string.hpp"
#include "common/test_util.hpp"
#include "gtest/gtest.h"
#include "page/page_manager.hpp"
#include "page/segment_manager.hpp"
#include "transaction/snapshot.hpp"
#include "transaction/transaction.hpp"
#include "transaction/transaction_manager.hpp"
#include "type/key_codec.hpp"

namespace structsy {

class TableTest : public ::testing::Test, public SchemaResolver {
 protected:
  void SetUp() override {
    filename_ = RandomStorePath("table_test");
    pm_ = std::make_unique<PageManager>(filename_, Options());
    ASSERT_SUCCESS(pm_->Open());
    tm_ = std::make_unique<TransactionManager>(pm_.get(), pm_->RecoveredLSN());

    StructDescriptor desc(
        "User",
        {FieldDescriptor("email", FieldType(FieldKind::kString),
                         IndexMode::kExclusive),
         FieldDescriptor("age", FieldType(FieldKind::kU32), IndexMode::kCluster),
         FieldDescriptor("bio", FieldType(FieldKind::kString)),
         FieldDescriptor("tags", FieldType::Vec(FieldType(FieldKind::kString)),
                         IndexMode::kCluster)});
    desc.SetTypeID(1);
    desc_ = std::make_shared<const StructDescriptor>(desc);

    auto txn = Begin();
    std::vector<Index> indexes;
    for (slot_t i = 0; i < desc_->FieldCount(); ++i) {
      const FieldDescriptor& f = desc_->GetField(i);
      if (!f.IsIndexed()) {
        continue;
      }
      ASSIGN_OR_ASSERT_FAIL(Index, idx,
                            Index::Create(*txn, f.index.name, f.index.mode, i));
      indexes.push_back(idx);
    }
    ASSERT_SUCCESS(txn->PreCommit());
    table_ = std::make_unique<Table>(desc_, indexes, &segments_, this);
  }

  void TearDown() override {
    table_.reset();
    tm_.reset();
    pm_.reset();
    RemoveStoreFiles(filename_);
  }

  [[nodiscard]] StatusOr<std::shared_ptr<const StructDescriptor>>
  ResolveStruct(std::string_view name) const override {
    if (name == "User") {
      return desc_;
    }
    return Status::kStructNotDefined;
  }

  std::shared_ptr<Transaction> Begin() {
    StatusOr<std::shared_ptr<Transaction>> txn = tm_->Begin();
    EXPECT_TRUE(txn.HasValue());
    return txn.HasValue() ? txn.Value() : nullptr;
  }

  static Record User(const std::string& email, uint32_t age,
                     const std::string& bio = "",
                     std::vector<std::string> tags = {}) {
    std::vector<Value> tag_values;
    for (auto& t : tags) {
      tag_values.emplace_back(t);
    }
    return Record({Value(email), Value(age), Value(bio),
                   Value::List(std::move(tag_values))});
  }

  static std::string StrKey(const std::string& s) {
    return EncodeKey(FieldType(FieldKind::kString), Value(s)).Value();
  }
  static std::string AgeKey(uint32_t age) {
    return EncodeKey(FieldType(FieldKind::kU32), Value(age)).Value();
  }

  std::vector<Rid> Lookup(const PageSource& src, const char* index,
                          const std::string& key) {
    StatusOr<std::vector<Rid>> rids = table_->IndexByName(index)->Point(src, key);
    EXPECT_TRUE(rids.HasValue());
    return rids.HasValue() ? rids.Value() : std::vector<Rid>();
  }

  size_t CountAll(const PageSource& src) {
    size_t count = 0;
    Iterator it = table_->BeginFullScan(src);
    for (; it.IsValid(); ++it) {
      ++count;
    }
    EXPECT_SUCCESS(it.GetStatus());
    return count;
  }

  std::string filename_;
  std::unique_ptr<PageManager> pm_;
  std::unique_ptr<TransactionManager> tm_;
  SegmentManager segments_;
  std::shared_ptr<const StructDescriptor> desc_;
  std::unique_ptr<Table> table_;
};

TEST_F(TableTest, InsertRead) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Rid, rid, table_->Insert(*txn, User("a@x", 20, "hi")));
  EXPECT_EQ(rid.type_id, 1);
  ASSERT_SUCCESS_AND_EQ(table_->Read(*txn, rid), User("a@x", 20, "hi"));
  ASSERT_SUCCESS(txn->PreCommit());

  auto snapshot = tm_->TakeSnapshot();
  ASSERT_SUCCESS_AND_EQ(table_->Read(*snapshot, rid), User("a@x", 20, "hi"));
  EXPECT_EQ(Lookup(*snapshot, "email", StrKey("a@x")), std::vector<Rid>{rid});
  EXPECT_EQ(Lookup(*snapshot, "age", AgeKey(20)), std::vector<Rid>{rid});
}

TEST_F(TableTest, InvalidRecordHasNoSideEffect) {
  auto txn = Begin();
  EXPECT_EQ(table_->Insert(*txn, Record({Value("only one")})).GetStatus(),
            Status::kInvalidArgument);
  EXPECT_EQ(table_->Insert(*txn, Record({Value("x"), Value(-1), Value(""),
                                         Value::List({})}))
                .GetStatus(),
            Status::kInvalidArgument);
  EXPECT_SUCCESS(txn->CheckUsable());
  EXPECT_EQ(txn->DirtyPageCount(), 0);
}

TEST_F(TableTest, ExclusiveViolationKeepsTransaction) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Rid, first, table_->Insert(*txn, User("dup@x", 1)));
  EXPECT_EQ(table_->Insert(*txn, User("dup@x", 2)).GetStatus(),
            Status::kDuplicates);
  EXPECT_SUCCESS(txn->CheckUsable());
  ASSIGN_OR_ASSERT_FAIL(Rid, second, table_->Insert(*txn, User("other@x", 2)));
  EXPECT_EQ(table_->Update(*txn, second, User("dup@x", 2)),
            Status::kDuplicates);
  ASSERT_SUCCESS(txn->PreCommit());

  auto snapshot = tm_->TakeSnapshot();
  ASSERT_SUCCESS_AND_EQ(table_->Read(*snapshot, first), User("dup@x", 1));
  ASSERT_SUCCESS_AND_EQ(table_->Read(*snapshot, second), User("other@x", 2));
}

TEST_F(TableTest, UpdateMaintainsIndexes) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Rid, rid,
                        table_->Insert(*txn, User("u@x", 30, "", {"a", "b"})));
  ASSERT_SUCCESS(table_->Update(*txn, rid, User("v@x", 31, "", {"b", "c"})));
  EXPECT_TRUE(Lookup(*txn, "email", StrKey("u@x")).empty());
  EXPECT_EQ(Lookup(*txn, "email", StrKey("v@x")), std::vector<Rid>{rid});
  EXPECT_TRUE(Lookup(*txn, "age", AgeKey(30)).empty());
  EXPECT_EQ(Lookup(*txn, "age", AgeKey(31)), std::vector<Rid>{rid});
  EXPECT_TRUE(Lookup(*txn, "tags", StrKey("a")).empty());
  EXPECT_EQ(Lookup(*txn, "tags", StrKey("b")), std::vector<Rid>{rid});
  EXPECT_EQ(Lookup(*txn, "tags", StrKey("c")), std::vector<Rid>{rid});
  // Moving a key between records inside one transaction.
  ASSIGN_OR_ASSERT_FAIL(Rid, other, table_->Insert(*txn, User("w@x", 1)));
  ASSERT_SUCCESS(table_->Update(*txn, rid, User("z@x", 31)));
  ASSERT_SUCCESS(table_->Update(*txn, other, User("v@x", 1)));
  EXPECT_EQ(Lookup(*txn, "email", StrKey("v@x")), std::vector<Rid>{other});
  ASSERT_SUCCESS(txn->PreCommit());
}

TEST_F(TableTest, GrowingRecordKeepsRid) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Rid, rid, table_->Insert(*txn, User("g@x", 1, "s")));
  ASSIGN_OR_ASSERT_FAIL(Rid, neighbour,
                        table_->Insert(*txn, User("n@x", 2, "s")));
  const std::string big(5000, 'b');
  ASSERT_SUCCESS(table_->Update(*txn, rid, User("g@x", 1, big)));
  ASSERT_SUCCESS_AND_EQ(table_->Read(*txn, rid), User("g@x", 1, big));
  // Outgrows the relocated slot too, then shrinks.
  const std::string bigger(12000, 'c');
  ASSERT_SUCCESS(table_->Update(*txn, rid, User("g@x", 1, bigger)));
  ASSERT_SUCCESS_AND_EQ(table_->Read(*txn, rid), User("g@x", 1, bigger));
  ASSERT_SUCCESS(table_->Update(*txn, rid, User("g@x", 1, "tiny")));
  ASSERT_SUCCESS_AND_EQ(table_->Read(*txn, rid), User("g@x", 1, "tiny"));
  ASSERT_SUCCESS_AND_EQ(table_->Read(*txn, neighbour), User("n@x", 2, "s"));
  EXPECT_EQ(CountAll(*txn), 2);
  ASSERT_SUCCESS(txn->PreCommit());

  auto writer = Begin();
  ASSERT_SUCCESS(table_->Update(*writer, rid, User("g@x", 1, big)));
  ASSERT_SUCCESS(table_->Delete(*writer, rid));
  EXPECT_EQ(table_->Read(*writer, rid).GetStatus(), Status::kNotExists);
  EXPECT_EQ(CountAll(*writer), 1);
  ASSERT_SUCCESS(writer->PreCommit());
}

TEST_F(TableTest, DeleteAndStaleRid) {
  Rid rid;
  {
    auto txn = Begin();
    ASSIGN_OR_ASSERT_FAIL(Rid, inserted, table_->Insert(*txn, User("d@x", 5)));
    rid = inserted;
    ASSERT_SUCCESS(txn->PreCommit());
  }
  auto before = tm_->TakeSnapshot();
  {
    auto txn = Begin();
    ASSERT_SUCCESS(table_->Delete(*txn, rid));
    EXPECT_EQ(table_->Delete(*txn, rid), Status::kInvalidId);
    EXPECT_EQ(table_->Update(*txn, rid, User("d@x", 6)), Status::kInvalidId);
    ASSIGN_OR_ASSERT_FAIL(Rid, reused, table_->Insert(*txn, User("e@x", 5)));
    EXPECT_NE(reused, rid);
    ASSERT_SUCCESS(txn->PreCommit());
  }
  auto after = tm_->TakeSnapshot();
  EXPECT_EQ(table_->Read(*after, rid).GetStatus(), Status::kNotExists);
  ASSERT_SUCCESS_AND_EQ(table_->Read(*before, rid), User("d@x", 5));
  EXPECT_TRUE(Lookup(*after, "email", StrKey("d@x")).empty());
}

TEST_F(TableTest, ForeignRid) {
  auto txn = Begin();
  ASSIGN_OR_ASSERT_FAIL(Rid, rid, table_->Insert(*txn, User("f@x", 5)));
  Rid wrong_type = rid;
  wrong_type.type_id = 9;
  EXPECT_EQ(table_->Read(*txn, wrong_type).GetStatus(), Status::kInvalidId);
  Rid out_of_file = rid;
  out_of_file.page_id = 1000;
  EXPECT_EQ(table_->Read(*txn, out_of_file).GetStatus(), Status::kInvalidId);
  EXPECT_EQ(table_->Read(*txn, Rid()).GetStatus(), Status::kInvalidId);
}

TEST_F(TableTest, FullScanSeesEveryRecordOnce) {
  constexpr int kRecords = 2000;
  auto txn = Begin();
  std::map<Rid, int> expected;
  size_t age_three = 0;
  for (int i = 0; i < kRecords; ++i) {
    if (i % 7 == 3) {
      ++age_three;
    }
    ASSIGN_OR_ASSERT_FAIL(
        Rid, rid,
        table_->Insert(*txn, User(std::to_string(i) + "@x",
                                  static_cast<uint32_t>(i % 7),
                                  std::string(i % 300, 'p'))));
    expected[rid] = i;
  }
  ASSERT_SUCCESS(txn->PreCommit());
  auto snapshot = tm_->TakeSnapshot();
  Iterator it = table_->BeginFullScan(*snapshot);
  size_t seen = 0;
  for (; it.IsValid(); ++it) {
    auto found = expected.find(it.Position());
    ASSERT_NE(found, expected.end());
    EXPECT_EQ(it->Get(0), Value(std::to_string(found->second) + "@x"));
    ++seen;
  }
  EXPECT_SUCCESS(it.GetStatus());
  EXPECT_EQ(seen, kRecords);
  EXPECT_EQ(Lookup(*snapshot, "age", AgeKey(3)).size(), age_three);
}

TEST_F(TableTest, RollbackForgetsRecords) {
  Rid rid;
  {
    auto txn = Begin();
    ASSIGN_OR_ASSERT_FAIL(Rid, inserted, table_->Insert(*txn, User("r@x", 1)));
    rid = inserted;
    txn->Abort();
  }
  auto snapshot = tm_->TakeSnapshot();
  EXPECT_FAIL(table_->Read(*snapshot, rid).GetStatus());
  EXPECT_EQ(CountAll(*snapshot), 0);
  EXPECT_TRUE(Lookup(*snapshot, "email", StrKey("r@x")).empty());
}

}  // namespace structsy
