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

#include "plan/optimizer.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/random_string.hpp"
#include "common/test_util.hpp"
#include "database/store.hpp"
#include "gtest/gtest.h"
#include "table/table.hpp"

namespace structsy {

static constexpr uint32_t kUsers = 60;

class OptimizerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = RandomStorePath("optimizer_test");
    ASSIGN_OR_ASSERT_FAIL(std::unique_ptr<Store>, store,
                          Store::Open(path_, Options()));
    store_ = std::move(store);
    ASSERT_TRUE(store_->Define(StructDescriptor(
        "Address", {FieldDescriptor("city", FieldType(FieldKind::kString))}))
                    .HasValue());
    ASSERT_TRUE(
        store_
            ->Define(StructDescriptor(
                "User",
                {FieldDescriptor("email", FieldType(FieldKind::kString),
                                 IndexMode::kExclusive),
                 FieldDescriptor("age", FieldType(FieldKind::kU32),
                                 IndexMode::kCluster),
                 FieldDescriptor(
                     "nick", FieldType::Option(FieldType(FieldKind::kString)),
                     IndexMode::kCluster),
                 FieldDescriptor(
                     "tags", FieldType::Vec(FieldType(FieldKind::kString)),
                     IndexMode::kCluster),
                 FieldDescriptor("address", FieldType::Embedded("Address"))}))
            .HasValue());
    ASSIGN_OR_ASSERT_FAIL(std::shared_ptr<Table>, table,
                          store_->GetTable("User"));
    table_ = table;

    ASSIGN_OR_ASSERT_FAIL(TransactionContext, ctx, store_->Begin());
    for (uint32_t i = 0; i < kUsers; ++i) {
      ASSERT_TRUE(ctx.Insert("User", UserOf(i)).HasValue());
    }
    ASSERT_SUCCESS(ctx.Commit());
  }

  void TearDown() override {
    table_.reset();
    store_.reset();
    RemoveStoreFiles(path_);
  }

  static Record UserOf(uint32_t i) {
    return Record(
        {Value("u" + std::to_string(i) + "@x"), Value(i % 10),
         i % 2 == 0 ? Value("n" + std::to_string(i)) : Value(),
         Value::List({Value("t" + std::to_string(i % 4)),
                      Value("t" + std::to_string((i + 1) % 4))}),
         Value(Record({Value("c" + std::to_string(i % 3))}))});
  }

  std::string PlanOf(const Query& q) {
    StatusOr<Plan> plan = Optimizer::Optimize(q, *table_, 100000);
    EXPECT_TRUE(plan.HasValue());
    return plan.HasValue() ? plan.Value()->ToString() : "";
  }

  Status PlanStatus(const Query& q) {
    return Optimizer::Optimize(q, *table_, 100000).GetStatus();
  }

  std::vector<Rid> RidsOf(const Query& q) const {
    SnapshotContext snap = store_->Snapshot();
    StatusOr<ResultSet> rs = snap.Execute(q);
    EXPECT_TRUE(rs.HasValue());
    if (!rs.HasValue()) {
      return {};
    }
    StatusOr<std::vector<std::pair<Rid, Record>>> all =
        rs.Value().ToVectorWithRid();
    EXPECT_TRUE(all.HasValue());
    std::vector<Rid> ret;
    for (const auto& [rid, rec] : all.Value()) {
      ret.push_back(rid);
    }
    return ret;
  }

  // Same conditions, but hidden from the index selection.
  void ExpectSameAsFullScan(const Filter& cond,
                            std::string_view type_name = "User") {
    std::vector<Rid> indexed = RidsOf(Query(type_name).Where(cond));
    std::vector<Rid> scanned = RidsOf(Query(type_name).Where(Not(Not(cond))));
    if (type_name == "User") {
      EXPECT_NE(PlanOf(Query("User").Where(Not(Not(cond)))).find("FullScan"),
                std::string::npos);
    }
    std::sort(indexed.begin(), indexed.end());
    std::sort(scanned.begin(), scanned.end());
    EXPECT_EQ(indexed, scanned) << *cond;
  }

  static bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
  }

  std::string path_;
  std::unique_ptr<Store> store_;
  std::shared_ptr<Table> table_;
};

TEST_F(OptimizerTest, NoConditionIsFullScan) {
  EXPECT_EQ(PlanOf(Query("User")), "FullScan: User");
}

TEST_F(OptimizerTest, ExclusivePoint) {
  std::string plan = PlanOf(Query("User").Where(Eq("email", Value("u3@x"))));
  EXPECT_TRUE(Contains(plan, "IndexScan: User.email (exclusive)")) << plan;
  EXPECT_TRUE(Contains(plan, "Select: ")) << plan;
}

TEST_F(OptimizerTest, ExclusivePointBeatsClusterPoint) {
  std::string plan = PlanOf(Query("User")
                                .Where(Eq("age", Value(3U)))
                                .Where(Eq("email", Value("u3@x"))));
  EXPECT_TRUE(Contains(plan, "User.email")) << plan;
}

TEST_F(OptimizerTest, ClusterPointTieGoesToFirstField) {
  std::string plan = PlanOf(Query("User")
                                .Where(Eq("tags", Value("t1")))
                                .Where(Eq("age", Value(3U))));
  EXPECT_TRUE(Contains(plan, "User.age (cluster)")) << plan;
}

TEST_F(OptimizerTest, MultiPointBeatsRange) {
  std::string plan = PlanOf(
      Query("User")
          .Where(Range("email", ValueBound{Value("u1"), true},
                       ValueBound{Value("u2"), false}))
          .Where(OneOf("age", {Value(4U), Value(1U), Value(4U)})));
  EXPECT_TRUE(Contains(plan, "User.age")) << plan;
  ExpectSameAsFullScan(OneOf("age", {Value(4U), Value(1U), Value(4U)}));
}

TEST_F(OptimizerTest, BoundedRangeBeatsHalfOpen) {
  std::string plan = PlanOf(
      Query("User")
          .Where(Compare("age", BinaryOperation::kGreaterThanEquals,
                         Value(3U)))
          .Where(Range("email", ValueBound{Value("u1"), true},
                       ValueBound{Value("u2"), false})));
  EXPECT_TRUE(Contains(plan, "User.email")) << plan;
}

TEST_F(OptimizerTest, RangesOnOneFieldIntersect) {
  Query q = Query("User")
                .Where(Compare("age", BinaryOperation::kGreaterThan, Value(3U)))
                .Where(Compare("age", BinaryOperation::kLessThan, Value(6U)))
                .Where(Compare("email", BinaryOperation::kGreaterThan,
                               Value("u")));
  std::string plan = PlanOf(q);
  EXPECT_TRUE(Contains(plan, "User.age")) << plan;
  EXPECT_FALSE(Contains(plan, "inf")) << plan;
  EXPECT_EQ(RidsOf(q).size(), kUsers / 10 * 2);
}

TEST_F(OptimizerTest, RangesOnSequenceStaySeparate) {
  Filter cond = And({Compare("tags", BinaryOperation::kLessThan, Value("t1")),
                     Compare("tags", BinaryOperation::kGreaterThan, Value("t2"))});
  std::string plan = PlanOf(Query("User").Where(cond));
  EXPECT_TRUE(Contains(plan, "User.tags")) << plan;
  // Only records tagged {t3, t0} have elements on both sides.
  ExpectSameAsFullScan(cond);
  EXPECT_EQ(RidsOf(Query("User").Where(cond)).size(), kUsers / 4);
}

TEST_F(OptimizerTest, ResultsMatchFullScan) {
  ExpectSameAsFullScan(Eq("email", Value("u7@x")));
  ExpectSameAsFullScan(Eq("age", Value(7U)));
  ExpectSameAsFullScan(Eq("nick", Value("n8")));
  ExpectSameAsFullScan(Eq("tags", Value("t2")));
  ExpectSameAsFullScan(Range("age", ValueBound{Value(2U), false},
                             ValueBound{Value(5U), true}));
  ExpectSameAsFullScan(Range("email", std::nullopt,
                             ValueBound{Value("u3"), true}));
  ExpectSameAsFullScan(
      Compare("nick", BinaryOperation::kGreaterThanEquals, Value("n3")));
  ExpectSameAsFullScan(OneOf("tags", {Value("t0"), Value("t3")}));
  ExpectSameAsFullScan(And({Eq("age", Value(1U)), IsSome("nick")}));
}

TEST_F(OptimizerTest, RoundedFloatOperandsMatchFullScan) {
  ASSERT_TRUE(store_
                  ->Define(StructDescriptor(
                      "Reading",
                      {FieldDescriptor("x", FieldType(FieldKind::kF32),
                                       IndexMode::kCluster),
                       FieldDescriptor("y", FieldType(FieldKind::kF64),
                                       IndexMode::kCluster)}))
                  .HasValue());
  const int64_t big = int64_t{1} << 53;
  {
    ASSIGN_OR_ASSERT_FAIL(TransactionContext, ctx, store_->Begin());
    for (int i = 0; i < 20; ++i) {
      const double x = static_cast<float>(i) / 10.0F;
      const double y = static_cast<double>(big + 2 * (i - 10));
      ASSERT_TRUE(ctx.Insert("Reading", Record({Value(x), Value(y)}))
                      .HasValue());
    }
    ASSERT_SUCCESS(ctx.Commit());
  }
  // 0.1 and 0.3 have no exact f32 form; 2^53 + 1 has no exact f64 form.
  const Filter conds[] = {
      Compare("x", BinaryOperation::kGreaterThan, Value(0.1)),
      Compare("x", BinaryOperation::kLessThan, Value(0.3)),
      Compare("x", BinaryOperation::kLessThanEquals, Value(0.1)),
      Range("x", ValueBound{Value(0.1), false}, ValueBound{Value(0.3), false}),
      Eq("x", Value(0.1)),
      OneOf("x", {Value(0.1), Value(0.5)}),
      Eq("x", Value(static_cast<double>(0.5F))),
      Compare("y", BinaryOperation::kLessThan, Value(big + 1)),
      Compare("y", BinaryOperation::kGreaterThan, Value(big + 1)),
      Eq("y", Value(big + 1)),
  };
  for (const Filter& cond : conds) {
    ExpectSameAsFullScan(cond, "Reading");
  }
  // The stored 0.1f is slightly above 0.1.
  EXPECT_EQ(RidsOf(Query("Reading").Where(conds[0])).size(), 19);
  EXPECT_EQ(RidsOf(Query("Reading").Where(conds[2])).size(), 1);
  EXPECT_EQ(RidsOf(Query("Reading").Where(conds[7])).size(), 11);

  ASSIGN_OR_ASSERT_FAIL(std::shared_ptr<Table>, reading,
                        store_->GetTable("Reading"));
  ASSIGN_OR_ASSERT_FAIL(
      Plan, inexact,
      Optimizer::Optimize(Query("Reading").Where(Eq("x", Value(0.1))),
                          *reading, 100000));
  EXPECT_TRUE(Contains(inexact->ToString(), "FullScan: Reading"))
      << inexact->ToString();
  ASSIGN_OR_ASSERT_FAIL(
      Plan, exact,
      Optimizer::Optimize(
          Query("Reading").Where(Eq("x", Value(static_cast<double>(0.5F)))),
          *reading, 100000));
  EXPECT_TRUE(Contains(exact->ToString(), "IndexScan: Reading.x"))
      << exact->ToString();
}

TEST_F(OptimizerTest, OrderByIndexedFieldStreams) {
  std::string plan = PlanOf(Query("User").OrderBy("age", false));
  EXPECT_TRUE(Contains(plan, "IndexScan: User.age (cluster) DESC")) << plan;
  EXPECT_FALSE(Contains(plan, "Sort")) << plan;

  plan = PlanOf(Query("User")
                    .Where(Compare("age", BinaryOperation::kLessThan, Value(5U)))
                    .OrderBy("age"));
  EXPECT_TRUE(Contains(plan, "IndexScan: User.age (cluster) ASC")) << plan;
  EXPECT_FALSE(Contains(plan, "Sort")) << plan;
}

TEST_F(OptimizerTest, OrderByOtherFieldSorts) {
  std::string plan =
      PlanOf(Query("User").Where(Eq("email", Value("u1@x"))).OrderBy("age"));
  EXPECT_TRUE(Contains(plan, "Sort: [age ASC]")) << plan;

  plan = PlanOf(Query("User").OrderBy("nick"));
  EXPECT_TRUE(Contains(plan, "Sort: [nick ASC]")) << plan;
  EXPECT_TRUE(Contains(plan, "FullScan: User")) << plan;

  plan = PlanOf(Query("User").OrderBy("tags"));
  EXPECT_TRUE(Contains(plan, "FullScan: User")) << plan;

  plan = PlanOf(Query("User").OrderBy("address.city").OrderBy("age", false));
  EXPECT_TRUE(Contains(plan, "Sort: [address.city ASC, age DESC]")) << plan;
}

TEST_F(OptimizerTest, OrderByOptionPutsAbsentLastAscending) {
  SnapshotContext snap = store_->Snapshot();
  ASSIGN_OR_ASSERT_FAIL(ResultSet, rs,
                        snap.Execute(Query("User").OrderBy("nick")));
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, all, rs.ToVector());
  ASSERT_EQ(all.size(), kUsers);
  for (size_t i = 0; i < kUsers / 2; ++i) {
    EXPECT_FALSE(all[i].Get(2).IsNull());
  }
  for (size_t i = kUsers / 2; i < kUsers; ++i) {
    EXPECT_TRUE(all[i].Get(2).IsNull());
  }

  // Descending is the exact reverse: absent values come first.
  ASSIGN_OR_ASSERT_FAIL(ResultSet, desc,
                        snap.Execute(Query("User").OrderBy("nick", false)));
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, reversed, desc.ToVector());
  ASSERT_EQ(reversed.size(), kUsers);
  for (size_t i = 0; i < kUsers / 2; ++i) {
    EXPECT_TRUE(reversed[i].Get(2).IsNull());
  }
  for (size_t i = kUsers / 2 + 1; i < kUsers; ++i) {
    EXPECT_GE(reversed[i - 1].Get(2).AsString(), reversed[i].Get(2).AsString());
  }
}

TEST_F(OptimizerTest, DescendingMultiPoint) {
  Query q = Query("User")
                .Where(OneOf("age", {Value(2U), Value(8U), Value(5U)}))
                .OrderBy("age", false);
  std::string plan = PlanOf(q);
  EXPECT_FALSE(Contains(plan, "Sort")) << plan;
  SnapshotContext snap = store_->Snapshot();
  ASSIGN_OR_ASSERT_FAIL(ResultSet, rs, snap.Execute(q));
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, all, rs.ToVector());
  ASSERT_EQ(all.size(), kUsers / 10 * 3);
  for (size_t i = 1; i < all.size(); ++i) {
    EXPECT_GE(all[i - 1].Get(1).AsUnsigned(), all[i].Get(1).AsUnsigned());
  }
}

TEST_F(OptimizerTest, LimitAndProjection) {
  std::string plan = PlanOf(
      Query("User").OrderBy("age").Limit(5).Project({"email", "age"}));
  EXPECT_TRUE(Contains(plan, "Projection: [email, age]\n  Limit: 5\n    "))
      << plan;
}

TEST_F(OptimizerTest, Rejects) {
  EXPECT_EQ(PlanStatus(Query("User").Where(Eq("missing", Value(1U)))),
            Status::kInvalidArgument);
  EXPECT_EQ(PlanStatus(Query("User").OrderBy("missing")),
            Status::kInvalidArgument);
  EXPECT_EQ(PlanStatus(Query("User").OrderBy("age.city")),
            Status::kInvalidArgument);
  EXPECT_EQ(PlanStatus(Query("User").Project({"email", "missing"})),
            Status::kInvalidArgument);
  EXPECT_EQ(PlanStatus(Query("User").Project({"email", "email"})),
            Status::kInvalidArgument);
}

}  // namespace structsy
