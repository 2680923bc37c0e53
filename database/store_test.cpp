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

#include "database/store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common/random_string.hpp"
#include "common/test_util.hpp"
#include "gtest/gtest.h"

namespace structsy {

struct MyData {
  std::string name;
  std::string address;
  bool operator==(const MyData& rhs) const = default;
};

template <>
struct Persistent<MyData> {
  static StructDescriptor Descriptor() {
    return StructDescriptor(
        "MyData", {FieldDescriptor("name", FieldType(FieldKind::kString),
                                   IndexMode::kCluster),
                   FieldDescriptor("address", FieldType(FieldKind::kString))});
  }
  static Record ToRecord(const MyData& d) {
    return Record({Value(d.name), Value(d.address)});
  }
  static StatusOr<MyData> FromRecord(const Record& r) {
    if (r.Size() != 2) {
      return Status::kInvalidArgument;
    }
    return MyData{r.Get(0).AsString(), r.Get(1).AsString()};
  }
};

// What a generated find_by_name helper looks like.
StatusOr<TypedResultSet<MyData>> FindByName(const ReadContext& ctx,
                                            const std::string& name) {
  return ctx.FindBy<MyData>("name", Value(name));
}

struct User {
  std::string name;
  std::string password;
};

template <>
struct Persistent<User> {
  static StructDescriptor Descriptor() {
    return StructDescriptor(
        "User", {FieldDescriptor("name", FieldType(FieldKind::kString),
                                 IndexMode::kCluster),
                 FieldDescriptor("password", FieldType(FieldKind::kString))});
  }
  static Record ToRecord(const User& u) {
    return Record({Value(u.name), Value(u.password)});
  }
  static StatusOr<User> FromRecord(const Record& r) {
    if (r.Size() != 2) {
      return Status::kInvalidArgument;
    }
    return User{r.Get(0).AsString(), r.Get(1).AsString()};
  }
};

struct UserName {
  std::string name;
};

template <>
struct Projection<UserName> {
  static std::vector<std::string> Shape() { return {"name"}; }
  static StatusOr<UserName> FromRecord(const Record& r) {
    if (r.Size() != 1) {
      return Status::kInvalidArgument;
    }
    return UserName{r.Get(0).AsString()};
  }
};

typedef TypedResultSet<UserName, Projection<UserName>> UserNames;

// User after a schema change: names become unique and passwords go.
struct Member {
  std::string name;
  uint32_t visits = 0;
  bool operator==(const Member& rhs) const = default;
};

template <>
struct Persistent<Member> {
  static StructDescriptor Descriptor() {
    return StructDescriptor(
        "Member", {FieldDescriptor("name", FieldType(FieldKind::kString),
                                   IndexMode::kExclusive),
                   FieldDescriptor("visits", FieldType(FieldKind::kU32))});
  }
  static Record ToRecord(const Member& m) {
    return Record({Value(m.name), Value(m.visits)});
  }
  static StatusOr<Member> FromRecord(const Record& r) {
    if (r.Size() != 2) {
      return Status::kInvalidArgument;
    }
    return Member{r.Get(0).AsString(),
                  static_cast<uint32_t>(r.Get(1).AsUnsigned())};
  }
};

class StoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = RandomStorePath("store_test");
    Reopen();
  }

  void TearDown() override {
    store_.reset();
    RemoveStoreFiles(path_);
  }

  void Reopen() {
    store_.reset();
    StatusOr<std::unique_ptr<Store>> store = Store::Open(path_);
    ASSERT_TRUE(store.HasValue());
    store_ = store.MoveValue();
  }

  TransactionContext Begin() {
    StatusOr<TransactionContext> ctx = store_->Begin();
    EXPECT_TRUE(ctx.HasValue());
    return ctx.MoveValue();
  }

  static StructDescriptor EventDescriptor() {
    return StructDescriptor(
        "Event", {FieldDescriptor("ts", FieldType(FieldKind::kI64),
                                  IndexMode::kCluster),
                  FieldDescriptor("body", FieldType(FieldKind::kString))});
  }
  static Record EventOf(int64_t ts) {
    return Record({Value(ts), Value("event " + std::to_string(ts))});
  }

  static StructDescriptor AccountDescriptor() {
    return StructDescriptor(
        "Account", {FieldDescriptor("email", FieldType(FieldKind::kString),
                                    IndexMode::kExclusive),
                    FieldDescriptor("balance", FieldType(FieldKind::kI64))});
  }
  static Record AccountOf(const std::string& email, int64_t balance) {
    return Record({Value(email), Value(balance)});
  }

  std::string path_;
  std::unique_ptr<Store> store_;
};

TEST_F(StoreTest, InsertFindDelete) {
  ASSERT_TRUE(store_->Define<MyData>().HasValue());
  Ref<MyData> ref;
  {
    TransactionContext ctx = Begin();
    ASSIGN_OR_ASSERT_FAIL(Ref<MyData>, inserted,
                          ctx.Insert(MyData{"alice", "1 Main St"}));
    ref = inserted;
    ASSERT_SUCCESS(ctx.Commit());
  }
  {
    SnapshotContext snap = store_->Snapshot();
    ASSIGN_OR_ASSERT_FAIL(TypedResultSet<MyData>, found,
                          FindByName(snap, "alice"));
    ASSIGN_OR_ASSERT_FAIL(std::vector<MyData>, all, found.ToVector());
    ASSERT_EQ(all.size(), 1);
    EXPECT_EQ(all[0], (MyData{"alice", "1 Main St"}));
    ASSERT_SUCCESS_AND_EQ(snap.Read(ref), (MyData{"alice", "1 Main St"}));
  }
  {
    TransactionContext ctx = Begin();
    ASSERT_SUCCESS(ctx.Delete(ref));
    ASSERT_SUCCESS(ctx.Commit());
  }
  SnapshotContext snap = store_->Snapshot();
  EXPECT_EQ(snap.Read(ref).GetStatus(), Status::kNotExists);
  ASSIGN_OR_ASSERT_FAIL(TypedResultSet<MyData>, found,
                        FindByName(snap, "alice"));
  ASSIGN_OR_ASSERT_FAIL(std::vector<MyData>, all, found.ToVector());
  EXPECT_TRUE(all.empty());
}

TEST_F(StoreTest, RangeQuery) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  {
    TransactionContext ctx = Begin();
    for (int64_t ts : {30, 10, 40, 20}) {
      ASSERT_TRUE(ctx.Insert("Event", EventOf(ts)).HasValue());
    }
    ASSERT_SUCCESS(ctx.Commit());
  }
  ASSIGN_OR_ASSERT_FAIL(
      ResultSet, rs,
      store_->Execute(
          Query("Event")
              .Where(Compare("ts", BinaryOperation::kGreaterThanEquals,
                             Value(int64_t{15})))
              .Where(Compare("ts", BinaryOperation::kLessThan,
                             Value(int64_t{35})))
              .OrderBy("ts")));
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, got, rs.ToVector());
  ASSERT_EQ(got.size(), 2);
  EXPECT_EQ(got[0], EventOf(20));
  EXPECT_EQ(got[1], EventOf(30));

  SnapshotContext snap = store_->Snapshot();
  ASSIGN_OR_ASSERT_FAIL(
      ResultSet, desc,
      snap.FindRange("Event", "ts", ValueBound{Value(int64_t{10}), false},
                     std::nullopt, false));
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, got_desc, desc.ToVector());
  ASSERT_EQ(got_desc.size(), 3);
  EXPECT_EQ(got_desc[0], EventOf(40));
  EXPECT_EQ(got_desc[2], EventOf(20));
}

TEST_F(StoreTest, ExclusiveViolation) {
  ASSERT_TRUE(store_->Define(AccountDescriptor()).HasValue());
  TransactionContext ctx = Begin();
  ASSIGN_OR_ASSERT_FAIL(Rid, first, ctx.Insert("Account", AccountOf("a@x", 1)));
  EXPECT_EQ(ctx.Insert("Account", AccountOf("a@x", 2)).GetStatus(),
            Status::kDuplicates);
  // The failed insert left nothing behind and the transaction goes on.
  ASSERT_SUCCESS_AND_EQ(ctx.Read(first), AccountOf("a@x", 1));
  ASSERT_SUCCESS_AND_EQ(ctx.Count(Query("Account")), 1);
  ASSERT_TRUE(ctx.Insert("Account", AccountOf("b@x", 2)).HasValue());
  ASSERT_SUCCESS(ctx.Commit());

  SnapshotContext snap = store_->Snapshot();
  ASSERT_SUCCESS_AND_EQ(snap.Read(first), AccountOf("a@x", 1));
  ASSERT_SUCCESS_AND_EQ(snap.Count(Query("Account")), 2);
}

TEST_F(StoreTest, RollbackAndCommit) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  {
    TransactionContext ctx = Begin();
    for (int64_t ts = 0; ts < 3; ++ts) {
      ASSERT_TRUE(ctx.Insert("Event", EventOf(ts)).HasValue());
    }
    ASSERT_SUCCESS_AND_EQ(ctx.Count(Query("Event")), 3);
    ASSERT_SUCCESS(ctx.Rollback());
    EXPECT_EQ(ctx.Rollback(), Status::kTransactionClosed);
  }
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 0);
  {
    TransactionContext ctx = Begin();
    for (int64_t ts = 0; ts < 3; ++ts) {
      ASSERT_TRUE(ctx.Insert("Event", EventOf(ts)).HasValue());
    }
    ASSERT_SUCCESS(ctx.Commit());
    EXPECT_EQ(ctx.Commit(), Status::kTransactionClosed);
  }
  SnapshotContext snap = store_->Snapshot();
  ASSERT_SUCCESS_AND_EQ(snap.Count(Query("Event")), 3);
  for (int64_t ts = 0; ts < 3; ++ts) {
    ASSERT_SUCCESS_AND_EQ(
        snap.Count(Query("Event").Where(Eq("ts", Value(ts)))), 1);
  }
}

TEST_F(StoreTest, DroppedTransactionRollsBack) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  {
    TransactionContext ctx = Begin();
    ASSERT_TRUE(ctx.Insert("Event", EventOf(1)).HasValue());
  }
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 0);
  // The writer was released.
  TransactionContext ctx = Begin();
  EXPECT_TRUE(ctx.IsOpen());
}

TEST_F(StoreTest, Projection) {
  ASSERT_TRUE(store_->Define<User>().HasValue());
  {
    TransactionContext ctx = Begin();
    ASSERT_TRUE(ctx.Insert(User{"alice", "secret"}).HasValue());
    ASSERT_TRUE(ctx.Insert(User{"bob", "hunter2"}).HasValue());
    ASSERT_SUCCESS(ctx.Commit());
  }
  SnapshotContext snap = store_->Snapshot();
  ASSIGN_OR_ASSERT_FAIL(
      UserNames, names,
      snap.ExecuteProjected<UserName>(Query("User").OrderBy("name")));
  ASSIGN_OR_ASSERT_FAIL(std::vector<UserName>, got, names.ToVector());
  ASSERT_EQ(got.size(), 2);
  EXPECT_EQ(got[0].name, "alice");
  EXPECT_EQ(got[1].name, "bob");

  ASSIGN_OR_ASSERT_FAIL(
      ResultSet, raw,
      snap.Execute(Query("User").Where(Eq("name", Value("bob"))).Project(
          {"password"})));
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, rows, raw.ToVector());
  ASSERT_EQ(rows.size(), 1);
  EXPECT_EQ(rows[0], Record({Value("hunter2")}));
}

TEST_F(StoreTest, CrashAfterLogFlush) {
  ASSERT_TRUE(store_->Define(AccountDescriptor()).HasValue());
  {
    TransactionContext ctx = Begin();
    ASSERT_TRUE(ctx.Insert("Account", AccountOf("before@x", 1)).HasValue());
    ASSERT_SUCCESS(ctx.Commit());
  }
  {
    TransactionContext ctx = Begin();
    for (int i = 0; i < 3; ++i) {
      ASSERT_TRUE(ctx.Insert("Account", AccountOf("crash" + std::to_string(i) +
                                                       "@x",
                                                   i))
                      .HasValue());
    }
    store_->Storage().Pages().SetCrashPointForTest(CrashPoint::kAfterWalFlush);
    EXPECT_EQ(ctx.Commit(), Status::kNeedsRecovery);
  }
  EXPECT_EQ(store_->Begin().GetStatus(), Status::kNeedsRecovery);

  Reopen();
  ASSERT_TRUE(store_->Define(AccountDescriptor()).HasValue());
  SnapshotContext snap = store_->Snapshot();
  ASSERT_SUCCESS_AND_EQ(snap.Count(Query("Account")), 4);
  for (int i = 0; i < 3; ++i) {
    ASSERT_SUCCESS_AND_EQ(
        snap.Count(Query("Account").Where(
            Eq("email", Value("crash" + std::to_string(i) + "@x")))),
        1);
  }
  TransactionContext ctx = Begin();
  EXPECT_EQ(ctx.Insert("Account", AccountOf("crash0@x", 9)).GetStatus(),
            Status::kDuplicates);
}

TEST_F(StoreTest, CrashDuringLogAppend) {
  ASSERT_TRUE(store_->Define(AccountDescriptor()).HasValue());
  {
    TransactionContext ctx = Begin();
    ASSERT_TRUE(ctx.Insert("Account", AccountOf("kept@x", 1)).HasValue());
    ASSERT_SUCCESS(ctx.Commit());
  }
  {
    TransactionContext ctx = Begin();
    ASSERT_TRUE(ctx.Insert("Account", AccountOf("lost@x", 2)).HasValue());
    store_->Storage().Pages().SetCrashPointForTest(
        CrashPoint::kDuringWalAppend);
    EXPECT_EQ(ctx.Commit(), Status::kNeedsRecovery);
  }
  Reopen();
  ASSERT_TRUE(store_->Define(AccountDescriptor()).HasValue());
  SnapshotContext snap = store_->Snapshot();
  ASSERT_SUCCESS_AND_EQ(snap.Count(Query("Account")), 1);
  ASSERT_SUCCESS_AND_EQ(
      snap.Count(Query("Account").Where(Eq("email", Value("lost@x")))), 0);
}

TEST_F(StoreTest, DefineRules) {
  ASSIGN_OR_ASSERT_FAIL(type_id_t, event, store_->Define(EventDescriptor()));
  ASSERT_SUCCESS_AND_EQ(store_->Define(EventDescriptor()), event);
  ASSIGN_OR_ASSERT_FAIL(type_id_t, account,
                        store_->Define(AccountDescriptor()));
  EXPECT_NE(event, account);

  StructDescriptor changed(
      "Event", {FieldDescriptor("ts", FieldType(FieldKind::kI32))});
  EXPECT_EQ(store_->Define(changed).GetStatus(),
            Status::kStructAlreadyDefined);
  EXPECT_TRUE(store_->IsDefined("Event"));
  EXPECT_FALSE(store_->IsDefined("Nothing"));
  EXPECT_EQ(store_->ListDefined(),
            (std::vector<std::string>{"Account", "Event"}));

  Reopen();
  EXPECT_FALSE(store_->IsDefined("Event"));
  EXPECT_EQ(store_->Snapshot().Scan("Event").GetStatus(),
            Status::kStructNotDefined);
  EXPECT_EQ(store_->Define(changed).GetStatus(),
            Status::kMigrationNotSupported);
  ASSERT_SUCCESS_AND_EQ(store_->Define(EventDescriptor()), event);
  ASSIGN_OR_ASSERT_FAIL(type_id_t, fresh,
                        store_->Define(StructDescriptor(
                            "Fresh", {FieldDescriptor(
                                         "x", FieldType(FieldKind::kBool))})));
  EXPECT_NE(fresh, event);
  EXPECT_NE(fresh, account);
}

TEST_F(StoreTest, InvalidDescriptors) {
  EXPECT_EQ(store_->Define(StructDescriptor(
                                "Dup", {FieldDescriptor(
                                            "a", FieldType(FieldKind::kBool)),
                                        FieldDescriptor(
                                            "a", FieldType(FieldKind::kU8))}))
                .GetStatus(),
            Status::kInvalidArgument);
  EXPECT_EQ(store_->Define(StructDescriptor(
                                "Holder", {FieldDescriptor(
                                               "inner",
                                               FieldType::Embedded("Nope"))}))
                .GetStatus(),
            Status::kStructNotDefined);
  EXPECT_EQ(store_->Define(StructDescriptor(
                                "Unindexable",
                                {FieldDescriptor("f", FieldType(FieldKind::kF64)),
                                 FieldDescriptor(
                                     "v",
                                     FieldType::Vec(
                                         FieldType::Vec(
                                             FieldType(FieldKind::kU8))),
                                     IndexMode::kCluster)}))
                .GetStatus(),
            Status::kInvalidArgument);
  EXPECT_TRUE(store_->ListDefined().empty());
}

TEST_F(StoreTest, SnapshotIsolation) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  SnapshotContext before = store_->Snapshot();
  TransactionContext ctx = Begin();
  ASSIGN_OR_ASSERT_FAIL(Rid, rid, ctx.Insert("Event", EventOf(5)));
  // Read your writes; nobody else sees them yet.
  ASSERT_SUCCESS_AND_EQ(ctx.Read(rid), EventOf(5));
  ASSERT_SUCCESS_AND_EQ(ctx.Count(Query("Event")), 1);
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 0);
  ASSERT_SUCCESS(ctx.Commit());

  ASSERT_SUCCESS_AND_EQ(before.Count(Query("Event")), 0);
  EXPECT_FALSE(before.Read(rid).HasValue());
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Read(rid), EventOf(5));
}

TEST_F(StoreTest, ResultSetLifetime) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  {
    TransactionContext ctx = Begin();
    for (int64_t ts = 0; ts < 10; ++ts) {
      ASSERT_TRUE(ctx.Insert("Event", EventOf(ts)).HasValue());
    }
    ASSERT_SUCCESS(ctx.Commit());
  }
  StatusOr<ResultSet> from_snapshot = store_->Snapshot().Scan("Event");
  ASSERT_TRUE(from_snapshot.HasValue());

  TransactionContext ctx = Begin();
  ASSIGN_OR_ASSERT_FAIL(ResultSet, rs, ctx.Scan("Event"));
  Record rec;
  ASSERT_SUCCESS_AND_EQ(rs.Next(&rec), true);
  ASSERT_TRUE(ctx.Insert("Event", EventOf(100)).HasValue());
  ASSERT_SUCCESS(ctx.Commit());
  EXPECT_EQ(rs.Next(&rec).GetStatus(), Status::kTransactionClosed);

  // The snapshot behind the first result set is gone from the caller's
  // hands but still readable.
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, all,
                        from_snapshot.Value().ToVector());
  EXPECT_EQ(all.size(), 10);
}

TEST_F(StoreTest, UpdateKeepsRidAndIndexes) {
  ASSERT_TRUE(store_->Define<MyData>().HasValue());
  TransactionContext ctx = Begin();
  ASSIGN_OR_ASSERT_FAIL(Ref<MyData>, ref, ctx.Insert(MyData{"a", "short"}));
  MyData grown{"b", std::string(5000, 'x')};
  ASSERT_SUCCESS(ctx.Update(ref, grown));
  ASSERT_SUCCESS_AND_EQ(ctx.Read(ref), grown);
  ASSERT_SUCCESS_AND_EQ(ctx.Count(Query("MyData").Where(Eq("name", Value("a")))),
                        0);
  ASSIGN_OR_ASSERT_FAIL(TypedResultSet<MyData>, found, FindByName(ctx, "b"));
  Rid rid;
  MyData got;
  ASSERT_SUCCESS_AND_EQ(found.Next(&got, &rid), true);
  EXPECT_EQ(rid, ref.rid);
  ASSERT_SUCCESS(ctx.Commit());
}

TEST_F(StoreTest, InvalidRecordLeavesTransactionUsable) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  TransactionContext ctx = Begin();
  EXPECT_EQ(ctx.Insert("Event", Record({Value("not a number"), Value("b")}))
                .GetStatus(),
            Status::kInvalidArgument);
  EXPECT_EQ(ctx.Insert("Nothing", EventOf(1)).GetStatus(),
            Status::kStructNotDefined);
  EXPECT_EQ(ctx.Delete(Rid(999, 1, 0, 0)), Status::kInvalidId);
  ASSERT_TRUE(ctx.Insert("Event", EventOf(1)).HasValue());
  ASSERT_SUCCESS(ctx.Commit());
}

TEST_F(StoreTest, FailedStatementAbortsTransaction) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  TransactionContext ctx = Begin();
  ASSERT_TRUE(ctx.Insert("Event", EventOf(1)).HasValue());
  ctx.GetTransaction().Fail(Status::kNoSpace);
  EXPECT_EQ(ctx.Insert("Event", EventOf(2)).GetStatus(), Status::kAborted);
  EXPECT_EQ(ctx.Count(Query("Event")).GetStatus(), Status::kAborted);
  EXPECT_EQ(ctx.Commit(), Status::kAborted);
  EXPECT_FALSE(ctx.IsOpen());
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 0);
}

TEST_F(StoreTest, ExceptionPoisonsWriter) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  try {
    TransactionContext ctx = Begin();
    ASSERT_TRUE(ctx.Insert("Event", EventOf(1)).HasValue());
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(store_->Begin().GetStatus(), Status::kLockPoisoned);
  // Readers keep working.
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 0);
  Reopen();
  EXPECT_TRUE(store_->Begin().HasValue());
}

TEST_F(StoreTest, SecondOpenIsRefused) {
  EXPECT_EQ(Store::Open(path_).GetStatus(), Status::kIOError);
  Options options;
  options.create_if_missing = false;
  EXPECT_EQ(Store::Open(path_ + ".missing", options).GetStatus(),
            Status::kIOError);
}

TEST_F(StoreTest, ReferenceFilter) {
  ASSERT_TRUE(store_->Define<User>().HasValue());
  ASSERT_TRUE(store_
                  ->Define(StructDescriptor(
                      "Post", {FieldDescriptor("author", FieldType::Ref("User")),
                               FieldDescriptor("title",
                                               FieldType(FieldKind::kString))}))
                  .HasValue());
  Ref<User> bob;
  {
    TransactionContext ctx = Begin();
    ASSIGN_OR_ASSERT_FAIL(Ref<User>, alice, ctx.Insert(User{"alice", "a"}));
    ASSIGN_OR_ASSERT_FAIL(Ref<User>, b, ctx.Insert(User{"bob", "b"}));
    bob = b;
    ASSERT_TRUE(
        ctx.Insert("Post", Record({Value(alice.rid), Value("hello")}))
            .HasValue());
    ASSERT_TRUE(
        ctx.Insert("Post", Record({Value(bob.rid), Value("hi")})).HasValue());
    ASSERT_TRUE(
        ctx.Insert("Post", Record({Value(bob.rid), Value("bye")})).HasValue());
    ASSERT_SUCCESS(ctx.Commit());
  }
  Query by_bob =
      Query("Post").Where(Reference("author", Eq("name", Value("bob"))));
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(by_bob), 2);
  {
    TransactionContext ctx = Begin();
    ASSERT_SUCCESS(ctx.Delete(bob));
    ASSERT_SUCCESS(ctx.Commit());
  }
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(by_bob), 0);
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Post")), 3);
}

TEST_F(StoreTest, RefRoundTripsThroughString) {
  ASSERT_TRUE(store_->Define<MyData>().HasValue());
  TransactionContext ctx = Begin();
  ASSIGN_OR_ASSERT_FAIL(Ref<MyData>, ref, ctx.Insert(MyData{"n", "a"}));
  ASSIGN_OR_ASSERT_FAIL(Ref<MyData>, parsed,
                        Ref<MyData>::FromString(ref.ToString()));
  EXPECT_EQ(parsed, ref);
  ASSERT_SUCCESS_AND_EQ(ctx.Read(parsed), (MyData{"n", "a"}));
}

TEST_F(StoreTest, WritersQueue) {
  ASSERT_TRUE(store_->Define(EventDescriptor()).HasValue());
  std::atomic<bool> second_began{false};
  StatusOr<TransactionContext> first = store_->Begin();
  ASSERT_TRUE(first.HasValue());
  std::thread other([&] {
    StatusOr<TransactionContext> second = store_->Begin();
    ASSERT_TRUE(second.HasValue());
    second_began = true;
    ASSERT_TRUE(second.Value().Insert("Event", EventOf(2)).HasValue());
    ASSERT_SUCCESS(second.Value().Commit());
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(second_began.load());
  ASSERT_TRUE(first.Value().Insert("Event", EventOf(1)).HasValue());
  ASSERT_SUCCESS(first.Value().Commit());
  other.join();
  EXPECT_TRUE(second_began.load());
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 2);
}

TEST_F(StoreTest, Undefine) {
  ASSIGN_OR_ASSERT_FAIL(type_id_t, event, store_->Define(EventDescriptor()));
  {
    TransactionContext ctx = Begin();
    for (int64_t ts : {10, 20, 30}) {
      ASSERT_TRUE(ctx.Insert("Event", EventOf(ts)).HasValue());
    }
    ASSERT_SUCCESS(ctx.Commit());
  }
  ASSERT_SUCCESS(store_->Undefine("Event"));
  EXPECT_FALSE(store_->IsDefined("Event"));
  EXPECT_EQ(store_->Snapshot().Scan("Event").GetStatus(),
            Status::kStructNotDefined);
  EXPECT_EQ(store_->Undefine("Event"), Status::kStructNotDefined);

  // The name is free again, for any shape.
  StructDescriptor changed(
      "Event", {FieldDescriptor("ts", FieldType(FieldKind::kI32))});
  ASSIGN_OR_ASSERT_FAIL(type_id_t, again, store_->Define(changed));
  EXPECT_NE(again, event);
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 0);

  Reopen();
  EXPECT_EQ(store_->Define(EventDescriptor()).GetStatus(),
            Status::kMigrationNotSupported);
  ASSERT_SUCCESS_AND_EQ(store_->Define(changed), again);
  // Undefining works without defining first.
  Reopen();
  ASSERT_SUCCESS(store_->Undefine("Event"));
  Reopen();
  ASSIGN_OR_ASSERT_FAIL(type_id_t, third, store_->Define(EventDescriptor()));
  EXPECT_NE(third, again);
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Count(Query("Event")), 0);
}

TEST_F(StoreTest, UndefineRefusesReferencedStructs) {
  ASSERT_TRUE(store_->Define<User>().HasValue());
  ASSERT_TRUE(store_
                  ->Define(StructDescriptor(
                      "Post", {FieldDescriptor("author", FieldType::Ref("User"))}))
                  .HasValue());
  EXPECT_EQ(store_->Undefine<User>(), Status::kMigrationNotSupported);
  EXPECT_EQ((store_->Migrate<User, Member>(
                [](User u) { return Member{u.name, 0}; })),
            Status::kMigrationNotSupported);
  EXPECT_TRUE(store_->IsDefined<User>());
  ASSERT_SUCCESS(store_->Undefine("Post"));
  ASSERT_SUCCESS(store_->Undefine<User>());
  EXPECT_TRUE(store_->ListDefined().empty());
}

TEST_F(StoreTest, MigrateKeepsRids) {
  std::function<Member(User)> convert = [](User u) {
    return Member{u.name, static_cast<uint32_t>(u.password.size())};
  };
  // Nothing stored as User yet.
  ASSERT_SUCCESS((store_->Migrate<User, Member>(convert)));
  EXPECT_FALSE(store_->IsDefined<Member>());

  ASSERT_TRUE(store_->Define<User>().HasValue());
  Ref<User> alice;
  Ref<User> bob;
  {
    TransactionContext ctx = Begin();
    ASSIGN_OR_ASSERT_FAIL(Ref<User>, a, ctx.Insert(User{"alice", "secret"}));
    ASSIGN_OR_ASSERT_FAIL(Ref<User>, b, ctx.Insert(User{"bob", "pw"}));
    alice = a;
    bob = b;
    ASSERT_SUCCESS(ctx.Commit());
  }
  ASSERT_SUCCESS((store_->Migrate<User, Member>(convert)));
  EXPECT_FALSE(store_->IsDefined<User>());
  EXPECT_TRUE(store_->IsDefined<Member>());
  {
    SnapshotContext snap = store_->Snapshot();
    ASSERT_SUCCESS_AND_EQ(snap.Read(Ref<Member>(alice.rid)),
                          (Member{"alice", 6}));
    ASSERT_SUCCESS_AND_EQ(snap.Read(Ref<Member>(bob.rid)), (Member{"bob", 2}));
    ASSIGN_OR_ASSERT_FAIL(TypedResultSet<Member>, found,
                          snap.FindBy<Member>("name", Value("bob")));
    ASSIGN_OR_ASSERT_FAIL(std::vector<Member>, all, found.ToVector());
    ASSERT_EQ(all.size(), 1);
    EXPECT_EQ(all[0], (Member{"bob", 2}));
    EXPECT_EQ(snap.Count(Query("User")).GetStatus(), Status::kStructNotDefined);
  }
  {
    // The new exclusive index is in force.
    TransactionContext ctx = Begin();
    EXPECT_EQ(ctx.Insert(Member{"alice", 1}).GetStatus(), Status::kDuplicates);
  }

  Reopen();
  ASSERT_SUCCESS_AND_EQ(store_->Define<Member>(), alice.rid.type_id);
  ASSERT_SUCCESS_AND_EQ(store_->Snapshot().Read(Ref<Member>(alice.rid)),
                        (Member{"alice", 6}));
  ASSIGN_OR_ASSERT_FAIL(type_id_t, user, store_->Define<User>());
  EXPECT_NE(user, alice.rid.type_id);
  // Migrating a type with no records only swaps the schema.
  ASSERT_SUCCESS(store_->Undefine<Member>());
  ASSERT_SUCCESS((store_->Migrate<User, Member>(convert)));
  ASSERT_SUCCESS_AND_EQ(store_->Define<Member>(), user);
}

TEST_F(StoreTest, FailedMigrationChangesNothing) {
  ASSIGN_OR_ASSERT_FAIL(type_id_t, event, store_->Define(EventDescriptor()));
  Rid first;
  {
    TransactionContext ctx = Begin();
    ASSIGN_OR_ASSERT_FAIL(Rid, rid, ctx.Insert("Event", EventOf(10)));
    first = rid;
    ASSERT_TRUE(ctx.Insert("Event", EventOf(20)).HasValue());
    ASSERT_SUCCESS(ctx.Commit());
  }
  StructDescriptor stamped(
      "Stamp", {FieldDescriptor("ts", FieldType(FieldKind::kI64),
                                IndexMode::kExclusive)});
  EXPECT_EQ(store_->Migrate("Event", stamped,
                            [](const Record&) -> StatusOr<Record> {
                              return Status::kInvalidArgument;
                            }),
            Status::kInvalidArgument);
  // Both records collapse onto one exclusive key.
  EXPECT_EQ(store_->Migrate("Event", stamped,
                            [](const Record&) -> StatusOr<Record> {
                              return Record({Value(int64_t{1})});
                            }),
            Status::kDuplicates);
  EXPECT_FALSE(store_->IsDefined("Stamp"));
  ASSERT_SUCCESS_AND_EQ(store_->Define(EventDescriptor()), event);
  SnapshotContext snap = store_->Snapshot();
  ASSERT_SUCCESS_AND_EQ(snap.Read(first), EventOf(10));
  ASSIGN_OR_ASSERT_FAIL(
      ResultSet, rs,
      snap.FindRange("Event", "ts", ValueBound{Value(int64_t{0}), true},
                     std::nullopt));
  ASSIGN_OR_ASSERT_FAIL(std::vector<Record>, got, rs.ToVector());
  ASSERT_EQ(got.size(), 2);

  // A stored name can not be the target.
  ASSERT_TRUE(store_->Define(AccountDescriptor()).HasValue());
  EXPECT_EQ(store_->Migrate("Event", AccountDescriptor(),
                            [](const Record& r) -> StatusOr<Record> {
                              return r;
                            }),
            Status::kStructAlreadyDefined);
}

TEST_F(StoreTest, MemoryStore) {
  ASSIGN_OR_ASSERT_FAIL(std::unique_ptr<Store>, memory, Store::OpenMemory());
  const std::string path = memory->Storage().Path();
  EXPECT_TRUE(std::filesystem::exists(path));
  ASSERT_TRUE(memory->Define(EventDescriptor()).HasValue());
  {
    StatusOr<TransactionContext> ctx = memory->Begin();
    ASSERT_TRUE(ctx.HasValue());
    ASSERT_TRUE(ctx.Value().Insert("Event", EventOf(1)).HasValue());
    ASSERT_SUCCESS(ctx.Value().Commit());
  }
  ASSERT_SUCCESS_AND_EQ(memory->Snapshot().Count(Query("Event")), 1);
  memory.reset();
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_FALSE(std::filesystem::exists(path + ".wal"));
}

}  // namespace structsy
