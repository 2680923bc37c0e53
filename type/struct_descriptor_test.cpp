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

#include "type/struct_descriptor.hpp"

#include <map>
#include <memory>
#include <string>

#include "common/test_util.hpp"
#include "gtest/gtest.h"

namespace structsy {

class MapResolver : public SchemaResolver {
 public:
  [[nodiscard]] StatusOr<std::shared_ptr<const StructDescriptor>>
  ResolveStruct(std::string_view name) const override {
    auto it = structs_.find(std::string(name));
    if (it == structs_.end()) {
      return Status::kStructNotDefined;
    }
    return it->second;
  }
  void Add(const StructDescriptor& desc) {
    structs_[desc.Name()] = std::make_shared<const StructDescriptor>(desc);
  }

 private:
  std::map<std::string, std::shared_ptr<const StructDescriptor>> structs_;
};

StructDescriptor UserDescriptor() {
  return StructDescriptor(
      "User", {FieldDescriptor("name", FieldType(FieldKind::kString),
                               IndexMode::kCluster),
               FieldDescriptor("email", FieldType(FieldKind::kString),
                               IndexMode::kExclusive, "by_email"),
               FieldDescriptor("age", FieldType(FieldKind::kU8))});
}

TEST(StructDescriptorTest, Construct) {
  StructDescriptor desc = UserDescriptor();
  EXPECT_EQ(desc.Name(), "User");
  EXPECT_EQ(desc.FieldCount(), 3);
  EXPECT_EQ(desc.FieldIndex("email"), 1);
  EXPECT_EQ(desc.FieldIndex("missing"), -1);
  EXPECT_EQ(desc.GetField(0).index.name, "name");
  EXPECT_EQ(desc.GetField(1).index.name, "by_email");
  EXPECT_FALSE(desc.GetField(2).IsIndexed());
}

TEST(StructDescriptorTest, SerializeDeserialize) {
  StructDescriptor desc(
      "Nested",
      {FieldDescriptor("tags", FieldType::Vec(FieldType(FieldKind::kString)),
                       IndexMode::kCluster),
       FieldDescriptor("owner", FieldType::Option(FieldType::Ref("User"))),
       FieldDescriptor("home", FieldType::Embedded("Address"))});
  SerializeDeserializeTest(desc);
  SerializeDeserializeTest(UserDescriptor());
}

TEST(StructDescriptorTest, StructuralHash) {
  const uint64_t base = UserDescriptor().StructuralHash();
  EXPECT_EQ(base, UserDescriptor().StructuralHash());

  StructDescriptor renamed_field(
      "User", {FieldDescriptor("nick", FieldType(FieldKind::kString),
                               IndexMode::kCluster),
               FieldDescriptor("email", FieldType(FieldKind::kString),
                               IndexMode::kExclusive, "by_email"),
               FieldDescriptor("age", FieldType(FieldKind::kU8))});
  EXPECT_NE(base, renamed_field.StructuralHash());

  StructDescriptor wider(
      "User", {FieldDescriptor("name", FieldType(FieldKind::kString),
                               IndexMode::kCluster),
               FieldDescriptor("email", FieldType(FieldKind::kString),
                               IndexMode::kExclusive, "by_email"),
               FieldDescriptor("age", FieldType(FieldKind::kU16))});
  EXPECT_NE(base, wider.StructuralHash());
}

TEST(StructDescriptorTest, Validate) {
  MapResolver resolver;
  EXPECT_SUCCESS(UserDescriptor().Validate(resolver));

  StructDescriptor dup("Dup", {FieldDescriptor("a", FieldType(FieldKind::kU8)),
                               FieldDescriptor("a", FieldType(FieldKind::kU8))});
  EXPECT_EQ(dup.Validate(resolver), Status::kInvalidArgument);

  StructDescriptor dup_index(
      "DupIndex",
      {FieldDescriptor("a", FieldType(FieldKind::kU8), IndexMode::kCluster,
                       "idx"),
       FieldDescriptor("b", FieldType(FieldKind::kU8), IndexMode::kCluster,
                       "idx")});
  EXPECT_EQ(dup_index.Validate(resolver), Status::kInvalidArgument);

  StructDescriptor bad_index(
      "BadIndex",
      {FieldDescriptor("inner", FieldType::Vec(FieldType::Vec(
                                    FieldType(FieldKind::kU8))),
                       IndexMode::kCluster)});
  EXPECT_EQ(bad_index.Validate(resolver), Status::kInvalidArgument);

  StructDescriptor embeds(
      "Person", {FieldDescriptor("home", FieldType::Embedded("Address"))});
  EXPECT_EQ(embeds.Validate(resolver), Status::kStructNotDefined);
  resolver.Add(StructDescriptor(
      "Address", {FieldDescriptor("city", FieldType(FieldKind::kString))}));
  EXPECT_SUCCESS(embeds.Validate(resolver));

  StructDescriptor self_ref(
      "Node", {FieldDescriptor("next", FieldType::Option(FieldType::Ref("Node")))});
  EXPECT_SUCCESS(self_ref.Validate(resolver));
}

TEST(FieldTypeTest, ToString) {
  EXPECT_EQ(FieldType(FieldKind::kI128).ToString(), "i128");
  EXPECT_EQ(FieldType::Option(FieldType::Vec(FieldType(FieldKind::kBytes)))
                .ToString(),
            "Option<Vec<bytes>>");
  EXPECT_EQ(FieldType::Ref("User").ToString(), "Ref<User>");
}

TEST(FieldTypeTest, Classification) {
  EXPECT_TRUE(FieldType(FieldKind::kU64).IsUnsigned());
  EXPECT_TRUE(FieldType(FieldKind::kI8).IsSigned());
  EXPECT_TRUE(FieldType(FieldKind::kF32).IsScalar());
  EXPECT_TRUE(FieldType::Ref("X").IsScalar());
  EXPECT_FALSE(FieldType::Embedded("X").IsIndexable());
  EXPECT_TRUE(FieldType::Option(FieldType(FieldKind::kString)).IsIndexable());
  EXPECT_EQ(FieldType::Vec(FieldType(FieldKind::kI32)).KeyType(),
            FieldType(FieldKind::kI32));
  EXPECT_EQ(FieldType(FieldKind::kI128).IntegerWidth(), 16);
}

}  // namespace structsy
