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

#ifndef STRUCTSY_FILTER_HPP
#define STRUCTSY_FILTER_HPP

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"
#include "type/record.hpp"
#include "type/struct_descriptor.hpp"
#include "type/value.hpp"

namespace structsy {

enum class FilterKind : uint8_t {
  kCompare,
  kRange,
  kOneOf,
  kContains,
  kLength,
  kIsSome,
  kIsNone,
  kEmbedded,
  kReference,
  kAnd,
  kOr,
  kNot,
};

// What a filter needs besides the record itself.
struct FilterContext {
  const SchemaResolver* resolver = nullptr;
  // Loads the record a Ref field points at.
  std::function<StatusOr<Record>(const Rid&)> deref;
};

struct ValueBound {
  Value value;
  bool inclusive = true;
};

class CompareFilter;
class RangeFilter;
class OneOfFilter;
class GroupFilter;

class FilterBase {
 public:
  FilterBase() = default;
  virtual ~FilterBase() = default;
  FilterBase(const FilterBase&) = delete;
  FilterBase(FilterBase&&) = delete;
  FilterBase& operator=(const FilterBase&) = delete;
  FilterBase& operator=(FilterBase&&) = delete;

  [[nodiscard]] virtual FilterKind Kind() const = 0;
  // kInvalidArgument for unknown fields or operands which can never be
  // stored in the field.
  [[nodiscard]] virtual Status Validate(
      const StructDescriptor& desc, const SchemaResolver& resolver) const = 0;
  [[nodiscard]] virtual StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const = 0;
  virtual void Dump(std::ostream& o) const = 0;

  [[nodiscard]] const CompareFilter& AsCompare() const;
  [[nodiscard]] const RangeFilter& AsRange() const;
  [[nodiscard]] const OneOfFilter& AsOneOf() const;
  [[nodiscard]] const GroupFilter& AsGroup() const;

  friend std::ostream& operator<<(std::ostream& o, const FilterBase& f) {
    f.Dump(o);
    return o;
  }
};

typedef std::shared_ptr<const FilterBase> Filter;

// A condition on one named field of the record.
class FieldFilter : public FilterBase {
 public:
  [[nodiscard]] const std::string& Field() const { return field_; }

 protected:
  explicit FieldFilter(std::string_view field) : field_(field) {}
  StatusOr<size_t> Locate(const StructDescriptor& desc) const;

  std::string field_;
};

class CompareFilter : public FieldFilter {
 public:
  CompareFilter(std::string_view field, BinaryOperation op, Value operand)
      : FieldFilter(field), op_(op), operand_(std::move(operand)) {}
  [[nodiscard]] FilterKind Kind() const override { return FilterKind::kCompare; }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

  [[nodiscard]] BinaryOperation Op() const { return op_; }
  [[nodiscard]] const Value& Operand() const { return operand_; }

 private:
  BinaryOperation op_;
  Value operand_;
};

class RangeFilter : public FieldFilter {
 public:
  RangeFilter(std::string_view field, std::optional<ValueBound> lower,
              std::optional<ValueBound> upper)
      : FieldFilter(field), lower_(std::move(lower)), upper_(std::move(upper)) {}
  [[nodiscard]] FilterKind Kind() const override { return FilterKind::kRange; }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

  [[nodiscard]] const std::optional<ValueBound>& Lower() const {
    return lower_;
  }
  [[nodiscard]] const std::optional<ValueBound>& Upper() const {
    return upper_;
  }

 private:
  std::optional<ValueBound> lower_;
  std::optional<ValueBound> upper_;
};

class OneOfFilter : public FieldFilter {
 public:
  OneOfFilter(std::string_view field, std::vector<Value> values)
      : FieldFilter(field), values_(std::move(values)) {}
  [[nodiscard]] FilterKind Kind() const override { return FilterKind::kOneOf; }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

  [[nodiscard]] const std::vector<Value>& Values() const { return values_; }

 private:
  std::vector<Value> values_;
};

// A sequence field holding an element equal to the operand.
class ContainsFilter : public FieldFilter {
 public:
  ContainsFilter(std::string_view field, Value element)
      : FieldFilter(field), element_(std::move(element)) {}
  [[nodiscard]] FilterKind Kind() const override {
    return FilterKind::kContains;
  }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

 private:
  Value element_;
};

// Length of a string or bytes field, or element count of a sequence.
class LengthFilter : public FieldFilter {
 public:
  LengthFilter(std::string_view field, BinaryOperation op, uint64_t length)
      : FieldFilter(field), op_(op), length_(length) {}
  [[nodiscard]] FilterKind Kind() const override { return FilterKind::kLength; }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

 private:
  BinaryOperation op_;
  uint64_t length_;
};

class PresenceFilter : public FieldFilter {
 public:
  PresenceFilter(std::string_view field, bool present)
      : FieldFilter(field), present_(present) {}
  [[nodiscard]] FilterKind Kind() const override {
    return present_ ? FilterKind::kIsSome : FilterKind::kIsNone;
  }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

 private:
  bool present_;
};

// Applies |sub| to an embedded record, or to the record a Ref points at.
class NestedFilter : public FieldFilter {
 public:
  NestedFilter(std::string_view field, Filter sub, bool follow_reference)
      : FieldFilter(field),
        sub_(std::move(sub)),
        follow_reference_(follow_reference) {}
  [[nodiscard]] FilterKind Kind() const override {
    return follow_reference_ ? FilterKind::kReference : FilterKind::kEmbedded;
  }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

 private:
  StatusOr<std::shared_ptr<const StructDescriptor>> Target(
      const StructDescriptor& desc, const SchemaResolver& resolver) const;

  Filter sub_;
  bool follow_reference_;
};

class GroupFilter : public FilterBase {
 public:
  // |kind| is kAnd or kOr.
  GroupFilter(FilterKind kind, std::vector<Filter> children)
      : kind_(kind), children_(std::move(children)) {}
  [[nodiscard]] FilterKind Kind() const override { return kind_; }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

  [[nodiscard]] const std::vector<Filter>& Children() const {
    return children_;
  }

 private:
  FilterKind kind_;
  std::vector<Filter> children_;
};

class NotFilter : public FilterBase {
 public:
  explicit NotFilter(Filter child) : child_(std::move(child)) {}
  [[nodiscard]] FilterKind Kind() const override { return FilterKind::kNot; }
  [[nodiscard]] Status Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const override;
  [[nodiscard]] StatusOr<bool> Evaluate(
      const StructDescriptor& desc, const Record& record,
      const FilterContext& ctx) const override;
  void Dump(std::ostream& o) const override;

 private:
  Filter child_;
};

Filter Compare(std::string_view field, BinaryOperation op, Value operand);
Filter Eq(std::string_view field, Value operand);
Filter Range(std::string_view field, std::optional<ValueBound> lower,
             std::optional<ValueBound> upper);
Filter OneOf(std::string_view field, std::vector<Value> values);
Filter Contains(std::string_view field, Value element);
Filter Length(std::string_view field, BinaryOperation op, uint64_t length);
Filter IsSome(std::string_view field);
Filter IsNone(std::string_view field);
Filter Embedded(std::string_view field, Filter sub);
Filter Reference(std::string_view field, Filter sub);
Filter And(std::vector<Filter> children);
Filter Or(std::vector<Filter> children);
Filter Not(Filter child);

// The type comparisons on a field apply to: Option and Vec unwrapped.
const FieldType& ElementTypeOf(const FieldType& type);

// Values of |value| that comparisons consider: nothing for an absent
// Option, every element of a Vec, otherwise the value itself.
void CandidatesOf(const FieldType& type, const Value& value,
                  std::vector<const Value*>* out);

}  // namespace structsy

#endif  // STRUCTSY_FILTER_HPP
