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

#include "query/filter.hpp"

#include <ostream>

#include "common/log_message.hpp"
#include "type/record_codec.hpp"

namespace structsy {

const FieldType& ElementTypeOf(const FieldType& type) {
  if (type.IsOption() || type.IsVec()) {
    return ElementTypeOf(type.Element());
  }
  return type;
}

void CandidatesOf(const FieldType& type, const Value& value,
                  std::vector<const Value*>* out) {
  if (value.IsNull()) {
    return;
  }
  if (type.IsOption()) {
    CandidatesOf(type.Element(), value, out);
    return;
  }
  if (type.IsVec()) {
    for (const auto& elm : value.Elements()) {
      CandidatesOf(type.Element(), elm, out);
    }
    return;
  }
  out->push_back(&value);
}

namespace {

Status CheckOperand(const FieldType& field_type, const Value& operand,
                    const SchemaResolver& resolver, std::string_view field) {
  const FieldType& target = ElementTypeOf(field_type);
  if (target.Kind() == FieldKind::kEmbedded) {
    LOG(WARN) << "embedded field " << field << " can not be compared";
    return Status::kInvalidArgument;
  }
  Status s = CheckValue(target, operand, resolver);
  if (s != Status::kSuccess) {
    LOG(WARN) << operand << " does not fit field " << field << " of type "
              << field_type;
  }
  return s;
}

bool InBounds(const Value& v, const std::optional<ValueBound>& lower,
              const std::optional<ValueBound>& upper) {
  if (lower.has_value()) {
    const int cmp = v.Compare(lower->value);
    if (cmp < 0 || (cmp == 0 && !lower->inclusive)) {
      return false;
    }
  }
  if (upper.has_value()) {
    const int cmp = v.Compare(upper->value);
    if (0 < cmp || (cmp == 0 && !upper->inclusive)) {
      return false;
    }
  }
  return true;
}

// Strips an Option wrapper. Null stays null.
const FieldType& StripOption(const FieldType& type) {
  return type.IsOption() ? StripOption(type.Element()) : type;
}

}  // namespace

const CompareFilter& FilterBase::AsCompare() const {
  return dynamic_cast<const CompareFilter&>(*this);
}
const RangeFilter& FilterBase::AsRange() const {
  return dynamic_cast<const RangeFilter&>(*this);
}
const OneOfFilter& FilterBase::AsOneOf() const {
  return dynamic_cast<const OneOfFilter&>(*this);
}
const GroupFilter& FilterBase::AsGroup() const {
  return dynamic_cast<const GroupFilter&>(*this);
}

StatusOr<size_t> FieldFilter::Locate(const StructDescriptor& desc) const {
  const int idx = desc.FieldIndex(field_);
  if (idx < 0) {
    LOG(WARN) << desc.Name() << " has no field " << field_;
    return Status::kInvalidArgument;
  }
  return static_cast<size_t>(idx);
}

Status CompareFilter::Validate(const StructDescriptor& desc,
                               const SchemaResolver& resolver) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const FieldType& type = desc.GetField(idx).type;
  if (operand_.IsNull()) {
    const bool is_presence =
        op_ == BinaryOperation::kEquals || op_ == BinaryOperation::kNotEquals;
    return type.IsOption() && is_presence ? Status::kSuccess
                                          : Status::kInvalidArgument;
  }
  return CheckOperand(type, operand_, resolver, field_);
}

StatusOr<bool> CompareFilter::Evaluate(const StructDescriptor& desc,
                                       const Record& record,
                                       const FilterContext& /*ctx*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const Value& value = record.Get(idx);
  if (operand_.IsNull()) {
    return (op_ == BinaryOperation::kEquals) == value.IsNull();
  }
  std::vector<const Value*> candidates;
  CandidatesOf(desc.GetField(idx).type, value, &candidates);
  for (const Value* c : candidates) {
    if (CompareResult(op_, c->Compare(operand_))) {
      return true;
    }
  }
  return false;
}

void CompareFilter::Dump(std::ostream& o) const {
  o << field_ << " " << ToString(op_) << " " << operand_;
}

Status RangeFilter::Validate(const StructDescriptor& desc,
                             const SchemaResolver& resolver) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const FieldType& type = desc.GetField(idx).type;
  if (lower_.has_value()) {
    RETURN_IF_FAIL(CheckOperand(type, lower_->value, resolver, field_));
  }
  if (upper_.has_value()) {
    RETURN_IF_FAIL(CheckOperand(type, upper_->value, resolver, field_));
  }
  return Status::kSuccess;
}

StatusOr<bool> RangeFilter::Evaluate(const StructDescriptor& desc,
                                     const Record& record,
                                     const FilterContext& /*ctx*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  std::vector<const Value*> candidates;
  CandidatesOf(desc.GetField(idx).type, record.Get(idx), &candidates);
  for (const Value* c : candidates) {
    if (InBounds(*c, lower_, upper_)) {
      return true;
    }
  }
  return false;
}

void RangeFilter::Dump(std::ostream& o) const {
  o << field_ << " in ";
  if (lower_.has_value()) {
    o << (lower_->inclusive ? "[" : "(") << lower_->value;
  } else {
    o << "(-inf";
  }
  o << ", ";
  if (upper_.has_value()) {
    o << upper_->value << (upper_->inclusive ? "]" : ")");
  } else {
    o << "+inf)";
  }
}

Status OneOfFilter::Validate(const StructDescriptor& desc,
                             const SchemaResolver& resolver) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  for (const auto& v : values_) {
    RETURN_IF_FAIL(
        CheckOperand(desc.GetField(idx).type, v, resolver, field_));
  }
  return Status::kSuccess;
}

StatusOr<bool> OneOfFilter::Evaluate(const StructDescriptor& desc,
                                     const Record& record,
                                     const FilterContext& /*ctx*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  std::vector<const Value*> candidates;
  CandidatesOf(desc.GetField(idx).type, record.Get(idx), &candidates);
  for (const Value* c : candidates) {
    for (const auto& v : values_) {
      if (*c == v) {
        return true;
      }
    }
  }
  return false;
}

void OneOfFilter::Dump(std::ostream& o) const {
  o << field_ << " one of {";
  for (size_t i = 0; i < values_.size(); ++i) {
    o << (i == 0 ? "" : ", ") << values_[i];
  }
  o << "}";
}

Status ContainsFilter::Validate(const StructDescriptor& desc,
                                const SchemaResolver& resolver) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const FieldType& type = StripOption(desc.GetField(idx).type);
  if (!type.IsVec()) {
    LOG(WARN) << field_ << " is not a sequence";
    return Status::kInvalidArgument;
  }
  return CheckOperand(type, element_, resolver, field_);
}

StatusOr<bool> ContainsFilter::Evaluate(const StructDescriptor& desc,
                                        const Record& record,
                                        const FilterContext& /*ctx*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const Value& value = record.Get(idx);
  if (value.IsNull()) {
    return false;
  }
  for (const auto& elm : value.Elements()) {
    if (elm == element_) {
      return true;
    }
  }
  return false;
}

void ContainsFilter::Dump(std::ostream& o) const {
  o << field_ << " contains " << element_;
}

Status LengthFilter::Validate(const StructDescriptor& desc,
                              const SchemaResolver& /*resolver*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const FieldType& type = StripOption(desc.GetField(idx).type);
  if (type.IsVec() || type.Kind() == FieldKind::kString ||
      type.Kind() == FieldKind::kBytes) {
    return Status::kSuccess;
  }
  LOG(WARN) << field_ << " of type " << type << " has no length";
  return Status::kInvalidArgument;
}

StatusOr<bool> LengthFilter::Evaluate(const StructDescriptor& desc,
                                      const Record& record,
                                      const FilterContext& /*ctx*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const Value& value = record.Get(idx);
  if (value.IsNull()) {
    return false;
  }
  const uint64_t length = value.Kind() == ValueKind::kList
                              ? value.Elements().size()
                              : value.AsString().size();
  const int cmp = length < length_ ? -1 : (length_ < length ? 1 : 0);
  return CompareResult(op_, cmp);
}

void LengthFilter::Dump(std::ostream& o) const {
  o << "len(" << field_ << ") " << ToString(op_) << " " << length_;
}

Status PresenceFilter::Validate(const StructDescriptor& desc,
                                const SchemaResolver& /*resolver*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  if (!desc.GetField(idx).type.IsOption()) {
    LOG(WARN) << field_ << " is not optional";
    return Status::kInvalidArgument;
  }
  return Status::kSuccess;
}

StatusOr<bool> PresenceFilter::Evaluate(const StructDescriptor& desc,
                                        const Record& record,
                                        const FilterContext& /*ctx*/) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  return record.Get(idx).IsNull() != present_;
}

void PresenceFilter::Dump(std::ostream& o) const {
  o << field_ << (present_ ? " is some" : " is none");
}

StatusOr<std::shared_ptr<const StructDescriptor>> NestedFilter::Target(
    const StructDescriptor& desc, const SchemaResolver& resolver) const {
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  const FieldType& type = ElementTypeOf(desc.GetField(idx).type);
  const FieldKind expected =
      follow_reference_ ? FieldKind::kRef : FieldKind::kEmbedded;
  if (type.Kind() != expected) {
    LOG(WARN) << field_ << " of type " << type << " is not "
              << ToString(expected);
    return Status::kInvalidArgument;
  }
  return resolver.ResolveStruct(type.TypeName());
}

Status NestedFilter::Validate(const StructDescriptor& desc,
                              const SchemaResolver& resolver) const {
  ASSIGN_OR_RETURN(std::shared_ptr<const StructDescriptor>, target,
                   Target(desc, resolver));
  return sub_->Validate(*target, resolver);
}

StatusOr<bool> NestedFilter::Evaluate(const StructDescriptor& desc,
                                      const Record& record,
                                      const FilterContext& ctx) const {
  ASSIGN_OR_RETURN(std::shared_ptr<const StructDescriptor>, target,
                   Target(desc, *ctx.resolver));
  ASSIGN_OR_RETURN(size_t, idx, Locate(desc));
  std::vector<const Value*> candidates;
  CandidatesOf(desc.GetField(idx).type, record.Get(idx), &candidates);
  for (const Value* c : candidates) {
    Record nested;
    if (follow_reference_) {
      StatusOr<Record> pointed = ctx.deref(c->AsRid());
      if (pointed.GetStatus() == Status::kNotExists ||
          pointed.GetStatus() == Status::kInvalidId) {
        // A dangling reference matches nothing.
        continue;
      }
      RETURN_IF_FAIL(pointed.GetStatus());
      nested = pointed.MoveValue();
    } else {
      nested = c->AsRecord();
    }
    ASSIGN_OR_RETURN(bool, matched, sub_->Evaluate(*target, nested, ctx));
    if (matched) {
      return true;
    }
  }
  return false;
}

void NestedFilter::Dump(std::ostream& o) const {
  o << field_ << (follow_reference_ ? "->{" : ".{") << *sub_ << "}";
}

Status GroupFilter::Validate(const StructDescriptor& desc,
                             const SchemaResolver& resolver) const {
  for (const auto& child : children_) {
    RETURN_IF_FAIL(child->Validate(desc, resolver));
  }
  return Status::kSuccess;
}

StatusOr<bool> GroupFilter::Evaluate(const StructDescriptor& desc,
                                     const Record& record,
                                     const FilterContext& ctx) const {
  const bool is_and = kind_ == FilterKind::kAnd;
  for (const auto& child : children_) {
    ASSIGN_OR_RETURN(bool, matched, child->Evaluate(desc, record, ctx));
    if (matched != is_and) {
      return matched;
    }
  }
  return is_and;
}

void GroupFilter::Dump(std::ostream& o) const {
  o << "(";
  for (size_t i = 0; i < children_.size(); ++i) {
    if (0 < i) {
      o << (kind_ == FilterKind::kAnd ? " AND " : " OR ");
    }
    o << *children_[i];
  }
  o << ")";
}

Status NotFilter::Validate(const StructDescriptor& desc,
                           const SchemaResolver& resolver) const {
  return child_->Validate(desc, resolver);
}

StatusOr<bool> NotFilter::Evaluate(const StructDescriptor& desc,
                                   const Record& record,
                                   const FilterContext& ctx) const {
  ASSIGN_OR_RETURN(bool, matched, child_->Evaluate(desc, record, ctx));
  return !matched;
}

void NotFilter::Dump(std::ostream& o) const { o << "NOT " << *child_; }

Filter Compare(std::string_view field, BinaryOperation op, Value operand) {
  return std::make_shared<CompareFilter>(field, op, std::move(operand));
}

Filter Eq(std::string_view field, Value operand) {
  return Compare(field, BinaryOperation::kEquals, std::move(operand));
}

Filter Range(std::string_view field, std::optional<ValueBound> lower,
             std::optional<ValueBound> upper) {
  return std::make_shared<RangeFilter>(field, std::move(lower),
                                       std::move(upper));
}

Filter OneOf(std::string_view field, std::vector<Value> values) {
  return std::make_shared<OneOfFilter>(field, std::move(values));
}

Filter Contains(std::string_view field, Value element) {
  return std::make_shared<ContainsFilter>(field, std::move(element));
}

Filter Length(std::string_view field, BinaryOperation op, uint64_t length) {
  return std::make_shared<LengthFilter>(field, op, length);
}

Filter IsSome(std::string_view field) {
  return std::make_shared<PresenceFilter>(field, true);
}

Filter IsNone(std::string_view field) {
  return std::make_shared<PresenceFilter>(field, false);
}

Filter Embedded(std::string_view field, Filter sub) {
  return std::make_shared<NestedFilter>(field, std::move(sub), false);
}

Filter Reference(std::string_view field, Filter sub) {
  return std::make_shared<NestedFilter>(field, std::move(sub), true);
}

Filter And(std::vector<Filter> children) {
  return std::make_shared<GroupFilter>(FilterKind::kAnd, std::move(children));
}

Filter Or(std::vector<Filter> children) {
  return std::make_shared<GroupFilter>(FilterKind::kOr, std::move(children));
}

Filter Not(Filter child) { return std::make_shared<NotFilter>(std::move(child)); }

}  // namespace structsy
