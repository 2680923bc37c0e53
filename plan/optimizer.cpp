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
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "common/log_message.hpp"
#include "index/index.hpp"
#include "index/key_range.hpp"
#include "plan/full_scan_plan.hpp"
#include "plan/index_scan_plan.hpp"
#include "plan/projection_plan.hpp"
#include "plan/selection_plan.hpp"
#include "plan/sort_plan.hpp"
#include "query/field_path.hpp"
#include "table/table.hpp"
#include "type/key_codec.hpp"

namespace structsy {
namespace {

// Lower is better.
enum class Rank : int {
  kExclusivePoint = 0,
  kClusterPoint = 1,
  kMultiPoint = 2,
  kBoundedRange = 3,
  kHalfOpenRange = 4,
};

std::ostream& operator<<(std::ostream& o, Rank r) {
  switch (r) {
    case Rank::kExclusivePoint:
      return o << "exclusive point";
    case Rank::kClusterPoint:
      return o << "cluster point";
    case Rank::kMultiPoint:
      return o << "multi point";
    case Rank::kBoundedRange:
      return o << "bounded range";
    case Rank::kHalfOpenRange:
      return o << "half-open range";
  }
  return o;
}

struct Candidate {
  Rank rank;
  const Index* index;
  slot_t field;
  std::vector<KeyRange> ranges;
};

bool BetterThan(const Candidate& a, const Candidate& b) {
  if (a.rank != b.rank) {
    return a.rank < b.rank;
  }
  if (a.index->IsExclusive() != b.index->IsExclusive()) {
    return a.index->IsExclusive();
  }
  return a.field < b.field;
}

// Intersection of every bound seen so far, over encoded keys.
struct Range {
  std::optional<KeyBound> lower;
  std::optional<KeyBound> upper;

  [[nodiscard]] bool Empty() const {
    return !lower.has_value() && !upper.has_value();
  }
  void TightenLower(KeyBound b) {
    if (!lower.has_value() || lower->key < b.key ||
        (lower->key == b.key && !b.inclusive)) {
      lower = std::move(b);
    }
  }
  void TightenUpper(KeyBound b) {
    if (!upper.has_value() || b.key < upper->key ||
        (upper->key == b.key && !b.inclusive)) {
      upper = std::move(b);
    }
  }
  [[nodiscard]] Rank GetRank() const {
    return lower.has_value() && upper.has_value() ? Rank::kBoundedRange
                                                  : Rank::kHalfOpenRange;
  }
  [[nodiscard]] KeyRange ToKeyRange() const {
    KeyRange ret;
    ret.lower = lower;
    ret.upper = upper;
    return ret;
  }
};

// A rounded operand widens to an inclusive bound; the residual filter
// drops the extra keys.
std::optional<KeyBound> BoundOf(const FieldType& key_type, const Value& v,
                                bool inclusive) {
  StatusOr<std::string> key = EncodeKey(key_type, v);
  if (!key.HasValue()) {
    return std::nullopt;
  }
  return KeyBound{key.MoveValue(), inclusive || !IsExactKey(key_type, v)};
}

// Adds the bounds of a comparison or range condition to |out|. False when
// |cond| gives no usable bound.
bool AddBounds(const FilterBase& cond, const FieldType& key_type, Range* out) {
  Range tmp;
  if (cond.Kind() == FilterKind::kCompare) {
    const CompareFilter& cmp = cond.AsCompare();
    if (cmp.Operand().IsNull()) {
      return false;
    }
    std::optional<KeyBound> b;
    switch (cmp.Op()) {
      case BinaryOperation::kLessThan:
      case BinaryOperation::kLessThanEquals:
        b = BoundOf(key_type, cmp.Operand(),
                    cmp.Op() == BinaryOperation::kLessThanEquals);
        if (!b.has_value()) {
          return false;
        }
        tmp.TightenUpper(std::move(*b));
        break;
      case BinaryOperation::kGreaterThan:
      case BinaryOperation::kGreaterThanEquals:
        b = BoundOf(key_type, cmp.Operand(),
                    cmp.Op() == BinaryOperation::kGreaterThanEquals);
        if (!b.has_value()) {
          return false;
        }
        tmp.TightenLower(std::move(*b));
        break;
      default:
        return false;
    }
  } else if (cond.Kind() == FilterKind::kRange) {
    const RangeFilter& range = cond.AsRange();
    if (range.Lower().has_value()) {
      std::optional<KeyBound> b = BoundOf(key_type, range.Lower()->value,
                                          range.Lower()->inclusive);
      if (!b.has_value()) {
        return false;
      }
      tmp.TightenLower(std::move(*b));
    }
    if (range.Upper().has_value()) {
      std::optional<KeyBound> b = BoundOf(key_type, range.Upper()->value,
                                          range.Upper()->inclusive);
      if (!b.has_value()) {
        return false;
      }
      tmp.TightenUpper(std::move(*b));
    }
    if (tmp.Empty()) {
      return false;
    }
  } else {
    return false;
  }
  if (tmp.lower.has_value()) {
    out->TightenLower(std::move(*tmp.lower));
  }
  if (tmp.upper.has_value()) {
    out->TightenUpper(std::move(*tmp.upper));
  }
  return true;
}

std::optional<Candidate> PointCandidate(const FilterBase& cond,
                                        const Index& index, slot_t field,
                                        const FieldType& key_type) {
  if (cond.Kind() == FilterKind::kCompare) {
    const CompareFilter& cmp = cond.AsCompare();
    if (cmp.Op() != BinaryOperation::kEquals || cmp.Operand().IsNull()) {
      return std::nullopt;
    }
    StatusOr<std::string> key = EncodeKey(key_type, cmp.Operand());
    if (!key.HasValue() || !IsExactKey(key_type, cmp.Operand())) {
      return std::nullopt;
    }
    return Candidate{index.IsExclusive() ? Rank::kExclusivePoint
                                         : Rank::kClusterPoint,
                     &index, field, {KeyRange::Point(key.Value())}};
  }
  if (cond.Kind() == FilterKind::kOneOf) {
    std::vector<std::string> keys;
    for (const auto& v : cond.AsOneOf().Values()) {
      StatusOr<std::string> key = EncodeKey(key_type, v);
      if (!key.HasValue() || !IsExactKey(key_type, v)) {
        return std::nullopt;
      }
      keys.push_back(key.MoveValue());
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    Candidate ret{Rank::kMultiPoint, &index, field, {}};
    ret.ranges.reserve(keys.size());
    for (const auto& k : keys) {
      ret.ranges.push_back(KeyRange::Point(k));
    }
    return ret;
  }
  return std::nullopt;
}

// Every way the top-level conditions allow reading |field| through |index|.
void CandidatesOn(const std::vector<Filter>& conditions,
                  const StructDescriptor& desc, slot_t field,
                  const Index& index, std::vector<Candidate>* out) {
  const FieldDescriptor& fd = desc.GetField(field);
  const FieldType& key_type = fd.type.KeyType();
  Range merged;
  for (const auto& cond : conditions) {
    const auto* ff = dynamic_cast<const FieldFilter*>(cond.get());
    if (ff == nullptr || ff->Field() != fd.name) {
      continue;
    }
    std::optional<Candidate> point =
        PointCandidate(*cond, index, field, key_type);
    if (point.has_value()) {
      out->push_back(std::move(*point));
      continue;
    }
    if (fd.type.IsVec()) {
      // Two ranges may be met by different elements of one record.
      Range own;
      if (AddBounds(*cond, key_type, &own)) {
        out->push_back({own.GetRank(), &index, field, {own.ToKeyRange()}});
      }
    } else {
      AddBounds(*cond, key_type, &merged);
    }
  }
  if (!merged.Empty()) {
    out->push_back({merged.GetRank(), &index, field, {merged.ToKeyRange()}});
  }
}

}  // namespace

StatusOr<Plan> Optimizer::Optimize(const Query& query, const Table& table,
                                   size_t max_sort_buffer) {
  const StructDescriptor& desc = table.Descriptor();
  const SchemaResolver& resolver = table.Resolver();
  for (const auto& cond : query.Conditions()) {
    Status s = cond->Validate(desc, resolver);
    if (s != Status::kSuccess) {
      LOG(WARN) << "invalid condition on " << desc.Name() << ": " << *cond;
      return s;
    }
  }
  std::vector<SortKey> sort_keys;
  for (const auto& ord : query.Orderings()) {
    StatusOr<FieldPath> path = FieldPath::Resolve(desc, ord.path, resolver);
    if (!path.HasValue()) {
      LOG(WARN) << "can not order " << desc.Name() << " by " << ord.path;
      return path.GetStatus();
    }
    sort_keys.push_back({path.MoveValue(), ord.ascending});
  }
  std::vector<size_t> projected;
  if (query.Projection().has_value()) {
    for (const auto& name : *query.Projection()) {
      int idx = desc.FieldIndex(name);
      if (idx < 0 ||
          std::find(projected.begin(), projected.end(),
                    static_cast<size_t>(idx)) != projected.end()) {
        LOG(WARN) << "can not project field " << name << " of "
                  << desc.Name();
        return Status::kInvalidArgument;
      }
      projected.push_back(idx);
    }
  }

  std::vector<Filter> conditions = query.TopLevelConditions();
  std::vector<Candidate> candidates;
  for (slot_t i = 0; i < desc.FieldCount(); ++i) {
    const Index* index = table.IndexOnField(i);
    if (index != nullptr) {
      CandidatesOn(conditions, desc, i, *index, &candidates);
    }
  }
  const Candidate* best = nullptr;
  for (const auto& c : candidates) {
    if (best == nullptr || BetterThan(c, *best)) {
      best = &c;
    }
  }

  Plan plan;
  bool streamed = false;
  if (best != nullptr) {
    const bool is_vec = desc.GetField(best->field).type.IsVec();
    bool ascending = true;
    std::vector<KeyRange> ranges = best->ranges;
    if (sort_keys.size() == 1 && sort_keys[0].path.IsTopLevel() &&
        sort_keys[0].path.indices[0] == best->field && !is_vec) {
      streamed = true;
      ascending = sort_keys[0].ascending;
      if (!ascending) {
        std::reverse(ranges.begin(), ranges.end());
      }
    }
    LOG(DEBUG) << "using " << best->rank << " on " << best->index->Name();
    plan = std::make_shared<IndexScanPlan>(table, *best->index,
                                           std::move(ranges), ascending,
                                           is_vec || 1 < best->ranges.size());
  } else if (!sort_keys.empty() && sort_keys[0].path.IsTopLevel()) {
    const auto field = static_cast<slot_t>(sort_keys[0].path.indices[0]);
    const Index* index = table.IndexOnField(field);
    const FieldType& type = desc.GetField(field).type;
    if (index != nullptr && !type.IsOption() && !type.IsVec()) {
      plan = std::make_shared<IndexScanPlan>(
          table, *index, std::vector<KeyRange>{KeyRange::All()},
          sort_keys[0].ascending, false);
      streamed = sort_keys.size() == 1;
    }
  }
  if (!plan) {
    plan = std::make_shared<FullScanPlan>(table);
  }
  if (!query.Conditions().empty()) {
    plan = std::make_shared<SelectionPlan>(plan, And(query.Conditions()));
  }
  if (!sort_keys.empty() && !streamed) {
    plan = std::make_shared<SortPlan>(plan, std::move(sort_keys),
                                      max_sort_buffer);
  }
  if (query.GetLimit().has_value()) {
    plan = std::make_shared<LimitPlan>(plan, *query.GetLimit());
  }
  if (query.Projection().has_value()) {
    plan = std::make_shared<ProjectionPlan>(plan, std::move(projected),
                                            *query.Projection());
  }
  LOG(DEBUG) << query << " planned as:\n" << plan;
  return plan;
}

}  // namespace structsy
