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

#ifndef STRUCTSY_PERSISTENT_HPP
#define STRUCTSY_PERSISTENT_HPP

#include <compare>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/status_or.hpp"
#include "database/result_set.hpp"
#include "type/record.hpp"
#include "type/rid.hpp"
#include "type/struct_descriptor.hpp"

namespace structsy {

// Specialized for every stored type T (usually by generated code):
//
//   template <>
//   struct Persistent<User> {
//     static StructDescriptor Descriptor();
//     static Record ToRecord(const User& user);
//     static StatusOr<User> FromRecord(const Record& record);
//   };
template <typename T>
struct Persistent;

// Specialized for every projection type P:
//
//   template <>
//   struct Projection<UserName> {
//     static std::vector<std::string> Shape();
//     static StatusOr<UserName> FromRecord(const Record& record);
//   };
//
// FromRecord receives the fields named by Shape(), in that order.
template <typename P>
struct Projection;

// A Rid known to point at a T.
template <typename T>
struct Ref {
  Ref() = default;
  explicit Ref(const Rid& r) : rid(r) {}

  [[nodiscard]] bool IsValid() const { return rid.IsValid(); }
  [[nodiscard]] std::string ToString() const { return rid.ToString(); }
  static StatusOr<Ref> FromString(std::string_view str) {
    ASSIGN_OR_RETURN(Rid, rid, Rid::FromString(str));
    return Ref(rid);
  }

  auto operator<=>(const Ref& rhs) const = default;
  bool operator==(const Ref& rhs) const = default;
  friend std::ostream& operator<<(std::ostream& o, const Ref& r) {
    o << r.rid;
    return o;
  }

  Rid rid;
};

// Decodes every record of a ResultSet with Codec::FromRecord.
template <typename T, typename Codec = Persistent<T>>
class TypedResultSet {
 public:
  explicit TypedResultSet(ResultSet rs) : rs_(std::move(rs)) {}

  StatusOr<bool> Next(T* dst, Rid* rid = nullptr) {
    Record rec;
    ASSIGN_OR_RETURN(bool, found, rs_.Next(&rec, rid));
    if (!found) {
      return false;
    }
    ASSIGN_OR_RETURN(T, value, Codec::FromRecord(rec));
    *dst = std::move(value);
    return true;
  }

  StatusOr<std::vector<T>> ToVector() {
    std::vector<T> ret;
    for (;;) {
      T value;
      ASSIGN_OR_RETURN(bool, found, Next(&value));
      if (!found) {
        break;
      }
      ret.push_back(std::move(value));
    }
    return ret;
  }

 private:
  ResultSet rs_;
};

}  // namespace structsy

#endif  // STRUCTSY_PERSISTENT_HPP
