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

#ifndef STRUCTSY_RID_HPP
#define STRUCTSY_RID_HPP

#include <compare>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>

#include "common/constants.hpp"
#include "common/decoder.hpp"
#include "common/encoder.hpp"
#include "common/status_or.hpp"

namespace structsy {

// Identifies one record for its whole life.
struct Rid {
  // Returns invalid id.
  Rid() = default;
  Rid(type_id_t type, page_id_t pid, slot_t sl, generation_t gen)
      : type_id(type), page_id(pid), slot(sl), generation(gen) {}

  type_id_t type_id = 0;

  // The segment page holding the slot.
  page_id_t page_id = 0;

  // n-th slot in the segment.
  slot_t slot = 0;

  // Generation of the slot when the record was allocated.
  generation_t generation = 0;

  // Page 0 is the header page, no record lives there.
  [[nodiscard]] bool IsValid() const { return page_id != 0; }

  auto operator<=>(const Rid& rhs) const = default;
  bool operator==(const Rid& rhs) const = default;

  // "type:page:slot:generation"
  [[nodiscard]] std::string ToString() const;
  static StatusOr<Rid> FromString(std::string_view str);

  // Fixed-width form used in slots and index values.
  [[nodiscard]] std::string Serialize() const;
  static StatusOr<Rid> Deserialize(std::string_view src);
  static constexpr size_t Size() {
    return sizeof(type_id) + sizeof(page_id) + sizeof(slot) +
           sizeof(generation);
  }

  friend std::ostream& operator<<(std::ostream& o, const Rid& r) {
    o << "{" << r.type_id << ":" << r.page_id << ":" << r.slot << ":"
      << r.generation << "}";
    return o;
  }
  friend Encoder& operator<<(Encoder& a, const Rid& r) {
    a << r.type_id << r.page_id << r.slot << r.generation;
    return a;
  }
  friend Decoder& operator>>(Decoder& a, Rid& r) {
    a >> r.type_id >> r.page_id >> r.slot >> r.generation;
    return a;
  }
};

}  // namespace structsy

namespace std {

template <>
class hash<structsy::Rid> {
 public:
  uint64_t operator()(const structsy::Rid& target) const {
    return std::hash<structsy::page_id_t>()(target.page_id) * 31 +
           (static_cast<uint64_t>(target.slot) << 32) + target.generation +
           (static_cast<uint64_t>(target.type_id) << 48);
  }
};

}  // namespace std

#endif  // STRUCTSY_RID_HPP
