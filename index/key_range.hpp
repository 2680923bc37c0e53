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

#ifndef STRUCTSY_KEY_RANGE_HPP
#define STRUCTSY_KEY_RANGE_HPP

#include <optional>
#include <utility>
#include <ostream>
#include <string>
#include <string_view>

#include "common/debug.hpp"
#include "type/key_codec.hpp"

namespace structsy {

struct KeyBound {
  std::string key;
  bool inclusive = true;
};

// A range over encoded keys. A missing bound is unbounded.
struct KeyRange {
  static KeyRange All() { return {}; }
  static KeyRange Point(std::string_view key) {
    KeyRange ret;
    ret.lower = KeyBound{std::string(key), true};
    ret.upper = KeyBound{std::string(key), true};
    return ret;
  }
  // Every key starting with |prefix|.
  static KeyRange Prefix(std::string_view prefix) {
    KeyRange ret;
    ret.lower = KeyBound{std::string(prefix), true};
    std::string successor = PrefixSuccessor(prefix);
    if (!successor.empty()) {
      ret.upper = KeyBound{std::move(successor), false};
    }
    return ret;
  }
  // Contains nothing.
  static KeyRange None() {
    KeyRange ret;
    ret.lower = KeyBound{"", false};
    ret.upper = KeyBound{"", false};
    return ret;
  }

  [[nodiscard]] bool AboveLower(std::string_view key) const {
    if (!lower.has_value()) {
      return true;
    }
    return lower->inclusive ? lower->key <= key : lower->key < key;
  }
  [[nodiscard]] bool BelowUpper(std::string_view key) const {
    if (!upper.has_value()) {
      return true;
    }
    return upper->inclusive ? key <= upper->key : key < upper->key;
  }
  [[nodiscard]] bool Contains(std::string_view key) const {
    return AboveLower(key) && BelowUpper(key);
  }
  // True when no key can be inside.
  [[nodiscard]] bool IsEmpty() const {
    if (!lower.has_value() || !upper.has_value()) {
      return false;
    }
    if (lower->key == upper->key) {
      return !(lower->inclusive && upper->inclusive);
    }
    return upper->key < lower->key;
  }

  friend std::ostream& operator<<(std::ostream& o, const KeyRange& r) {
    if (r.lower.has_value()) {
      o << (r.lower->inclusive ? "[" : "(") << OmittedString(Hex(r.lower->key), 24);
    } else {
      o << "(-inf";
    }
    o << ", ";
    if (r.upper.has_value()) {
      o << OmittedString(Hex(r.upper->key), 24) << (r.upper->inclusive ? "]" : ")");
    } else {
      o << "+inf)";
    }
    return o;
  }

  std::optional<KeyBound> lower;
  std::optional<KeyBound> upper;
};

}  // namespace structsy

#endif  // STRUCTSY_KEY_RANGE_HPP
