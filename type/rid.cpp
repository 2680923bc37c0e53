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

#include "type/rid.hpp"

#include <charconv>
#include <vector>

namespace structsy {

std::string Rid::ToString() const {
  return std::to_string(type_id) + ":" + std::to_string(page_id) + ":" +
         std::to_string(slot) + ":" + std::to_string(generation);
}

namespace {

template <typename T>
bool ParseNumber(std::string_view str, T* out) {
  if (str.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), *out);
  return ec == std::errc() && ptr == str.data() + str.size();
}

}  // namespace

StatusOr<Rid> Rid::FromString(std::string_view str) {
  std::vector<std::string_view> parts;
  while (true) {
    size_t colon = str.find(':');
    parts.push_back(str.substr(0, colon));
    if (colon == std::string_view::npos) {
      break;
    }
    str.remove_prefix(colon + 1);
  }
  if (parts.size() != 4) {
    return Status::kInvalidId;
  }
  Rid ret;
  if (!ParseNumber(parts[0], &ret.type_id) ||
      !ParseNumber(parts[1], &ret.page_id) ||
      !ParseNumber(parts[2], &ret.slot) ||
      !ParseNumber(parts[3], &ret.generation)) {
    return Status::kInvalidId;
  }
  return ret;
}

std::string Rid::Serialize() const {
  std::string s(Size(), '\0');
  char* dst = s.data();
  memcpy(dst, &type_id, sizeof(type_id));
  dst += sizeof(type_id);
  memcpy(dst, &page_id, sizeof(page_id));
  dst += sizeof(page_id);
  memcpy(dst, &slot, sizeof(slot));
  dst += sizeof(slot);
  memcpy(dst, &generation, sizeof(generation));
  return s;
}

StatusOr<Rid> Rid::Deserialize(std::string_view src) {
  if (src.size() != Size()) {
    return Status::kBackingStoreError;
  }
  Rid ret;
  const char* p = src.data();
  memcpy(&ret.type_id, p, sizeof(ret.type_id));
  p += sizeof(ret.type_id);
  memcpy(&ret.page_id, p, sizeof(ret.page_id));
  p += sizeof(ret.page_id);
  memcpy(&ret.slot, p, sizeof(ret.slot));
  p += sizeof(ret.slot);
  memcpy(&ret.generation, p, sizeof(ret.generation));
  return ret;
}

}  // namespace structsy
