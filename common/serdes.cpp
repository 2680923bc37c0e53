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

#include "common/serdes.hpp"

#include <cstdint>
#include <cstring>
#include <string_view>

#include "common/constants.hpp"

namespace structsy {

size_t SerializeStringView(char* pos, std::string_view bin) {
  bin_size_t len = bin.size();
  memcpy(pos, &len, sizeof(len));
  memcpy(pos + sizeof(len), bin.data(), bin.size());
  return sizeof(len) + bin.size();
}

size_t SerializePID(char* pos, page_id_t pid) {
  memcpy(pos, &pid, sizeof(pid));
  return sizeof(page_id_t);
}

size_t SerializeSize(std::string_view bin) {
  return sizeof(bin_size_t) + bin.size();
}

size_t DeserializeStringView(const char* pos, std::string_view* out) {
  bin_size_t len = 0;
  memcpy(&len, pos, sizeof(bin_size_t));
  *out = {pos + sizeof(len), len};
  return sizeof(len) + len;
}

size_t DeserializePID(const char* pos, page_id_t* out) {
  memcpy(out, pos, sizeof(page_id_t));
  return sizeof(page_id_t);
}

void AppendBigEndian16(std::string* dst, uint16_t v) {
  dst->push_back(static_cast<char>(v >> 8));
  dst->push_back(static_cast<char>(v));
}

void AppendBigEndian32(std::string* dst, uint32_t v) {
  for (int shift = 24; 0 <= shift; shift -= 8) {
    dst->push_back(static_cast<char>(v >> shift));
  }
}

void AppendBigEndian64(std::string* dst, uint64_t v) {
  for (int shift = 56; 0 <= shift; shift -= 8) {
    dst->push_back(static_cast<char>(v >> shift));
  }
}

uint64_t ReadBigEndian64(const char* pos) {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | static_cast<uint8_t>(pos[i]);
  }
  return v;
}

uint32_t ReadBigEndian32(const char* pos) {
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v = (v << 8) | static_cast<uint8_t>(pos[i]);
  }
  return v;
}

uint16_t ReadBigEndian16(const char* pos) {
  return static_cast<uint16_t>((static_cast<uint8_t>(pos[0]) << 8) |
                               static_cast<uint8_t>(pos[1]));
}

}  // namespace structsy
