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

#ifndef STRUCTSY_DECODER_HPP
#define STRUCTSY_DECODER_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/constants.hpp"
#include "common/status_or.hpp"

namespace structsy {

// Reads what Encoder wrote. A short or malformed input puts the decoder in
// a failed state instead of throwing; check IsValid() after reading.
class Decoder {
 public:
  explicit Decoder(std::istream& is) : is_(&is) {}
  Decoder& operator>>(std::string& str);
  Decoder& operator>>(uint8_t& u8);
  Decoder& operator>>(uint16_t& u16);
  Decoder& operator>>(uint32_t& u32);
  Decoder& operator>>(uint64_t& u64);
  Decoder& operator>>(int8_t& i8);
  Decoder& operator>>(int16_t& i16);
  Decoder& operator>>(int32_t& i32);
  Decoder& operator>>(int64_t& i64);
  Decoder& operator>>(float& f);
  Decoder& operator>>(double& d);
  Decoder& operator>>(bool& v);

  // Reads exactly |length| bytes without a length prefix.
  Decoder& ReadRaw(size_t length, std::string* out);

  template <typename T>
  Decoder& operator>>(std::vector<T>& vec) {
    uint32_t size = 0;
    *this >> size;
    vec.clear();
    for (uint32_t i = 0; i < size && IsValid(); ++i) {
      T elm{};
      *this >> elm;
      vec.push_back(std::move(elm));
    }
    return *this;
  }

  template <typename T, typename U>
  Decoder& operator>>(std::pair<T, U>& p) {
    *this >> p.first >> p.second;
    return *this;
  }

  [[nodiscard]] bool IsValid() const { return !is_->fail(); }
  [[nodiscard]] bool AtEnd() const;
  void Fail() { is_->setstate(std::ios::failbit); }

 private:
  std::istream* is_;
};

template <typename T>
StatusOr<T> Decode(std::string_view src) {
  std::string buffer(src);
  std::stringstream ss(buffer);
  Decoder dec(ss);
  T ret{};
  dec >> ret;
  if (!dec.IsValid() || !dec.AtEnd()) {
    return Status::kBackingStoreError;
  }
  return ret;
}

}  // namespace structsy

#endif  // STRUCTSY_DECODER_HPP
