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

#ifndef STRUCTSY_SERDES_HPP
#define STRUCTSY_SERDES_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "common/constants.hpp"

namespace structsy {

// In-page cells: a bin_size_t length followed by the bytes.
size_t SerializeStringView(char* pos, std::string_view bin);
size_t SerializePID(char* pos, page_id_t pid);
size_t SerializeSize(std::string_view bin);

size_t DeserializeStringView(const char* pos, std::string_view* out);
size_t DeserializePID(const char* pos, page_id_t* out);

// Big-endian appenders keep byte order equal to numeric order.
void AppendBigEndian16(std::string* dst, uint16_t v);
void AppendBigEndian32(std::string* dst, uint32_t v);
void AppendBigEndian64(std::string* dst, uint64_t v);
uint64_t ReadBigEndian64(const char* pos);
uint32_t ReadBigEndian32(const char* pos);
uint16_t ReadBigEndian16(const char* pos);

}  // namespace structsy

#endif  // STRUCTSY_SERDES_HPP
