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

#ifndef STRUCTSY_RECORD_CODEC_HPP
#define STRUCTSY_RECORD_CODEC_HPP

#include <string>
#include <string_view>

#include "common/status_or.hpp"
#include "type/record.hpp"
#include "type/struct_descriptor.hpp"

namespace structsy {

// Canonical little-endian record layout. Fields follow each other in
// declaration order with no padding; embedded records are inlined.
// kInvalidArgument when |record| does not fit |desc|.
StatusOr<std::string> EncodeRecord(const StructDescriptor& desc,
                                   const Record& record,
                                   const SchemaResolver& resolver);

// kBackingStoreError when |bytes| is not a valid encoding for |desc|.
StatusOr<Record> DecodeRecord(const StructDescriptor& desc,
                              std::string_view bytes,
                              const SchemaResolver& resolver);

// Whether |value| can be stored in a field of |type|.
Status CheckValue(const FieldType& type, const Value& value,
                  const SchemaResolver& resolver);

bool IsValidUtf8(std::string_view str);

}  // namespace structsy

#endif  // STRUCTSY_RECORD_CODEC_HPP
