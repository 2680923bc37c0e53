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

#ifndef STRUCTSY_KEY_CODEC_HPP
#define STRUCTSY_KEY_CODEC_HPP

#include <string>
#include <string_view>
#include <vector>

#include "common/status_or.hpp"
#include "type/field_type.hpp"
#include "type/value.hpp"

namespace structsy {

// Memcomparable key encoding: memcmp order of two keys equals the natural
// order of the values for the scalar |key_type|.
// kInvalidArgument when |value| has no key of that type.
StatusOr<std::string> EncodeKey(const FieldType& key_type, const Value& value);

// False when the key of |value| stands for a different value, i.e. a
// float operand rounded to the width of |key_type|.
bool IsExactKey(const FieldType& key_type, const Value& value);

// Keys an index on a field of |field_type| holds for |value|: one for a
// scalar, none or one for an Option, one per distinct element of a Vec.
StatusOr<std::vector<std::string>> IndexKeysOf(const FieldType& field_type,
                                               const Value& value);

// The smallest string greater than every string starting with |prefix|.
// Empty when there is none.
std::string PrefixSuccessor(std::string_view prefix);

}  // namespace structsy

#endif  // STRUCTSY_KEY_CODEC_HPP
