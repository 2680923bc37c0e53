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

#ifndef STRUCTSY_DEBUG_HPP
#define STRUCTSY_DEBUG_HPP

#include <string>
#include <string_view>

namespace structsy {

std::string Hex(std::string_view in);

// Shortens long binary keys for page dumps.
std::string OmittedString(std::string_view original, size_t length);

}  // namespace structsy

#endif  // STRUCTSY_DEBUG_HPP
