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

#include "index/index_scan_iterator.hpp"

#include "index/index.hpp"

namespace structsy {

std::string_view IndexScanIterator::Key() const {
  std::string_view key = iter_.Key();
  if (clustered_ && Index::kClusterSuffixSize <= key.size()) {
    key.remove_suffix(Index::kClusterSuffixSize);
  }
  return key;
}

}  // namespace structsy
