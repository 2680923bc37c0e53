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

#ifndef STRUCTSY_FREE_PAGE_HPP
#define STRUCTSY_FREE_PAGE_HPP

#include <ostream>

#include "common/constants.hpp"

namespace structsy {

class FreePage {
 public:
  void Initialize() {
    next_free_page = 0;
    generation_floor = 0;
  }

  void Dump(std::ostream& o, int) const {
    o << "[NextFreePage: " << next_free_page
      << " GenerationFloor: " << generation_floor << "]";
  }

  page_id_t next_free_page;
  // Slot generations of a segment built on this page start here, so a Rid
  // into the previous segment never matches a new record.
  generation_t generation_floor;
};

}  // namespace structsy

#endif  // STRUCTSY_FREE_PAGE_HPP
