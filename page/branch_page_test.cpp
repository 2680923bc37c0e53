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

#include "page/branch_page.hpp"

#include <memory>
#include <string>

#include "common/test_util.hpp"
#include "gtest/gtest.h"
#include "page/page.hpp"

namespace structsy {

class BranchPageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    page_ = std::make_unique<Page>(1, PageType::kBranchPage);
    Branch().SetLowestPage(100);
  }

  BranchPage& Branch() { return page_->body.branch_page; }

  std::unique_ptr<Page> page_;
};

TEST_F(BranchPageTest, Construct) {
  EXPECT_EQ(Branch().RowCount(), 0);
  EXPECT_EQ(Branch().GetPageForKey("anything"), 100);
}

TEST_F(BranchPageTest, Route) {
  ASSERT_SUCCESS(Branch().Insert("m", 200));
  ASSERT_SUCCESS(Branch().Insert("t", 300));
  EXPECT_EQ(Branch().GetPageForKey("a"), 100);
  EXPECT_EQ(Branch().GetPageForKey("m"), 200);
  EXPECT_EQ(Branch().GetPageForKey("p"), 200);
  EXPECT_EQ(Branch().GetPageForKey("t"), 300);
  EXPECT_EQ(Branch().GetPageForKey("z"), 300);
}

TEST_F(BranchPageTest, Split) {
  page_id_t child = 101;
  size_t inserted = 0;
  while (true) {
    char key[16];
    snprintf(key, sizeof(key), "k%07zu", inserted);
    if (!Branch().HasRoomFor(key)) {
      break;
    }
    ASSERT_SUCCESS(Branch().Insert(key, child++));
    ++inserted;
  }
  auto right = std::make_unique<Page>(2, PageType::kBranchPage);
  std::string middle;
  Branch().Split(right.get(), &middle);
  const BranchPage& r = right->body.branch_page;
  EXPECT_EQ(Branch().RowCount() + r.RowCount() + 1, inserted);
  EXPECT_LT(Branch().GetKey(Branch().RowCount() - 1), middle);
  EXPECT_LT(middle, r.GetKey(0));
  EXPECT_EQ(r.GetPageForKey(middle), r.LowestPage());
  EXPECT_EQ(Branch().GetPageForKey("a"), 100);
}

}  // namespace structsy
