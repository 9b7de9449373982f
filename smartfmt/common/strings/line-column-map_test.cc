// Copyright 2026 The smartfmt Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "smartfmt/common/strings/line-column-map.h"

#include <sstream>
#include <vector>

#include "gtest/gtest.h"

namespace smartfmt {
namespace {

TEST(LineColumnTest, PrintsOneBased) {
  std::ostringstream stream;
  stream << LineColumn{2, 7};
  EXPECT_EQ(stream.str(), "3:8");
}

TEST(LineColumnMapTest, EmptyText) {
  const LineColumnMap map("");
  EXPECT_EQ(map.NumLines(), 1);
  EXPECT_EQ(map.OffsetAtLine(0), 0);
  EXPECT_EQ(map.EndOfLineOffset(0), 0);
  EXPECT_EQ(map.LineAtOffset(0), 0);
}

TEST(LineColumnMapTest, LineStartsAndEnds) {
  //                     0123 4567 89
  const LineColumnMap map("abc\nde\n\nf");
  EXPECT_EQ(map.GetBeginningOfLineOffsets(), (std::vector<int>{0, 4, 7, 8}));
  EXPECT_EQ(map.EndOfLineOffset(0), 3);
  EXPECT_EQ(map.EndOfLineOffset(1), 6);
  EXPECT_EQ(map.EndOfLineOffset(2), 7);
  EXPECT_EQ(map.EndOfLineOffset(3), 9);
  // Beyond the last line clamps.
  EXPECT_EQ(map.OffsetAtLine(10), 8);
}

TEST(LineColumnMapTest, LineAtOffset) {
  const LineColumnMap map("abc\nde\n\nf");
  EXPECT_EQ(map.LineAtOffset(0), 0);
  EXPECT_EQ(map.LineAtOffset(3), 0);  // the newline itself
  EXPECT_EQ(map.LineAtOffset(4), 1);
  EXPECT_EQ(map.LineAtOffset(7), 2);
  EXPECT_EQ(map.LineAtOffset(8), 3);
  EXPECT_EQ(map.LineAtOffset(9), 3);
  EXPECT_EQ(map.GetLineColAtOffset(5), (LineColumn{1, 1}));
}

}  // namespace
}  // namespace smartfmt
