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

#include "smartfmt/common/formatting/basic-format-style.h"

#include <sstream>
#include <string>

#include "gtest/gtest.h"

namespace smartfmt {
namespace {

TEST(IndentStyleParseFlagTest, Parse) {
  std::string error;
  IndentStyle style;
  EXPECT_TRUE(AbslParseFlag("none", &style, &error));
  EXPECT_EQ(style, IndentStyle::kNone);
  EXPECT_TRUE(AbslParseFlag("block", &style, &error));
  EXPECT_EQ(style, IndentStyle::kBlock);
  EXPECT_TRUE(AbslParseFlag("smart", &style, &error));
  EXPECT_EQ(style, IndentStyle::kSmart);
  EXPECT_TRUE(error.empty()) << error;

  EXPECT_FALSE(AbslParseFlag("clever", &style, &error));
  EXPECT_EQ(style, IndentStyle::kSmart);
  EXPECT_NE(error.find("none,block,smart"), std::string::npos) << error;
}

TEST(IndentStyleUnparseFlagTest, Unparse) {
  EXPECT_EQ(AbslUnparseFlag(IndentStyle::kNone), "none");
  EXPECT_EQ(AbslUnparseFlag(IndentStyle::kBlock), "block");
  EXPECT_EQ(AbslUnparseFlag(IndentStyle::kSmart), "smart");
}

TEST(IndentStyleTest, Print) {
  std::ostringstream stream;
  stream << IndentStyle::kBlock;
  EXPECT_EQ(stream.str(), "block");
}

TEST(BasicFormatStyleTest, Defaults) {
  const BasicFormatStyle style;
  EXPECT_EQ(style.indentation_spaces, 4);
  EXPECT_EQ(style.smart_indent, IndentStyle::kSmart);
  EXPECT_TRUE(style.auto_format_on_close_brace);
  EXPECT_TRUE(style.auto_format_on_semicolon);
}

}  // namespace
}  // namespace smartfmt
