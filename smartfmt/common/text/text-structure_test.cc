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

#include "smartfmt/common/text/text-structure.h"

#include <memory>
#include <string>
#include <string_view>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "smartfmt/common/text/constants.h"
#include "smartfmt/common/text/text-structure-test-utils.h"
#include "smartfmt/common/text/token-info.h"
#include "smartfmt/common/text/tree-builder-test-util.h"

namespace smartfmt {
namespace {

using ::testing::IsNull;
using ::testing::SizeIs;

enum {
  kSpace = 1,
  kNewline,
  kComment,
  kWord,
  kSemi,
};

enum class Tag { kStatement = 1, kRoot };

int ClassifyTrivia(std::string_view text) {
  return text.find('\n') != std::string_view::npos ? kNewline : kSpace;
}

// "foo bar;\n  // note\nbaz;"
std::unique_ptr<TextStructure> MakeTwoStatements() {
  return BuildTextStructure(
      Tree(Tag::kRoot,
           {Tree(Tag::kStatement,
                 {Tok(kWord, "foo"), " ", Tok(kWord, "bar"), Tok(kSemi, ";")}),
            "\n  ", Trivia(kComment, "// note"), "\n",
            Tree(Tag::kStatement, {Tok(kWord, "baz"), Tok(kSemi, ";")})}),
      ClassifyTrivia);
}

TEST(TextStructureTest, OwnsContentsAndTokens) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  EXPECT_EQ(view.Contents(), "foo bar;\n  // note\nbaz;");
  // 5 leaves + EOF in the tree, 4 trivia more in the stream.
  EXPECT_THAT(view.Leaves(), SizeIs(6));
  EXPECT_THAT(view.TokenStream(), SizeIs(10));
  for (const auto &token : view.TokenStream()) {
    EXPECT_GE(view.StartOffset(token), 0);
    EXPECT_LE(view.EndOffset(token),
              static_cast<int>(view.Contents().length()));
  }
  EXPECT_TRUE(view.TokenStream().back().isEOF());
}

TEST(TextStructureTest, ParentOfLeaf) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  const SyntaxToken bar = view.FindToken(5, false);
  EXPECT_EQ(bar.Text(), "bar");
  ASSERT_NE(bar.Parent(), nullptr);
  EXPECT_TRUE(bar.Parent()->MatchesTag(Tag::kStatement));
  const SyntaxTreeNode *root = view.Parent(*bar.Parent());
  ASSERT_NE(root, nullptr);
  EXPECT_TRUE(root->MatchesTag(Tag::kRoot));
  EXPECT_THAT(view.Parent(*root), IsNull());
}

TEST(TextStructureTest, FindTokenInsideToken) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  EXPECT_EQ(view.FindToken(0, true).Text(), "foo");
  EXPECT_EQ(view.FindToken(2, false).Text(), "foo");
  EXPECT_EQ(view.FindToken(7, true).Text(), ";");
}

TEST(TextStructureTest, FindTokenInTrivia) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  // Offset 3 is the space between "foo" and "bar".
  EXPECT_EQ(view.FindToken(3, true).Text(), "foo");
  EXPECT_EQ(view.FindToken(3, false).Text(), "bar");
  // Inside the comment.
  const int comment = NthOffsetOf(view.Contents(), "note");
  EXPECT_EQ(view.FindToken(comment, true).Text(), ";");
  EXPECT_EQ(view.FindToken(comment, false).Text(), "baz");
}

TEST(TextStructureTest, FindTokenClampsOffset) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  EXPECT_TRUE(view.FindToken(1000, true).Leaf()->get().isEOF());
  EXPECT_EQ(view.FindToken(-5, true).Text(), "foo");
}

TEST(TextStructureTest, FindTokenInLeadingTrivia) {
  const auto text = BuildTextStructure(
      Tree(Tag::kRoot, {"  ", Tok(kWord, "x")}), ClassifyTrivia);
  const TextStructureView &view = text->Data();
  EXPECT_TRUE(view.FindToken(1, true).IsMissing());
  EXPECT_EQ(view.FindToken(1, false).Text(), "x");
}

TEST(TextStructureTest, PreviousAndNextToken) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  const SyntaxToken bar = view.FindToken(5, false);
  EXPECT_EQ(view.PreviousToken(bar).Text(), "foo");
  EXPECT_EQ(view.NextToken(bar).Text(), ";");
  EXPECT_TRUE(view.PreviousToken(view.PreviousToken(bar)).IsMissing());
  EXPECT_TRUE(view.NextToken(SyntaxToken()).IsMissing());
}

TEST(TextStructureTest, IsFirstTokenOnLine) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  EXPECT_TRUE(view.IsFirstTokenOnLine(view.FindToken(0, false)));
  EXPECT_FALSE(view.IsFirstTokenOnLine(view.FindToken(5, false)));
  const int baz = NthOffsetOf(view.Contents(), "baz");
  EXPECT_TRUE(view.IsFirstTokenOnLine(view.FindToken(baz, false)));
  EXPECT_FALSE(view.IsFirstTokenOnLine(SyntaxToken()));
}

TEST(TextStructureTest, FindStreamTokenAt) {
  const auto text = MakeTwoStatements();
  const TextStructureView &view = text->Data();
  const int comment = NthOffsetOf(view.Contents(), "//");
  const TokenInfo *token = view.FindStreamTokenAt(comment + 3);
  ASSERT_NE(token, nullptr);
  EXPECT_EQ(token->token_enum(), kComment);
  EXPECT_EQ(view.FindStreamTokenAt(3)->token_enum(), kSpace);
  EXPECT_THAT(view.FindStreamTokenAt(1000), IsNull());
}

TEST(SyntaxTokenTest, MissingToken) {
  const SyntaxToken missing;
  EXPECT_TRUE(missing.IsMissing());
  EXPECT_EQ(missing.Kind(), TK_NONE);
  EXPECT_EQ(missing.Text(), "");
  EXPECT_THAT(missing.Parent(), IsNull());
}

TEST(SyntaxTokenTest, ZeroWidthTokenIsMissingButEOFIsNot) {
  const auto text = BuildTextStructure(
      Tree(Tag::kRoot, {Tok(kWord, "x"), Tok(kSemi, "")}), ClassifyTrivia);
  const TextStructureView &view = text->Data();
  const SyntaxToken x = view.FindToken(0, false);
  const SyntaxToken semi = view.NextToken(x);
  EXPECT_EQ(semi.Kind(), kSemi);
  EXPECT_TRUE(semi.IsMissing());
  const SyntaxToken eof = view.NextToken(semi);
  EXPECT_EQ(eof.Kind(), TK_EOF);
  EXPECT_FALSE(eof.IsMissing());
}

TEST(RespaceTextStructureTest, KeepsTreeShape) {
  const auto text = MakeTwoStatements();
  const auto respaced = RespaceTextStructure(
      text->Data(), "foo  bar ;\n// note\n\n  baz;", ClassifyTrivia);
  const TextStructureView &view = respaced->Data();
  EXPECT_THAT(view.Leaves(), SizeIs(6));
  const SyntaxToken semi = view.FindToken(9, false);
  EXPECT_EQ(semi.Text(), ";");
  ASSERT_NE(semi.Parent(), nullptr);
  EXPECT_TRUE(semi.Parent()->MatchesTag(Tag::kStatement));
  const int baz = NthOffsetOf(view.Contents(), "baz");
  EXPECT_TRUE(view.IsFirstTokenOnLine(view.FindToken(baz, false)));
}

}  // namespace
}  // namespace smartfmt
