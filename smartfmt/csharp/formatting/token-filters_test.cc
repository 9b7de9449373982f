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

#include "smartfmt/csharp/formatting/token-filters.h"

#include <memory>
#include <string_view>

#include "gtest/gtest.h"
#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-builder-test-util.h"
#include "smartfmt/csharp/CST/csharp-nonterminals.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"
#include "smartfmt/csharp/CST/csharp-tree-test-util.h"

namespace csharp {
namespace formatter {
namespace {

using smartfmt::BasicFormatStyle;
using smartfmt::IndentStyle;
using smartfmt::NthOffsetOf;
using smartfmt::SyntaxToken;
using smartfmt::TextStructure;
using smartfmt::TextStructureView;
using smartfmt::Tree;

TEST(TriggerCharacterTest, Supported) {
  for (const char ch : std::string_view(";{}#nte:)")) {
    EXPECT_TRUE(IsTriggerCharacter(ch)) << ch;
  }
  for (const char ch : std::string_view("(]a.,x=\n ")) {
    EXPECT_FALSE(IsTriggerCharacter(ch)) << ch;
  }
}

TEST(TriggerEnabledTest, DefaultStyleEnablesAll) {
  const BasicFormatStyle style;
  for (const char ch : kTriggerCharacters) {
    EXPECT_TRUE(IsTriggerEnabled(ch, style)) << ch;
  }
}

TEST(TriggerEnabledTest, CloseBrace) {
  BasicFormatStyle style;
  style.auto_format_on_close_brace = false;
  EXPECT_TRUE(IsTriggerEnabled('}', style));  // still smart indent
  style.smart_indent = IndentStyle::kBlock;
  EXPECT_FALSE(IsTriggerEnabled('}', style));
  style.auto_format_on_close_brace = true;
  EXPECT_TRUE(IsTriggerEnabled('}', style));
}

TEST(TriggerEnabledTest, Semicolon) {
  BasicFormatStyle style;
  style.smart_indent = IndentStyle::kNone;
  EXPECT_TRUE(IsTriggerEnabled(';', style));
  style.auto_format_on_semicolon = false;
  EXPECT_FALSE(IsTriggerEnabled(';', style));
}

TEST(TriggerEnabledTest, DirectivesNeedSmartIndent) {
  BasicFormatStyle style;
  EXPECT_TRUE(IsTriggerEnabled('#', style));
  EXPECT_TRUE(IsTriggerEnabled('n', style));
  for (const IndentStyle indent : {IndentStyle::kNone, IndentStyle::kBlock}) {
    style.smart_indent = indent;
    EXPECT_FALSE(IsTriggerEnabled('#', style));
    EXPECT_FALSE(IsTriggerEnabled('n', style));
    EXPECT_TRUE(IsTriggerEnabled('t', style));
    EXPECT_TRUE(IsTriggerEnabled('{', style));
  }
}

class TokenFiltersTest : public ::testing::Test {
 protected:
  void Build(const TreeFragment &root) { text_ = BuildCSharpText(root); }

  const TextStructureView &View() const { return text_->Data(); }

  SyntaxToken TokenAt(std::string_view needle, int n = 0) const {
    return View().FindToken(NthOffsetOf(View().Contents(), needle, n), false);
  }

  SyntaxToken EndOfFile() const {
    return View().MakeToken(*View().Leaves().back());
  }

  std::unique_ptr<TextStructure> text_;
};

TEST_F(TokenFiltersTest, InvalidTokenKinds) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kRegionDirectiveTrivia,
                   {P("#"), Kw("region"), EndOfDirective()}),
              "\n", Id("abc"), P(";")}));
  EXPECT_TRUE(IsInvalidTokenKind(SyntaxToken()));
  EXPECT_TRUE(IsInvalidTokenKind(EndOfFile()));
  const SyntaxToken end_of_directive =
      View().NextToken(TokenAt("region"));
  ASSERT_EQ(end_of_directive.Kind(), kEndOfDirectiveToken);
  EXPECT_TRUE(IsInvalidTokenKind(end_of_directive));
  EXPECT_FALSE(IsInvalidTokenKind(TokenAt("abc")));

  EXPECT_TRUE(IsInvalidSingleCharacterToken(TokenAt("abc")));
  EXPECT_FALSE(IsInvalidSingleCharacterToken(TokenAt(";")));
  EXPECT_TRUE(IsInvalidSingleCharacterToken(EndOfFile()));
}

TEST_F(TokenFiltersTest, KeywordSuffixes) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kRegionDirectiveTrivia,
                   {P("#"), Kw("region"), EndOfDirective()}),
              "\n",
              Tree(NodeEnum::kEndRegionDirectiveTrivia,
                   {P("#"), Kw("endregion"), EndOfDirective()}),
              "\n",
              Tree(NodeEnum::kQueryExpression,
                   {Kw("from"), " ", Id("item"), " ", Kw("in"), " ",
                    Id("list"), " ", Kw("where"), " ", Id("done"), " ",
                    Kw("select"), " ", Id("item")}),
              "\n", Id("region2")}));
  EXPECT_TRUE(MatchesTypedCharacter('n', TokenAt("region")));
  EXPECT_TRUE(MatchesTypedCharacter('n', TokenAt("endregion")));
  EXPECT_FALSE(MatchesTypedCharacter('n', TokenAt("in")));
  EXPECT_FALSE(MatchesTypedCharacter('n', TokenAt("region2")));
  EXPECT_TRUE(MatchesTypedCharacter('e', TokenAt("where")));
  EXPECT_FALSE(MatchesTypedCharacter('e', TokenAt("done")));
  EXPECT_TRUE(MatchesTypedCharacter('t', TokenAt("select")));
  EXPECT_FALSE(MatchesTypedCharacter('t', TokenAt("list")));
}

TEST_F(TokenFiltersTest, SingleCharacterTriggers) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kExpressionStatement,
                   {Id("a"), " ", P("=="), " ", Id("b"), P(";")})}));
  EXPECT_TRUE(MatchesTypedCharacter(';', TokenAt(";")));
  EXPECT_FALSE(MatchesTypedCharacter('}', TokenAt(";")));
  EXPECT_FALSE(MatchesTypedCharacter(';', TokenAt("b")));
  EXPECT_FALSE(MatchesTypedCharacter('=', TokenAt("==")));
  EXPECT_FALSE(MatchesTypedCharacter(';', EndOfFile()));
  EXPECT_FALSE(MatchesTypedCharacter(';', SyntaxToken()));
}

TEST_F(TokenFiltersTest, CloseParenContext) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kUsingStatement,
                   {Kw("using"), " ", P("("), Id("r"), P(")")}),
              "\n",
              Tree(NodeEnum::kInvocationExpression,
                   {Id("f"), Tree(NodeEnum::kArgumentList,
                                  {P("("), P(")")})})}));
  EXPECT_FALSE(ShouldNotFormatOnTypedCharacter(View(), TokenAt(")", 0)));
  EXPECT_TRUE(ShouldNotFormatOnTypedCharacter(View(), TokenAt(")", 1)));
  EXPECT_FALSE(ShouldNotFormatOnReturn(TokenAt(")", 0)));
  EXPECT_TRUE(ShouldNotFormatOnReturn(TokenAt(")", 1)));
  EXPECT_TRUE(ShouldNotFormatOnReturn(TokenAt("using")));
}

TEST_F(TokenFiltersTest, ColonContext) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kLabeledStatement,
                   {Id("done"), P(":"), " ",
                    Tree(NodeEnum::kBreakStatement, {Kw("break"), P(";")})}),
              "\n",
              Tree(NodeEnum::kDefaultSwitchLabel, {Kw("default"), P(":")}),
              "\n",
              Tree(NodeEnum::kConditionalExpression,
                   {Id("a"), " ", P("?"), " ", Id("b"), " ", P(":"), " ",
                    Id("c")})}));
  EXPECT_FALSE(ShouldNotFormatOnTypedCharacter(View(), TokenAt(":", 0)));
  EXPECT_FALSE(ShouldNotFormatOnTypedCharacter(View(), TokenAt(":", 1)));
  EXPECT_TRUE(ShouldNotFormatOnTypedCharacter(View(), TokenAt(":", 2)));
}

TEST_F(TokenFiltersTest, OpenBraceMustStartLine) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kIfStatement,
                   {Kw("if"), " ", P("("), Id("x"), P(")"), " ",
                    Tree(NodeEnum::kBlock, {P("{"), P("}")}), "\n",
                    Tree(NodeEnum::kElseClause,
                         {Kw("else"), "\n  ",
                          Tree(NodeEnum::kBlock, {P("{"), P("}")})})})}));
  EXPECT_TRUE(ShouldNotFormatOnTypedCharacter(View(), TokenAt("{", 0)));
  EXPECT_FALSE(ShouldNotFormatOnTypedCharacter(View(), TokenAt("{", 1)));
  EXPECT_FALSE(ShouldNotFormatOnTypedCharacter(View(), TokenAt("}", 0)));
}

TEST_F(TokenFiltersTest, EndTokens) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kBlock, {P("{"), P("}")})}));
  EXPECT_FALSE(IsEndToken(TokenAt("{")));
  EXPECT_TRUE(IsEndToken(TokenAt("}")));
}

}  // namespace
}  // namespace formatter
}  // namespace csharp
