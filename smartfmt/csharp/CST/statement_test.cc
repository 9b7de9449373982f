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

#include "smartfmt/csharp/CST/statement.h"

#include <memory>
#include <string_view>

#include "gtest/gtest.h"
#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-builder-test-util.h"
#include "smartfmt/csharp/CST/csharp-nonterminals.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"
#include "smartfmt/csharp/CST/csharp-tree-test-util.h"

namespace csharp {
namespace {

using smartfmt::NthOffsetOf;
using smartfmt::SyntaxToken;
using smartfmt::TextStructure;
using smartfmt::TextStructureView;
using smartfmt::Tree;

class StatementTest : public ::testing::Test {
 protected:
  void Build(TreeFragment root) { text_ = BuildCSharpText(root); }

  const TextStructureView &View() const { return text_->Data(); }

  SyntaxToken TokenAt(std::string_view needle, int n = 0) const {
    return View().FindToken(NthOffsetOf(View().Contents(), needle, n), false);
  }

  // using (r)
  // {
  // done: break;
  // }
  void BuildUsingStatement() {
    Build(Tree(NodeEnum::kCompilationUnit,
               {Tree(NodeEnum::kUsingStatement,
                     {Kw("using"), " ", P("("),
                      Tree(NodeEnum::kVariableDeclarator, {Id("r")}), P(")"),
                      "\n",
                      Tree(NodeEnum::kBlock,
                           {P("{"), "\n",
                            Tree(NodeEnum::kLabeledStatement,
                                 {Id("done"), P(":"), " ",
                                  Tree(NodeEnum::kBreakStatement,
                                       {Kw("break"), P(";")})}),
                            "\n", P("}")})})}));
  }

  std::unique_ptr<TextStructure> text_;
};

TEST_F(StatementTest, ParentEnum) {
  BuildUsingStatement();
  EXPECT_EQ(ParentEnum(TokenAt("using")), NodeEnum::kUsingStatement);
  EXPECT_EQ(ParentEnum(TokenAt("{")), NodeEnum::kBlock);
  EXPECT_EQ(ParentEnum(SyntaxToken()), NodeEnum::kUntagged);
}

TEST_F(StatementTest, UsingStatementParent) {
  BuildUsingStatement();
  EXPECT_TRUE(IsUsingStatementParent(TokenAt(")")));
  EXPECT_TRUE(IsUsingStatementParent(TokenAt("(")));
  EXPECT_FALSE(IsUsingStatementParent(TokenAt("r")));
  EXPECT_FALSE(IsUsingStatementParent(TokenAt("}")));
  EXPECT_FALSE(IsUsingStatementParent(SyntaxToken()));
}

TEST_F(StatementTest, LabeledStatementColon) {
  BuildUsingStatement();
  EXPECT_TRUE(IsLabelOrSwitchLabelParent(TokenAt(":")));
  EXPECT_FALSE(IsLabelOrSwitchLabelParent(TokenAt(";")));
}

TEST_F(StatementTest, SwitchLabelColon) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kSwitchSection,
                   {Tree(NodeEnum::kCaseSwitchLabel,
                         {Kw("case"), " ", Num("1"), P(":")}),
                    " ",
                    Tree(NodeEnum::kDefaultSwitchLabel,
                         {Kw("default"), P(":")}),
                    " ",
                    Tree(NodeEnum::kConditionalExpression,
                         {Id("a"), P("?"), Id("b"), P(":"), Id("c")})})}));
  EXPECT_TRUE(IsLabelOrSwitchLabelParent(TokenAt(":", 0)));
  EXPECT_TRUE(IsLabelOrSwitchLabelParent(TokenAt(":", 1)));
  EXPECT_FALSE(IsLabelOrSwitchLabelParent(TokenAt(":", 2)));
}

TEST_F(StatementTest, RegionDirective) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kRegionDirectiveTrivia,
                   {P("#"), Kw("region"), " ", Message("Designer"),
                    EndOfDirective()}),
              "\n", Id("x")}));
  const SyntaxToken region = TokenAt("region");
  EXPECT_TRUE(IsRegionDirectiveParent(region));
  EXPECT_FALSE(IsRegionDirectiveParent(TokenAt("x")));
  const smartfmt::SyntaxTreeLeaf *message =
      GetRegionDirectiveMessage(*region.Parent());
  ASSERT_NE(message, nullptr);
  EXPECT_EQ(message->get().text(), "Designer");
}

TEST_F(StatementTest, RegionDirectiveWithoutMessage) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kEndRegionDirectiveTrivia,
                   {P("#"), Kw("endregion"), EndOfDirective()})}));
  EXPECT_EQ(GetRegionDirectiveMessage(*TokenAt("#").Parent()), nullptr);
}

TEST_F(StatementTest, OutermostNodeEndingWithCloseBrace) {
  BuildUsingStatement();
  const smartfmt::SyntaxTreeNode *node =
      GetOutermostNodeEndingWith(View(), TokenAt("}"));
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(NodeEnum(node->Tag().tag), NodeEnum::kUsingStatement);
}

TEST_F(StatementTest, OutermostNodeEndingWithSemicolon) {
  BuildUsingStatement();
  const smartfmt::SyntaxTreeNode *node =
      GetOutermostNodeEndingWith(View(), TokenAt(";"));
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(NodeEnum(node->Tag().tag), NodeEnum::kLabeledStatement);
}

TEST_F(StatementTest, OutermostNodeEndingWithNone) {
  BuildUsingStatement();
  EXPECT_EQ(GetOutermostNodeEndingWith(View(), TokenAt(":")), nullptr);
  EXPECT_EQ(GetOutermostNodeEndingWith(View(), TokenAt("(")), nullptr);
  EXPECT_EQ(GetOutermostNodeEndingWith(View(), SyntaxToken()), nullptr);
}

TEST_F(StatementTest, OutermostNodeIgnoresMissingTokens) {
  Build(Tree(NodeEnum::kCompilationUnit,
             {Tree(NodeEnum::kExpressionStatement,
                   {Id("x"), MissingTok(kSemicolonToken)})}));
  const smartfmt::SyntaxTreeNode *node =
      GetOutermostNodeEndingWith(View(), TokenAt("x"));
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(NodeEnum(node->Tag().tag), NodeEnum::kExpressionStatement);
}

}  // namespace
}  // namespace csharp
