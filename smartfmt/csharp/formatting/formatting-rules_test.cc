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

#include "smartfmt/csharp/formatting/formatting-rules.h"

#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/formatting/basic-layout-engine.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/text/text-edit.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-builder-test-util.h"
#include "smartfmt/common/util/cancellation.h"
#include "smartfmt/csharp/CST/csharp-nonterminals.h"
#include "smartfmt/csharp/CST/csharp-tree-test-util.h"

namespace csharp {
namespace formatter {
namespace {

using smartfmt::FormattingRuleChain;
using smartfmt::Tree;

class FormattingRulesTest : public ::testing::Test {
 protected:
  // Formats the whole of 'root' with 'rules'.
  std::string Format(const TreeFragment &root,
                     const FormattingRuleChain &rules) const {
    const auto text = BuildCSharpText(root);
    const auto &view = text->Data();
    const int length = static_cast<int>(view.Contents().length());
    const auto edits =
        engine_.ComputeEdits(view, {{0, length}}, rules, style_,
                             smartfmt::CancellationToken::None());
    EXPECT_TRUE(edits.ok()) << edits.status();
    if (!edits.ok()) return "";
    const auto result = smartfmt::ApplyEdits(view.Contents(), *edits);
    EXPECT_TRUE(result.ok()) << result.status();
    return result.ok() ? *result : "";
  }

  std::string FormatWithDefaults(const TreeFragment &root) const {
    return Format(root, service_.GetDefaultFormattingRules());
  }

  smartfmt::BasicLayoutEngine engine_;
  smartfmt::BasicFormatStyle style_;
  CSharpSyntaxFormattingService service_;
};

TEST_F(FormattingRulesTest, ClassWithMethod) {
  const TreeFragment root = Tree(
      NodeEnum::kCompilationUnit,
      {Tree(NodeEnum::kClassDeclaration,
            {Kw("class"), " ", Id("C"), "\n", P("{"), "\n",
             Tree(NodeEnum::kMethodDeclaration,
                  {Kw("void"), " ", Id("M"), " ",
                   Tree(NodeEnum::kParameterList, {P("("), " ", P(")")}),
                   "\n",
                   Tree(NodeEnum::kBlock,
                        {P("{"), "\n",
                         Tree(NodeEnum::kExpressionStatement,
                              {Id("x"), " ", P("="), " ",
                               Tree(NodeEnum::kInvocationExpression,
                                    {Id("f"), " ",
                                     Tree(NodeEnum::kArgumentList,
                                          {P("("), Num("1"), " ", P(","),
                                           Num("2"), P(")")})}),
                               " ", P(";")}),
                         "\n", P("}")})}),
             "\n", P("}")})});
  EXPECT_EQ(FormatWithDefaults(root),
            "class C\n"
            "{\n"
            "    void M()\n"
            "    {\n"
            "        x = f(1, 2);\n"
            "    }\n"
            "}");
}

TEST_F(FormattingRulesTest, DirectiveAtColumnZero) {
  const TreeFragment root = Tree(
      NodeEnum::kCompilationUnit,
      {Tree(NodeEnum::kBlock,
            {P("{"), "\n    ",
             Tree(NodeEnum::kRegionDirectiveTrivia,
                  {P("#"), " ", Kw("region"), " ", Message("Helpers"),
                   EndOfDirective()}),
             "\n", Id("x"), P(";"), "\n",
             Tree(NodeEnum::kEndRegionDirectiveTrivia,
                  {P("#"), Kw("endregion"), EndOfDirective()}),
             "\n", P("}")})});
  EXPECT_EQ(FormatWithDefaults(root),
            "{\n"
            "#region Helpers\n"
            "    x;\n"
            "#endregion\n"
            "}");
}

TEST_F(FormattingRulesTest, LabelColon) {
  const TreeFragment root = Tree(
      NodeEnum::kCompilationUnit,
      {Tree(NodeEnum::kSwitchSection,
            {Tree(NodeEnum::kCaseSwitchLabel,
                  {Kw("case"), " ", Num("1"), " ", P(":")}),
             " ",
             Tree(NodeEnum::kExpressionStatement,
                  {Tree(NodeEnum::kConditionalExpression,
                        {Id("a"), P("?"), Id("b"), P(":"), Id("c")}),
                   P(";")})})});
  EXPECT_EQ(FormatWithDefaults(root), "case 1: a ? b : c;");
}

TEST_F(FormattingRulesTest, PasteKeepsSpacingWithinLines) {
  const TreeFragment root =
      Tree(NodeEnum::kCompilationUnit,
           {Tree(NodeEnum::kBlock,
                 {P("{"), "\n",
                  Tree(NodeEnum::kExpressionStatement,
                       {Id("x"), "  ", P("="), "  ", Num("1"), P(";")}),
                  "\n", P("}")})});
  const FormattingRuleChain rules =
      smartfmt::ConcatRuleChains({std::make_shared<PasteFormattingRule>()},
                                 service_.GetDefaultFormattingRules());
  EXPECT_EQ(Format(root, rules), "{\n    x  =  1;\n}");
}

TEST_F(FormattingRulesTest, SpacingRuleKeepsEarlierDecision) {
  smartfmt::LayoutContext context;
  context.spacing = smartfmt::SpacingOptions::kPreserve;
  context.spaces_required = 4;
  SpacingRule().ApplyTo(&context);
  EXPECT_EQ(context.spacing, smartfmt::SpacingOptions::kPreserve);
  EXPECT_EQ(context.spaces_required, 4);
}

TEST_F(FormattingRulesTest, PasteRuleAfterDefaultsStillPreserves) {
  const TreeFragment root = Tree(
      NodeEnum::kCompilationUnit,
      {Tree(NodeEnum::kExpressionStatement,
            {Id("x"), "  ", P("="), "  ", Num("1"), P(";")})});
  EXPECT_EQ(FormatWithDefaults(root), "x = 1;");
  const FormattingRuleChain rules = smartfmt::ConcatRuleChains(
      service_.GetDefaultFormattingRules(),
      {std::make_shared<PasteFormattingRule>()});
  EXPECT_EQ(Format(root, rules), "x  =  1;");
}

TEST_F(FormattingRulesTest, BaseIndentation) {
  const TreeFragment root =
      Tree(NodeEnum::kCompilationUnit,
           {Tree(NodeEnum::kBlock,
                 {P("{"), "\n",
                  Tree(NodeEnum::kExpressionStatement, {Id("x"), P(";")}),
                  "\n", P("}")})});
  const FormattingRuleChain rules =
      smartfmt::ConcatRuleChains({std::make_shared<BaseIndentationRule>(2)},
                                 service_.GetDefaultFormattingRules());
  // The first token of the text starts the span and keeps its gap.
  EXPECT_EQ(Format(root, rules), "{\n      x;\n  }");
}

TEST_F(FormattingRulesTest, DefaultRulesAreFreshPerCall) {
  const FormattingRuleChain first = service_.GetDefaultFormattingRules();
  const FormattingRuleChain second = service_.GetDefaultFormattingRules();
  ASSERT_EQ(first.size(), 3u);
  ASSERT_EQ(second.size(), 3u);
  EXPECT_NE(first.front(), second.front());
}

}  // namespace
}  // namespace formatter
}  // namespace csharp
