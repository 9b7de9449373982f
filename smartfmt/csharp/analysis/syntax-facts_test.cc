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

#include "smartfmt/csharp/analysis/syntax-facts.h"

#include <memory>

#include "gtest/gtest.h"
#include "re2/re2.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-builder-test-util.h"
#include "smartfmt/csharp/CST/csharp-nonterminals.h"
#include "smartfmt/csharp/CST/csharp-tree-test-util.h"

namespace csharp {
namespace {

using smartfmt::NthOffsetOf;
using smartfmt::TextStructure;
using smartfmt::Tree;

TreeFragment Region(const char *message) {
  return Tree(NodeEnum::kRegionDirectiveTrivia,
              {P("#"), Kw("region"), " ", Message(message), EndOfDirective()});
}

TreeFragment EndRegion() {
  return Tree(NodeEnum::kEndRegionDirectiveTrivia,
              {P("#"), Kw("endregion"), EndOfDirective()});
}

std::shared_ptr<const re2::RE2> DesignerPattern() {
  return std::make_shared<const re2::RE2>("Designer generated");
}

TEST(CSharpSyntaxFactsTest, DesignerRegion) {
  const std::unique_ptr<TextStructure> text = BuildCSharpText(
      Tree(NodeEnum::kCompilationUnit,
           {Region("Windows Form Designer generated code"), "\n", Id("x"),
            "\n", EndRegion(), "\n", Id("y")}));
  const auto &view = text->Data();
  const CSharpSyntaxFacts facts(DesignerPattern());
  EXPECT_FALSE(facts.IsInNonUserCode(view, 0));
  EXPECT_TRUE(
      facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "Designer")));
  EXPECT_TRUE(facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "x")));
  EXPECT_FALSE(facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "y")));
  EXPECT_FALSE(facts.IsInNonUserCode(
      view, static_cast<int>(view.Contents().length())));
}

TEST(CSharpSyntaxFactsTest, UserRegionIsUserCode) {
  const std::unique_ptr<TextStructure> text = BuildCSharpText(Tree(
      NodeEnum::kCompilationUnit,
      {Region("Helpers"), "\n", Id("x"), "\n", EndRegion()}));
  const auto &view = text->Data();
  const CSharpSyntaxFacts facts(DesignerPattern());
  EXPECT_FALSE(facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "x")));
}

TEST(CSharpSyntaxFactsTest, NestedRegions) {
  const std::unique_ptr<TextStructure> text = BuildCSharpText(
      Tree(NodeEnum::kCompilationUnit,
           {Region("Outer"), "\n", Region("Designer generated"), "\n",
            Id("alpha"), "\n", EndRegion(), "\n", Id("b"), "\n", EndRegion()}));
  const auto &view = text->Data();
  const CSharpSyntaxFacts facts(DesignerPattern());
  const int alpha = NthOffsetOf(view.Contents(), "alpha");
  EXPECT_TRUE(facts.IsInNonUserCode(view, alpha));
  EXPECT_FALSE(facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "b")));
}

TEST(CSharpSyntaxFactsTest, UnterminatedRegionExtendsToEnd) {
  const std::unique_ptr<TextStructure> text = BuildCSharpText(
      Tree(NodeEnum::kCompilationUnit,
           {Region("Designer generated"), "\n", Id("alpha")}));
  const auto &view = text->Data();
  const CSharpSyntaxFacts facts(DesignerPattern());
  const int alpha = NthOffsetOf(view.Contents(), "alpha");
  EXPECT_TRUE(facts.IsInNonUserCode(view, alpha));
}

TEST(CSharpSyntaxFactsTest, NoPatternDisablesRegions) {
  const std::unique_ptr<TextStructure> text = BuildCSharpText(
      Tree(NodeEnum::kCompilationUnit,
           {Region("Designer generated"), "\n", Id("alpha"), "\n",
            EndRegion()}));
  const auto &view = text->Data();
  const CSharpSyntaxFacts facts(nullptr);
  const int alpha = NthOffsetOf(view.Contents(), "alpha");
  EXPECT_FALSE(facts.IsInNonUserCode(view, alpha));
}

TEST(CSharpSyntaxFactsTest, DisabledText) {
  const std::unique_ptr<TextStructure> text = BuildCSharpText(
      Tree(NodeEnum::kCompilationUnit,
           {Id("a"), "\n", DisabledText("int q = 0;\n"), Id("b")}));
  const auto &view = text->Data();
  const CSharpSyntaxFacts facts(nullptr);
  EXPECT_TRUE(facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "q")));
  EXPECT_FALSE(facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "a")));
  EXPECT_FALSE(facts.IsInNonUserCode(view, NthOffsetOf(view.Contents(), "b")));
}

}  // namespace
}  // namespace csharp
