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

// Shorthand for building C# documents in tests, on top of
// tree-builder-test-util.  Example:
//
//   auto text = BuildCSharpText(Tree(NodeEnum::kCompilationUnit, {
//       Tree(NodeEnum::kExpressionStatement,
//            {Id("x"), " ", P("="), " ", Num("1"), P(";")})}));

#ifndef SMARTFMT_CSHARP_CST_CSHARP_TREE_TEST_UTIL_H_
#define SMARTFMT_CSHARP_CST_CSHARP_TREE_TEST_UTIL_H_

#include <memory>
#include <string_view>

#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-builder-test-util.h"

namespace csharp {

using smartfmt::TreeFragment;

// Unclassified whitespace: kEndOfLineTrivia if it holds a newline,
// kWhitespaceTrivia otherwise.
int ClassifyCSharpTrivia(std::string_view text);

std::unique_ptr<smartfmt::TextStructure> BuildCSharpText(
    const TreeFragment &root);

// Punctuation leaf, e.g. P(";").  Fatal for unknown punctuation.
TreeFragment P(std::string_view text);

// Keyword leaf, e.g. Kw("using").  Fatal for unknown keywords.
TreeFragment Kw(std::string_view text);

TreeFragment Id(std::string_view name);
TreeFragment Num(std::string_view digits);

// Comment trivia; "//" selects single-line, "/*" multi-line.
TreeFragment Comment(std::string_view text);

TreeFragment DisabledText(std::string_view text);

// Preprocessor directive parts.
TreeFragment Message(std::string_view text);
TreeFragment EndOfDirective();

// Zero-width leaf that a parser inserts for error recovery.
TreeFragment MissingTok(int kind);

}  // namespace csharp

#endif  // SMARTFMT_CSHARP_CST_CSHARP_TREE_TEST_UTIL_H_
