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

// Suite of helper functions for concisely building trees inline

#ifndef SMARTFMT_COMMON_TEXT_TREE_BUILDER_TEST_UTIL_H_
#define SMARTFMT_COMMON_TEXT_TREE_BUILDER_TEST_UTIL_H_

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/constants.h"
#include "smartfmt/common/text/text-structure.h"

namespace smartfmt {

template <typename... Args>
SymbolPtr Node(Args... args) {
  return MakeNode(args...);
}
template <typename... Args, typename Enum>
SymbolPtr TNode(Enum e, Args... args) {
  return MakeTaggedNode(e, args...);
}

template <typename... Args>
SymbolPtr Leaf(Args &&...args) {
  return SymbolPtr(new SyntaxTreeLeaf(std::forward<Args>(args)...));
}

// Descend through subtree, using path's indices, asserting that each subnode
// along the way is a node.
const Symbol *DescendPath(const Symbol &symbol,
                          std::initializer_list<size_t> path);

// Maps the text of unclassified trivia to a token enum.
using TriviaClassifier = std::function<int(std::string_view)>;

// Description of a document as a tree of text fragments, from which both the
// token stream and the syntax tree are derived.  The document text is the
// concatenation of all fragment texts in order.
//
//   BuildTextStructure(
//       Tree(kBlock, {Tok(kOpen, "{"), "\n  ", Tok(kClose, "}")}), ...);
//
// Plain string literals are trivia whose kind is chosen by the classifier.
struct TreeFragment {
  enum class Type { kLeaf, kTrivia, kNode };

  Type type = Type::kTrivia;
  // Token enum for leaves and trivia, node tag for nodes.
  // kUntagged for unclassified trivia.
  int tag = kUntagged;
  std::string text;
  std::vector<TreeFragment> children;

  TreeFragment(Type t, int tag, std::string_view text,
               std::vector<TreeFragment> children = {})
      : type(t), tag(tag), text(text), children(std::move(children)) {}

  // Implicit construction intentional.
  TreeFragment(const char *trivia_text)  // NOLINT(google-explicit-constructor)
      : text(trivia_text) {}
};

// Leaf token.  Empty text makes a missing token.
TreeFragment Tok(int token_enum, std::string_view text);

// Trivia token: present in the token stream only, not in the tree.
TreeFragment Trivia(int token_enum, std::string_view text);

template <typename Enum>
TreeFragment Tree(Enum tag, std::vector<TreeFragment> children) {
  return TreeFragment(TreeFragment::Type::kNode, static_cast<int>(tag), "",
                      std::move(children));
}

// Builds an owned text structure from 'root', which must be a node.
// An end-of-file leaf is appended to the root and to the token stream.
std::unique_ptr<TextStructure> BuildTextStructure(
    const TreeFragment &root, const TriviaClassifier &classify_trivia);

// Returns the byte offset of the n-th (0-based) occurrence of 'needle' in
// 'text'.  Fatal if there is no such occurrence.
int NthOffsetOf(std::string_view text, std::string_view needle, int n = 0);

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_TREE_BUILDER_TEST_UTIL_H_
