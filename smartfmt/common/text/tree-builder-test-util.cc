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

#include "smartfmt/common/text/tree-builder-test-util.h"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/token-info.h"
#include "smartfmt/common/text/tree-utils.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {

const Symbol *DescendPath(const Symbol &symbol,
                          std::initializer_list<size_t> path) {
  const Symbol *node_symbol = &symbol;
  for (const auto &index : path) {
    const auto &node = SymbolCastToNode(*ABSL_DIE_IF_NULL(node_symbol));
    CHECK_LT(index, node.size());  // bounds check, like ::at()
    node_symbol = node[index].get();
  }
  return node_symbol;
}

TreeFragment Tok(int token_enum, std::string_view text) {
  return TreeFragment(TreeFragment::Type::kLeaf, token_enum, text);
}

TreeFragment Trivia(int token_enum, std::string_view text) {
  return TreeFragment(TreeFragment::Type::kTrivia, token_enum, text);
}

namespace {

void AppendText(const TreeFragment &fragment, std::string *out) {
  out->append(fragment.text);
  for (const auto &child : fragment.children) AppendText(child, out);
}

// Walks fragments in text order, creating tokens that point into 'text'.
class TreeMaker {
 public:
  TreeMaker(std::string_view text, const TriviaClassifier &classify)
      : text_(text), classify_(classify) {}

  SymbolPtr Make(const TreeFragment &fragment) {
    switch (fragment.type) {
      case TreeFragment::Type::kLeaf: {
        const TokenInfo token(fragment.tag, Take(fragment.text.length()));
        tokens_.push_back(token);
        return Leaf(token);
      }
      case TreeFragment::Type::kTrivia: {
        const int kind = fragment.tag == kUntagged ? classify_(fragment.text)
                                                   : fragment.tag;
        tokens_.emplace_back(kind, Take(fragment.text.length()));
        return nullptr;
      }
      case TreeFragment::Type::kNode:
        break;
    }
    auto node = std::make_unique<SyntaxTreeNode>(fragment.tag);
    for (const auto &child : fragment.children) {
      SymbolPtr symbol = Make(child);
      if (symbol != nullptr) node->AppendChild(std::move(symbol));
    }
    return node;
  }

  TokenSequence ReleaseTokens() { return std::move(tokens_); }

 private:
  std::string_view Take(size_t length) {
    const std::string_view result = text_.substr(offset_, length);
    offset_ += length;
    return result;
  }

  const std::string_view text_;
  const TriviaClassifier &classify_;
  size_t offset_ = 0;
  TokenSequence tokens_;
};

}  // namespace

std::unique_ptr<TextStructure> BuildTextStructure(
    const TreeFragment &root, const TriviaClassifier &classify_trivia) {
  CHECK(root.type == TreeFragment::Type::kNode);
  std::string text;
  AppendText(root, &text);

  TreeMaker maker(text, classify_trivia);
  SymbolPtr tree = maker.Make(root);
  TokenSequence tokens = maker.ReleaseTokens();
  const TokenInfo eof = TokenInfo::EOFToken(text);
  tokens.push_back(eof);
  SymbolCastToNode(*tree).AppendChild(Leaf(eof));
  return std::make_unique<TextStructure>(text, std::move(tokens),
                                         std::move(tree));
}

int NthOffsetOf(std::string_view text, std::string_view needle, int n) {
  size_t pos = text.find(needle);
  for (; n > 0 && pos != std::string_view::npos; --n) {
    pos = text.find(needle, pos + 1);
  }
  CHECK_NE(pos, std::string_view::npos)
      << "'" << needle << "' not found in: " << text;
  return static_cast<int>(pos);
}

}  // namespace smartfmt
