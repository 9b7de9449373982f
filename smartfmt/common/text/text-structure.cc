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

#include <algorithm>
#include <iterator>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/token-info.h"
#include "smartfmt/common/text/tree-utils.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {

std::ostream &operator<<(std::ostream &stream, const SyntaxToken &token) {
  if (token.Leaf() == nullptr) return stream << "(missing)";
  return stream << token.Leaf()->get();
}

TextStructureView::TextStructureView(std::string_view contents,
                                     TokenSequence tokens,
                                     ConcreteSyntaxTree tree)
    : contents_(contents),
      tokens_(std::move(tokens)),
      syntax_tree_(std::move(tree)),
      line_column_map_(contents) {
  if (syntax_tree_ != nullptr) IndexSubtree(*syntax_tree_, nullptr);
  for (const auto *leaf : leaves_) {
    CHECK_LE(StartOffset(leaf->get()), EndOffset(leaf->get()));
    CHECK_LE(EndOffset(leaf->get()), static_cast<int>(contents_.length()))
        << "Leaf outside of text: " << leaf->get();
  }
}

void TextStructureView::IndexSubtree(const Symbol &symbol,
                                     const SyntaxTreeNode *parent) {
  parents_[&symbol] = parent;
  if (symbol.Kind() == SymbolKind::kLeaf) {
    const SyntaxTreeLeaf &leaf = SymbolCastToLeaf(symbol);
    leaf_index_[&leaf] = leaves_.size();
    leaves_.push_back(&leaf);
    return;
  }
  const SyntaxTreeNode &node = SymbolCastToNode(symbol);
  for (const auto &child : node.children()) {
    if (child != nullptr) IndexSubtree(*child, &node);
  }
}

const SyntaxTreeNode *TextStructureView::Parent(const Symbol &symbol) const {
  const auto found = parents_.find(&symbol);
  if (found == parents_.end()) return nullptr;
  return found->second;
}

SyntaxToken TextStructureView::FindToken(int offset,
                                         bool include_trivia) const {
  if (leaves_.empty()) return {};
  offset = std::clamp(offset, 0, static_cast<int>(contents_.length()));

  // First leaf that starts past the offset.
  const auto next = std::upper_bound(
      leaves_.begin(), leaves_.end(), offset,
      [this](int off, const SyntaxTreeLeaf *leaf) {
        return off < StartOffset(leaf->get());
      });
  if (next == leaves_.begin()) {
    // Leading trivia of the whole text.
    if (include_trivia) return {};
    return MakeToken(*leaves_.front());
  }
  const SyntaxTreeLeaf *candidate = *std::prev(next);
  if (offset < EndOffset(candidate->get()) || include_trivia ||
      next == leaves_.end()) {
    return MakeToken(*candidate);
  }
  return MakeToken(**next);
}

int TextStructureView::LeafIndex(const SyntaxToken &token) const {
  if (token.Leaf() == nullptr) return -1;
  const auto found = leaf_index_.find(token.Leaf());
  return found == leaf_index_.end() ? -1 : found->second;
}

SyntaxToken TextStructureView::PreviousToken(const SyntaxToken &token) const {
  const int index = LeafIndex(token);
  if (index <= 0) return {};
  return MakeToken(*leaves_[index - 1]);
}

SyntaxToken TextStructureView::NextToken(const SyntaxToken &token) const {
  const int index = LeafIndex(token);
  if (index < 0 || index + 1 >= static_cast<int>(leaves_.size())) return {};
  return MakeToken(*leaves_[index + 1]);
}

int TextStructureView::StartOffset(const SyntaxToken &token) const {
  CHECK(token.Leaf() != nullptr);
  return StartOffset(token.Leaf()->get());
}

int TextStructureView::EndOffset(const SyntaxToken &token) const {
  CHECK(token.Leaf() != nullptr);
  return EndOffset(token.Leaf()->get());
}

bool TextStructureView::IsFirstTokenOnLine(const SyntaxToken &token) const {
  if (token.Leaf() == nullptr) return false;
  const int line = line_column_map_.LineAtOffset(StartOffset(token));
  // Zero-width tokens do not occupy a line.
  SyntaxToken previous = PreviousToken(token);
  while (previous.Leaf() != nullptr && previous.Text().empty()) {
    previous = PreviousToken(previous);
  }
  if (previous.Leaf() == nullptr) return true;
  return line_column_map_.LineAtOffset(EndOffset(previous)) != line;
}

const TokenInfo *TextStructureView::FindStreamTokenAt(int offset) const {
  const auto next = std::upper_bound(
      tokens_.begin(), tokens_.end(), offset,
      [this](int off, const TokenInfo &token) {
        return off < StartOffset(token);
      });
  if (next == tokens_.begin()) return nullptr;
  const TokenInfo &candidate = *std::prev(next);
  if (offset < EndOffset(candidate)) return &candidate;
  return nullptr;
}

namespace {
// Returns the substring of 'new_base' at the same position that 'text' has
// relative to 'old_base'.
std::string_view Rebase(std::string_view text, std::string_view old_base,
                        std::string_view new_base) {
  const auto offset = text.data() - old_base.data();
  CHECK_GE(offset, 0);
  CHECK_LE(offset + text.length(), new_base.length());
  return new_base.substr(offset, text.length());
}

TokenSequence RebaseTokens(TokenSequence tokens, std::string_view old_base,
                           std::string_view new_base) {
  for (auto &token : tokens) {
    token.RebaseStringView(Rebase(token.text(), old_base, new_base));
  }
  return tokens;
}

ConcreteSyntaxTree RebaseTree(ConcreteSyntaxTree tree,
                              std::string_view old_base,
                              std::string_view new_base) {
  MutateLeaves(&tree, [=](TokenInfo *token) {
    token->RebaseStringView(Rebase(token->text(), old_base, new_base));
  });
  return tree;
}
}  // namespace

TextStructure::TextStructure(std::string_view contents, TokenSequence tokens,
                             ConcreteSyntaxTree tree)
    : contents_(contents),
      data_(contents_, RebaseTokens(std::move(tokens), contents, contents_),
            RebaseTree(std::move(tree), contents, contents_)) {}

}  // namespace smartfmt
