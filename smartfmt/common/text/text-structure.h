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

// TextStructureView is an immutable snapshot of a parsed document: the text,
// the full token stream (trivia included), and the concrete syntax tree whose
// leaves are the non-trivia tokens.  It provides token lookup by offset and
// parent back-references, which the tree itself does not store.

#ifndef SMARTFMT_COMMON_TEXT_TEXT_STRUCTURE_H_
#define SMARTFMT_COMMON_TEXT_TEXT_STRUCTURE_H_

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "smartfmt/common/strings/line-column-map.h"
#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/token-info.h"

namespace smartfmt {

using TokenSequence = std::vector<TokenInfo>;

// Value-like handle to a leaf of a syntax tree snapshot, together with its
// parent node.  A default-constructed handle is the "missing" token.
// Handles do not own anything; the snapshot must outlive them.
class SyntaxToken {
 public:
  SyntaxToken() = default;

  SyntaxToken(const SyntaxTreeLeaf *leaf, const SyntaxTreeNode *parent)
      : leaf_(leaf), parent_(parent) {}

  // True for the default handle, and for zero-width tokens that a parser
  // inserted for error recovery (anything but end-of-file).
  bool IsMissing() const {
    return leaf_ == nullptr ||
           (leaf_->get().text().empty() && !leaf_->get().isEOF());
  }

  // TK_NONE when there is no leaf.
  int Kind() const {
    return leaf_ == nullptr ? TK_NONE : leaf_->get().token_enum();
  }

  std::string_view Text() const {
    return leaf_ == nullptr ? std::string_view() : leaf_->get().text();
  }

  const SyntaxTreeLeaf *Leaf() const { return leaf_; }

  // Immediate parent node, nullptr for the missing token (or a bare leaf
  // as tree root).
  const SyntaxTreeNode *Parent() const { return parent_; }

  bool operator==(const SyntaxToken &other) const {
    return leaf_ == other.leaf_;
  }
  bool operator!=(const SyntaxToken &other) const { return !(*this == other); }

 private:
  const SyntaxTreeLeaf *leaf_ = nullptr;
  const SyntaxTreeNode *parent_ = nullptr;
};

std::ostream &operator<<(std::ostream &, const SyntaxToken &);

class TextStructureView {
 public:
  // 'tokens' and the leaves of 'tree' must point into 'contents', which
  // must outlive this object.  Trivia appear only in 'tokens'.
  TextStructureView(std::string_view contents, TokenSequence tokens,
                    ConcreteSyntaxTree tree);

  // Do not copy/assign.  This contains pointers into the tree.
  TextStructureView(const TextStructureView &) = delete;
  TextStructureView &operator=(const TextStructureView &) = delete;

  std::string_view Contents() const { return contents_; }

  const ConcreteSyntaxTree &SyntaxTree() const { return syntax_tree_; }

  // All tokens in text order, including trivia.
  const TokenSequence &TokenStream() const { return tokens_; }

  const LineColumnMap &GetLineColumnMap() const { return line_column_map_; }

  // All leaves of the syntax tree in text order.
  const std::vector<const SyntaxTreeLeaf *> &Leaves() const {
    return leaves_;
  }

  // Returns the parent node of a leaf or node in this tree, or nullptr for
  // the root (and for symbols that do not belong to this tree).
  const SyntaxTreeNode *Parent(const Symbol &symbol) const;

  SyntaxToken MakeToken(const SyntaxTreeLeaf &leaf) const {
    return SyntaxToken(&leaf, Parent(leaf));
  }

  // Finds the leaf token whose text contains 'offset' (clamped to the
  // buffer).  When 'offset' falls into trivia between two tokens:
  // with 'include_trivia' the preceding token is returned (the missing token
  // if there is none); otherwise the following token is returned.
  SyntaxToken FindToken(int offset, bool include_trivia) const;

  // Neighbors in text order; the missing token at either end.
  SyntaxToken PreviousToken(const SyntaxToken &token) const;
  SyntaxToken NextToken(const SyntaxToken &token) const;

  // Byte offsets of a token's text relative to Contents().
  int StartOffset(const TokenInfo &token) const {
    return token.left(contents_);
  }
  int EndOffset(const TokenInfo &token) const { return token.right(contents_); }
  int StartOffset(const SyntaxToken &token) const;
  int EndOffset(const SyntaxToken &token) const;

  // True if no other leaf token ends on the line on which 'token' starts.
  bool IsFirstTokenOnLine(const SyntaxToken &token) const;

  // Returns the element of TokenStream() whose text contains 'offset', or
  // nullptr if none does.
  const TokenInfo *FindStreamTokenAt(int offset) const;

 private:
  void IndexSubtree(const Symbol &symbol, const SyntaxTreeNode *parent);

  int LeafIndex(const SyntaxToken &token) const;

  std::string_view contents_;

  TokenSequence tokens_;

  ConcreteSyntaxTree syntax_tree_;

  LineColumnMap line_column_map_;

  // Leaves in text order.
  std::vector<const SyntaxTreeLeaf *> leaves_;

  // Position of each leaf in leaves_.
  absl::flat_hash_map<const SyntaxTreeLeaf *, int> leaf_index_;

  // Back-references from every symbol to its parent node.
  absl::flat_hash_map<const Symbol *, const SyntaxTreeNode *> parents_;
};

// TextStructure owns the text that a TextStructureView refers to.
class TextStructure {
 public:
  // Copies 'contents' into owned memory, and re-points 'tokens' and the
  // leaves of 'tree' (which must point into 'contents') at the copy.
  TextStructure(std::string_view contents, TokenSequence tokens,
                ConcreteSyntaxTree tree);

  TextStructure(const TextStructure &) = delete;
  TextStructure &operator=(const TextStructure &) = delete;
  TextStructure(TextStructure &&) = delete;
  TextStructure &operator=(TextStructure &&) = delete;

  const TextStructureView &Data() const { return data_; }

 private:
  const std::string contents_;

  // The data_ object's string_views point into contents_.
  const TextStructureView data_;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_TEXT_STRUCTURE_H_
