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

// ConcreteSyntaxTree represents the structure of a body of text.
//
// This header also provides the following (ownership-transferring) functions
// for constructing syntax trees, as a parser front-end would:
//
//   tree = MakeNode(child1, child2, ...);
//   tree = MakeTaggedNode(kTag, child1, child2, ...);
//
// As ownership is transferred exclusively, the pointers left behind are
// null as a result.

#ifndef SMARTFMT_COMMON_TEXT_CONCRETE_SYNTAX_TREE_H_
#define SMARTFMT_COMMON_TEXT_CONCRETE_SYNTAX_TREE_H_

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "smartfmt/common/text/constants.h"
#include "smartfmt/common/text/symbol.h"  // IWYU pragma: export
#include "smartfmt/common/text/visitors.h"

namespace smartfmt {

// Currently, a tree *is* a tree-node, but this may change in the future.
// Treat this as an opaque type.
using ConcreteSyntaxTree = SymbolPtr;

// SyntaxTreeNode is a language-agnostic node structure, supporting an
// arbitrary number of children.  The 'tag' field is a node type enumeration
// used by language front-ends.
class SyntaxTreeNode final : public Symbol {
 public:
  using ChildContainer = std::vector<SymbolPtr>;

  explicit SyntaxTreeNode(const int tag = kUntagged) : tag_(tag) {}

  // Transfer ownership of argument to this object.
  // Call MakeNode or MakeTaggedNode instead of calling this directly.
  void AppendChild(SymbolPtr child) {
    children_.emplace_back(std::move(child));
  }

  // This no-op case is the base case for the variadic Append.
  void Append() const {}

  // Ownership of all arguments is transferred to this object.
  template <typename T, typename... Args>
  void Append(T &&t, Args &&...args) {
    AppendChild(std::move(t));            // Append the first.
    Append(std::forward<Args>(args)...);  // Append the rest.
  }

  // Children accessor (mutable).
  SymbolPtr &operator[](size_t i);

  // Children accessor (const).
  const SymbolPtr &operator[](size_t i) const;

  const SymbolPtr &front() const { return children_.front(); }
  const SymbolPtr &back() const { return children_.back(); }

  size_t size() const { return children_.size(); }
  bool empty() const { return children_.empty(); }

  // Children may contain nullptr for absent optional constructs.
  const ChildContainer &children() const { return children_; }
  ChildContainer &mutable_children() { return children_; }

  // Uses passed TreeVisitorRecursive to visit itself, then all children
  // recursively.
  void Accept(TreeVisitorRecursive *visitor) const final;

  // Accepting a symbol visitor does not recursively visit children.
  void Accept(SymbolVisitor *visitor) const final;

  SymbolKind Kind() const final { return SymbolKind::kNode; }
  SymbolTag Tag() const final { return NodeTag(tag_); }

  // MatchesTag returns true if the tag value matches the argument.
  // This is designed to work with any enumeration type.
  template <typename EnumType>
  bool MatchesTag(EnumType e) const {
    return tag_ == static_cast<int>(e);
  }

 private:
  // Language-specific node enumeration, kept as a generic int.
  int tag_;

  // Sequence of pointers to subtrees and leaves.
  ChildContainer children_;
};

// Construct an untagged syntax tree node.
// Ownership of all args is transferred, and consumed by the new node.
template <typename... Args>
SymbolPtr MakeNode(Args &&...args) {
  auto *const node_pointer = new SyntaxTreeNode();
  node_pointer->Append(std::forward<Args>(args)...);
  return SymbolPtr(node_pointer);
}

// Construct a syntax tree node with a tag.
// Ownership of all args is transferred, and consumed by the new node.
// Sample usage:
//   tree = MakeTaggedNode(TAG);  // empty, no children
//   tree = MakeTaggedNode(TAG, child1, child2);
template <typename Enum, typename... Args>
SymbolPtr MakeTaggedNode(const Enum tag, Args &&...args) {
  auto *const node_pointer = new SyntaxTreeNode(static_cast<int>(tag));
  node_pointer->Append(std::forward<Args>(args)...);
  return SymbolPtr(node_pointer);
}

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_CONCRETE_SYNTAX_TREE_H_
