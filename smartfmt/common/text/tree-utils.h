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

// Contains a suite of functions for operating on SyntaxTrees

#ifndef SMARTFMT_COMMON_TEXT_TREE_UTILS_H_
#define SMARTFMT_COMMON_TEXT_TREE_UTILS_H_

#include <functional>

#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/token-info.h"

namespace smartfmt {

// Returns the leftmost leaf contained in Symbol.
// nullptr is returned if no leaves are found.
// If symbol is a leaf node, then it is its own leftmost leaf.
const SyntaxTreeLeaf *GetLeftmostLeaf(const Symbol &symbol);

// Returns a SyntaxTreeNode down_casted from a Symbol.
const SyntaxTreeNode &SymbolCastToNode(const Symbol &);
// Mutable variant.
SyntaxTreeNode &SymbolCastToNode(Symbol &);  // NOLINT

// Returns a SyntaxTreeLeaf down_casted from a Symbol.
const SyntaxTreeLeaf &SymbolCastToLeaf(const Symbol &);

// Succeeds if symbol is a node enumerated 'node_enum'; returns nullptr
// otherwise (including for leaves and nullptr).
template <typename E>
const SyntaxTreeNode *MatchNodeEnumOrNull(const Symbol *symbol, E node_enum) {
  if (symbol == nullptr || symbol->Kind() != SymbolKind::kNode) return nullptr;
  const SyntaxTreeNode &node = SymbolCastToNode(*symbol);
  return node.MatchesTag(node_enum) ? &node : nullptr;
}

using LeafMutator = std::function<void(TokenInfo *)>;

// Applies the mutator transformation to every leaf (token) in the syntax tree.
void MutateLeaves(ConcreteSyntaxTree *tree, const LeafMutator &mutator);

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_TREE_UTILS_H_
