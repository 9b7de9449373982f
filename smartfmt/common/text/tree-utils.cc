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

#include "smartfmt/common/text/tree-utils.h"


#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/token-info.h"
#include "smartfmt/common/util/casts.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {

const SyntaxTreeLeaf *GetLeftmostLeaf(const Symbol &symbol) {
  if (symbol.Kind() == SymbolKind::kLeaf) {
    return &SymbolCastToLeaf(symbol);
  }

  for (const auto &child : SymbolCastToNode(symbol).children()) {
    if (child != nullptr) {
      const auto *leaf = GetLeftmostLeaf(*child);
      if (leaf != nullptr) return leaf;
    }
  }
  return nullptr;
}

const SyntaxTreeNode &SymbolCastToNode(const Symbol &symbol) {
  CHECK_EQ(symbol.Kind(), SymbolKind::kNode)
      << "got tag: " << symbol.Tag().tag;
  return down_cast<const SyntaxTreeNode &>(symbol);
}

SyntaxTreeNode &SymbolCastToNode(Symbol &symbol) {
  CHECK_EQ(symbol.Kind(), SymbolKind::kNode)
      << "got tag: " << symbol.Tag().tag;
  return down_cast<SyntaxTreeNode &>(symbol);
}

const SyntaxTreeLeaf &SymbolCastToLeaf(const Symbol &symbol) {
  CHECK_EQ(symbol.Kind(), SymbolKind::kLeaf)
      << "got tag: " << symbol.Tag().tag;
  return down_cast<const SyntaxTreeLeaf &>(symbol);
}

void MutateLeaves(ConcreteSyntaxTree *tree, const LeafMutator &mutator) {
  if (tree == nullptr || *tree == nullptr) return;
  if ((*tree)->Kind() == SymbolKind::kLeaf) {
    mutator(down_cast<SyntaxTreeLeaf &>(**tree).get_mutable());
    return;
  }
  for (auto &child : SymbolCastToNode(**tree).mutable_children()) {
    MutateLeaves(&child, mutator);
  }
}

}  // namespace smartfmt
