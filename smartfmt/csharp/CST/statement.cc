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

#include "smartfmt/csharp/CST/statement.h"

#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-utils.h"
#include "smartfmt/csharp/CST/csharp-nonterminals.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"

namespace csharp {

using smartfmt::Symbol;
using smartfmt::SymbolKind;
using smartfmt::SyntaxToken;
using smartfmt::SyntaxTreeLeaf;
using smartfmt::SyntaxTreeNode;

NodeEnum ParentEnum(const SyntaxToken &token) {
  const SyntaxTreeNode *parent = token.Parent();
  if (parent == nullptr) return NodeEnum::kUntagged;
  return NodeEnum(parent->Tag().tag);
}

bool IsUsingStatementParent(const SyntaxToken &token) {
  return smartfmt::MatchNodeEnumOrNull(token.Parent(),
                                       NodeEnum::kUsingStatement) != nullptr;
}

bool IsLabelOrSwitchLabelParent(const SyntaxToken &token) {
  const NodeEnum parent = ParentEnum(token);
  return parent == NodeEnum::kLabeledStatement || IsSwitchLabel(parent);
}

bool IsRegionDirectiveParent(const SyntaxToken &token) {
  return IsRegionDirective(ParentEnum(token));
}

const SyntaxTreeLeaf *GetRegionDirectiveMessage(
    const SyntaxTreeNode &directive) {
  for (const auto &child : directive.children()) {
    if (child == nullptr || child->Kind() != SymbolKind::kLeaf) continue;
    const SyntaxTreeLeaf &leaf = smartfmt::SymbolCastToLeaf(*child);
    if (leaf.get().token_enum() == kPreprocessingMessageToken) return &leaf;
  }
  return nullptr;
}

// Last leaf of 'symbol' with text, or nullptr.
static const SyntaxTreeLeaf *LastNonEmptyLeaf(const Symbol &symbol) {
  if (symbol.Kind() == SymbolKind::kLeaf) {
    const SyntaxTreeLeaf &leaf = smartfmt::SymbolCastToLeaf(symbol);
    return leaf.get().text().empty() ? nullptr : &leaf;
  }
  const SyntaxTreeNode &node = smartfmt::SymbolCastToNode(symbol);
  for (auto iter = node.children().rbegin(); iter != node.children().rend();
       ++iter) {
    if (*iter == nullptr) continue;
    const SyntaxTreeLeaf *leaf = LastNonEmptyLeaf(**iter);
    if (leaf != nullptr) return leaf;
  }
  return nullptr;
}

const SyntaxTreeNode *GetOutermostNodeEndingWith(
    const smartfmt::TextStructureView &view, const SyntaxToken &token) {
  if (token.Leaf() == nullptr) return nullptr;
  const SyntaxTreeNode *result = nullptr;
  for (const SyntaxTreeNode *node = token.Parent(); node != nullptr;
       node = view.Parent(*node)) {
    if (view.Parent(*node) == nullptr) break;  // root
    if (LastNonEmptyLeaf(*node) != token.Leaf()) break;
    result = node;
  }
  return result;
}

}  // namespace csharp
