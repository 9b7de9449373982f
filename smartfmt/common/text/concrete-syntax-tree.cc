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

#include "smartfmt/common/text/concrete-syntax-tree.h"

#include <cstddef>

#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/visitors.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {

SymbolPtr &SyntaxTreeNode::operator[](const size_t i) {
  CHECK_LT(i, children_.size());
  return children_[i];
}

const SymbolPtr &SyntaxTreeNode::operator[](const size_t i) const {
  CHECK_LT(i, children_.size());
  return children_[i];
}

// visits self, then forwards visitor to every child
void SyntaxTreeNode::Accept(TreeVisitorRecursive *visitor) const {
  visitor->Visit(*this);
  for (const auto &child : children_) {
    if (child != nullptr) child->Accept(visitor);
  }
}

void SyntaxTreeNode::Accept(SymbolVisitor *visitor) const {
  visitor->Visit(*this);
}

}  // namespace smartfmt
