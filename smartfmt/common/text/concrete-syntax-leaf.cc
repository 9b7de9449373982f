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

#include "smartfmt/common/text/concrete-syntax-leaf.h"

#include <ostream>

#include "smartfmt/common/text/symbol.h"
#include "smartfmt/common/text/visitors.h"

namespace smartfmt {

std::ostream &operator<<(std::ostream &stream, SymbolKind kind) {
  switch (kind) {
    case SymbolKind::kLeaf:
      return stream << "leaf";
    case SymbolKind::kNode:
      return stream << "node";
  }
  return stream << "???";
}

void SyntaxTreeLeaf::Accept(TreeVisitorRecursive *visitor) const {
  visitor->Visit(*this);
}

void SyntaxTreeLeaf::Accept(SymbolVisitor *visitor) const {
  visitor->Visit(*this);
}

std::ostream &operator<<(std::ostream &os, const SyntaxTreeLeaf &l) {
  return os << l.get();
}

}  // namespace smartfmt
