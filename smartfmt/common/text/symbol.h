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

// Symbol is a base class that covers both terminal and nonterminal symbols.

#ifndef SMARTFMT_COMMON_TEXT_SYMBOL_H_
#define SMARTFMT_COMMON_TEXT_SYMBOL_H_

#include <iosfwd>
#include <memory>

#include "smartfmt/common/text/visitors.h"

namespace smartfmt {

class Symbol;
using SymbolPtr = std::unique_ptr<Symbol>;

// Kind is a datatype representing the subclass of a Symbol*
enum class SymbolKind { kLeaf, kNode };

std::ostream &operator<<(std::ostream &, SymbolKind);

// Pair that identifies a tree symbol (leaf or node).
struct SymbolTag {
  SymbolKind kind;
  int tag;

  bool operator==(const SymbolTag &symbol_tag) const {
    return kind == symbol_tag.kind && tag == symbol_tag.tag;
  }

  bool operator!=(const SymbolTag &symbol_tag) const {
    return !(*this == symbol_tag);
  }
};

// Pair of inline helper functions for building SymbolTag
template <typename EnumType>
constexpr SymbolTag NodeTag(EnumType tag) {
  return {SymbolKind::kNode, static_cast<int>(tag)};
}
constexpr SymbolTag LeafTag(int tag) { return {SymbolKind::kLeaf, tag}; }

class Symbol {
 public:
  virtual ~Symbol() = default;

  // Visitor pattern methods
  virtual void Accept(TreeVisitorRecursive *visitor) const = 0;
  virtual void Accept(SymbolVisitor *visitor) const = 0;

  // Implemented in subclasses to denote their type
  virtual SymbolKind Kind() const = 0;
  virtual SymbolTag Tag() const = 0;

 protected:
  Symbol() = default;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_SYMBOL_H_
