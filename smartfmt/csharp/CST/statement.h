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

// Queries about the syntactic context of a token.

#ifndef SMARTFMT_CSHARP_CST_STATEMENT_H_
#define SMARTFMT_CSHARP_CST_STATEMENT_H_

#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/csharp/CST/csharp-nonterminals.h"

namespace csharp {

// Returns the tag of 'token''s parent, kUntagged if it has none.
NodeEnum ParentEnum(const smartfmt::SyntaxToken &token);

// True if 'token' belongs directly to a 'using (...)' statement, as its
// parentheses and keyword do.
bool IsUsingStatementParent(const smartfmt::SyntaxToken &token);

// True if 'token' belongs directly to a labeled statement or to a
// 'case'/'default' switch label.
bool IsLabelOrSwitchLabelParent(const smartfmt::SyntaxToken &token);

// True if 'token' belongs directly to a #region or #endregion directive.
bool IsRegionDirectiveParent(const smartfmt::SyntaxToken &token);

// Returns the message leaf of a #region directive node, or nullptr if it
// has none.
const smartfmt::SyntaxTreeLeaf *GetRegionDirectiveMessage(
    const smartfmt::SyntaxTreeNode &directive);

// Returns the outermost ancestor of 'token', below the root, whose last
// leaf is 'token' (ignoring zero-width leaves), or nullptr if the parent
// itself does not end with 'token'.
const smartfmt::SyntaxTreeNode *GetOutermostNodeEndingWith(
    const smartfmt::TextStructureView &view,
    const smartfmt::SyntaxToken &token);

}  // namespace csharp

#endif  // SMARTFMT_CSHARP_CST_STATEMENT_H_
