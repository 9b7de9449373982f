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

#include "smartfmt/csharp/formatting/formatting-range-helper.h"

#include <algorithm>
#include <optional>

#include "smartfmt/common/strings/line-column-map.h"
#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/concrete-syntax-tree.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/text/tree-utils.h"
#include "smartfmt/common/util/interval.h"
#include "smartfmt/common/util/logging.h"
#include "smartfmt/csharp/CST/csharp-nonterminals.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"
#include "smartfmt/csharp/CST/statement.h"

namespace csharp {
namespace formatter {

using smartfmt::Interval;
using smartfmt::SyntaxToken;
using smartfmt::SyntaxTreeNode;
using smartfmt::TextStructureView;

// Returns the first token of 'node' with text, or 'end' if there is none
// before it.
static SyntaxToken FirstTokenOf(const TextStructureView &view,
                                const SyntaxTreeNode &node,
                                const SyntaxToken &end) {
  const smartfmt::SyntaxTreeLeaf *leftmost = smartfmt::GetLeftmostLeaf(node);
  if (leftmost == nullptr) return end;
  SyntaxToken token = view.MakeToken(*leftmost);
  while (token != end && token.IsMissing()) token = view.NextToken(token);
  return token.Leaf() == nullptr ? end : token;
}

static SyntaxToken FirstTokenOnLine(const TextStructureView &view,
                                    const SyntaxToken &end) {
  SyntaxToken token = end;
  while (!view.IsFirstTokenOnLine(token)) {
    const SyntaxToken previous = view.PreviousToken(token);
    if (previous.Leaf() == nullptr) break;
    token = previous;
  }
  while (token != end && token.IsMissing()) token = view.NextToken(token);
  return token;
}

std::optional<TokenRange> StructuralRangeResolver::FindAppropriateRange(
    const TextStructureView &view, const SyntaxToken &end_token) const {
  if (end_token.IsMissing() || end_token.Kind() == kOpenBraceToken) {
    return std::nullopt;
  }

  if (end_token.Kind() == kCloseParenToken &&
      IsUsingStatementParent(end_token)) {
    return TokenRange{FirstTokenOf(view, *end_token.Parent(), end_token),
                      end_token};
  }

  if ((end_token.Kind() == kRegionKeyword ||
       end_token.Kind() == kEndRegionKeyword) &&
      IsRegionDirectiveParent(end_token)) {
    return TokenRange{FirstTokenOf(view, *end_token.Parent(), end_token),
                      end_token};
  }

  const SyntaxTreeNode *construct = GetOutermostNodeEndingWith(view, end_token);
  if (construct != nullptr) {
    VLOG(2) << "Range of " << end_token << ": "
            << NodeEnumToString(NodeEnum(construct->Tag().tag));
    return TokenRange{FirstTokenOf(view, *construct, end_token), end_token};
  }

  return TokenRange{FirstTokenOnLine(view, end_token), end_token};
}

Interval<int> GetFormattingSpan(const TextStructureView &view,
                                Interval<int> span) {
  const int length = static_cast<int>(view.Contents().length());
  const int min = std::clamp(span.min, 0, length);
  const int max = std::clamp(span.max, min, length);
  const smartfmt::LineColumnMap &line_map = view.GetLineColumnMap();
  const int first_line = line_map.LineAtOffset(min);
  const int last_line = max > min ? line_map.LineAtOffset(max - 1) : first_line;
  const int line_start = line_map.OffsetAtLine(first_line);
  // Include the preceding newline so that the gap before the first token of
  // the line is inside the span.
  return {std::max(0, line_start - 1), line_map.EndOfLineOffset(last_line)};
}

}  // namespace formatter
}  // namespace csharp
