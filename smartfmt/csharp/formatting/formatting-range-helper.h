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

// Finding the span that editor formatting reformats.

#ifndef SMARTFMT_CSHARP_FORMATTING_FORMATTING_RANGE_HELPER_H_
#define SMARTFMT_CSHARP_FORMATTING_FORMATTING_RANGE_HELPER_H_

#include <optional>

#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/util/interval.h"

namespace csharp {
namespace formatter {

// Inclusive pair of tokens that bound a range to reformat.
struct TokenRange {
  smartfmt::SyntaxToken start;
  smartfmt::SyntaxToken end;
};

// Computes the syntactic range that a just-completed token closes.
class RangeResolver {
 public:
  virtual ~RangeResolver() = default;

  // Returns the range that ends with 'end_token', or nullopt if there is
  // none.  A range whose start is 'end_token' itself is degenerate.
  virtual std::optional<TokenRange> FindAppropriateRange(
      const smartfmt::TextStructureView &view,
      const smartfmt::SyntaxToken &end_token) const = 0;
};

// Range by tree structure:
//   * ')' of a using statement: from the 'using' keyword.
//   * 'region'/'endregion' keyword: from the directive's '#'.
//   * otherwise: the outermost construct that ends with 'end_token', e.g.
//     the statement closed by ';' or the declaration closed by '}'.
//   * otherwise: from the first token on the line of 'end_token'.
// '{' never ends a range.
class StructuralRangeResolver : public RangeResolver {
 public:
  std::optional<TokenRange> FindAppropriateRange(
      const smartfmt::TextStructureView &view,
      const smartfmt::SyntaxToken &end_token) const final;
};

// Widens 'span' (clamped to the text) to whole lines: from the line break
// that precedes the first touched line (or the start of the text) to the
// end of the last touched line.  An empty span touches its line.  A span
// that ends at the start of a line does not touch that line.
smartfmt::Interval<int> GetFormattingSpan(
    const smartfmt::TextStructureView &view, smartfmt::Interval<int> span);

}  // namespace formatter
}  // namespace csharp

#endif  // SMARTFMT_CSHARP_FORMATTING_FORMATTING_RANGE_HELPER_H_
