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

#ifndef SMARTFMT_COMMON_FORMATTING_BASIC_LAYOUT_ENGINE_H_
#define SMARTFMT_COMMON_FORMATTING_BASIC_LAYOUT_ENGINE_H_

#include <functional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/formatting/layout-engine.h"
#include "smartfmt/common/text/text-edit.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/util/cancellation.h"
#include "smartfmt/common/util/interval.h"

namespace smartfmt {

// Line-preserving layout engine: never adds or removes line breaks.
//
// Walks all non-trivia tokens from the start of the text, running the rule
// chain on each gap to track brace depth.  Gaps selected for formatting are
// rewritten as follows:
//   * on the same line: 'spaces_required' spaces
//   * after a line break: the original text up to the last newline, then
//     the indentation (indentation_override, or
//     depth * indentation_spaces + extra_indentation)
//   * kPreserve, or a gap that holds a comment: unchanged
// Zero-width (missing) tokens and the end-of-file token are skipped.
class BasicLayoutEngine : public LayoutEngine {
 public:
  // Selects the gap before the token starting at 'offset'.
  using GapSelector = std::function<bool(int offset)>;

  absl::StatusOr<std::vector<TextEdit>> ComputeEdits(
      const TextStructureView &view, const std::vector<Interval<int>> &spans,
      const FormattingRuleChain &rules, const BasicFormatStyle &style,
      const CancellationToken &cancel) const final;

  absl::StatusOr<std::vector<TextEdit>> ComputeTokenEdits(
      const TextStructureView &view, const SyntaxToken &token,
      const FormattingRuleChain &rules, const BasicFormatStyle &style,
      const CancellationToken &cancel) const final;

 private:
  absl::StatusOr<std::vector<TextEdit>> Layout(
      const TextStructureView &view, const GapSelector &selected,
      const FormattingRuleChain &rules, const BasicFormatStyle &style,
      const CancellationToken &cancel) const;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_FORMATTING_BASIC_LAYOUT_ENGINE_H_
