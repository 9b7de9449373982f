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

#include "smartfmt/common/formatting/basic-layout-engine.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/text/concrete-syntax-leaf.h"
#include "smartfmt/common/text/text-edit.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/util/cancellation.h"
#include "smartfmt/common/util/interval.h"
#include "smartfmt/common/util/logging.h"
#include "smartfmt/common/util/status-macros.h"

namespace smartfmt {

// Number of tokens between cancellation checks.
static constexpr int kCancellationCheckInterval = 1024;

static bool IsBlank(std::string_view text) {
  return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

absl::StatusOr<std::vector<TextEdit>> BasicLayoutEngine::ComputeEdits(
    const TextStructureView &view, const std::vector<Interval<int>> &spans,
    const FormattingRuleChain &rules, const BasicFormatStyle &style,
    const CancellationToken &cancel) const {
  // The gap before the first token of a span lies outside of it.
  const auto selected = [&spans](int offset) {
    return std::any_of(spans.begin(), spans.end(),
                       [offset](const Interval<int> &span) {
                         return offset > span.min && offset < span.max;
                       });
  };
  return Layout(view, selected, rules, style, cancel);
}

absl::StatusOr<std::vector<TextEdit>> BasicLayoutEngine::ComputeTokenEdits(
    const TextStructureView &view, const SyntaxToken &token,
    const FormattingRuleChain &rules, const BasicFormatStyle &style,
    const CancellationToken &cancel) const {
  if (token.IsMissing()) {
    RETURN_IF_ERROR(cancel.Check());
    return std::vector<TextEdit>();
  }
  const int target = view.StartOffset(token);
  return Layout(
      view, [target](int offset) { return offset == target; }, rules, style,
      cancel);
}

absl::StatusOr<std::vector<TextEdit>> BasicLayoutEngine::Layout(
    const TextStructureView &view, const GapSelector &selected,
    const FormattingRuleChain &rules, const BasicFormatStyle &style,
    const CancellationToken &cancel) const {
  RETURN_IF_ERROR(cancel.Check());
  const std::string_view contents = view.Contents();
  std::vector<TextEdit> edits;
  const auto add_edit = [&contents, &edits](int begin, int end,
                                            std::string replacement) {
    if (contents.substr(begin, end - begin) == replacement) return;
    edits.push_back({{begin, end}, std::move(replacement)});
  };

  SyntaxToken left;
  int prev_end = 0;
  int depth = 0;
  int count = 0;
  for (const SyntaxTreeLeaf *leaf : view.Leaves()) {
    const SyntaxToken right = view.MakeToken(*leaf);
    if (right.IsMissing() || leaf->get().isEOF()) continue;
    if (++count % kCancellationCheckInterval == 0) {
      RETURN_IF_ERROR(cancel.Check());
    }

    const int start = view.StartOffset(right);
    LayoutContext context;
    context.left = left;
    context.right = right;
    context.original_space = contents.substr(prev_end, start - prev_end);
    context.line_break =
        left.Leaf() == nullptr ||
        context.original_space.find('\n') != std::string_view::npos;
    context.depth = depth;
    context.offset = start;
    for (const auto &rule : rules) rule->ApplyTo(&context);
    VLOG(3) << context;

    const int indent_depth = std::max(0, depth + context.depth_before);
    depth = std::max(0, indent_depth + context.depth_after);

    if (selected(start) && context.spacing != SpacingOptions::kPreserve &&
        IsBlank(context.original_space)) {
      if (context.line_break) {
        // Only the indentation after the last newline is rewritten.
        const size_t newline = context.original_space.rfind('\n');
        const int indent_begin =
            newline == std::string_view::npos ? prev_end
                                              : prev_end + newline + 1;
        const int indentation =
            context.indentation_override >= 0
                ? context.indentation_override
                : indent_depth * style.indentation_spaces +
                      context.extra_indentation;
        add_edit(indent_begin, start,
                 std::string(std::max(0, indentation), ' '));
      } else {
        add_edit(prev_end, start,
                 std::string(std::max(0, context.spaces_required), ' '));
      }
    }
    left = right;
    prev_end = view.EndOffset(right);
  }
  RETURN_IF_ERROR(cancel.Check());
  return edits;
}

}  // namespace smartfmt
