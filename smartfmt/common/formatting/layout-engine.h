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

#ifndef SMARTFMT_COMMON_FORMATTING_LAYOUT_ENGINE_H_
#define SMARTFMT_COMMON_FORMATTING_LAYOUT_ENGINE_H_

#include <vector>

#include "absl/status/statusor.h"
#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/text/text-edit.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/util/cancellation.h"
#include "smartfmt/common/util/interval.h"

namespace smartfmt {

// Computes whitespace edits for a document snapshot, parametrized by an
// ordered rule chain.  Implementations must not modify the snapshot.
class LayoutEngine {
 public:
  virtual ~LayoutEngine() = default;

  // Edits for the gaps between tokens inside any of 'spans' (byte ranges
  // of view.Contents()).  Returned edits are sorted and non-overlapping.
  virtual absl::StatusOr<std::vector<TextEdit>> ComputeEdits(
      const TextStructureView &view, const std::vector<Interval<int>> &spans,
      const FormattingRuleChain &rules, const BasicFormatStyle &style,
      const CancellationToken &cancel) const = 0;

  // Edits for the single gap before 'token' (its indentation when it starts
  // a line).
  virtual absl::StatusOr<std::vector<TextEdit>> ComputeTokenEdits(
      const TextStructureView &view, const SyntaxToken &token,
      const FormattingRuleChain &rules, const BasicFormatStyle &style,
      const CancellationToken &cancel) const = 0;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_FORMATTING_LAYOUT_ENGINE_H_
