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

#include "smartfmt/common/formatting/formatting-rule.h"

#include <ostream>

#include "absl/strings/escaping.h"

namespace smartfmt {

std::ostream &operator<<(std::ostream &stream, SpacingOptions b) {
  switch (b) {
    case SpacingOptions::kUndecided:
      stream << "undecided";
      break;
    case SpacingOptions::kSpaces:
      stream << "spaces";
      break;
    case SpacingOptions::kPreserve:
      stream << "preserve";
      break;
  }
  return stream;
}

std::ostream &operator<<(std::ostream &stream, const LayoutContext &context) {
  stream << context.left << " <" << absl::CEscape(context.original_space)
         << "> " << context.right << " @" << context.offset
         << " depth:" << context.depth << ' ' << context.spacing;
  if (context.spacing == SpacingOptions::kSpaces) {
    stream << '(' << context.spaces_required << ')';
  }
  if (context.indentation_override >= 0) {
    stream << " indent:" << context.indentation_override;
  }
  return stream;
}

FormattingRuleChain ConcatRuleChains(const FormattingRuleChain &first,
                                     const FormattingRuleChain &second) {
  FormattingRuleChain result;
  result.reserve(first.size() + second.size());
  result.insert(result.end(), first.begin(), first.end());
  result.insert(result.end(), second.begin(), second.end());
  return result;
}

}  // namespace smartfmt
