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

// Formatting rules parametrize a layout engine.  A rule inspects one gap
// between adjacent tokens (a LayoutContext) and may record spacing and
// indentation decisions in it.  Rules are composed into an ordered chain;
// each rule sees the decisions of the rules before it, and may keep or
// replace them.

#ifndef SMARTFMT_COMMON_FORMATTING_FORMATTING_RULE_H_
#define SMARTFMT_COMMON_FORMATTING_FORMATTING_RULE_H_

#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

#include "smartfmt/common/text/text-structure.h"

namespace smartfmt {

// How the whitespace between two tokens is to be produced.
enum class SpacingOptions {
  kUndecided,  // no rule has decided yet (default)
  kSpaces,     // use spaces_required, or indentation after a line break
  kPreserve,   // do not touch, keep the original text
};

std::ostream &operator<<(std::ostream &, SpacingOptions);

// LayoutContext describes the gap before the 'right' token, and carries the
// decisions that rules make about it.
struct LayoutContext {
  // Previous non-trivia token, missing at the start of the text.
  SyntaxToken left;

  SyntaxToken right;

  // The original text between 'left' and 'right' (may include comments).
  std::string_view original_space;

  // True if original_space contains a newline, or 'right' starts the text.
  bool line_break = false;

  // Brace nesting depth before 'right', as accumulated from the start of the
  // text.
  int depth = 0;

  // Byte offset of 'right' in the text.
  int offset = 0;

  // ---- Decisions ----

  SpacingOptions spacing = SpacingOptions::kUndecided;

  // Spaces between the tokens when they stay on the same line.
  int spaces_required = 1;

  // Adjustment of 'depth' that applies to 'right' itself and onwards,
  // e.g. -1 for a closing brace.
  int depth_before = 0;

  // Adjustment of 'depth' that applies only after 'right', e.g. +1 for an
  // opening brace.
  int depth_after = 0;

  // When >= 0, the exact indentation column of 'right' on a new line.
  int indentation_override = -1;

  // Spaces added to the depth-based indentation of 'right' on a new line.
  int extra_indentation = 0;
};

std::ostream &operator<<(std::ostream &, const LayoutContext &);

class FormattingRule {
 public:
  virtual ~FormattingRule() = default;

  // Records decisions about the gap described by 'context'.
  virtual void ApplyTo(LayoutContext *context) const = 0;
};

// Rules are applied in order.  Later rules see the decisions of earlier ones
// and may keep them, so a rule placed first can settle a gap's 'spacing'.
// Chains are immutable once built, and rules are shared between chains.
using FormattingRuleChain = std::vector<std::shared_ptr<const FormattingRule>>;

// Returns 'first' followed by 'second'.
FormattingRuleChain ConcatRuleChains(const FormattingRuleChain &first,
                                     const FormattingRuleChain &second);

// Supplies the language's default rule set.
class SyntaxFormattingService {
 public:
  virtual ~SyntaxFormattingService() = default;

  virtual FormattingRuleChain GetDefaultFormattingRules() const = 0;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_FORMATTING_FORMATTING_RULE_H_
