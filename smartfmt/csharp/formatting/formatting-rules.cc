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

#include "smartfmt/csharp/formatting/formatting-rules.h"

#include <memory>

#include "smartfmt/common/formatting/formatting-rule.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/common/util/logging.h"
#include "smartfmt/common/util/with-reason.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"
#include "smartfmt/csharp/CST/statement.h"

namespace csharp {
namespace formatter {

using smartfmt::FormattingRuleChain;
using smartfmt::LayoutContext;
using smartfmt::SpacingOptions;
using smartfmt::SyntaxToken;
using smartfmt::WithReason;

// Signal that spacing was not explicitly handled in case logic.
// This value must be negative.
static constexpr int kUnhandledSpacesRequired = -1;

static bool IsDirectiveHash(const SyntaxToken &token) {
  return token.Kind() == kHashToken && IsRegionDirectiveParent(token);
}

void DirectiveRule::ApplyTo(LayoutContext *context) const {
  if (IsDirectiveHash(context->right)) {
    context->indentation_override = 0;
  }
  if (IsDirectiveHash(context->left) &&
      context->spacing == SpacingOptions::kUndecided) {
    context->spacing = SpacingOptions::kSpaces;
    context->spaces_required = 0;
  }
}

// Returns minimum number of spaces required between left and right token.
static WithReason<int> SpacesRequiredBetween(const SyntaxToken &left,
                                             const SyntaxToken &right) {
  // Higher precedence rules should be handled earlier in this function.
  switch (right.Kind()) {
    case kSemicolonToken:
    case kCommaToken:
    case kCloseParenToken:
    case kCloseBracketToken:
    case kDotToken:
      return {0, "No space before ; , ) ] ."};
    default:
      break;
  }

  switch (left.Kind()) {
    case kOpenParenToken:
    case kOpenBracketToken:
    case kDotToken:
    case kExclamationToken:
      return {0, "No space after ( [ . !"};
    default:
      break;
  }

  if (left.Kind() == kIdentifierToken &&
      (right.Kind() == kOpenParenToken || right.Kind() == kOpenBracketToken)) {
    return {0, "Invocation or indexing: no space before ( ["};
  }

  if (right.Kind() == kColonToken && IsLabelOrSwitchLabelParent(right)) {
    return {0, "No space before the ':' of a label"};
  }

  return {kUnhandledSpacesRequired, "Default: unhandled case"};
}

void SpacingRule::ApplyTo(LayoutContext *context) const {
  // Default for unhandled cases.
  constexpr int kUnhandledSpacesDefault = 1;
  if (context->spacing != SpacingOptions::kUndecided) return;
  context->spacing = SpacingOptions::kSpaces;
  if (context->left.Leaf() == nullptr) return;

  const auto spaces = SpacesRequiredBetween(context->left, context->right);
  VLOG(3) << "spaces: " << spaces.value << ", reason: " << spaces.reason;
  context->spaces_required = spaces.value == kUnhandledSpacesRequired
                                 ? kUnhandledSpacesDefault
                                 : spaces.value;
}

void BraceIndentationRule::ApplyTo(LayoutContext *context) const {
  switch (context->right.Kind()) {
    case kOpenBraceToken:
      context->depth_after = 1;
      break;
    case kCloseBraceToken:
      context->depth_before = -1;
      break;
    default:
      break;
  }
}

void PasteFormattingRule::ApplyTo(LayoutContext *context) const {
  if (!context->line_break) context->spacing = SpacingOptions::kPreserve;
}

void BaseIndentationRule::ApplyTo(LayoutContext *context) const {
  context->extra_indentation = base_indentation_;
}

FormattingRuleChain CSharpSyntaxFormattingService::GetDefaultFormattingRules()
    const {
  return {std::make_shared<DirectiveRule>(), std::make_shared<SpacingRule>(),
          std::make_shared<BraceIndentationRule>()};
}

}  // namespace formatter
}  // namespace csharp
