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

// Formatting rules for C# editor formatting, and the services that supply
// rule chains to the trigger policy.

#ifndef SMARTFMT_CSHARP_FORMATTING_FORMATTING_RULES_H_
#define SMARTFMT_CSHARP_FORMATTING_FORMATTING_RULES_H_

#include "smartfmt/common/formatting/formatting-rule.h"

namespace csharp {
namespace formatter {

// Preprocessor directives: '#' starts at column 0 and is followed by its
// keyword without a space.
class DirectiveRule : public smartfmt::FormattingRule {
 public:
  void ApplyTo(smartfmt::LayoutContext *context) const final;
};

// Inter-token spacing, e.g. no space before ';' or after '('.
// Only decides gaps that no earlier rule has decided, so rules placed
// before it (such as PasteFormattingRule) keep their decisions.
class SpacingRule : public smartfmt::FormattingRule {
 public:
  void ApplyTo(smartfmt::LayoutContext *context) const final;
};

// Braces nest: '{' indents what follows, '}' outdents itself.
class BraceIndentationRule : public smartfmt::FormattingRule {
 public:
  void ApplyTo(smartfmt::LayoutContext *context) const final;
};

// Keeps the spacing of pasted code within each line, so that a paste only
// re-indents lines.  Must precede the default rules.
class PasteFormattingRule : public smartfmt::FormattingRule {
 public:
  void ApplyTo(smartfmt::LayoutContext *context) const final;
};

// Shifts all new-line indentation by a fixed number of spaces, for code
// embedded in a host document (e.g. a script block in markup).
class BaseIndentationRule : public smartfmt::FormattingRule {
 public:
  explicit BaseIndentationRule(int base_indentation)
      : base_indentation_(base_indentation) {}

  void ApplyTo(smartfmt::LayoutContext *context) const final;

 private:
  const int base_indentation_;
};

// Default rule set for C#: directives, spacing, brace indentation.
class CSharpSyntaxFormattingService
    : public smartfmt::SyntaxFormattingService {
 public:
  smartfmt::FormattingRuleChain GetDefaultFormattingRules() const final;
};

}  // namespace formatter
}  // namespace csharp

#endif  // SMARTFMT_CSHARP_FORMATTING_FORMATTING_RULES_H_
