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

#include "smartfmt/csharp/formatting/token-filters.h"

#include <string_view>

#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/text/text-structure.h"
#include "smartfmt/csharp/CST/csharp-token-kinds.h"
#include "smartfmt/csharp/CST/statement.h"

namespace csharp {
namespace formatter {

using smartfmt::BasicFormatStyle;
using smartfmt::IndentStyle;
using smartfmt::SyntaxToken;

bool IsTriggerCharacter(char ch) {
  return kTriggerCharacters.find(ch) != std::string_view::npos;
}

bool IsTriggerEnabled(char ch, const BasicFormatStyle &style) {
  const bool smart_indent = style.smart_indent == IndentStyle::kSmart;
  switch (ch) {
    case '}':
      return style.auto_format_on_close_brace || smart_indent;
    case ';':
      return style.auto_format_on_semicolon;
    case '#':
    case 'n':
      return smart_indent;
    default:
      return true;
  }
}

bool IsInvalidTokenKind(const SyntaxToken &token) {
  switch (token.Kind()) {
    case kNone:
    case kEndOfDirectiveToken:
    case kEndOfFileToken:
      return true;
    default:
      return false;
  }
}

bool IsInvalidSingleCharacterToken(const SyntaxToken &token) {
  return IsInvalidTokenKind(token) || token.Text().length() != 1;
}

bool MatchesTypedCharacter(char ch, const SyntaxToken &token) {
  switch (ch) {
    case 'n':
      return token.Kind() == kRegionKeyword ||
             token.Kind() == kEndRegionKeyword;
    case 't':
      return token.Kind() == kSelectKeyword;
    case 'e':
      return token.Kind() == kWhereKeyword;
    default:
      return !IsInvalidSingleCharacterToken(token) && token.Text()[0] == ch;
  }
}

bool ShouldNotFormatOnTypedCharacter(const smartfmt::TextStructureView &view,
                                     const SyntaxToken &token) {
  switch (token.Kind()) {
    case kCloseParenToken:
      return !IsUsingStatementParent(token);
    case kColonToken:
      return !IsLabelOrSwitchLabelParent(token);
    case kOpenBraceToken:
      // Only format a '{' that starts its line.
      return !view.IsFirstTokenOnLine(token);
    default:
      return false;
  }
}

bool ShouldNotFormatOnReturn(const SyntaxToken &token) {
  return token.Kind() != kCloseParenToken || !IsUsingStatementParent(token);
}

bool IsEndToken(const SyntaxToken &token) {
  return token.Kind() != kOpenBraceToken;
}

}  // namespace formatter
}  // namespace csharp
