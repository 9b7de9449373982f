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

// Predicates deciding whether a token may anchor editor formatting.

#ifndef SMARTFMT_CSHARP_FORMATTING_TOKEN_FILTERS_H_
#define SMARTFMT_CSHARP_FORMATTING_TOKEN_FILTERS_H_

#include <string_view>

#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/text/text-structure.h"

namespace csharp {
namespace formatter {

// Characters whose typing may trigger formatting.
inline constexpr std::string_view kTriggerCharacters = ";{}#nte:)";

bool IsTriggerCharacter(char ch);

// Returns false when 'style' turns formatting on 'ch' off:
// '}' when close-brace formatting is off and smart indent is not active,
// ';' when semicolon formatting is off, '#' and 'n' without smart indent.
// Does not check IsTriggerCharacter().
bool IsTriggerEnabled(char ch, const smartfmt::BasicFormatStyle &style);

// True for tokens that never anchor formatting: no token, end of directive,
// end of file.
bool IsInvalidTokenKind(const smartfmt::SyntaxToken &token);

// True if IsInvalidTokenKind(), or if the text is not a single character.
bool IsInvalidSingleCharacterToken(const smartfmt::SyntaxToken &token);

// Returns true if 'token' is what typing 'ch' produced.
// 'n', 't' and 'e' only count as the last letter of the keywords
// region/endregion, select and where.  The other trigger characters must
// match a single-character token exactly.
bool MatchesTypedCharacter(char ch, const smartfmt::SyntaxToken &token);

// Context exclusions for typed characters:
// ')' outside of a using statement, ':' outside of a label, and '{' that
// is not the first token on its line.
bool ShouldNotFormatOnTypedCharacter(const smartfmt::TextStructureView &view,
                                     const smartfmt::SyntaxToken &token);

// Return formats only after the ')' of a using statement.
bool ShouldNotFormatOnReturn(const smartfmt::SyntaxToken &token);

// '{' never ends a formatting range.
bool IsEndToken(const smartfmt::SyntaxToken &token);

}  // namespace formatter
}  // namespace csharp

#endif  // SMARTFMT_CSHARP_FORMATTING_TOKEN_FILTERS_H_
