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

// C# token kinds: the token_enum values of TokenInfo in C# documents.

#ifndef SMARTFMT_CSHARP_CST_CSHARP_TOKEN_KINDS_H_
#define SMARTFMT_CSHARP_CST_CSHARP_TOKEN_KINDS_H_

#include <iosfwd>
#include <string_view>

#include "smartfmt/common/text/constants.h"

namespace csharp {

// Unscoped so that values compare directly with TokenInfo::token_enum().
enum TokenKind : int {
  kNone = smartfmt::TK_NONE,
#define CONSIDER(val) val,
#include "smartfmt/csharp/CST/csharp_token_kinds_foreach.inc"  // IWYU pragma: keep
#undef CONSIDER
};

static_assert(kEndOfFileToken == smartfmt::TK_EOF,
              "end-of-file must use the reserved token enum");

// Returns the name of a token kind, e.g. "kSemicolonToken".
std::string_view TokenKindToString(int kind);

std::ostream &operator<<(std::ostream &, TokenKind);

}  // namespace csharp

#endif  // SMARTFMT_CSHARP_CST_CSHARP_TOKEN_KINDS_H_
