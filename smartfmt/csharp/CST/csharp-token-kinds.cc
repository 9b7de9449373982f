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

#include "smartfmt/csharp/CST/csharp-token-kinds.h"

#include <ostream>
#include <string_view>

namespace csharp {

std::string_view TokenKindToString(int kind) {
  switch (kind) {
    case kNone:
      return "kNone";
#define CONSIDER(val) \
  case val:           \
    return #val;
#include "smartfmt/csharp/CST/csharp_token_kinds_foreach.inc"  // IWYU pragma: keep
#undef CONSIDER
    default:
      return "???";
  }
}

std::ostream &operator<<(std::ostream &stream, TokenKind kind) {
  return stream << TokenKindToString(kind);
}

}  // namespace csharp
