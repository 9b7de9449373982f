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

#ifndef SMARTFMT_COMMON_TEXT_CONSTANTS_H_
#define SMARTFMT_COMMON_TEXT_CONSTANTS_H_

namespace smartfmt {

// Token enum reserved for "no token", e.g. the kind of a missing token.
constexpr int TK_NONE = -1;

// Token enum reserved for end-of-file.  Language token enumerations start
// their numbering here.
constexpr int TK_EOF = 0;

// Tag of a SyntaxTreeNode that was constructed without one.
constexpr int kUntagged = -1;

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_CONSTANTS_H_
