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

#ifndef SMARTFMT_COMMON_TEXT_TOKEN_INFO_H_
#define SMARTFMT_COMMON_TEXT_TOKEN_INFO_H_

#include <iosfwd>
#include <iterator>
#include <string>
#include <string_view>

#include "smartfmt/common/text/constants.h"

namespace smartfmt {

// TokenInfo describes the kind and location of a lexed token.
// Reminder: The text string_view doesn't own its memory, so the owner must
// always out-live the token.
class TokenInfo {
 public:
  // Construct an EOF token that points to the end of a string buffer.
  static TokenInfo EOFToken(std::string_view buffer);

  TokenInfo() = delete;

  TokenInfo(int token_enum, std::string_view text)
      : token_enum_(token_enum), text_(text) {}

  TokenInfo(const TokenInfo &) = default;
  TokenInfo(TokenInfo &&) = default;
  TokenInfo &operator=(const TokenInfo &) = default;

  int token_enum() const { return token_enum_; }
  std::string_view text() const { return text_; }

  // Return position of this token's text start relative to a base buffer.
  int left(std::string_view base) const {
    return std::distance(base.begin(), text_.begin());
  }

  // Return position of this token's text end relative to a base buffer.
  int right(std::string_view base) const {
    return std::distance(base.begin(), text_.end());
  }

  // Prints token representation without byte offsets.
  std::ostream &ToStream(std::ostream &) const;

  std::string ToString() const;

  // 'Moves' text string_view to point to another buffer, where the
  // contents still matches.  It is the caller's responsibility that
  // new_text points to valid memory that outlives this token.
  void RebaseStringView(std::string_view new_text);

  // Equal tokens have the same enum and the same buffer range (not only the
  // same contents).
  bool operator==(const TokenInfo &token) const;
  bool operator!=(const TokenInfo &token) const { return !(*this == token); }

  bool isEOF() const { return token_enum_ == TK_EOF; }

 protected:
  int token_enum_;

  // The substring of a larger text that this token represents.
  std::string_view text_;
};

std::ostream &operator<<(std::ostream &, const TokenInfo &);

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_TOKEN_INFO_H_
