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

#include "smartfmt/common/text/token-info.h"

#include <ostream>
#include <sstream>  // IWYU pragma: keep  // for ostringstream
#include <string>
#include <string_view>

#include "absl/strings/escaping.h"
#include "smartfmt/common/text/constants.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {

TokenInfo TokenInfo::EOFToken(std::string_view buffer) {
  return {TK_EOF, std::string_view(buffer.data() + buffer.length(), 0)};
}

bool TokenInfo::operator==(const TokenInfo &token) const {
  return token_enum_ == token.token_enum_ &&
         text_.data() == token.text_.data() &&
         text_.length() == token.text_.length();
}

std::ostream &TokenInfo::ToStream(std::ostream &output_stream) const {
  return output_stream << "(#" << token_enum_ << ": \"" << absl::CEscape(text_)
                       << "\")";
}

std::string TokenInfo::ToString() const {
  std::ostringstream output_stream;
  ToStream(output_stream);
  return output_stream.str();
}

void TokenInfo::RebaseStringView(std::string_view new_text) {
  CHECK_EQ(text_, new_text) << "Only rebase onto identical contents.";
  text_ = new_text;
}

// Print human-readable token information.
std::ostream &operator<<(std::ostream &stream, const TokenInfo &token) {
  return token.ToStream(stream);
}

}  // namespace smartfmt
