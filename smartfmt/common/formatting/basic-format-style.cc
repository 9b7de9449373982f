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

#include "smartfmt/common/formatting/basic-format-style.h"

#include <ostream>
#include <string>
#include <string_view>

#include "smartfmt/common/util/enum-flags.h"

namespace smartfmt {

// This mapping defines how this enum is displayed and parsed.
const EnumNameMap<IndentStyle> &IndentStyleStrings() {
  static const EnumNameMap<IndentStyle> kIndentStyleStringMap({
      {"none", IndentStyle::kNone},
      {"block", IndentStyle::kBlock},
      {"smart", IndentStyle::kSmart},
  });
  return kIndentStyleStringMap;
}

std::ostream &operator<<(std::ostream &stream, IndentStyle p) {
  return IndentStyleStrings().Unparse(p, stream);
}

bool AbslParseFlag(std::string_view text, IndentStyle *mode,
                   std::string *error) {
  return IndentStyleStrings().Parse(text, mode, error, "IndentStyle");
}

std::string AbslUnparseFlag(const IndentStyle &mode) {
  return std::string{IndentStyleStrings().EnumName(mode)};
}

}  // namespace smartfmt
