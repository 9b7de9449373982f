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

#ifndef SMARTFMT_COMMON_FORMATTING_BASIC_FORMAT_STYLE_H_
#define SMARTFMT_COMMON_FORMATTING_BASIC_FORMAT_STYLE_H_

#include <iosfwd>
#include <string>
#include <string_view>

#include "smartfmt/common/util/enum-flags.h"

namespace smartfmt {

// How the editor indents a new or re-typed line.
enum class IndentStyle {
  kNone,   // keep the indentation of the previous line verbatim
  kBlock,  // follow the enclosing block
  kSmart,  // compute from the surrounding syntax
};

// Names of the IndentStyle values, for flags and configuration strings.
const EnumNameMap<IndentStyle> &IndentStyleStrings();

std::ostream &operator<<(std::ostream &, IndentStyle);

bool AbslParseFlag(std::string_view text, IndentStyle *mode,
                   std::string *error);

std::string AbslUnparseFlag(const IndentStyle &mode);

// Language-agnostic editor formatting options.
struct BasicFormatStyle {
  // Each indentation level adds this many spaces.
  int indentation_spaces = 4;

  IndentStyle smart_indent = IndentStyle::kSmart;

  // Reformat the enclosing construct when '}' is typed.
  bool auto_format_on_close_brace = true;

  // Reformat the completed statement when ';' is typed.
  bool auto_format_on_semicolon = true;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_FORMATTING_BASIC_FORMAT_STYLE_H_
