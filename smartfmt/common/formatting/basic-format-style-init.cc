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

#include "smartfmt/common/formatting/basic-format-style-init.h"

#include "absl/flags/flag.h"
#include "smartfmt/common/formatting/basic-format-style.h"

ABSL_FLAG(int, indentation_spaces, 4,
          "Each indentation level adds this many spaces.");

ABSL_FLAG(smartfmt::IndentStyle, smart_indent, smartfmt::IndentStyle::kSmart,
          "Indentation mode of the editor: {none,block,smart}.  Formatting "
          "on '#' and on directive keywords requires 'smart'.");

ABSL_FLAG(bool, auto_format_on_close_brace, true,
          "Reformat the enclosing construct when '}' is typed.  When off, "
          "'}' only re-indents its own line (under smart indent).");

ABSL_FLAG(bool, auto_format_on_semicolon, true,
          "Reformat the completed statement when ';' is typed.");

namespace smartfmt {
void InitializeFromFlags(BasicFormatStyle *style) {
#define STYLE_FROM_FLAG(name) style->name = absl::GetFlag(FLAGS_##name)

  // Simply in the sequence as declared in struct BasicFormatStyle
  STYLE_FROM_FLAG(indentation_spaces);
  STYLE_FROM_FLAG(smart_indent);
  STYLE_FROM_FLAG(auto_format_on_close_brace);
  STYLE_FROM_FLAG(auto_format_on_semicolon);

#undef STYLE_FROM_FLAG
}
}  // namespace smartfmt
