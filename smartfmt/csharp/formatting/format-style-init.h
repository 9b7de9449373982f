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

#ifndef SMARTFMT_CSHARP_FORMATTING_FORMAT_STYLE_INIT_H_
#define SMARTFMT_CSHARP_FORMATTING_FORMAT_STYLE_INIT_H_

#include <string_view>

#include "absl/status/status.h"
#include "smartfmt/csharp/formatting/format-style.h"

namespace csharp {
namespace formatter {

// Initialize format style from flags
void InitializeFromFlags(FormatStyle *style);

// Parses a configuration string of the form
//   indentation_spaces:2; smart_indent:block; non_user_code_region:^Gen
// into 'style'.  Names are the FormatStyle field names.  On error, 'style'
// is left unchanged.
absl::Status ParseFormatStyle(std::string_view config, FormatStyle *style);

}  // namespace formatter
}  // namespace csharp

#endif  // SMARTFMT_CSHARP_FORMATTING_FORMAT_STYLE_INIT_H_
