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

#include "smartfmt/csharp/formatting/format-style-init.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "re2/re2.h"
#include "smartfmt/common/formatting/basic-format-style-init.h"
#include "smartfmt/common/formatting/basic-format-style.h"
#include "smartfmt/common/text/config-utils.h"
#include "smartfmt/common/util/logging.h"
#include "smartfmt/csharp/formatting/format-style.h"

ABSL_FLAG(std::string, non_user_code_region,
          csharp::formatter::kDefaultNonUserCodeRegion,
          "Regular expression (RE2) for the message of #regions that hold "
          "generated code, in which typing never triggers formatting.  "
          "Empty disables the check.");

namespace csharp {
namespace formatter {

void InitializeFromFlags(FormatStyle *style) {
  smartfmt::InitializeFromFlags(style);  // Initialize BasicFormatStyle

  const std::string pattern = absl::GetFlag(FLAGS_non_user_code_region);
  if (pattern.empty()) {
    style->non_user_code_region = nullptr;
    return;
  }
  auto regex = std::make_shared<const re2::RE2>(pattern, re2::RE2::Quiet);
  if (!regex->ok()) {
    LOG(WARNING) << "Ignoring --non_user_code_region: " << regex->error();
    return;
  }
  style->non_user_code_region = std::move(regex);
}

absl::Status ParseFormatStyle(std::string_view config, FormatStyle *style) {
  using smartfmt::config::SetBool;
  using smartfmt::config::SetEnum;
  using smartfmt::config::SetInt;
  using smartfmt::config::SetRegex;

  FormatStyle parsed(*style);
  const absl::Status status = smartfmt::ParseNameValues(
      config,
      {{"indentation_spaces", SetInt(&parsed.indentation_spaces, 0, 16)},
       {"smart_indent", SetEnum(&parsed.smart_indent,
                                smartfmt::IndentStyleStrings(), "IndentStyle")},
       {"auto_format_on_close_brace",
        SetBool(&parsed.auto_format_on_close_brace)},
       {"auto_format_on_semicolon", SetBool(&parsed.auto_format_on_semicolon)},
       {"non_user_code_region", SetRegex(&parsed.non_user_code_region)}});
  if (!status.ok()) return status;
  *style = parsed;
  return absl::OkStatus();
}

}  // namespace formatter
}  // namespace csharp
