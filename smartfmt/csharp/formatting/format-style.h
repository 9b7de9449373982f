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

#ifndef SMARTFMT_CSHARP_FORMATTING_FORMAT_STYLE_H_
#define SMARTFMT_CSHARP_FORMATTING_FORMAT_STYLE_H_

#include <memory>

#include "re2/re2.h"
#include "smartfmt/common/formatting/basic-format-style.h"

namespace csharp {
namespace formatter {

// Message of the #regions that designers generate, e.g.
// "#region Windows Form Designer generated code".
inline constexpr char kDefaultNonUserCodeRegion[] = "Designer generated code";

// Style parameters that are specific to C# editor formatting
struct FormatStyle : public smartfmt::BasicFormatStyle {
  FormatStyle()
      : non_user_code_region(
            std::make_shared<const re2::RE2>(kDefaultNonUserCodeRegion)) {}

  FormatStyle(const FormatStyle &) = default;
  FormatStyle &operator=(const FormatStyle &) = default;

  /*
   * InitializeFromFlags() [format-style-init.h] provides flags that are
   * named like these fields and allow configuration on the command line.
   * So field foo here can be configured with flag --foo
   */

  // Typing inside a #region whose message matches this pattern never
  // triggers formatting.  Null disables the check.
  std::shared_ptr<const re2::RE2> non_user_code_region;
};

}  // namespace formatter
}  // namespace csharp

#endif  // SMARTFMT_CSHARP_FORMATTING_FORMAT_STYLE_H_
