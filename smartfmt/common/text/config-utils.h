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

#ifndef SMARTFMT_COMMON_TEXT_CONFIG_UTILS_H_
#define SMARTFMT_COMMON_TEXT_CONFIG_UTILS_H_

#include <functional>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "re2/re2.h"
#include "smartfmt/common/util/enum-flags.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {
namespace config {
using ConfigValueSetter = std::function<absl::Status(std::string_view)>;

struct NVConfigSpec {
  const char *name;
  ConfigValueSetter set_value;
};
}  // namespace config

// Parses name/value pairs from a string and directly sets user values.
//
// The "config_string" contains colon-separated name:value pairs, separated
// by semicolon or newline, e.g. 'indentation_spaces:2; smart_indent:block'.
// Whitespace around names and values is ignored.
//
// For each parsed pair, the setter associated with that name in "spec" is
// called with the value.  A name not found in "spec" is an error, and so is
// any error returned by a setter; the error message is prefixed with the
// offending name.
//
// Sample call:
// return ParseNameValues(configuration_string,
//                        {{"indentation_spaces", SetInt(&indentation, 0, 16)},
//                         {"auto_format_on_semicolon", SetBool(&on_semi)}});
absl::Status ParseNameValues(
    std::string_view config_string,
    const std::initializer_list<config::NVConfigSpec> &spec);

namespace config {

// Setter factories for ParseNameValues() that parse values directly into
// variables.

ConfigValueSetter SetInt(int *value);

// Set an integer value and validate that it is in [minimum...maximum] range.
ConfigValueSetter SetInt(int *value, int minimum, int maximum);
ConfigValueSetter SetBool(bool *value);

// Set an enum by one of its names in 'names'.  'names' must outlive the
// returned setter.
template <typename EnumType>
ConfigValueSetter SetEnum(EnumType *value, const EnumNameMap<EnumType> &names,
                          std::string_view type_name) {
  CHECK(value) << "Must provide pointer to enum to store.";
  return [value, &names, type_name](std::string_view v) {
    std::ostringstream errstream;
    if (names.Parse(v, value, errstream, type_name)) return absl::OkStatus();
    return absl::InvalidArgumentError(errstream.str());
  };
}

// Set a regular expression.  An empty value clears it.
ConfigValueSetter SetRegex(std::shared_ptr<const re2::RE2> *regex);

}  // namespace config
}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_CONFIG_UTILS_H_
