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

#include "smartfmt/common/text/config-utils.h"

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "re2/re2.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {
using config::NVConfigSpec;

absl::Status ParseNameValues(std::string_view config_string,
                             const std::initializer_list<NVConfigSpec> &spec) {
  for (std::string_view single_config :
       absl::StrSplit(config_string, absl::ByAnyChar(";\n"),
                      absl::SkipWhitespace())) {
    std::pair<std::string_view, std::string_view> nv_pair =
        absl::StrSplit(single_config, absl::MaxSplits(':', 1));
    nv_pair.first = absl::StripAsciiWhitespace(nv_pair.first);
    nv_pair.second = absl::StripAsciiWhitespace(nv_pair.second);
    const auto value_config = std::find_if(  // linear search
        spec.begin(), spec.end(),
        [&nv_pair](const NVConfigSpec &s) { return nv_pair.first == s.name; });
    if (value_config == spec.end()) {
      std::string available;
      for (const auto &s : spec) {
        if (!available.empty()) available.append(", ");
        available.append("'").append(s.name).append("'");
      }
      const bool plural = spec.size() > 1;
      return absl::InvalidArgumentError(absl::StrCat(
          nv_pair.first, ": unknown parameter; supported ",
          (plural ? "parameters are " : "parameter is "), available));
    }
    if (!value_config->set_value) continue;  // accepted, but unused
    const absl::Status result = value_config->set_value(nv_pair.second);
    if (!result.ok()) {
      // The setter only knows the value; name the parameter here.
      return absl::InvalidArgumentError(
          absl::StrCat(nv_pair.first, ": ", result.message()));
    }
  }
  return absl::OkStatus();
}

namespace config {
ConfigValueSetter SetInt(int *value, int minimum, int maximum) {
  CHECK(value) << "Must provide pointer to integer to store.";
  return [value, minimum, maximum](std::string_view v) {
    int parsed_value;
    if (!absl::SimpleAtoi(v, &parsed_value)) {
      return absl::InvalidArgumentError(
          absl::StrCat("'", v, "': Cannot parse integer"));
    }
    if (parsed_value < minimum || parsed_value > maximum) {
      return absl::InvalidArgumentError(absl::StrCat(
          parsed_value, " out of range [", minimum, "...", maximum, "]"));
    }
    *value = parsed_value;
    return absl::OkStatus();
  };
}

ConfigValueSetter SetInt(int *value) {
  return SetInt(value, std::numeric_limits<int>::min(),
                std::numeric_limits<int>::max());
}

ConfigValueSetter SetBool(bool *value) {
  CHECK(value) << "Must provide pointer to boolean to store.";
  return [value](std::string_view v) {
    // clang-format off
    if (v.empty() || v == "1"
        || absl::EqualsIgnoreCase(v, "true")
        || absl::EqualsIgnoreCase(v, "on")) {
      *value = true;
      return absl::OkStatus();
    }
    if (v == "0"
        || absl::EqualsIgnoreCase(v, "false")
        || absl::EqualsIgnoreCase(v, "off")) {
      *value = false;
      return absl::OkStatus();
    }
    // clang-format on
    return absl::InvalidArgumentError(
        "Boolean value should be one of "
        "'true', 'on' or 'false', 'off'");
  };
}

ConfigValueSetter SetRegex(std::shared_ptr<const re2::RE2> *regex) {
  CHECK(regex) << "Must provide pointer to a RE2 to store.";
  return [regex](std::string_view v) {
    if (v.empty()) {
      regex->reset();
      return absl::OkStatus();
    }
    auto parsed = std::make_shared<const re2::RE2>(v, re2::RE2::Quiet);
    if (!parsed->ok()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Failed to parse regular expression: ", parsed->error()));
    }
    *regex = std::move(parsed);
    return absl::OkStatus();
  };
}

}  // namespace config
}  // namespace smartfmt
