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

#ifndef SMARTFMT_COMMON_UTIL_ENUM_FLAGS_H_
#define SMARTFMT_COMMON_UTIL_ENUM_FLAGS_H_

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_join.h"
#include "smartfmt/common/util/logging.h"

namespace smartfmt {

/**
EnumNameMap provides a consistent way to parse and unparse enumerations with
string/named representations, which makes them usable as absl flags and as
values in configuration strings.

Usage:

////////////////// .h header file ///////////////////
enum class MyEnumType { ... };

std::ostream& operator<<(std::ostream& stream, MyEnumType p);

bool AbslParseFlag(std::string_view text, MyEnumType* mode,
                   std::string* error);
std::string AbslUnparseFlag(const MyEnumType& mode);

/////////////// .cc implementation file ////////////////
static const EnumNameMap<MyEnumType> kMyEnumTypeNames{{
  {"enum1", MyEnumType::kEnum1},
  {"enum2", MyEnumType::kEnum2},
}};
**/
template <typename EnumType>
class EnumNameMap {
  // String-literals are acceptable sources of these string_views.
  using key_type = std::string_view;

 public:
  // Pairs must contain unique keys and unique values.
  EnumNameMap(std::initializer_list<std::pair<key_type, EnumType>> pairs)
      : names_(pairs) {
    for (auto it = names_.begin(); it != names_.end(); ++it) {
      for (auto other = names_.begin(); other != it; ++other) {
        CHECK(other->first != it->first) << "Duplicate key: " << it->first;
        CHECK(other->second != it->second)
            << "Duplicate value for key: " << it->first;
      }
    }
  }

  EnumNameMap(const EnumNameMap &) = delete;
  EnumNameMap &operator=(const EnumNameMap &) = delete;

  // Print a list of string representations of the enums.
  std::ostream &ListNames(std::ostream &stream, std::string_view sep) const {
    return stream << absl::StrJoin(
               names_, sep, [](std::string *out, const auto &p) {
                 out->append(p.first.begin(), p.first.end());
               });
  }

  // Converts the name of an enum to its corresponding value.
  // 'type_name' is a text name for the enum type used in diagnostics.
  // Returns true if successful.
  bool Parse(key_type text, EnumType *enum_value, std::ostream &errstream,
             std::string_view type_name) const {
    for (const auto &p : names_) {
      if (p.first == text) {
        *enum_value = p.second;
        return true;
      }
    }
    errstream << "Invalid " << type_name << ": '" << text
              << "'\nValid options are: ";
    ListNames(errstream, ",");
    return false;
  }

  // This variant writes diagnostics to the 'error' string.
  bool Parse(key_type text, EnumType *enum_value, std::string *error,
             std::string_view type_name) const {
    std::ostringstream stream;
    const bool success = Parse(text, enum_value, stream, type_name);
    *error += stream.str();
    return success;
  }

  // Returns the string representation of an enum.
  std::string_view EnumName(EnumType value) const {
    for (const auto &p : names_) {
      if (p.second == value) return p.first;
    }
    return "???";
  }


  std::ostream &Unparse(EnumType value, std::ostream &stream) const {
    return stream << EnumName(value);
  }

 private:
  // Few entries; linear search keeps declaration order for diagnostics.
  std::vector<std::pair<key_type, EnumType>> names_;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_UTIL_ENUM_FLAGS_H_
