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

#include "smartfmt/csharp/CST/csharp-nonterminals.h"

#include <ostream>
#include <string>

#include "absl/strings/str_cat.h"

namespace csharp {

std::string NodeEnumToString(NodeEnum node_enum) {
  switch (node_enum) {
    case NodeEnum::kUntagged:
      return "kUntagged";
#define CONSIDER(val) \
  case NodeEnum::val: \
    return #val;
#include "smartfmt/csharp/CST/csharp_nonterminals_foreach.inc"  // IWYU pragma: keep
#undef CONSIDER
    default:
      return absl::StrCat("No Associated String: ",
                          static_cast<int>(node_enum));
  }
}

std::ostream &operator<<(std::ostream &stream, const NodeEnum &e) {
  return stream << NodeEnumToString(e);
}

bool IsSwitchLabel(NodeEnum node_enum) {
  switch (node_enum) {
    case NodeEnum::kCaseSwitchLabel:
    case NodeEnum::kDefaultSwitchLabel:
      return true;
    default:
      return false;
  }
}

bool IsRegionDirective(NodeEnum node_enum) {
  return node_enum == NodeEnum::kRegionDirectiveTrivia ||
         node_enum == NodeEnum::kEndRegionDirectiveTrivia;
}

}  // namespace csharp
