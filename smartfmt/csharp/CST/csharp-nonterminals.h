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

#ifndef SMARTFMT_CSHARP_CST_CSHARP_NONTERMINALS_H_
#define SMARTFMT_CSHARP_CST_CSHARP_NONTERMINALS_H_

#include <iosfwd>
#include <string>

#include "smartfmt/common/text/constants.h"

namespace csharp {

// Tags of C# syntax tree nodes.
enum class NodeEnum {
  kUntagged = smartfmt::kUntagged,
#define CONSIDER(val) val,
#include "smartfmt/csharp/CST/csharp_nonterminals_foreach.inc"  // IWYU pragma: keep
#undef CONSIDER
  kInvalidTag,  // sentinel, keep last
};

// Stringify function for NodeEnum
std::string NodeEnumToString(NodeEnum node_enum);

std::ostream &operator<<(std::ostream &stream, const NodeEnum &e);

// Returns true for 'case ...:' and 'default:' labels.
bool IsSwitchLabel(NodeEnum node_enum);

// Returns true for #region and #endregion directive nodes.
bool IsRegionDirective(NodeEnum node_enum);

}  // namespace csharp

#endif  // SMARTFMT_CSHARP_CST_CSHARP_NONTERMINALS_H_
