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

#ifndef SMARTFMT_COMMON_UTIL_CASTS_H_
#define SMARTFMT_COMMON_UTIL_CASTS_H_

#include <cassert>
#include <type_traits>

namespace smartfmt {

// Checked (in debug builds with RTTI) static downcast of a syntax tree
// reference, e.g. Symbol& -> SyntaxTreeNode&.
template <typename To, typename From>
inline To down_cast(From &f) {
  static_assert(std::is_lvalue_reference_v<To>, "target type not a reference");
  static_assert((std::is_base_of_v<From, std::remove_reference_t<To>>),
                "target type not derived from source type");
#if !defined(__GNUC__) || defined(__GXX_RTTI)
  assert(dynamic_cast<std::remove_reference_t<To> *>(&f) != nullptr);
#endif
  return static_cast<To>(f);
}

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_UTIL_CASTS_H_
