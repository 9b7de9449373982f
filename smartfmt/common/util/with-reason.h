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

#ifndef SMARTFMT_COMMON_UTIL_WITH_REASON_H_
#define SMARTFMT_COMMON_UTIL_WITH_REASON_H_

namespace smartfmt {

// Pairs a value with the explanation of why it was chosen, for functions
// that return the first matching case out of a priority-ordered list.
// The explanation is meant for debug logging.
//
//   WithReason<int> SpacesBetween(...) {
//     if (...) return {0, "No space before semicolon"};
//     ...
//   }
template <typename T>
struct WithReason {
  T value;
  const char *reason;  // A string literal.
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_UTIL_WITH_REASON_H_
