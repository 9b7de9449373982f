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

#ifndef SMARTFMT_COMMON_TEXT_TEXT_EDIT_H_
#define SMARTFMT_COMMON_TEXT_TEXT_EDIT_H_

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "smartfmt/common/util/interval.h"

namespace smartfmt {

// Replaces the bytes [span.min, span.max) of a document with 'replacement'.
// Offsets refer to the document before any edit of the same batch applies.
struct TextEdit {
  Interval<int> span;
  std::string replacement;

  bool operator==(const TextEdit &other) const {
    return span == other.span && replacement == other.replacement;
  }
  bool operator!=(const TextEdit &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &, const TextEdit &);

// Applies a batch of edits to 'contents'.  Edits may come in any order, but
// must not overlap and must lie within 'contents'.
absl::StatusOr<std::string> ApplyEdits(std::string_view contents,
                                       const std::vector<TextEdit> &edits);

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_TEXT_TEXT_EDIT_H_
