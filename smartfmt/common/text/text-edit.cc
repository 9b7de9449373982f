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

#include "smartfmt/common/text/text-edit.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"

namespace smartfmt {

std::ostream &operator<<(std::ostream &stream, const TextEdit &edit) {
  return stream << edit.span << " -> \"" << absl::CEscape(edit.replacement)
                << '"';
}

absl::StatusOr<std::string> ApplyEdits(std::string_view contents,
                                       const std::vector<TextEdit> &edits) {
  std::vector<const TextEdit *> sorted;
  sorted.reserve(edits.size());
  for (const auto &edit : edits) {
    if (!edit.span.valid() || edit.span.min < 0 ||
        edit.span.max > static_cast<int>(contents.length())) {
      return absl::OutOfRangeError(
          absl::StrCat("Edit ", edit.span.min, "..", edit.span.max,
                       " is outside of text of length ", contents.length()));
    }
    sorted.push_back(&edit);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TextEdit *a, const TextEdit *b) {
                     return a->span.min < b->span.min;
                   });

  std::string result;
  int prev_end = 0;
  for (const TextEdit *edit : sorted) {
    if (edit->span.min < prev_end) {
      return absl::InvalidArgumentError(
          absl::StrCat("Edits overlap at offset ", edit->span.min));
    }
    absl::StrAppend(&result,
                    contents.substr(prev_end, edit->span.min - prev_end),
                    edit->replacement);
    prev_end = edit->span.max;
  }
  absl::StrAppend(&result, contents.substr(prev_end));
  return result;
}

}  // namespace smartfmt
