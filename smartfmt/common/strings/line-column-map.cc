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

#include "smartfmt/common/strings/line-column-map.h"

#include <algorithm>  // for binary search
#include <iostream>
#include <iterator>
#include <string_view>
#include <vector>

namespace smartfmt {

// Print to the user as 1-based index because that is how lines
// and columns are indexed in every file diagnostic tool.
std::ostream &operator<<(std::ostream &out, const LineColumn &line_column) {
  return out << line_column.line + 1 << ':' << line_column.column + 1;
}

// Records locations of line breaks, which can then be used to translate
// offsets into line numbers.
// Offsets are monotonically increasing, and thus, are binary-searchable.
LineColumnMap::LineColumnMap(std::string_view text)
    : text_length_(text.length()) {
  beginning_of_line_offsets_.push_back(0);
  auto offset = text.find('\n');
  while (offset != std::string_view::npos) {
    beginning_of_line_offsets_.push_back(offset + 1);
    offset = text.find('\n', offset + 1);
  }
}

int LineColumnMap::EndOfLineOffset(size_t lineno) const {
  if (lineno + 1 >= beginning_of_line_offsets_.size()) return text_length_;
  // Exclude the '\n'.
  return beginning_of_line_offsets_[lineno + 1] - 1;
}

int LineColumnMap::LineAtOffset(int bytes_offset) const {
  // Find the first line start that is past the offset; the line before it
  // contains the offset.
  const auto base = std::upper_bound(beginning_of_line_offsets_.begin(),
                                     beginning_of_line_offsets_.end(),
                                     bytes_offset);
  return std::max<int>(
      std::distance(beginning_of_line_offsets_.begin(), base) - 1, 0);
}

LineColumn LineColumnMap::GetLineColAtOffset(int bytes_offset) const {
  const int line = LineAtOffset(bytes_offset);
  return {line, bytes_offset - beginning_of_line_offsets_[line]};
}

}  // namespace smartfmt
