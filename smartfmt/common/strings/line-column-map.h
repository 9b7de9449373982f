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

// LineColumnMap translates byte-offset into line-column and back.
//
// usage:
// std::string_view text = ...;
// LineColumnMap lcmap(text);
// const int line = lcmap.LineAtOffset(caret_offset);
// const int line_start = lcmap.OffsetAtLine(line);

#ifndef SMARTFMT_COMMON_STRINGS_LINE_COLUMN_MAP_H_
#define SMARTFMT_COMMON_STRINGS_LINE_COLUMN_MAP_H_

#include <algorithm>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace smartfmt {

// Pair: line number and column number.
struct LineColumn {
  int line;    // 0-based index
  int column;  // 0-based byte index

  constexpr bool operator==(const LineColumn &r) const {
    return line == r.line && column == r.column;
  }
  constexpr bool operator<(const LineColumn &r) const {
    if (line < r.line) return true;
    if (line > r.line) return false;
    return column < r.column;
  }
};

std::ostream &operator<<(std::ostream &, const LineColumn &);

// Fast mapping of byte offsets to lines.
class LineColumnMap {
 public:
  explicit LineColumnMap(std::string_view text);

  // Number of lines; text without a trailing newline still counts its
  // last partial line.
  int NumLines() const { return beginning_of_line_offsets_.size(); }

  // Returns byte offset corresponding to the 0-based line number.
  // If lineno exceeds number of lines, return the start of the last line.
  int OffsetAtLine(size_t lineno) const {
    const size_t index =
        std::min(lineno, beginning_of_line_offsets_.size() - 1);
    return beginning_of_line_offsets_[index];
  }

  // Returns the offset one past the last character of 'lineno', excluding
  // the terminating newline.
  int EndOfLineOffset(size_t lineno) const;

  // Get line number at the given byte offset.
  int LineAtOffset(int bytes_offset) const;

  LineColumn GetLineColAtOffset(int bytes_offset) const;

  const std::vector<int> &GetBeginningOfLineOffsets() const {
    return beginning_of_line_offsets_;
  }

 private:
  // Index: line number, Value: byte offset that starts the line.
  // The first value will always be 0 because the beginning of the first line
  // has offset 0.
  std::vector<int> beginning_of_line_offsets_;

  // Length of the mapped text.
  int text_length_;
};

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_STRINGS_LINE_COLUMN_MAP_H_
