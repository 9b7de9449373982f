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

#ifndef SMARTFMT_COMMON_UTIL_INTERVAL_H_
#define SMARTFMT_COMMON_UTIL_INTERVAL_H_

#include <ostream>

namespace smartfmt {

// An integer-valued interval, representing [min, max).
// Byte ranges of a text buffer (selections, paste regions, edit spans) are
// expressed as Interval<int>.
template <typename T>
struct Interval {
  using value_type = T;

  // Allow direct access.  Use responsibly.  Check valid()-ity.
  T min = {};
  T max = {};

  Interval() = default;
  Interval(const T &f, const T &s) : min(f), max(s) {}

  bool empty() const { return min == max; }

  bool valid() const { return min <= max; }

  T length() const { return max - min; }

  // Returns true if integer value is in [min, max).
  bool contains(const T &value) const { return value >= min && value < max; }

  // Returns true if other range is in [min, max).
  bool contains(const Interval<T> &other) const {
    return min <= other.min && max >= other.max;
  }

  bool operator==(const Interval<T> &other) const {
    return min == other.min && max == other.max;
  }

  bool operator!=(const Interval<T> &other) const { return !(*this == other); }
};

template <typename T>
std::ostream &operator<<(std::ostream &stream, const Interval<T> &interval) {
  return stream << '[' << interval.min << ", " << interval.max << ')';
}

}  // namespace smartfmt

#endif  // SMARTFMT_COMMON_UTIL_INTERVAL_H_
