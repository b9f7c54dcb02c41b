/***
 * Name: pyhost::coerce::Range
 * Purpose: Host description of an integer range, exported as a Python slice.
 * Theory of Operation: An exclusive range maps to slice(start, end, step). An
 *   inclusive range maps to slice(start, end + 1, step), except that an
 *   inclusive end of -1 (or the largest long long) means "through the last
 *   element" and maps to slice(start, None, step).
 */
#pragma once

namespace pyhost::coerce {

struct Range {
  long long start{0};
  long long end{0};
  long long step{1};
  bool inclusive{false};

  static Range until(long long start, long long end, long long step = 1) { return Range{start, end, step, false}; }
  static Range to(long long start, long long end, long long step = 1) { return Range{start, end, step, true}; }
};

} // namespace pyhost::coerce
