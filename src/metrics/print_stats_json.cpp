/***
 * Name: pyhost::metrics::PrintStatsJson
 * Purpose: Print bridge counters in JSON for consumption by tools.
 * Theory of Operation: Every value is an unsigned integer, so no string
 *   escaping is needed.
 */
#include "pyhost/metrics/stats.h"

namespace pyhost::metrics {

void PrintStatsJson(const refs::BridgeStats& stats, std::size_t pending, std::ostream& out) {
  out << "{";
  out << "\n  \"borrowed\": " << stats.numBorrowed << ",";
  out << "\n  \"received\": " << stats.numReceived << ",";
  out << "\n  \"closed\": " << stats.numClosed << ",";
  out << "\n  \"enqueued\": " << stats.numEnqueued << ",";
  out << "\n  \"reclaimed\": " << stats.numReclaimed << ",";
  out << "\n  \"pending\": " << pending << ",";
  out << "\n  \"peak_pending\": " << stats.peakPending << ",";
  out << "\n  \"translated_errors\": " << stats.numTranslatedErrors;
  out << "\n}\n";
}

} // namespace pyhost::metrics
