/***
 * Name: pyhost::metrics::PrintStats
 * Purpose: Pretty-print bridge counters.
 */
#include "pyhost/metrics/stats.h"

namespace pyhost::metrics {

void PrintStats(const refs::BridgeStats& stats, std::size_t pending, std::ostream& out) {
  out << "== Bridge stats ==\n";
  out << "  borrowed: " << stats.numBorrowed << "\n";
  out << "  received: " << stats.numReceived << "\n";
  out << "  closed: " << stats.numClosed << "\n";
  out << "  enqueued: " << stats.numEnqueued << "\n";
  out << "  reclaimed: " << stats.numReclaimed << "\n";
  out << "  pending: " << pending << " (peak " << stats.peakPending << ")\n";
  out << "  translated errors: " << stats.numTranslatedErrors << "\n";
}

} // namespace pyhost::metrics
