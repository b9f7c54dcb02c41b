/***
 * Name: test_stats_output
 * Purpose: Text and JSON rendering of bridge counters.
 */
#include <gtest/gtest.h>

#include <sstream>

#include "pyhost/metrics/stats.h"

namespace {
pyhost::refs::BridgeStats sample() {
  pyhost::refs::BridgeStats stats;
  stats.numBorrowed = 4;
  stats.numReceived = 9;
  stats.numClosed = 3;
  stats.numEnqueued = 10;
  stats.numReclaimed = 8;
  stats.numTranslatedErrors = 1;
  stats.peakPending = 5;
  return stats;
}
} // namespace

TEST(StatsOutput, Text) {
  std::ostringstream out;
  pyhost::metrics::PrintStats(sample(), 2, out);
  const auto text = out.str();
  EXPECT_EQ(text.rfind("== Bridge stats ==\n", 0), 0u);
  EXPECT_NE(text.find("  received: 9\n"), std::string::npos);
  EXPECT_NE(text.find("  pending: 2 (peak 5)\n"), std::string::npos);
  EXPECT_NE(text.find("  translated errors: 1\n"), std::string::npos);
}

TEST(StatsOutput, Json) {
  std::ostringstream out;
  pyhost::metrics::PrintStatsJson(sample(), 2, out);
  EXPECT_EQ(out.str(),
            "{\n"
            "  \"borrowed\": 4,\n"
            "  \"received\": 9,\n"
            "  \"closed\": 3,\n"
            "  \"enqueued\": 10,\n"
            "  \"reclaimed\": 8,\n"
            "  \"pending\": 2,\n"
            "  \"peak_pending\": 5,\n"
            "  \"translated_errors\": 1\n"
            "}\n");
}
