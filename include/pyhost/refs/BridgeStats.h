/***
 * Name: pyhost::refs::BridgeStats
 * Purpose: Expose reference-management counters to tests and tooling.
 */
#pragma once

#include <cstdint>

namespace pyhost::refs {
    struct BridgeStats {
        uint64_t numBorrowed{0};       // acquisitions that incremented the foreign count
        uint64_t numReceived{0};       // acquisitions that adopted an owned reference
        uint64_t numClosed{0};         // synchronous releases
        uint64_t numEnqueued{0};       // deferred releases handed to the queue
        uint64_t numReclaimed{0};      // deferred releases applied by a drain
        uint64_t numTranslatedErrors{0};
        uint64_t peakPending{0};       // deepest the reclamation queue has been
    };
} // namespace pyhost::refs
