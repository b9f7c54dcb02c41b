/***
 * Name: pyhost::metrics
 * Purpose: Report bridge counters for --metrics/--metrics-json and bench_refs.
 * Inputs:
 *   - stats: snapshot from ReferenceManager::stats()
 *   - pending: current reclamation queue depth
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Text is one "name: value" line per counter under a
 *   "== Bridge stats ==" header; JSON is a single flat object with the same
 *   counters in snake_case.
 */
#pragma once

#include <cstddef>
#include <ostream>

#include "pyhost/refs/BridgeStats.h"

namespace pyhost::metrics {

void PrintStats(const refs::BridgeStats& stats, std::size_t pending, std::ostream& out);

void PrintStatsJson(const refs::BridgeStats& stats, std::size_t pending, std::ostream& out);

} // namespace pyhost::metrics
