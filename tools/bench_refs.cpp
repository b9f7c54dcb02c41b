/**
 * Reference bridge benchmark: acquisition and release throughput with
 * synchronous close vs. deferred reclamation, and with drops from a second thread.
 * Usage: bench_refs [iters]
 */
#include "pyhost/metrics/stats.h"
#include "pyhost/pyhost.h"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

using pyhost::object::ProxyObject;

int main(int argc, char** argv) {
  std::size_t iters = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 200000;

  try {
    auto python = pyhost::interp::Interpreter::start();
    auto& bridge = python->bridge();

    auto report = [&](const char* label, auto&& body) {
      const auto before = bridge.refs().stats();
      const auto t0 = std::chrono::steady_clock::now();
      body();
      bridge.refs().reclaim();
      const auto t1 = std::chrono::steady_clock::now();
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
      const auto st = bridge.refs().stats();
      std::cout << "[" << label << "]"
                << " iters=" << iters
                << " time_ms=" << ms
                << " received=" << (st.numReceived - before.numReceived)
                << " borrowed=" << (st.numBorrowed - before.numBorrowed)
                << " closed=" << (st.numClosed - before.numClosed)
                << " reclaimed=" << (st.numReclaimed - before.numReclaimed)
                << " peak_pending=" << st.peakPending
                << "\n";
    };

    report("close", [&] {
      for (std::size_t i = 0; i < iters; ++i) {
        ProxyObject value = bridge.box(static_cast<long long>(i));
        value.close();
      }
    });

    report("deferred", [&] {
      for (std::size_t i = 0; i < iters; ++i) {
        ProxyObject value = bridge.box(static_cast<long long>(i));
        ProxyObject copy = value;
      }
    });

    report("cross-thread", [&] {
      std::vector<ProxyObject> batch;
      batch.reserve(iters);
      for (std::size_t i = 0; i < iters; ++i) { batch.push_back(bridge.box(static_cast<long long>(i))); }
      std::thread dropper([moved = std::move(batch)]() mutable { moved.clear(); });
      dropper.join();
    });

    pyhost::metrics::PrintStats(bridge.refs().stats(), bridge.refs().pending(), std::cout);
  } catch (const pyhost::exceptions::PyhostException& ex) {
    std::cerr << "bench_refs: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
