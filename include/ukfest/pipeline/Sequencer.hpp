#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "ukfest/core/Filter.hpp"
#include "ukfest/core/PerformanceMetrics.hpp"
#include "ukfest/data/DataSource.hpp"

namespace ukfest {

// What the sequencer does when a tick's forecast fails.
enum class FailurePolicy_e {
  kAbort,
  kSkip
};

struct SequencerOptions_t {
  // Stops after this many filtered ticks; 0 means no limit.
  std::size_t maxTicks = 0;
  FailurePolicy_e onForecastFailure = FailurePolicy_e::kAbort;
  // Samples before startTime are ignored; the first accepted sample anchors the clock.
  std::optional<double> startTime;
  std::optional<double> stopTime;
};

struct RunSummary_t {
  std::size_t ticks = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::size_t constrainedTicks = 0;
  bool stoppedEarly = false;
};

// Drives a filter over a tick source, one step per sample, in timestamp order.
//
// The first accepted sample only sets the clock: the filter's initial estimate is taken to
// hold at that time. Each following sample is filtered with dt measured from the last
// successful posterior.
class Sequencer {
public:
  Sequencer(std::shared_ptr<ITickSource> source, std::shared_ptr<IFilter> filter, SequencerOptions_t options = {});

  // Throws ForecastFailure under kAbort, SequenceError for non-increasing timestamps, and
  // lets SingularCovarianceError and NumericalError through unchanged.
  RunSummary_t run();

  // Stops issuing ticks once the tick in flight has completed. Safe from any thread.
  void requestStop() { stopRequested.store(true); }

  const std::vector<TickResult_t>& results() const { return tickResults; }
  const PerformanceMetrics& metrics() const { return performance; }

private:
  std::shared_ptr<ITickSource> source;
  std::shared_ptr<IFilter> filter;
  SequencerOptions_t options;
  std::atomic<bool> stopRequested{false};
  std::vector<TickResult_t> tickResults;
  PerformanceMetrics performance;
};

} // namespace ukfest
