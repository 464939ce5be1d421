#include "ukfest/pipeline/Sequencer.hpp"

#include <chrono>
#include <utility>

#include <fmt/core.h>

#include "ukfest/core/Errors.hpp"
#include "ukfest/core/Logger.hpp"

namespace ukfest {

Sequencer::Sequencer(std::shared_ptr<ITickSource> sourceInput,
                     std::shared_ptr<IFilter> filterInput,
                     SequencerOptions_t optionsInput)
    : source(std::move(sourceInput)), filter(std::move(filterInput)), options(optionsInput) {
  if (!source || !filter) {
    throw ConfigurationError("Sequencer requires a tick source and a filter");
  }
  if (auto logger = Logger::GetClass("Sequencer")) {
    logger->info("Sequencer created maxTicks {} onForecastFailure {}",
                 options.maxTicks == 0 ? -1 : static_cast<long long>(options.maxTicks),
                 options.onForecastFailure == FailurePolicy_e::kSkip ? "skip" : "abort");
  }
}

RunSummary_t Sequencer::run() {
  auto logger = Logger::GetClass("Sequencer");
  RunSummary_t summary;
  Tick_t tick;
  double lastTime = 0.0;
  bool hasClock = false;
  std::size_t tickIndex = 0;

  while (source->next(tick)) {
    if (stopRequested.load()) {
      summary.stoppedEarly = true;
      if (logger) {
        logger->info("Sequencer: stop requested after {} ticks", summary.ticks);
      }
      break;
    }
    if (options.startTime && tick.time < *options.startTime) {
      continue;
    }
    if (options.stopTime && tick.time > *options.stopTime) {
      break;
    }
    if (!hasClock) {
      lastTime = tick.time;
      hasClock = true;
      if (logger) {
        logger->info("Sequencer: clock anchored at t={:.6f}", lastTime);
      }
      continue;
    }
    if (options.maxTicks > 0 && summary.ticks >= options.maxTicks) {
      if (logger) {
        logger->info("Sequencer: reached max ticks {}", options.maxTicks);
      }
      break;
    }
    if (!(tick.time > lastTime)) {
      throw SequenceError(fmt::format("Tick {} at t={} does not follow t={}", tickIndex, tick.time, lastTime));
    }
    tick.dt = tick.time - lastTime;

    const auto started = std::chrono::steady_clock::now();
    try {
      TickResult_t result = filter->step(tick, tickIndex);
      const double runtimeMs =
          std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
      performance.update(result.innovation, result.nis, runtimeMs);
      if (result.anyConstraintActive()) {
        ++summary.constrainedTicks;
      }
      ++summary.succeeded;
      lastTime = tick.time;
      tickResults.push_back(std::move(result));
    } catch (const ForecastFailure& failure) {
      if (options.onForecastFailure == FailurePolicy_e::kAbort) {
        if (logger) {
          logger->error("Sequencer: aborting at tick {} t={:.6f}: {}", tickIndex, tick.time, failure.what());
        }
        throw;
      }
      if (logger) {
        logger->warn("Sequencer: skipping tick {} t={:.6f}: {}", tickIndex, tick.time, failure.what());
      }
      TickResult_t skipped;
      skipped.tickIndex = tickIndex;
      skipped.time = tick.time;
      skipped.status = TickStatus_e::kForecastFailure;
      skipped.failureReason = failure.what();
      skipped.posteriorMean = filter->mean();
      skipped.posteriorCovariance = filter->covariance();
      ++summary.failed;
      tickResults.push_back(std::move(skipped));
    }
    ++summary.ticks;
    ++tickIndex;

    if (logger && (tickIndex % 200) == 0) {
      logger->debug("Sequencer: tick {} t={:.6f} dt {:.6f} |innovation| {:.3e} NIS {:.3f} step {:.3f} ms",
                    tickIndex,
                    tick.time,
                    tick.dt,
                    performance.lastInnovationNorm(),
                    performance.lastNis(),
                    performance.lastRuntimeMs());
    }
  }

  if (logger) {
    logger->info("Sequencer completed {} ticks ({} ok, {} failed, {} constrained), innovation rms {:.4e}, mean NIS {:.3f}",
                 summary.ticks,
                 summary.succeeded,
                 summary.failed,
                 summary.constrainedTicks,
                 performance.innovationRms(),
                 performance.meanNis());
  }
  return summary;
}

} // namespace ukfest
