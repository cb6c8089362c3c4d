#include "step_executor.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace stream_exec {

const char *outcome_name(RunOutcome outcome) {
  switch (outcome) {
  case RunOutcome::Completed:
    return "completed";
  case RunOutcome::Cancelled:
    return "cancelled";
  case RunOutcome::Disconnected:
    return "disconnected";
  case RunOutcome::Faulted:
    return "faulted";
  }
  return "unknown";
}

StepWork simulated_work(std::chrono::milliseconds step_duration) {
  return [step_duration](int, const stream_core::CancellationSignal &signal) {
    return !signal.wait_for(step_duration);
  };
}

StepWork faulting_work(StepWork inner, int fail_at_step) {
  return [inner = std::move(inner),
          fail_at_step](int step, const stream_core::CancellationSignal &signal) {
    if (step == fail_at_step) {
      throw std::runtime_error("injected fault at step " +
                               std::to_string(step));
    }
    return inner(step, signal);
  };
}

StepExecutor::StepExecutor(TaskOptions options)
    : options_(options), work_(simulated_work(options.step_duration)) {}

StepExecutor::StepExecutor(TaskOptions options, StepWork work)
    : options_(options), work_(std::move(work)) {
  if (!work_) {
    work_ = simulated_work(options_.step_duration);
  }
}

RunResult StepExecutor::cancel_at(int step, const EventSink &sink) const {
  std::cerr << "[StepExecutor] Stopping at step " << step
            << " due to cancellation" << std::endl;
  // The peer is usually gone by now; an undelivered ack is still a cancel.
  (void)sink(stream_codec::make_cancelled(step));
  return RunResult{RunOutcome::Cancelled, step, {}};
}

RunResult StepExecutor::run(const stream_core::CancellationSignal &signal,
                            const EventSink &sink) const {
  const int total = options_.total_steps;
  int step = 1;

  try {
    for (; step <= total; ++step) {
      if (signal.is_requested()) {
        return cancel_at(step, sink);
      }

      if (!work_(step, signal)) {
        return cancel_at(step, sink);
      }

      if (!sink(stream_codec::make_progress(step, total))) {
        return RunResult{RunOutcome::Disconnected, step, {}};
      }
      std::cerr << "[StepExecutor] Completed step " << step << "/" << total
                << std::endl;
    }

    step = total;
    if (!sink(stream_codec::make_complete())) {
      return RunResult{RunOutcome::Disconnected, step, {}};
    }
    return RunResult{RunOutcome::Completed, step, {}};
  } catch (const std::exception &e) {
    std::cerr << "[StepExecutor] Fault at step " << step << ": " << e.what()
              << std::endl;
    return RunResult{RunOutcome::Faulted, step, e.what()};
  }
}

} // namespace stream_exec
