#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "codec/event_codec.hpp"
#include "core/cancellation_signal.hpp"

namespace stream_exec {

using stream_codec::Event;

struct TaskOptions {
  int total_steps = 10;
  std::chrono::milliseconds step_duration{1000};
};

enum class RunOutcome {
  Completed,    // complete emitted after the last step
  Cancelled,    // cancelled emitted; no further steps ran
  Disconnected, // sink reported the peer gone; production stopped
  Faulted       // work or emission threw; no event for the faulted step
};

const char *outcome_name(RunOutcome outcome);

struct RunResult {
  RunOutcome outcome = RunOutcome::Faulted;
  int step = 0; // step the run ended on
  std::string error;
};

// Receives each event in emission order. Returns false once the event can
// no longer be delivered, which stops the run without an error.
using EventSink = std::function<bool(const Event &)>;

// Performs the work of one step. Returns false when cancellation
// interrupted the work before it finished. May throw.
using StepWork =
    std::function<bool(int step, const stream_core::CancellationSignal &)>;

// Simulated work: an interruptible wait of `step_duration`.
StepWork simulated_work(std::chrono::milliseconds step_duration);

// Chaos wrapper: throws std::runtime_error before step `fail_at_step`.
StepWork faulting_work(StepWork inner, int fail_at_step);

class StepExecutor {
public:
  explicit StepExecutor(TaskOptions options);
  StepExecutor(TaskOptions options, StepWork work);

  // Drives steps 1..total_steps. The signal is checked before every step,
  // and the work itself returns early when the signal is raised mid-step.
  RunResult run(const stream_core::CancellationSignal &signal,
                const EventSink &sink) const;

  const TaskOptions &options() const { return options_; }

private:
  RunResult cancel_at(int step, const EventSink &sink) const;

  TaskOptions options_;
  StepWork work_;
};

} // namespace stream_exec
