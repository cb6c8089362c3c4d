#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "executor/step_executor.hpp"

namespace stream_exec {
namespace {

using namespace std::chrono_literals;
using stream_core::CancellationSignal;

TaskOptions fast_options(int steps) {
  TaskOptions options;
  options.total_steps = steps;
  options.step_duration = 0ms;
  return options;
}

class StepExecutorTest : public ::testing::Test {
protected:
  EventSink recorder() {
    return [this](const Event &event) {
      events_.push_back(event);
      return true;
    };
  }

  std::vector<int> progress_steps() const {
    std::vector<int> steps;
    for (const auto &e : events_) {
      if (e.type() == "progress") {
        steps.push_back(e.step());
      }
    }
    return steps;
  }

  CancellationSignal signal_;
  std::vector<Event> events_;
};

TEST_F(StepExecutorTest, RunsEveryStepThenCompletes) {
  StepExecutor executor(fast_options(10));
  const RunResult result = executor.run(signal_, recorder());

  EXPECT_EQ(result.outcome, RunOutcome::Completed);
  EXPECT_EQ(result.step, 10);
  ASSERT_EQ(events_.size(), 11u);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(events_[i].type(), "progress");
    EXPECT_EQ(events_[i].step(), i + 1);
    EXPECT_EQ(events_[i].total_steps(), 10);
  }
  EXPECT_EQ(events_.back().type(), "complete");
}

TEST_F(StepExecutorTest, SignalBeforeStartCancelsAtStepOne) {
  signal_.request();
  StepExecutor executor(fast_options(5));
  const RunResult result = executor.run(signal_, recorder());

  EXPECT_EQ(result.outcome, RunOutcome::Cancelled);
  EXPECT_EQ(result.step, 1);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].type(), "cancelled");
  EXPECT_EQ(events_[0].step(), 1);
}

TEST_F(StepExecutorTest, SignalBetweenStepsStopsBeforeNextStep) {
  StepExecutor executor(fast_options(10));
  const RunResult result = executor.run(signal_, [this](const Event &event) {
    events_.push_back(event);
    if (event.type() == "progress" && event.step() == 3) {
      signal_.request();
    }
    return true;
  });

  EXPECT_EQ(result.outcome, RunOutcome::Cancelled);
  EXPECT_EQ(result.step, 4);
  EXPECT_EQ(progress_steps(), (std::vector<int>{1, 2, 3}));
  ASSERT_FALSE(events_.empty());
  EXPECT_EQ(events_.back().type(), "cancelled");
  EXPECT_EQ(events_.back().step(), 4);
}

TEST_F(StepExecutorTest, SignalMidStepInterruptsTheWait) {
  TaskOptions options;
  options.total_steps = 3;
  options.step_duration = 10s;
  StepExecutor executor(options);

  std::thread canceller([this] {
    std::this_thread::sleep_for(50ms);
    signal_.request();
  });

  const auto start = std::chrono::steady_clock::now();
  const RunResult result = executor.run(signal_, recorder());
  const auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_EQ(result.outcome, RunOutcome::Cancelled);
  EXPECT_EQ(result.step, 1);
  EXPECT_LT(elapsed, 5s);
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].type(), "cancelled");
}

TEST_F(StepExecutorTest, FaultStopsWithoutTerminalEvent) {
  StepExecutor executor(fast_options(5),
                        faulting_work(simulated_work(0ms), 3));
  const RunResult result = executor.run(signal_, recorder());

  EXPECT_EQ(result.outcome, RunOutcome::Faulted);
  EXPECT_EQ(result.step, 3);
  EXPECT_NE(result.error.find("injected fault at step 3"), std::string::npos);
  EXPECT_EQ(progress_steps(), (std::vector<int>{1, 2}));
  for (const auto &e : events_) {
    EXPECT_FALSE(stream_codec::is_terminal(e));
  }
}

TEST_F(StepExecutorTest, RejectedEventStopsProduction) {
  StepExecutor executor(fast_options(10));
  int delivered = 0;
  const RunResult result = executor.run(signal_, [&delivered](const Event &) {
    return ++delivered < 2;
  });

  EXPECT_EQ(result.outcome, RunOutcome::Disconnected);
  EXPECT_EQ(result.step, 2);
  EXPECT_EQ(delivered, 2);
}

TEST_F(StepExecutorTest, CustomWorkSeesEveryStep) {
  std::vector<int> seen;
  StepExecutor executor(fast_options(4),
                        [&seen](int step, const CancellationSignal &) {
                          seen.push_back(step);
                          return true;
                        });
  EXPECT_EQ(executor.run(signal_, recorder()).outcome, RunOutcome::Completed);
  EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 4}));
}

TEST(StepExecutorOutcomeTest, Names) {
  EXPECT_STREQ(outcome_name(RunOutcome::Completed), "completed");
  EXPECT_STREQ(outcome_name(RunOutcome::Cancelled), "cancelled");
  EXPECT_STREQ(outcome_name(RunOutcome::Disconnected), "disconnected");
  EXPECT_STREQ(outcome_name(RunOutcome::Faulted), "faulted");
}

} // namespace
} // namespace stream_exec
