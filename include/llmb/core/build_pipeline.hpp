#pragma once

#include "llmb/core/build_stats.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace llmb::core {

struct BuildStep {
  std::string label;
  std::function<void()> run;
};

// Runs build steps strictly in order, timing each one. A throwing step stops
// the pipeline with a BuildStepError; the latencies of earlier steps stay in
// the stats.
class BuildPipeline {
public:
  enum class State { Pending, Running, Complete, Failed };

  using StatusCallback = std::function<void(const std::string &message)>;
  using Reclaimer = std::function<void()>;

  BuildPipeline(std::vector<BuildStep> steps, BuildStats &stats);

  void setStatusCallback(StatusCallback callback) {
    statusCallback_ = std::move(callback);
  }
  // Runs after every step, whether it failed or not. Defaults to
  // releaseMemory().
  void setReclaimer(Reclaimer reclaimer) { reclaimer_ = std::move(reclaimer); }
  // Only the worker that reports (rank 0) prints progress.
  void setReportProgress(bool report) { reportProgress_ = report; }

  void run();

  State state() const noexcept { return state_; }
  // Index of the running or failed step; equals size() when complete.
  std::size_t currentStep() const noexcept { return current_; }
  std::size_t size() const noexcept { return steps_.size(); }
  std::vector<std::string> labels() const;

  // Hands freed heap pages back to the system.
  static void releaseMemory();

private:
  void report(const std::string &message) const;

  std::vector<BuildStep> steps_;
  BuildStats &stats_;
  StatusCallback statusCallback_;
  Reclaimer reclaimer_;
  bool reportProgress_ = true;
  State state_ = State::Pending;
  std::size_t current_ = 0;
};

const char *pipelineStateName(BuildPipeline::State state) noexcept;

} // namespace llmb::core
