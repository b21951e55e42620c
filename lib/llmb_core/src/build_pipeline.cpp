#include "llmb/core/build_pipeline.hpp"

#include "llmb/core/errors.hpp"
#include "llmb/log.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace llmb::core {
namespace {

std::string formatSeconds(double seconds) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.3fs", seconds);
  return buffer;
}

} // namespace

BuildPipeline::BuildPipeline(std::vector<BuildStep> steps, BuildStats &stats)
    : steps_(std::move(steps)), stats_(stats), reclaimer_(&releaseMemory) {}

std::vector<std::string> BuildPipeline::labels() const {
  std::vector<std::string> result;
  result.reserve(steps_.size());
  for (const auto &step : steps_)
    result.push_back(step.label);
  return result;
}

void BuildPipeline::releaseMemory() {
#if defined(__GLIBC__)
  malloc_trim(0);
#endif
}

void BuildPipeline::report(const std::string &message) const {
  if (!reportProgress_)
    return;
  if (statusCallback_)
    statusCallback_(message);
  else
    log::info(message);
}

void BuildPipeline::run() {
  using Clock = std::chrono::steady_clock;

  state_ = State::Running;
  const auto pipelineStart = Clock::now();
  const std::size_t total = steps_.size();

  for (current_ = 0; current_ < total; ++current_) {
    const auto &step = steps_[current_];
    report("Loading model: [" + std::to_string(current_ + 1) + "/" +
           std::to_string(total) + "] " + step.label);

    const auto start = Clock::now();
    std::exception_ptr failure;
    try {
      if (step.run)
        step.run();
    } catch (...) {
      failure = std::current_exception();
    }
    if (reclaimer_)
      reclaimer_();

    if (failure) {
      state_ = State::Failed;
      std::string reason = "unknown error";
      try {
        std::rethrow_exception(failure);
      } catch (const std::exception &e) {
        reason = e.what();
      } catch (...) {
        throw BuildStepError("Build step '" + step.label + "' failed",
                             step.label, current_);
      }
      throw BuildStepError("Build step '" + step.label + "' failed: " + reason,
                           step.label, current_);
    }

    const double latency =
        std::chrono::duration<double>(Clock::now() - start).count();
    stats_.buildSteps.emplace_back(step.label, latency);
    report("Time: " + formatSeconds(latency));
  }

  state_ = State::Complete;
  const double overall =
      std::chrono::duration<double>(Clock::now() - pipelineStart).count();
  report("Loading model done. Total latency: " + formatSeconds(overall));
}

const char *pipelineStateName(BuildPipeline::State state) noexcept {
  switch (state) {
  case BuildPipeline::State::Pending:
    return "pending";
  case BuildPipeline::State::Running:
    return "running";
  case BuildPipeline::State::Complete:
    return "complete";
  case BuildPipeline::State::Failed:
    return "failed";
  }
  return "unknown";
}

} // namespace llmb::core
