#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace llmb::core {

// Base of every arbitration failure. All of them surface before any build step
// runs.
class ConfigArbitrateError : public std::runtime_error {
public:
  explicit ConfigArbitrateError(const std::string &message)
      : std::runtime_error(message) {}
};

// Two functional claims want different values for the same option.
class ConfigConflictError : public ConfigArbitrateError {
public:
  ConfigConflictError(const std::string &message, std::string group,
                      std::string option, std::string feature,
                      std::string existingSource)
      : ConfigArbitrateError(message), group_(std::move(group)),
        option_(std::move(option)), feature_(std::move(feature)),
        existingSource_(std::move(existingSource)) {}

  const std::string &group() const noexcept { return group_; }
  const std::string &option() const noexcept { return option_; }
  const std::string &feature() const noexcept { return feature_; }
  const std::string &existingSource() const noexcept {
    return existingSource_;
  }

private:
  std::string group_;
  std::string option_;
  std::string feature_;
  std::string existingSource_;
};

class InconsistentBaselineError : public ConfigArbitrateError {
public:
  using ConfigArbitrateError::ConfigArbitrateError;
};

// Unknown option key or a value of the wrong type for a live config object.
class InvalidOptionError : public ConfigArbitrateError {
public:
  using ConfigArbitrateError::ConfigArbitrateError;
};

class FormatInferenceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InvalidArgumentError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CacheError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class BuildStepError : public std::runtime_error {
public:
  BuildStepError(const std::string &message, std::string step,
                 std::size_t index)
      : std::runtime_error(message), step_(std::move(step)), index_(index) {}

  const std::string &step() const noexcept { return step_; }
  std::size_t index() const noexcept { return index_; }

private:
  std::string step_;
  std::size_t index_;
};

class WorkerError : public std::runtime_error {
public:
  WorkerError(const std::string &message, std::size_t rank)
      : std::runtime_error(message), rank_(rank) {}

  std::size_t rank() const noexcept { return rank_; }

private:
  std::size_t rank_;
};

} // namespace llmb::core
