#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace llmb::core {

/**
 * @brief A fixed group of workers, one per rank, that run the same task.
 *
 * submitSync() hands task(rank) to every worker, waits for all of them and
 * returns the results ordered by rank. If any worker fails, a WorkerError for
 * the lowest failing rank is thrown once all workers have finished.
 */
class WorkerSession {
public:
  using Task = std::function<nlohmann::json(std::size_t rank)>;

  virtual ~WorkerSession() = default;

  virtual std::size_t size() const noexcept = 0;
  virtual std::vector<nlohmann::json> submitSync(const Task &task) = 0;
};

// Workers are threads of the calling process.
class ThreadWorkerSession : public WorkerSession {
public:
  explicit ThreadWorkerSession(std::size_t size);

  std::size_t size() const noexcept override { return size_; }
  std::vector<nlohmann::json> submitSync(const Task &task) override;

private:
  std::size_t size_;
};

// Every submitSync() forks one child per rank. Results travel back as JSON
// over a pipe, so tasks must only depend on state copied into the child.
class ProcessWorkerSession : public WorkerSession {
public:
  explicit ProcessWorkerSession(std::size_t size);

  std::size_t size() const noexcept override { return size_; }
  std::vector<nlohmann::json> submitSync(const Task &task) override;

private:
  std::size_t size_;
};

} // namespace llmb::core
