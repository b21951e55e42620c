#include "llmb/core/worker_session.hpp"

#include "llmb/core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <optional>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace llmb::core {
namespace {

struct Outcome {
  std::optional<nlohmann::json> result;
  std::string error;
};

nlohmann::json runTask(const WorkerSession::Task &task, std::size_t rank) {
  try {
    return {{"ok", true}, {"result", task(rank)}};
  } catch (const std::exception &e) {
    return {{"ok", false}, {"error", e.what()}};
  } catch (...) {
    // A forked child must never unwind past its task.
    return {{"ok", false}, {"error", "unknown exception"}};
  }
}

void throwFirstFailure(const std::vector<Outcome> &outcomes) {
  for (std::size_t rank = 0; rank < outcomes.size(); ++rank) {
    if (!outcomes[rank].result)
      throw WorkerError("Worker " + std::to_string(rank) +
                            " failed: " + outcomes[rank].error,
                        rank);
  }
}

bool writeAll(int fd, const std::string &data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

std::string readAll(int fd) {
  std::string data;
  char buffer[4096];
  while (true) {
    ssize_t count = ::read(fd, buffer, sizeof(buffer));
    if (count < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (count == 0)
      break;
    data.append(buffer, static_cast<std::size_t>(count));
  }
  return data;
}

int waitForChild(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return -1;
  }
  return status;
}

Outcome decode(const nlohmann::json &message, int status) {
  Outcome outcome;
  if (message.is_object() && message.value("ok", false) &&
      message.contains("result")) {
    outcome.result = message["result"];
    return outcome;
  }
  if (message.is_object() && message.contains("error") &&
      message["error"].is_string()) {
    outcome.error = message["error"].get<std::string>();
    return outcome;
  }
  if (status == -1)
    outcome.error = "lost track of worker process";
  else if (WIFSIGNALED(status))
    outcome.error = "terminated by signal " + std::to_string(WTERMSIG(status));
  else if (WIFEXITED(status))
    outcome.error = "exited with status " + std::to_string(WEXITSTATUS(status));
  else
    outcome.error = "no result";
  return outcome;
}

} // namespace

ThreadWorkerSession::ThreadWorkerSession(std::size_t size) : size_(size) {
  if (size_ == 0)
    throw InvalidArgumentError("A worker session needs at least one worker");
}

std::vector<nlohmann::json>
ThreadWorkerSession::submitSync(const Task &task) {
  std::vector<nlohmann::json> messages(size_);
  std::vector<std::thread> workers;
  workers.reserve(size_);
  for (std::size_t rank = 0; rank < size_; ++rank)
    workers.emplace_back(
        [&, rank]() { messages[rank] = runTask(task, rank); });
  for (auto &worker : workers)
    worker.join();

  std::vector<Outcome> outcomes(size_);
  for (std::size_t rank = 0; rank < size_; ++rank)
    outcomes[rank] = decode(messages[rank], 0);
  throwFirstFailure(outcomes);

  std::vector<nlohmann::json> results;
  results.reserve(size_);
  for (auto &outcome : outcomes)
    results.push_back(std::move(*outcome.result));
  return results;
}

ProcessWorkerSession::ProcessWorkerSession(std::size_t size) : size_(size) {
  if (size_ == 0)
    throw InvalidArgumentError("A worker session needs at least one worker");
}

std::vector<nlohmann::json>
ProcessWorkerSession::submitSync(const Task &task) {
  struct Child {
    pid_t pid = -1;
    int readFd = -1;
  };
  std::vector<Child> children(size_);
  std::vector<Outcome> outcomes(size_);

  for (std::size_t rank = 0; rank < size_; ++rank) {
    int fds[2];
    if (::pipe(fds) == -1) {
      outcomes[rank].error = std::string("pipe failed: ") + std::strerror(errno);
      continue;
    }

    pid_t pid = ::fork();
    if (pid == -1) {
      outcomes[rank].error = std::string("fork failed: ") + std::strerror(errno);
      ::close(fds[0]);
      ::close(fds[1]);
      continue;
    }

    if (pid == 0) {
      ::close(fds[0]);
      for (std::size_t other = 0; other < rank; ++other) {
        if (children[other].readFd >= 0)
          ::close(children[other].readFd);
      }
      bool sent = writeAll(fds[1], runTask(task, rank).dump());
      ::close(fds[1]);
      _exit(sent ? 0 : 1);
    }

    ::close(fds[1]);
    children[rank] = {pid, fds[0]};
  }

  for (std::size_t rank = 0; rank < size_; ++rank) {
    auto &child = children[rank];
    if (child.pid == -1)
      continue;
    std::string payload = readAll(child.readFd);
    ::close(child.readFd);
    int status = waitForChild(child.pid);
    outcomes[rank] =
        decode(nlohmann::json::parse(payload, nullptr, false), status);
  }

  throwFirstFailure(outcomes);

  std::vector<nlohmann::json> results;
  results.reserve(size_);
  for (auto &outcome : outcomes)
    results.push_back(std::move(*outcome.result));
  return results;
}

} // namespace llmb::core
