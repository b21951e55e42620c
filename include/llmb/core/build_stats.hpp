#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llmb::core {

// Outcome of one build attempt. Fresh per attempt, never persisted.
struct BuildStats {
  // True when the returned engine came out of the cache, including when a
  // concurrent writer published it first.
  bool cacheHit = false;
  std::optional<std::string> cacheInfo;

  bool modelFromHub = false;
  std::optional<std::filesystem::path> localModelDir;
  std::optional<std::filesystem::path> engineDir;

  // Label and latency in seconds of every completed step, in order.
  std::vector<std::pair<std::string, double>> buildSteps;

  double totalLatency() const;

  nlohmann::json toJson() const;
  static BuildStats fromJson(const nlohmann::json &data);
};

} // namespace llmb::core
