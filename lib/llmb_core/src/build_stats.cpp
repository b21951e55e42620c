#include "llmb/core/build_stats.hpp"

#include <nlohmann/json.hpp>

namespace llmb::core {

double BuildStats::totalLatency() const {
  double total = 0.0;
  for (const auto &step : buildSteps)
    total += step.second;
  return total;
}

nlohmann::json BuildStats::toJson() const {
  nlohmann::json steps = nlohmann::json::array();
  for (const auto &[label, latency] : buildSteps)
    steps.push_back(nlohmann::json{{"label", label}, {"latency", latency}});

  nlohmann::json data = {{"cache_hit", cacheHit},
                         {"model_from_hub", modelFromHub},
                         {"build_steps", steps}};
  data["cache_info"] = cacheInfo ? nlohmann::json(*cacheInfo) : nullptr;
  data["local_model_dir"] =
      localModelDir ? nlohmann::json(localModelDir->string()) : nullptr;
  data["engine_dir"] = engineDir ? nlohmann::json(engineDir->string()) : nullptr;
  return data;
}

BuildStats BuildStats::fromJson(const nlohmann::json &data) {
  BuildStats stats;
  if (!data.is_object())
    return stats;

  stats.cacheHit = data.value("cache_hit", false);
  stats.modelFromHub = data.value("model_from_hub", false);
  if (data.contains("cache_info") && data["cache_info"].is_string())
    stats.cacheInfo = data["cache_info"].get<std::string>();
  if (data.contains("local_model_dir") && data["local_model_dir"].is_string())
    stats.localModelDir = data["local_model_dir"].get<std::string>();
  if (data.contains("engine_dir") && data["engine_dir"].is_string())
    stats.engineDir = data["engine_dir"].get<std::string>();

  if (data.contains("build_steps") && data["build_steps"].is_array()) {
    for (const auto &step : data["build_steps"]) {
      if (!step.is_object())
        continue;
      stats.buildSteps.emplace_back(step.value("label", std::string()),
                                    step.value("latency", 0.0));
    }
  }
  return stats;
}

} // namespace llmb::core
