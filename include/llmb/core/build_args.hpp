#pragma once

#include "llmb/core/build_cache.hpp"
#include "llmb/core/configs.hpp"
#include "llmb/core/model_info.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace llmb::core {

struct DeviceInfo {
  int computeCapabilityMajor = 8;

  bool isPostAmpere() const noexcept { return computeCapabilityMajor >= 8; }
};

/**
 * @brief Everything that decides how an engine gets built.
 *
 * Filled in by the caller, then completed by setup(): the model is classified,
 * configs stored with engines and checkpoints are loaded, feature switches are
 * turned into plugin and KV cache options, and the options features claim are
 * arbitrated into buildConfig and kvCacheConfig.
 */
class BuildArgs {
public:
  // Hub model id or local directory; a directory wins when both could apply.
  std::string model;
  std::string revision;
  ParallelConfig parallel;
  std::string dtype = "auto";
  std::string loadFormat = "auto";
  bool trustRemoteCode = false;

  bool enableLora = false;
  std::optional<std::int64_t> maxLoraRank;
  bool enablePromptAdapter = false;
  std::int64_t maxPromptAdapterToken = 0;

  std::optional<BuildConfig> buildConfig;
  std::optional<QuantConfig> quantConfig;
  std::optional<CalibConfig> calibConfig;
  KvCacheConfig kvCacheConfig;

  bool fastBuild = false;
  // NONE, SHARDING_ALONG_VOCAB or SHARDING_ALONG_HIDDEN.
  std::string embeddingParallelMode = "SHARDING_ALONG_VOCAB";
  bool shareEmbeddingTable = false;

  bool enableBuildCache = false;
  std::optional<BuildCacheConfig> buildCacheConfig;

  bool enableChunkedContext = false;
  bool performConfigArbitration = true;

  void setup(const DeviceInfo &device = {});

  bool isLocalModel() const noexcept { return modelDir_.has_value(); }
  bool isHubModel() const noexcept { return !modelDir_.has_value(); }
  // Throws InvalidArgumentError for hub models.
  const std::filesystem::path &modelDir() const;
  ModelFormat modelFormat() const noexcept { return modelFormat_; }
  bool buildConfigMutable() const noexcept {
    return modelFormat_ != ModelFormat::Engine;
  }

  // Marks a downloaded hub model as local.
  void setLocalModel(std::filesystem::path dir);
  // Points the arguments at a finished engine, e.g. a cache hit.
  void useEngine(std::filesystem::path dir);

  const nlohmann::json &convertOptions() const noexcept {
    return convertOptions_;
  }
  // Descriptor stored with an engine or checkpoint input, if any.
  const std::optional<PretrainedDescriptor> &storedDescriptor() const noexcept {
    return storedDescriptor_;
  }

private:
  void checkModel();
  void setupEmbeddingParallelMode();
  void loadConfigFromEngine(const std::filesystem::path &engineDir);
  void loadConfigFromCheckpoint(const std::filesystem::path &checkpointDir);
  void setupDtype(const DeviceInfo &device);
  void arbitrate(const DeviceInfo &device);
  void validateKvCacheConfig() const;

  std::optional<std::filesystem::path> modelDir_;
  ModelFormat modelFormat_ = ModelFormat::Source;
  nlohmann::json convertOptions_ = nlohmann::json::object();
  std::optional<PretrainedDescriptor> storedDescriptor_;
};

} // namespace llmb::core
