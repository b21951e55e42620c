#pragma once

#include "llmb/core/configs.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>

namespace llmb::core {

enum class ModelFormat {
  Source,     // raw hub-style model directory
  Checkpoint, // intermediate checkpoint
  Engine      // prebuilt engine
};

const char *modelFormatName(ModelFormat format) noexcept;

// Reads <dir>/config.json. Throws FormatInferenceError when it is missing or
// not a JSON object.
nlohmann::json readModelConfig(const std::filesystem::path &modelDir);

// Classifies a model directory by the keys of its config.json:
// pretrained_config + build_config is an engine, architecture + dtype is a
// checkpoint, anything else a source model.
ModelFormat inferModelFormat(const std::filesystem::path &modelDir);

// Model identity used in cache keys: architecture, dtype and parallel mapping.
struct PretrainedDescriptor {
  std::string architecture;
  std::string dtype;
  Mapping mapping;

  nlohmann::json toJson() const;

  static PretrainedDescriptor fromSourceModel(const std::filesystem::path &dir,
                                              const std::string &dtype,
                                              const Mapping &mapping);
  static PretrainedDescriptor fromCheckpoint(const std::filesystem::path &dir);
  static PretrainedDescriptor fromEngine(const std::filesystem::path &dir);
};

// "auto" takes the dtype the source model was saved in; float32 and unknown
// dtypes build as float16.
std::string resolveDtype(const std::string &requested,
                         const std::string &sourceDtype);

struct ModelInfo {
  std::string architecture;
  std::string dtype;

  const std::string &modelName() const;

  static ModelInfo fromDescriptor(const PretrainedDescriptor &descriptor);
  static ModelInfo fromEngineConfig(const nlohmann::json &config);
};

} // namespace llmb::core
