#pragma once

#include "llmb/core/configs.hpp"
#include "llmb/core/model_info.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace llmb::core {

// Collaborators the loaders drive but do not implement: weight loading and
// the engine compiler.

class Model {
public:
  virtual ~Model() = default;
  virtual PretrainedDescriptor descriptor() const = 0;
};

class Engine {
public:
  virtual ~Engine() = default;
  // Writes the engine files, including config.json, into an existing dir.
  virtual void save(const std::filesystem::path &dir) const = 0;
};

struct LoadOptions {
  std::string dtype = "auto";
  Mapping mapping;
  QuantConfig quantConfig;
  CalibConfig calibConfig;
  nlohmann::json convertOptions = nlohmann::json::object();
  std::string loadFormat = "auto";
  bool trustRemoteCode = false;
  std::filesystem::path workspace;
  std::size_t rank = 0;
};

class ModelSource {
public:
  virtual ~ModelSource() = default;

  // Fetches a hub model and returns its local directory.
  virtual std::filesystem::path download(const std::string &modelId,
                                         const std::string &revision) = 0;
  virtual std::unique_ptr<Model> loadSource(const std::filesystem::path &dir,
                                            const LoadOptions &options) = 0;
  virtual std::unique_ptr<Model>
  loadCheckpoint(const std::filesystem::path &dir,
                 const LoadOptions &options) = 0;
};

class EngineBuilder {
public:
  virtual ~EngineBuilder() = default;
  virtual std::unique_ptr<Engine> build(Model &model,
                                        const BuildConfig &config) = 0;
};

struct Toolchain {
  std::shared_ptr<ModelSource> source;
  std::shared_ptr<EngineBuilder> builder;
};

} // namespace llmb::core
