#pragma once

#include "llmb/core/build_args.hpp"
#include "llmb/core/build_pipeline.hpp"
#include "llmb/core/build_stats.hpp"
#include "llmb/core/engine.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llmb::core {

// Builds the engine of one rank: gathers the steps the model format needs,
// runs them through a BuildPipeline and saves the result.
class ModelLoader {
public:
  ModelLoader(BuildArgs args, Toolchain toolchain,
              std::filesystem::path workspace, BuildStats &stats,
              std::size_t rank = 0);
  ModelLoader(const ModelLoader &) = delete;
  ModelLoader &operator=(const ModelLoader &) = delete;

  // Returns the model directory for engine input, otherwise builds into
  // engineDir and returns it.
  std::filesystem::path run(const std::filesystem::path &engineDir);

  std::vector<std::string> stepLabels() const;
  const Mapping &mapping() const noexcept { return mapping_; }

  void setStatusCallback(BuildPipeline::StatusCallback callback) {
    statusCallback_ = std::move(callback);
  }
  void setReclaimer(BuildPipeline::Reclaimer reclaimer) {
    reclaimer_ = std::move(reclaimer);
  }

  // Saves the engine and, on rank 0, copies tokenizer files from modelDir so
  // the engine directory works as a standalone model directory.
  static void save(const Engine &engine, const std::filesystem::path &modelDir,
                   const std::filesystem::path &engineDir, std::size_t rank);

  // Build options stored with an engine, without the plugin section.
  // std::nullopt when modelDir does not hold an engine.
  static std::optional<nlohmann::json>
  loadExtraBuildConfig(const std::filesystem::path &modelDir);

private:
  void gatherSteps();
  LoadOptions loadOptions() const;

  void downloadModel();
  void loadSourceModel();
  void loadCheckpoint();
  void buildEngine();

  BuildArgs args_;
  Toolchain toolchain_;
  std::filesystem::path workspace_;
  BuildStats &stats_;
  std::size_t rank_;
  Mapping mapping_;

  std::vector<BuildStep> steps_;
  BuildPipeline::StatusCallback statusCallback_;
  BuildPipeline::Reclaimer reclaimer_;

  std::unique_ptr<Model> model_;
  std::unique_ptr<Engine> engine_;
  std::optional<ModelInfo> modelInfo_;
};

} // namespace llmb::core
