#include "llmb/core/model_loader.hpp"

#include "llmb/core/errors.hpp"
#include "llmb/log.hpp"

namespace llmb::core {

ModelLoader::ModelLoader(BuildArgs args, Toolchain toolchain,
                         std::filesystem::path workspace, BuildStats &stats,
                         std::size_t rank)
    : args_(std::move(args)), toolchain_(std::move(toolchain)),
      workspace_(std::move(workspace)), stats_(stats), rank_(rank) {
  if (!args_.buildConfig)
    throw InvalidArgumentError("BuildArgs::setup() must run before loading.");

  const auto &parallel = args_.parallel;
  if (parallel.isMultiGpu() && !parallel.autoParallel) {
    mapping_.worldSize = parallel.worldSize();
    mapping_.tpSize = parallel.tpSize;
    mapping_.ppSize = parallel.ppSize;
    mapping_.rank = static_cast<int>(rank_);
  }

  gatherSteps();
}

void ModelLoader::gatherSteps() {
  const auto format = args_.modelFormat();

  if (args_.isHubModel() && format != ModelFormat::Engine)
    steps_.push_back({"Downloading model", [this]() { downloadModel(); }});

  switch (format) {
  case ModelFormat::Source:
    steps_.push_back(
        {"Loading model to memory", [this]() { loadSourceModel(); }});
    steps_.push_back({"Building engine", [this]() { buildEngine(); }});
    break;
  case ModelFormat::Checkpoint:
    steps_.push_back(
        {"Loading checkpoints to memory", [this]() { loadCheckpoint(); }});
    steps_.push_back({"Building engine", [this]() { buildEngine(); }});
    break;
  case ModelFormat::Engine:
    break;
  }
}

std::vector<std::string> ModelLoader::stepLabels() const {
  std::vector<std::string> labels;
  for (const auto &step : steps_)
    labels.push_back(step.label);
  return labels;
}

LoadOptions ModelLoader::loadOptions() const {
  LoadOptions options;
  options.dtype = args_.dtype;
  options.mapping = mapping_;
  options.quantConfig = *args_.quantConfig;
  options.calibConfig = *args_.calibConfig;
  options.convertOptions = args_.convertOptions();
  options.loadFormat = args_.loadFormat;
  options.trustRemoteCode = args_.trustRemoteCode;
  options.workspace = workspace_;
  options.rank = rank_;
  return options;
}

void ModelLoader::downloadModel() {
  if (!toolchain_.source)
    throw InvalidArgumentError("No model source configured for hub models.");
  auto dir = toolchain_.source->download(
      args_.model, args_.revision.empty() ? "main" : args_.revision);
  if (rank_ == 0)
    log::info("Downloaded model to " + dir.string());
  args_.setLocalModel(dir);
  stats_.localModelDir = dir;
}

void ModelLoader::loadSourceModel() {
  if (!toolchain_.source)
    throw InvalidArgumentError("No model source configured.");
  model_ = toolchain_.source->loadSource(args_.modelDir(), loadOptions());
  if (!model_)
    throw InvalidArgumentError("The model source returned no model.");
  modelInfo_ = ModelInfo::fromDescriptor(model_->descriptor());
}

void ModelLoader::loadCheckpoint() {
  if (!toolchain_.source)
    throw InvalidArgumentError("No model source configured.");
  model_ = toolchain_.source->loadCheckpoint(args_.modelDir(), loadOptions());
  if (!model_)
    throw InvalidArgumentError("The model source returned no model.");
  modelInfo_ = ModelInfo::fromDescriptor(model_->descriptor());
}

void ModelLoader::buildEngine() {
  if (!toolchain_.builder)
    throw InvalidArgumentError("No engine builder configured.");
  if (!model_)
    throw InvalidArgumentError("The model is not loaded yet.");

  // The builder gets its own copy so it cannot alter the arguments.
  const BuildConfig config = *args_.buildConfig;
  engine_ = toolchain_.builder->build(*model_, config);
  if (!engine_)
    throw InvalidArgumentError("The engine builder returned no engine.");
  model_.reset();
}

std::filesystem::path ModelLoader::run(const std::filesystem::path &engineDir) {
  if (args_.modelFormat() == ModelFormat::Engine)
    return args_.modelDir();

  BuildPipeline pipeline(steps_, stats_);
  pipeline.setReportProgress(rank_ == 0);
  if (statusCallback_)
    pipeline.setStatusCallback(statusCallback_);
  if (reclaimer_)
    pipeline.setReclaimer(reclaimer_);
  pipeline.run();

  save(*engine_, args_.modelDir(), engineDir, rank_);
  engine_.reset();
  return engineDir;
}

void ModelLoader::save(const Engine &engine,
                       const std::filesystem::path &modelDir,
                       const std::filesystem::path &engineDir,
                       std::size_t rank) {
  std::filesystem::create_directories(engineDir);
  engine.save(engineDir);
  if (rank != 0)
    return;

  for (const auto &entry : std::filesystem::directory_iterator(modelDir)) {
    const auto name = entry.path().filename().string();
    if (name.rfind("tokenizer", 0) != 0)
      continue;
    auto source = entry.path();
    if (entry.is_symlink())
      source = std::filesystem::canonical(source);
    const auto target = engineDir / name;
    if (std::filesystem::is_directory(source))
      std::filesystem::copy(source, target,
                            std::filesystem::copy_options::recursive |
                                std::filesystem::copy_options::overwrite_existing);
    else
      std::filesystem::copy_file(
          source, target, std::filesystem::copy_options::overwrite_existing);
  }
}

std::optional<nlohmann::json>
ModelLoader::loadExtraBuildConfig(const std::filesystem::path &modelDir) {
  if (inferModelFormat(modelDir) != ModelFormat::Engine)
    return std::nullopt;
  auto buildConfig = readModelConfig(modelDir)["build_config"];
  buildConfig.erase("plugin_config");
  return buildConfig;
}

} // namespace llmb::core
