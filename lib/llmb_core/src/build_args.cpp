#include "llmb/core/build_args.hpp"

#include "llmb/core/config_arbitrator.hpp"
#include "llmb/core/errors.hpp"
#include "llmb/log.hpp"

#include <algorithm>

namespace llmb::core {

using config::OptionMap;
using config::OptionValue;

const std::filesystem::path &BuildArgs::modelDir() const {
  if (!modelDir_)
    throw InvalidArgumentError("model_dir is only available for local models, '" +
                               model + "' is a hub model.");
  return *modelDir_;
}

void BuildArgs::setLocalModel(std::filesystem::path dir) {
  model = dir.string();
  modelDir_ = std::move(dir);
}

void BuildArgs::useEngine(std::filesystem::path dir) {
  setLocalModel(std::move(dir));
  modelFormat_ = ModelFormat::Engine;
}

void BuildArgs::setup(const DeviceInfo &device) {
  checkModel();
  setupEmbeddingParallelMode();

  if (enableBuildCache && !buildCacheConfig)
    buildCacheConfig = buildCacheConfigFromEnv().config;

  if (isLocalModel()) {
    modelFormat_ = inferModelFormat(*modelDir_);
    if (modelFormat_ == ModelFormat::Engine) {
      if (buildConfig)
        log::warning("The build config is ignored for model format of engine.");
      loadConfigFromEngine(*modelDir_);
    } else if (modelFormat_ == ModelFormat::Checkpoint) {
      loadConfigFromCheckpoint(*modelDir_);
    }
  } else {
    modelFormat_ = ModelFormat::Source;
  }

  if (!quantConfig)
    quantConfig.emplace();
  if (!calibConfig)
    calibConfig.emplace();
  if (!buildConfig)
    buildConfig.emplace();

  auto &plugin = buildConfig->plugin_config;

  if (fastBuild && (quantConfig->quant_algo == QuantAlgo::Fp8 ||
                    quantConfig->quant_algo == QuantAlgo::None))
    plugin.manage_weights = true;

  if (parallel.worldSize() == 1)
    plugin.nccl_plugin.clear();

  if (enableLora) {
    plugin.lora_plugin = "auto";
    if (maxLoraRank)
      buildConfig->max_lora_rank = *maxLoraRank;
  }

  if (enablePromptAdapter)
    buildConfig->max_prompt_embedding_table_size =
        maxPromptAdapterToken * buildConfig->max_batch_size;

  setupDtype(device);

  if (performConfigArbitration)
    arbitrate(device);
}

void BuildArgs::checkModel() {
  if (model.empty())
    throw InvalidArgumentError("model should be provided.");

  std::error_code ec;
  std::filesystem::path candidate(model);
  if (std::filesystem::is_directory(candidate, ec))
    modelDir_ = candidate;
  else
    modelDir_.reset();
}

void BuildArgs::setupEmbeddingParallelMode() {
  if (embeddingParallelMode == "NONE") {
    convertOptions_["use_parallel_embedding"] = false;
  } else if (embeddingParallelMode == "SHARDING_ALONG_VOCAB") {
    convertOptions_["use_parallel_embedding"] = true;
    convertOptions_["embedding_sharding_dim"] = 0;
  } else if (embeddingParallelMode == "SHARDING_ALONG_HIDDEN") {
    convertOptions_["use_parallel_embedding"] = true;
    convertOptions_["embedding_sharding_dim"] = 1;
  } else {
    throw InvalidArgumentError("Invalid embedding_parallel_mode: " +
                               embeddingParallelMode);
  }
  convertOptions_["share_embedding_table"] = shareEmbeddingTable;
}

void BuildArgs::loadConfigFromEngine(const std::filesystem::path &engineDir) {
  const auto config = readModelConfig(engineDir);
  storedDescriptor_ = PretrainedDescriptor::fromEngine(engineDir);
  buildConfig = BuildConfig::fromFullJson(config["build_config"]);

  const auto &mapping = storedDescriptor_->mapping;
  if (parallel.tpSize != 1 && parallel.tpSize != mapping.tpSize)
    throw InvalidArgumentError(
        "tp_size " + std::to_string(parallel.tpSize) +
        " is not consistent with the engine's tp_size " +
        std::to_string(mapping.tpSize));
  if (parallel.ppSize != 1 && parallel.ppSize != mapping.ppSize)
    throw InvalidArgumentError(
        "pp_size " + std::to_string(parallel.ppSize) +
        " is not consistent with the engine's pp_size " +
        std::to_string(mapping.ppSize));
  parallel = ParallelConfig(mapping.tpSize, mapping.ppSize);
}

void BuildArgs::loadConfigFromCheckpoint(
    const std::filesystem::path &checkpointDir) {
  storedDescriptor_ = PretrainedDescriptor::fromCheckpoint(checkpointDir);
  const auto &mapping = storedDescriptor_->mapping;

  if (parallel.tpSize != 1 && parallel.tpSize != mapping.tpSize)
    throw InvalidArgumentError(
        "tp_size " + std::to_string(parallel.tpSize) +
        " is not consistent with the checkpoint's tp_size " +
        std::to_string(mapping.tpSize));
  if (parallel.ppSize != 1 && parallel.ppSize != mapping.ppSize)
    throw InvalidArgumentError(
        "pp_size " + std::to_string(parallel.ppSize) +
        " is not consistent with the checkpoint's pp_size " +
        std::to_string(mapping.ppSize));
  if (parallel.autoParallel && parallel.worldSize() != 1 &&
      mapping.worldSize != 1)
    throw InvalidArgumentError(
        "auto parallel with world_size " +
        std::to_string(parallel.worldSize()) +
        " does not support checkpoint with world_size " +
        std::to_string(mapping.worldSize) + " > 1");
  if (!parallel.autoParallel)
    parallel = ParallelConfig(mapping.tpSize, mapping.ppSize);
}

void BuildArgs::setupDtype(const DeviceInfo &device) {
  if (device.isPostAmpere())
    return;
  if (dtype == "bfloat16")
    throw InvalidArgumentError(
        "bfloat16 is not supported on devices with compute capability " +
        std::to_string(device.computeCapabilityMajor) + ".");
  if (dtype == "auto")
    dtype = "float16";
}

void BuildArgs::validateKvCacheConfig() const {
  const auto &window = kvCacheConfig.max_attention_window;
  if (!window)
    throw InvalidArgumentError(
        "KvCacheConfig.max_attention_window should be set for streaming LLM.");
  if (std::any_of(window->begin(), window->end(),
                  [](std::int64_t size) { return size <= 0; }))
    throw InvalidArgumentError("Elements in KvCacheConfig.max_attention_window "
                               "should be greater than 0.");
  if (!kvCacheConfig.sink_token_length)
    throw InvalidArgumentError(
        "KvCacheConfig.sink_token_length should be set for streaming LLM.");
  if (*kvCacheConfig.sink_token_length <= 0)
    throw InvalidArgumentError(
        "KvCacheConfig.sink_token_length should be greater than 0.");
}

void BuildArgs::arbitrate(const DeviceInfo &device) {
  ConfigArbitrator arbitrator;
  auto &build = *buildConfig;
  auto &plugin = build.plugin_config;

  if (buildConfigMutable()) {
    if (!build.max_num_tokens)
      build.max_num_tokens = 2048;

    if (!device.isPostAmpere())
      arbitrator.setup("pre-ampere not supported", plugin.groupName(),
                       {{"use_paged_context_fmha", false}});

    if (enableChunkedContext) {
      arbitrator.claimPerformance(
          "chunked_context", plugin.groupName(),
          {{"use_paged_context_fmha", true}}, [this]() {
            log::warning(
                "Disabling chunked context due to configuration conflict.");
            enableChunkedContext = false;
          });
    }

    if (plugin.streamingllm) {
      validateKvCacheConfig();
      arbitrator.claimFunctional(
          "streamingllm", plugin.groupName(),
          {{"streamingllm", true}, {"use_paged_context_fmha", false}});
      arbitrator.claimFunctional("streamingllm", kvCacheConfig.groupName(),
                                 {{"enable_block_reuse", false}});
    }

    if (quantConfig->quant_algo == QuantAlgo::Fp8)
      arbitrator.claimFunctional("fp8_quant", plugin.groupName(),
                                 {{"use_paged_context_fmha", false}});

    if (build.max_beam_width > 1)
      arbitrator.claimFunctional("beam_search (beam_width > 1)",
                                 kvCacheConfig.groupName(),
                                 {{"enable_block_reuse", false}});
  } else {
    arbitrator.setup("BuildConfig is readonly", build.groupName(),
                     build.snapshot());
    arbitrator.setup("PluginConfig is readonly", plugin.groupName(),
                     plugin.snapshot());
  }

  if (!device.isPostAmpere())
    arbitrator.setup("pre-ampere not supported", kvCacheConfig.groupName(),
                     {{"enable_block_reuse", false}});

  if (kvCacheConfig.enable_block_reuse) {
    arbitrator.claimFunctional("enable_block_reuse", kvCacheConfig.groupName(),
                               {{"enable_block_reuse", true}});
    arbitrator.claimFunctional("enable_block_reuse", plugin.groupName(),
                               {{"use_paged_context_fmha", true}});
  }

  arbitrator.resolve({&plugin, &kvCacheConfig, &build});
}

} // namespace llmb::core
