#include "llmb/core/build_args.hpp"
#include "llmb/core/errors.hpp"
#include "llmb/log.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using llmb::core::BuildArgs;
using llmb::core::DeviceInfo;
using llmb::core::ModelFormat;

namespace {

class BuildArgsTest : public ::testing::Test {
protected:
  void SetUp() override {
    llmb::log::setSink([this](llmb::log::Level level, const std::string &msg) {
      if (level == llmb::log::Level::Warning)
        warnings_.push_back(msg);
    });
  }

  void TearDown() override { llmb::log::setSink({}); }

  BuildArgs localArgs() {
    BuildArgs args;
    args.model = llmb::test::makeSourceModel(dir_ / "model").string();
    return args;
  }

  static DeviceInfo preAmpere() {
    DeviceInfo device;
    device.computeCapabilityMajor = 7;
    return device;
  }

  llmb::test::TempDir dir_{"llmb_build_args"};
  std::vector<std::string> warnings_;
};

} // namespace

TEST_F(BuildArgsTest, HubModelGetsDefaults) {
  BuildArgs args;
  args.model = "example-org/tiny-llama";
  args.setup();

  EXPECT_TRUE(args.isHubModel());
  EXPECT_EQ(args.modelFormat(), ModelFormat::Source);
  EXPECT_THROW(args.modelDir(), llmb::core::InvalidArgumentError);
  ASSERT_TRUE(args.buildConfig.has_value());
  ASSERT_TRUE(args.quantConfig.has_value());
  ASSERT_TRUE(args.calibConfig.has_value());
  EXPECT_EQ(args.buildConfig->max_num_tokens, std::optional<std::int64_t>(2048));
  EXPECT_TRUE(args.buildConfig->plugin_config.nccl_plugin.empty());
}

TEST_F(BuildArgsTest, LocalDirectoryIsSourceModel) {
  auto args = localArgs();
  args.setup();

  EXPECT_TRUE(args.isLocalModel());
  EXPECT_EQ(args.modelDir(), dir_ / "model");
  EXPECT_EQ(args.modelFormat(), ModelFormat::Source);
  EXPECT_TRUE(args.buildConfigMutable());
}

TEST_F(BuildArgsTest, ModelIsRequired) {
  BuildArgs args;
  EXPECT_THROW(args.setup(), llmb::core::InvalidArgumentError);
}

TEST_F(BuildArgsTest, EmbeddingParallelModeShapesConvertOptions) {
  auto args = localArgs();
  args.embeddingParallelMode = "SHARDING_ALONG_HIDDEN";
  args.shareEmbeddingTable = true;
  args.setup();

  const auto &options = args.convertOptions();
  EXPECT_EQ(options["use_parallel_embedding"], true);
  EXPECT_EQ(options["embedding_sharding_dim"], 1);
  EXPECT_EQ(options["share_embedding_table"], true);

  auto invalid = localArgs();
  invalid.embeddingParallelMode = "SHARDING_ALONG_BATCH";
  EXPECT_THROW(invalid.setup(), llmb::core::InvalidArgumentError);
}

TEST_F(BuildArgsTest, FeatureSwitchesEditBuildConfig) {
  auto args = localArgs();
  args.fastBuild = true;
  args.enableLora = true;
  args.maxLoraRank = 16;
  args.enablePromptAdapter = true;
  args.maxPromptAdapterToken = 4;
  args.buildConfig.emplace();
  args.buildConfig->max_batch_size = 8;
  args.setup();

  const auto &build = *args.buildConfig;
  EXPECT_TRUE(build.plugin_config.manage_weights);
  EXPECT_EQ(build.plugin_config.lora_plugin, "auto");
  EXPECT_EQ(build.max_lora_rank, 16);
  EXPECT_EQ(build.max_prompt_embedding_table_size, 32);
}

TEST_F(BuildArgsTest, MultiGpuKeepsNcclPlugin) {
  auto args = localArgs();
  args.parallel = llmb::core::ParallelConfig(2, 1);
  args.setup();
  EXPECT_EQ(args.buildConfig->plugin_config.nccl_plugin, "auto");
}

TEST_F(BuildArgsTest, BuildCacheConfigDefaultsWhenEnabled) {
  auto args = localArgs();
  args.enableBuildCache = true;
  args.setup();
  EXPECT_TRUE(args.buildCacheConfig.has_value());
}

TEST_F(BuildArgsTest, ChunkedContextPagesContextAttention) {
  auto args = localArgs();
  args.enableChunkedContext = true;
  args.setup();

  EXPECT_TRUE(args.enableChunkedContext);
  EXPECT_TRUE(args.buildConfig->plugin_config.use_paged_context_fmha);
  EXPECT_TRUE(warnings_.empty());
}

TEST_F(BuildArgsTest, StreamingLlmDisablesChunkedContext) {
  auto args = localArgs();
  args.enableChunkedContext = true;
  args.buildConfig.emplace();
  args.buildConfig->plugin_config.streamingllm = true;
  args.kvCacheConfig.max_attention_window = std::vector<std::int64_t>{2048};
  args.kvCacheConfig.sink_token_length = 4;
  args.setup();

  EXPECT_FALSE(args.enableChunkedContext);
  EXPECT_FALSE(args.buildConfig->plugin_config.use_paged_context_fmha);
  EXPECT_TRUE(args.buildConfig->plugin_config.streamingllm);
  EXPECT_FALSE(args.kvCacheConfig.enable_block_reuse);
  ASSERT_EQ(warnings_.size(), 2u);
  EXPECT_EQ(warnings_[1],
            "Disabling chunked context due to configuration conflict.");
}

TEST_F(BuildArgsTest, StreamingLlmNeedsAttentionWindow) {
  auto args = localArgs();
  args.buildConfig.emplace();
  args.buildConfig->plugin_config.streamingllm = true;
  args.kvCacheConfig.sink_token_length = 4;
  EXPECT_THROW(args.setup(), llmb::core::InvalidArgumentError);

  args.kvCacheConfig.max_attention_window = std::vector<std::int64_t>{0};
  EXPECT_THROW(args.setup(), llmb::core::InvalidArgumentError);
}

TEST_F(BuildArgsTest, BlockReuseConflictsWithBeamSearch) {
  auto args = localArgs();
  args.buildConfig.emplace();
  args.buildConfig->max_beam_width = 4;
  args.kvCacheConfig.enable_block_reuse = true;

  try {
    args.setup();
    FAIL() << "expected ConfigConflictError";
  } catch (const llmb::core::ConfigConflictError &e) {
    EXPECT_EQ(e.feature(), "enable_block_reuse");
    EXPECT_EQ(e.existingSource(), "beam_search (beam_width > 1)");
  }
}

TEST_F(BuildArgsTest, BlockReuseConflictsWithFp8) {
  auto args = localArgs();
  args.quantConfig.emplace();
  args.quantConfig->quant_algo = llmb::core::QuantAlgo::Fp8;
  args.kvCacheConfig.enable_block_reuse = true;
  EXPECT_THROW(args.setup(), llmb::core::ConfigConflictError);
}

TEST_F(BuildArgsTest, BlockReusePagesContextAttention) {
  auto args = localArgs();
  args.kvCacheConfig.enable_block_reuse = true;
  args.setup();
  EXPECT_TRUE(args.kvCacheConfig.enable_block_reuse);
  EXPECT_TRUE(args.buildConfig->plugin_config.use_paged_context_fmha);
}

TEST_F(BuildArgsTest, PreAmpereRestrictsDtypeAndFeatures) {
  auto args = localArgs();
  args.setup(preAmpere());
  EXPECT_EQ(args.dtype, "float16");
  EXPECT_FALSE(args.buildConfig->plugin_config.use_paged_context_fmha);

  auto bf16 = localArgs();
  bf16.dtype = "bfloat16";
  EXPECT_THROW(bf16.setup(preAmpere()), llmb::core::InvalidArgumentError);

  auto reuse = localArgs();
  reuse.kvCacheConfig.enable_block_reuse = true;
  EXPECT_THROW(reuse.setup(preAmpere()), llmb::core::ConfigConflictError);
}

TEST_F(BuildArgsTest, PreAmpereDropsChunkedContext) {
  auto args = localArgs();
  args.enableChunkedContext = true;
  args.setup(preAmpere());
  EXPECT_FALSE(args.enableChunkedContext);
  EXPECT_FALSE(args.buildConfig->plugin_config.use_paged_context_fmha);
}

TEST_F(BuildArgsTest, CheckpointDictatesTopology) {
  BuildArgs args;
  args.model = llmb::test::makeCheckpoint(dir_ / "ckpt", 2, 1).string();
  args.setup();

  EXPECT_EQ(args.modelFormat(), ModelFormat::Checkpoint);
  EXPECT_EQ(args.parallel.tpSize, 2);
  EXPECT_EQ(args.parallel.worldSize(), 2);
  ASSERT_TRUE(args.storedDescriptor().has_value());
  EXPECT_EQ(args.storedDescriptor()->architecture, "LlamaForCausalLM");

  BuildArgs mismatch;
  mismatch.model = (dir_ / "ckpt").string();
  mismatch.parallel = llmb::core::ParallelConfig(4, 1);
  EXPECT_THROW(mismatch.setup(), llmb::core::InvalidArgumentError);
}

TEST_F(BuildArgsTest, EngineConfigIsLoadedAndReadonly) {
  llmb::core::BuildConfig stored;
  stored.max_batch_size = 4;
  BuildArgs args;
  args.model = llmb::test::makeEngine(dir_ / "engine", stored).string();
  args.setup();

  EXPECT_EQ(args.modelFormat(), ModelFormat::Engine);
  EXPECT_FALSE(args.buildConfigMutable());
  EXPECT_EQ(args.buildConfig->max_batch_size, 4);
  EXPECT_FALSE(args.buildConfig->max_num_tokens.has_value());

  BuildArgs reuse;
  reuse.model = (dir_ / "engine").string();
  reuse.kvCacheConfig.enable_block_reuse = true;
  try {
    reuse.setup();
    FAIL() << "expected ConfigConflictError";
  } catch (const llmb::core::ConfigConflictError &e) {
    EXPECT_EQ(e.existingSource(), "PluginConfig is readonly");
  }
}

TEST_F(BuildArgsTest, EngineTopologyMustMatch) {
  BuildArgs args;
  args.model = llmb::test::makeEngine(dir_ / "engine", {}, 2, 1).string();
  args.parallel = llmb::core::ParallelConfig(4, 1);
  EXPECT_THROW(args.setup(), llmb::core::InvalidArgumentError);
}

TEST_F(BuildArgsTest, ArbitrationCanBeSkipped) {
  auto args = localArgs();
  args.performConfigArbitration = false;
  args.enableChunkedContext = true;
  args.setup();
  EXPECT_FALSE(args.buildConfig->plugin_config.use_paged_context_fmha);
  EXPECT_FALSE(args.buildConfig->max_num_tokens.has_value());
}

TEST_F(BuildArgsTest, UseEngineRetargetsArguments) {
  auto args = localArgs();
  args.setup();
  args.useEngine(dir_ / "cached");
  EXPECT_EQ(args.modelFormat(), ModelFormat::Engine);
  EXPECT_EQ(args.modelDir(), dir_ / "cached");
  EXPECT_EQ(args.model, (dir_ / "cached").string());
}
