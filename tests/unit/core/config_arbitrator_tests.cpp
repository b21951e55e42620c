#include "llmb/core/config_arbitrator.hpp"
#include "llmb/core/errors.hpp"
#include "llmb/log.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using llmb::config::OptionValue;
using llmb::core::ConfigArbitrator;

namespace {

class ConfigArbitratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    llmb::log::setSink([this](llmb::log::Level level, const std::string &msg) {
      if (level == llmb::log::Level::Warning)
        warnings_.push_back(msg);
    });
  }

  void TearDown() override { llmb::log::setSink({}); }

  std::vector<std::string> warnings_;
};

// Claims that a build with chunked context on a streaming model registers.
void registerStreamingClaims(ConfigArbitrator &arbitrator, int &fallbacks) {
  arbitrator.setup("pre-ampere not supported", "kv_cache_config",
                   {{"enable_block_reuse", false}});
  arbitrator.claimFunctional("streamingllm", "plugin_config",
                             {{"streamingllm", true},
                              {"use_paged_context_fmha", false}});
  arbitrator.claimPerformance("chunked_context", "plugin_config",
                              {{"use_paged_context_fmha", true}},
                              [&fallbacks]() { ++fallbacks; });
  arbitrator.claimPerformance("large_batches", "build_config",
                              {{"max_batch_size", 256}});
}

} // namespace

TEST_F(ConfigArbitratorTest, NonOverlappingFunctionalClaimsApplyUnchanged) {
  ConfigArbitrator arbitrator;
  arbitrator.claimFunctional("lora", "plugin_config", {{"lora_plugin", "auto"}});
  arbitrator.claimFunctional("streamingllm", "plugin_config",
                             {{"streamingllm", true}});
  arbitrator.claimFunctional("beam_search", "kv_cache_config",
                             {{"enable_block_reuse", false}});

  auto resolved = arbitrator.arbitrate();
  EXPECT_EQ(resolved.value("plugin_config", "lora_plugin"), OptionValue("auto"));
  EXPECT_EQ(resolved.value("plugin_config", "streamingllm"), OptionValue(true));
  EXPECT_EQ(resolved.value("kv_cache_config", "enable_block_reuse"),
            OptionValue(false));
  EXPECT_EQ(resolved.store().source("plugin_config", "lora_plugin"), "lora");
  EXPECT_TRUE(resolved.droppedClaims().empty());
}

TEST_F(ConfigArbitratorTest, FeaturesAgreeingOnAValueResolve) {
  ConfigArbitrator arbitrator;
  arbitrator.claimFunctional("featureA", "plugin", {{"optX", true}});
  arbitrator.claimFunctional("featureB", "plugin", {{"optX", true}});

  auto resolved = arbitrator.arbitrate();
  EXPECT_EQ(resolved.value("plugin", "optX"), OptionValue(true));
  EXPECT_EQ(resolved.store().source("plugin", "optX"), "featureA");
}

TEST_F(ConfigArbitratorTest, ConflictingFeaturesNameBothClaimants) {
  ConfigArbitrator arbitrator;
  arbitrator.claimFunctional("featureA", "plugin", {{"optX", true}});
  arbitrator.claimFunctional("featureB", "plugin", {{"optX", false}});

  try {
    arbitrator.arbitrate();
    FAIL() << "expected ConfigConflictError";
  } catch (const llmb::core::ConfigConflictError &e) {
    EXPECT_EQ(e.feature(), "featureB");
    EXPECT_EQ(e.existingSource(), "featureA");
    EXPECT_EQ(e.option(), "optX");
    EXPECT_EQ(e.group(), "plugin");
    EXPECT_STREQ(e.what(), "Cannot set 'optX' to be 'false' when enabling "
                           "'featureB', since 'featureA' has set it to be "
                           "'true'.");
  }
}

TEST_F(ConfigArbitratorTest, ConflictIsFoundInEitherClaimOrder) {
  ConfigArbitrator arbitrator;
  arbitrator.claimFunctional("featureB", "plugin", {{"optX", false}});
  arbitrator.claimFunctional("featureA", "plugin", {{"optX", true}});

  try {
    arbitrator.arbitrate();
    FAIL() << "expected ConfigConflictError";
  } catch (const llmb::core::ConfigConflictError &e) {
    EXPECT_EQ(e.feature(), "featureA");
    EXPECT_EQ(e.existingSource(), "featureB");
    EXPECT_EQ(e.option(), "optX");
    EXPECT_STREQ(e.what(), "Cannot set 'optX' to be 'true' when enabling "
                           "'featureA', since 'featureB' has set it to be "
                           "'false'.");
  }
}

TEST_F(ConfigArbitratorTest, ConflictsAreArbitrateErrors) {
  ConfigArbitrator arbitrator;
  arbitrator.claimFunctional("featureA", "plugin", {{"optX", 1}});
  arbitrator.claimFunctional("featureB", "plugin", {{"optX", 2}});
  EXPECT_THROW(arbitrator.arbitrate(), llmb::core::ConfigArbitrateError);
}

TEST_F(ConfigArbitratorTest, FunctionalClaimCannotOverrideBaseline) {
  ConfigArbitrator arbitrator;
  arbitrator.setup("pre-ampere not supported", "plugin_config",
                   {{"use_paged_context_fmha", false}});
  arbitrator.claimFunctional("enable_block_reuse", "plugin_config",
                             {{"use_paged_context_fmha", true}});

  try {
    arbitrator.arbitrate();
    FAIL() << "expected ConfigConflictError";
  } catch (const llmb::core::ConfigConflictError &e) {
    EXPECT_EQ(e.existingSource(), "pre-ampere not supported");
  }
}

TEST_F(ConfigArbitratorTest, InconsistentBaselineIsRejected) {
  ConfigArbitrator arbitrator;
  arbitrator.setup("device", "kv_cache_config", {{"enable_block_reuse", false}});
  EXPECT_NO_THROW(arbitrator.setup("readonly", "kv_cache_config",
                                   {{"enable_block_reuse", false}}));
  EXPECT_THROW(arbitrator.setup("readonly", "kv_cache_config",
                                {{"enable_block_reuse", true}}),
               llmb::core::InconsistentBaselineError);
}

TEST_F(ConfigArbitratorTest, DroppedPerformanceClaimRunsFallbackOnce) {
  ConfigArbitrator arbitrator;
  int fallbacks = 0;
  arbitrator.claimFunctional("beam_search", "cache",
                             {{"enable_block_reuse", false}});
  arbitrator.claimPerformance("enable_block_reuse", "cache",
                              {{"enable_block_reuse", true}},
                              [&fallbacks]() { ++fallbacks; });

  llmb::core::KvCacheConfig kv;
  auto resolved = arbitrator.resolve({{"cache", &kv}});

  EXPECT_EQ(fallbacks, 1);
  EXPECT_EQ(resolved.value("cache", "enable_block_reuse"), OptionValue(false));
  EXPECT_FALSE(kv.enable_block_reuse);
  ASSERT_EQ(resolved.droppedClaims().size(), 1u);
  EXPECT_EQ(resolved.droppedClaims()[0].claim, "enable_block_reuse");
  EXPECT_EQ(resolved.droppedClaims()[0].existingSource, "beam_search");
  ASSERT_EQ(warnings_.size(), 1u);
  EXPECT_EQ(warnings_[0], "Ignoring performance claim 'enable_block_reuse' for "
                          "option 'enable_block_reuse' due to conflict.");
}

TEST_F(ConfigArbitratorTest, PerformanceClaimAppliesAtomically) {
  ConfigArbitrator arbitrator;
  int fallbacks = 0;
  arbitrator.claimFunctional("fp8_quant", "plugin_config",
                             {{"use_paged_context_fmha", false}});
  arbitrator.claimPerformance("fast_context", "build_config",
                              {{"max_num_tokens", 8192}},
                              [&fallbacks]() { ++fallbacks; });
  arbitrator.claimPerformance("fast_context", "plugin_config",
                              {{"use_paged_context_fmha", true}});
  arbitrator.claimPerformance("small_batches", "build_config",
                              {{"max_batch_size", 16}});

  auto resolved = arbitrator.arbitrate();
  EXPECT_FALSE(resolved.value("build_config", "max_num_tokens").has_value());
  EXPECT_EQ(resolved.value("plugin_config", "use_paged_context_fmha"),
            OptionValue(false));
  EXPECT_EQ(resolved.value("build_config", "max_batch_size"), OptionValue(16));
  EXPECT_EQ(fallbacks, 0);

  llmb::core::BuildConfig build;
  arbitrator.resolve({&build.plugin_config, &build});
  EXPECT_EQ(fallbacks, 1);
  EXPECT_EQ(build.max_batch_size, 16);
  EXPECT_FALSE(build.max_num_tokens.has_value());
}

TEST_F(ConfigArbitratorTest, EarlierPerformanceClaimWins) {
  ConfigArbitrator arbitrator;
  int secondFallbacks = 0;
  arbitrator.claimPerformance("first", "build_config", {{"max_batch_size", 8}});
  arbitrator.claimPerformance("second", "build_config", {{"max_batch_size", 32}},
                              [&secondFallbacks]() { ++secondFallbacks; });

  llmb::core::BuildConfig build;
  auto resolved = arbitrator.resolve({&build});
  EXPECT_EQ(build.max_batch_size, 8);
  EXPECT_EQ(secondFallbacks, 1);
  EXPECT_EQ(resolved.store().source("build_config", "max_batch_size"), "first");
}

TEST_F(ConfigArbitratorTest, FirstFallbackOfAClaimIsKept) {
  ConfigArbitrator arbitrator;
  std::vector<std::string> calls;
  arbitrator.claimFunctional("streamingllm", "plugin_config",
                             {{"use_paged_context_fmha", false}});
  arbitrator.claimPerformance("chunked_context", "build_config",
                              {{"max_num_tokens", 1024}});
  arbitrator.claimPerformance("chunked_context", "plugin_config",
                              {{"use_paged_context_fmha", true}},
                              [&calls]() { calls.push_back("first"); });
  arbitrator.claimPerformance("chunked_context", "plugin_config",
                              {{"use_paged_context_fmha", true}},
                              [&calls]() { calls.push_back("second"); });

  llmb::core::BuildConfig build;
  arbitrator.resolve({&build.plugin_config, &build});
  EXPECT_EQ(calls, (std::vector<std::string>{"first"}));
}

TEST_F(ConfigArbitratorTest, FreshArbitratorsConverge) {
  int fallbacksA = 0;
  int fallbacksB = 0;
  ConfigArbitrator first;
  ConfigArbitrator second;
  registerStreamingClaims(first, fallbacksA);
  registerStreamingClaims(second, fallbacksB);

  auto a = first.arbitrate();
  auto b = second.arbitrate();
  EXPECT_EQ(a, b);
  EXPECT_EQ(a, first.arbitrate());
  EXPECT_EQ(fallbacksA, 0);

  llmb::core::BuildConfig buildA;
  llmb::core::KvCacheConfig kvA;
  llmb::core::BuildConfig buildB;
  llmb::core::KvCacheConfig kvB;
  first.resolve({&buildA.plugin_config, &kvA, &buildA});
  second.resolve({&buildB.plugin_config, &kvB, &buildB});
  EXPECT_EQ(buildA.snapshot(), buildB.snapshot());
  EXPECT_EQ(buildA.plugin_config.snapshot(), buildB.plugin_config.snapshot());
  EXPECT_EQ(kvA.snapshot(), kvB.snapshot());
  EXPECT_EQ(buildA.max_batch_size, 256);
  EXPECT_EQ(fallbacksA, 1);
  EXPECT_EQ(fallbacksB, 1);
}

TEST_F(ConfigArbitratorTest, UnknownOptionFailsBeforeAnyFallback) {
  ConfigArbitrator arbitrator;
  int fallbacks = 0;
  arbitrator.claimFunctional("featureA", "plugin_config",
                             {{"use_paged_context_fmha", false},
                              {"not_an_option", true}});
  arbitrator.claimPerformance("chunked_context", "plugin_config",
                              {{"use_paged_context_fmha", true}},
                              [&fallbacks]() { ++fallbacks; });

  llmb::core::PluginConfig plugin;
  EXPECT_THROW(arbitrator.resolve({&plugin}), llmb::core::InvalidOptionError);
  EXPECT_EQ(fallbacks, 0);
  EXPECT_FALSE(plugin.use_paged_context_fmha);
}

TEST_F(ConfigArbitratorTest, WrongValueTypeIsInvalidOption) {
  ConfigArbitrator arbitrator;
  arbitrator.claimFunctional("featureA", "kv_cache_config",
                             {{"enable_block_reuse", "yes"}});
  llmb::core::KvCacheConfig kv;
  EXPECT_THROW(arbitrator.resolve({&kv}), llmb::core::InvalidOptionError);
  EXPECT_FALSE(kv.enable_block_reuse);
}

TEST_F(ConfigArbitratorTest, GroupsWithoutTargetAreLeftInResult) {
  ConfigArbitrator arbitrator;
  arbitrator.claimFunctional("featureA", "other_config", {{"anything", 1}});
  llmb::core::PluginConfig plugin;
  auto resolved = arbitrator.resolve({&plugin});
  EXPECT_EQ(resolved.value("other_config", "anything"), OptionValue(1));
}
