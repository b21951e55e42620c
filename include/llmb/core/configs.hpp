#pragma once

#include "llmb/options.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llmb::core {

// A live configuration object the arbitrator writes resolved options into.
// Options are addressed by their serialized key, e.g. "use_paged_context_fmha".
class ConfigObject {
public:
  virtual ~ConfigObject() = default;

  virtual const char *groupName() const noexcept = 0;
  virtual const std::vector<config::OptionDefinition> &definitions() const = 0;

  // Both throw InvalidOptionError for unknown keys; assign() also rejects
  // values whose type does not match the option kind.
  virtual config::OptionValue get(const std::string &key) const = 0;
  virtual void assign(const std::string &key,
                      const config::OptionValue &value) = 0;

  bool has(const std::string &key) const;
  std::vector<std::string> keys() const;
  config::OptionMap snapshot() const;
  nlohmann::json toJson() const;

  // Copies known keys from a JSON object, ignoring unknown ones.
  void update(const nlohmann::json &data);
};

class PluginConfig : public ConfigObject {
public:
  bool use_paged_context_fmha = false;
  bool streamingllm = false;
  bool manage_weights = false;
  std::string nccl_plugin = "auto"; // empty disables the plugin
  std::string lora_plugin;
  std::string gpt_attention_plugin = "auto";
  bool use_fp8_context_fmha = false;
  bool paged_kv_cache = true;
  bool remove_input_padding = true;
  bool context_fmha = true;

  const char *groupName() const noexcept override { return "plugin_config"; }
  const std::vector<config::OptionDefinition> &definitions() const override;
  config::OptionValue get(const std::string &key) const override;
  void assign(const std::string &key,
              const config::OptionValue &value) override;
};

class KvCacheConfig : public ConfigObject {
public:
  bool enable_block_reuse = false;
  std::optional<std::int64_t> max_tokens;
  std::optional<std::vector<std::int64_t>> max_attention_window;
  std::optional<std::int64_t> sink_token_length;
  std::optional<double> free_gpu_memory_fraction;

  const char *groupName() const noexcept override { return "kv_cache_config"; }
  const std::vector<config::OptionDefinition> &definitions() const override;
  config::OptionValue get(const std::string &key) const override;
  void assign(const std::string &key,
              const config::OptionValue &value) override;
};

class BuildConfig : public ConfigObject {
public:
  std::int64_t max_input_len = 1024;
  std::optional<std::int64_t> max_seq_len;
  std::int64_t max_batch_size = 2048;
  std::int64_t max_beam_width = 1;
  std::optional<std::int64_t> max_num_tokens;
  std::int64_t max_prompt_embedding_table_size = 0;
  bool strongly_typed = true;
  bool gather_context_logits = false;
  std::int64_t max_lora_rank = 64;

  PluginConfig plugin_config;

  const char *groupName() const noexcept override { return "build_config"; }
  const std::vector<config::OptionDefinition> &definitions() const override;
  config::OptionValue get(const std::string &key) const override;
  void assign(const std::string &key,
              const config::OptionValue &value) override;

  // Build options plus a nested "plugin_config" object, the layout engine
  // directories persist.
  nlohmann::json toFullJson() const;
  static BuildConfig fromFullJson(const nlohmann::json &data);
};

enum class QuantAlgo {
  None,
  Fp8,
  Int8WeightOnly,
  Int4WeightOnly,
  W4A16Awq,
  W8A8SmoothQuant
};

const char *quantAlgoName(QuantAlgo algo) noexcept;
std::optional<QuantAlgo> parseQuantAlgo(const std::string &name);

class QuantConfig : public ConfigObject {
public:
  QuantAlgo quant_algo = QuantAlgo::None;
  QuantAlgo kv_cache_quant_algo = QuantAlgo::None;
  std::int64_t group_size = 128;

  bool requiresCalibration() const noexcept;

  const char *groupName() const noexcept override { return "quant_config"; }
  const std::vector<config::OptionDefinition> &definitions() const override;
  config::OptionValue get(const std::string &key) const override;
  void assign(const std::string &key,
              const config::OptionValue &value) override;
};

class CalibConfig : public ConfigObject {
public:
  std::string device = "cuda";
  std::string calib_dataset = "cnn_dailymail";
  std::int64_t calib_batches = 512;
  std::int64_t calib_batch_size = 1;
  std::int64_t calib_max_seq_length = 512;
  std::int64_t random_seed = 1234;
  std::int64_t tokenizer_max_seq_length = 2048;

  const char *groupName() const noexcept override { return "calib_config"; }
  const std::vector<config::OptionDefinition> &definitions() const override;
  config::OptionValue get(const std::string &key) const override;
  void assign(const std::string &key,
              const config::OptionValue &value) override;
};

// Rank placement inside a tensor/pipeline parallel grid.
struct Mapping {
  int worldSize = 1;
  int tpSize = 1;
  int ppSize = 1;
  int rank = 0;

  nlohmann::json toJson() const;
  static Mapping fromJson(const nlohmann::json &data);

  bool operator==(const Mapping &other) const noexcept {
    return worldSize == other.worldSize && tpSize == other.tpSize &&
           ppSize == other.ppSize && rank == other.rank;
  }
};

class ParallelConfig {
public:
  ParallelConfig() = default;
  ParallelConfig(int tpSize, int ppSize, bool autoParallel = false)
      : tpSize(tpSize), ppSize(ppSize), autoParallel(autoParallel) {}

  int tpSize = 1;
  int ppSize = 1;
  bool autoParallel = false;

  // tp * pp outside auto parallel mode. Throws InvalidArgumentError when the
  // manual and automatic settings are mixed.
  int worldSize() const;
  void setWorldSize(int worldSize);

  std::vector<int> devices() const;
  void setDevices(std::vector<int> devices);

  bool isMultiGpu() const { return worldSize() > 1; }

  nlohmann::json toJson() const;

private:
  int worldSize_ = 1;
  std::optional<std::vector<int>> devices_;
};

} // namespace llmb::core
