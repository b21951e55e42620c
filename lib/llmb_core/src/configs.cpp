#include "llmb/core/configs.hpp"

#include "llmb/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>

namespace llmb::core {
namespace {

using config::OptionDefinition;
using config::OptionKind;
using config::OptionValue;

template <typename Config> struct Field {
  OptionDefinition definition;
  std::function<OptionValue(const Config &)> read;
  std::function<void(Config &, const OptionValue &)> write;
};

template <typename Config> class FieldTable {
public:
  FieldTable(const char *group, std::vector<Field<Config>> fields)
      : group_(group), fields_(std::move(fields)) {
    Config defaults{};
    for (auto &field : fields_) {
      field.definition.defaultValue = field.read(defaults);
      definitions_.push_back(field.definition);
    }
  }

  const std::vector<OptionDefinition> &definitions() const {
    return definitions_;
  }

  OptionValue get(const Config &config, const std::string &key) const {
    return lookup(key).read(config);
  }

  void assign(Config &config, const std::string &key,
              const OptionValue &value) const {
    const auto &field = lookup(key);
    const auto &def = field.definition;
    if (!config::isCompatible(def.kind, value.type(), def.nullable)) {
      std::ostringstream message;
      message << "Invalid value '" << value.describe() << "' ("
              << config::valueTypeName(value.type()) << ") for option '" << key
              << "' of '" << group_ << "', expected "
              << config::kindName(def.kind)
              << (def.nullable ? " or None" : "") << ".";
      throw InvalidOptionError(message.str());
    }
    field.write(config, value);
  }

private:
  const Field<Config> &lookup(const std::string &key) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const Field<Config> &field) {
                             return field.definition.key == key;
                           });
    if (it == fields_.end())
      throw InvalidOptionError("'" + group_ + "' has no option named '" +
                               key + "'.");
    return *it;
  }

  std::string group_;
  std::vector<Field<Config>> fields_;
  std::vector<OptionDefinition> definitions_;
};

template <typename Config>
Field<Config> boolField(const char *key, bool Config::*member,
                        const char *description) {
  return {{key, OptionKind::Boolean, {}, description, false},
          [member](const Config &c) { return OptionValue(c.*member); },
          [member](Config &c, const OptionValue &v) {
            c.*member = v.toBool();
          }};
}

template <typename Config>
Field<Config> intField(const char *key, std::int64_t Config::*member,
                       const char *description) {
  return {{key, OptionKind::Integer, {}, description, false},
          [member](const Config &c) { return OptionValue(c.*member); },
          [member](Config &c, const OptionValue &v) {
            c.*member = v.toInteger();
          }};
}

template <typename Config>
Field<Config> optionalIntField(const char *key,
                               std::optional<std::int64_t> Config::*member,
                               const char *description) {
  return {{key, OptionKind::Integer, {}, description, true},
          [member](const Config &c) {
            return (c.*member) ? OptionValue(*(c.*member)) : OptionValue();
          },
          [member](Config &c, const OptionValue &v) {
            if (v.isNull())
              c.*member = std::nullopt;
            else
              c.*member = v.toInteger();
          }};
}

template <typename Config>
Field<Config> optionalDoubleField(const char *key,
                                  std::optional<double> Config::*member,
                                  const char *description) {
  return {{key, OptionKind::Double, {}, description, true},
          [member](const Config &c) {
            return (c.*member) ? OptionValue(*(c.*member)) : OptionValue();
          },
          [member](Config &c, const OptionValue &v) {
            if (v.isNull())
              c.*member = std::nullopt;
            else
              c.*member = v.toDouble();
          }};
}

template <typename Config>
Field<Config> stringField(const char *key, std::string Config::*member,
                          const char *description) {
  return {{key, OptionKind::String, {}, description, false},
          [member](const Config &c) { return OptionValue(c.*member); },
          [member](Config &c, const OptionValue &v) {
            c.*member = v.toString();
          }};
}

template <typename Config>
Field<Config> optionalIntListField(
    const char *key, std::optional<std::vector<std::int64_t>> Config::*member,
    const char *description) {
  return {{key, OptionKind::IntegerList, {}, description, true},
          [member](const Config &c) {
            return (c.*member) ? OptionValue(*(c.*member)) : OptionValue();
          },
          [member](Config &c, const OptionValue &v) {
            if (v.isNull())
              c.*member = std::nullopt;
            else
              c.*member = v.toIntegerList();
          }};
}

template <typename Config>
Field<Config> quantAlgoField(const char *key, QuantAlgo Config::*member,
                             const char *description) {
  return {{key, OptionKind::String, {}, description, false},
          [member](const Config &c) {
            return OptionValue(quantAlgoName(c.*member));
          },
          [member, key](Config &c, const OptionValue &v) {
            auto parsed = parseQuantAlgo(v.toString());
            if (!parsed)
              throw InvalidOptionError("Unknown quantization algorithm '" +
                                       v.toString() + "' for option '" + key +
                                       "'.");
            c.*member = *parsed;
          }};
}

const FieldTable<PluginConfig> &pluginFields() {
  static const FieldTable<PluginConfig> table(
      "plugin_config",
      {
          boolField("use_paged_context_fmha",
                    &PluginConfig::use_paged_context_fmha,
                    "Context attention over the paged KV cache."),
          boolField("streamingllm", &PluginConfig::streamingllm,
                    "Streaming LLM attention with sink tokens."),
          boolField("manage_weights", &PluginConfig::manage_weights,
                    "Engine manages its own weights."),
          stringField("nccl_plugin", &PluginConfig::nccl_plugin,
                      "NCCL plugin dtype, empty disables it."),
          stringField("lora_plugin", &PluginConfig::lora_plugin,
                      "LoRA plugin dtype, empty disables it."),
          stringField("gpt_attention_plugin",
                      &PluginConfig::gpt_attention_plugin,
                      "GPT attention plugin dtype."),
          boolField("use_fp8_context_fmha",
                    &PluginConfig::use_fp8_context_fmha,
                    "FP8 context attention."),
          boolField("paged_kv_cache", &PluginConfig::paged_kv_cache,
                    "Paged KV cache."),
          boolField("remove_input_padding",
                    &PluginConfig::remove_input_padding,
                    "Packed input tensors."),
          boolField("context_fmha", &PluginConfig::context_fmha,
                    "Fused multi-head attention in context phase."),
      });
  return table;
}

const FieldTable<KvCacheConfig> &kvCacheFields() {
  static const FieldTable<KvCacheConfig> table(
      "kv_cache_config",
      {
          boolField("enable_block_reuse", &KvCacheConfig::enable_block_reuse,
                    "Reuse KV cache blocks across requests."),
          optionalIntField("max_tokens", &KvCacheConfig::max_tokens,
                           "Upper bound of tokens held by the KV cache."),
          optionalIntListField("max_attention_window",
                               &KvCacheConfig::max_attention_window,
                               "Attention window size per layer."),
          optionalIntField("sink_token_length",
                           &KvCacheConfig::sink_token_length,
                           "Number of sink tokens kept in the window."),
          optionalDoubleField("free_gpu_memory_fraction",
                              &KvCacheConfig::free_gpu_memory_fraction,
                              "Share of free device memory for the cache."),
      });
  return table;
}

const FieldTable<BuildConfig> &buildFields() {
  static const FieldTable<BuildConfig> table(
      "build_config",
      {
          intField("max_input_len", &BuildConfig::max_input_len,
                   "Maximum input length."),
          optionalIntField("max_seq_len", &BuildConfig::max_seq_len,
                           "Maximum total sequence length."),
          intField("max_batch_size", &BuildConfig::max_batch_size,
                   "Maximum batch size."),
          intField("max_beam_width", &BuildConfig::max_beam_width,
                   "Maximum beam width."),
          optionalIntField("max_num_tokens", &BuildConfig::max_num_tokens,
                           "Maximum tokens per batch after padding removal."),
          intField("max_prompt_embedding_table_size",
                   &BuildConfig::max_prompt_embedding_table_size,
                   "Prompt tuning table size."),
          boolField("strongly_typed", &BuildConfig::strongly_typed,
                    "Strongly typed network."),
          boolField("gather_context_logits",
                    &BuildConfig::gather_context_logits,
                    "Return logits of the context phase."),
          intField("max_lora_rank", &BuildConfig::max_lora_rank,
                   "Largest LoRA rank."),
      });
  return table;
}

const FieldTable<QuantConfig> &quantFields() {
  static const FieldTable<QuantConfig> table(
      "quant_config",
      {
          quantAlgoField("quant_algo", &QuantConfig::quant_algo,
                         "Weight and activation quantization."),
          quantAlgoField("kv_cache_quant_algo",
                         &QuantConfig::kv_cache_quant_algo,
                         "KV cache quantization."),
          intField("group_size", &QuantConfig::group_size,
                   "Group size of group-wise quantization."),
      });
  return table;
}

const FieldTable<CalibConfig> &calibFields() {
  static const FieldTable<CalibConfig> table(
      "calib_config",
      {
          stringField("device", &CalibConfig::device,
                      "Device that runs calibration."),
          stringField("calib_dataset", &CalibConfig::calib_dataset,
                      "Name or path of the calibration dataset."),
          intField("calib_batches", &CalibConfig::calib_batches,
                   "Number of calibration batches."),
          intField("calib_batch_size", &CalibConfig::calib_batch_size,
                   "Calibration batch size."),
          intField("calib_max_seq_length", &CalibConfig::calib_max_seq_length,
                   "Calibration sequence length."),
          intField("random_seed", &CalibConfig::random_seed, "Random seed."),
          intField("tokenizer_max_seq_length",
                   &CalibConfig::tokenizer_max_seq_length,
                   "Tokenizer sequence length for calibration."),
      });
  return table;
}

} // namespace

bool ConfigObject::has(const std::string &key) const {
  const auto &defs = definitions();
  return std::any_of(defs.begin(), defs.end(),
                     [&](const auto &def) { return def.key == key; });
}

std::vector<std::string> ConfigObject::keys() const {
  std::vector<std::string> result;
  for (const auto &def : definitions())
    result.push_back(def.key);
  return result;
}

config::OptionMap ConfigObject::snapshot() const {
  config::OptionMap result;
  for (const auto &def : definitions())
    result[def.key] = get(def.key);
  return result;
}

nlohmann::json ConfigObject::toJson() const {
  return config::toJson(snapshot());
}

void ConfigObject::update(const nlohmann::json &data) {
  if (!data.is_object())
    return;
  for (const auto &def : definitions()) {
    auto it = data.find(def.key);
    if (it == data.end())
      continue;
    OptionValue value = config::fromJson(def.kind, *it);
    if (value.isNull() && !def.nullable)
      continue;
    assign(def.key, value);
  }
}

const std::vector<config::OptionDefinition> &
PluginConfig::definitions() const {
  return pluginFields().definitions();
}

config::OptionValue PluginConfig::get(const std::string &key) const {
  return pluginFields().get(*this, key);
}

void PluginConfig::assign(const std::string &key,
                          const config::OptionValue &value) {
  pluginFields().assign(*this, key, value);
}

const std::vector<config::OptionDefinition> &
KvCacheConfig::definitions() const {
  return kvCacheFields().definitions();
}

config::OptionValue KvCacheConfig::get(const std::string &key) const {
  return kvCacheFields().get(*this, key);
}

void KvCacheConfig::assign(const std::string &key,
                           const config::OptionValue &value) {
  kvCacheFields().assign(*this, key, value);
}

const std::vector<config::OptionDefinition> &
BuildConfig::definitions() const {
  return buildFields().definitions();
}

config::OptionValue BuildConfig::get(const std::string &key) const {
  return buildFields().get(*this, key);
}

void BuildConfig::assign(const std::string &key,
                         const config::OptionValue &value) {
  buildFields().assign(*this, key, value);
}

nlohmann::json BuildConfig::toFullJson() const {
  nlohmann::json data = toJson();
  data["plugin_config"] = plugin_config.toJson();
  return data;
}

BuildConfig BuildConfig::fromFullJson(const nlohmann::json &data) {
  BuildConfig config;
  config.update(data);
  if (data.is_object() && data.contains("plugin_config"))
    config.plugin_config.update(data["plugin_config"]);
  return config;
}

const char *quantAlgoName(QuantAlgo algo) noexcept {
  switch (algo) {
  case QuantAlgo::None:
    return "none";
  case QuantAlgo::Fp8:
    return "fp8";
  case QuantAlgo::Int8WeightOnly:
    return "w8a16";
  case QuantAlgo::Int4WeightOnly:
    return "w4a16";
  case QuantAlgo::W4A16Awq:
    return "w4a16_awq";
  case QuantAlgo::W8A8SmoothQuant:
    return "w8a8_sq_per_channel";
  }
  return "none";
}

std::optional<QuantAlgo> parseQuantAlgo(const std::string &name) {
  std::string lower;
  for (char ch : name)
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  for (auto algo : {QuantAlgo::None, QuantAlgo::Fp8, QuantAlgo::Int8WeightOnly,
                    QuantAlgo::Int4WeightOnly, QuantAlgo::W4A16Awq,
                    QuantAlgo::W8A8SmoothQuant}) {
    if (lower == quantAlgoName(algo))
      return algo;
  }
  if (lower.empty())
    return QuantAlgo::None;
  return std::nullopt;
}

bool QuantConfig::requiresCalibration() const noexcept {
  switch (quant_algo) {
  case QuantAlgo::Fp8:
  case QuantAlgo::W4A16Awq:
  case QuantAlgo::W8A8SmoothQuant:
    return true;
  default:
    break;
  }
  return kv_cache_quant_algo == QuantAlgo::Fp8 ||
         kv_cache_quant_algo == QuantAlgo::W8A8SmoothQuant;
}

const std::vector<config::OptionDefinition> &
QuantConfig::definitions() const {
  return quantFields().definitions();
}

config::OptionValue QuantConfig::get(const std::string &key) const {
  return quantFields().get(*this, key);
}

void QuantConfig::assign(const std::string &key,
                         const config::OptionValue &value) {
  quantFields().assign(*this, key, value);
}

const std::vector<config::OptionDefinition> &
CalibConfig::definitions() const {
  return calibFields().definitions();
}

config::OptionValue CalibConfig::get(const std::string &key) const {
  return calibFields().get(*this, key);
}

void CalibConfig::assign(const std::string &key,
                         const config::OptionValue &value) {
  calibFields().assign(*this, key, value);
}

nlohmann::json Mapping::toJson() const {
  return {{"world_size", worldSize},
          {"tp_size", tpSize},
          {"pp_size", ppSize},
          {"rank", rank}};
}

Mapping Mapping::fromJson(const nlohmann::json &data) {
  Mapping mapping;
  if (!data.is_object())
    return mapping;
  mapping.tpSize = data.value("tp_size", 1);
  mapping.ppSize = data.value("pp_size", 1);
  mapping.worldSize = data.value("world_size", mapping.tpSize * mapping.ppSize);
  mapping.rank = data.value("rank", 0);
  return mapping;
}

int ParallelConfig::worldSize() const {
  if (autoParallel) {
    if (tpSize > 1 || ppSize > 1)
      throw InvalidArgumentError(
          "manually TP and PP are not supported in auto parallel mode.");
    return worldSize_;
  }
  if (worldSize_ > 1)
    throw InvalidArgumentError(
        "world_size > 1 is only supported in auto parallel mode.");
  return tpSize * ppSize;
}

void ParallelConfig::setWorldSize(int worldSize) {
  if (autoParallel) {
    worldSize_ = worldSize;
    return;
  }
  if (worldSize != tpSize * ppSize)
    throw InvalidArgumentError(
        "world_size " + std::to_string(worldSize) +
        " should be equal to tp_size * pp_size " +
        std::to_string(tpSize * ppSize) + " in non-auto_parallel mode.");
}

std::vector<int> ParallelConfig::devices() const {
  if (devices_)
    return *devices_;
  std::vector<int> result(static_cast<std::size_t>(worldSize()));
  for (std::size_t i = 0; i < result.size(); ++i)
    result[i] = static_cast<int>(i);
  return result;
}

void ParallelConfig::setDevices(std::vector<int> devices) {
  if (static_cast<int>(devices.size()) != worldSize())
    throw InvalidArgumentError("devices should have the same length as "
                               "world_size " +
                               std::to_string(worldSize()) + ".");
  devices_ = std::move(devices);
}

nlohmann::json ParallelConfig::toJson() const {
  return {{"tp_size", tpSize},
          {"pp_size", ppSize},
          {"auto_parallel", autoParallel},
          {"world_size", worldSize()}};
}

} // namespace llmb::core
