#include "llmb/core/model_info.hpp"

#include "llmb/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace llmb::core {
namespace {

bool hasString(const nlohmann::json &data, const char *key) {
  auto it = data.find(key);
  return it != data.end() && it->is_string();
}

void validateFormat(ModelFormat format, const nlohmann::json &config) {
  std::string problem;
  switch (format) {
  case ModelFormat::Engine: {
    auto pretrained = config.find("pretrained_config");
    auto build = config.find("build_config");
    if (pretrained == config.end() || !pretrained->is_object())
      problem = "'pretrained_config' is not an object";
    else if (!hasString(*pretrained, "architecture") ||
             !hasString(*pretrained, "dtype"))
      problem = "'pretrained_config' lacks architecture or dtype";
    else if (build == config.end() || !build->is_object())
      problem = "'build_config' is not an object";
    break;
  }
  case ModelFormat::Checkpoint:
    if (!hasString(config, "architecture") || !hasString(config, "dtype"))
      problem = "architecture and dtype must be strings";
    else if (config.contains("mapping") && !config["mapping"].is_object())
      problem = "'mapping' is not an object";
    break;
  case ModelFormat::Source: {
    auto it = config.find("architectures");
    if (it == config.end() || !it->is_array() || it->empty() ||
        !it->front().is_string())
      problem = "no architectures listed";
    break;
  }
  }

  if (!problem.empty())
    throw FormatInferenceError(std::string("Inferred model format ") +
                               modelFormatName(format) +
                               ", but failed to load config.json: " + problem);
}

} // namespace

const char *modelFormatName(ModelFormat format) noexcept {
  switch (format) {
  case ModelFormat::Source:
    return "source";
  case ModelFormat::Checkpoint:
    return "checkpoint";
  case ModelFormat::Engine:
    return "engine";
  }
  return "unknown";
}

nlohmann::json readModelConfig(const std::filesystem::path &modelDir) {
  const auto path = modelDir / "config.json";
  std::ifstream in(path);
  if (!in)
    throw FormatInferenceError(
        "Failed to infer model format because no config.json exists in " +
        modelDir.string());

  nlohmann::json config;
  try {
    in >> config;
  } catch (const nlohmann::json::exception &e) {
    throw FormatInferenceError("Failed to parse " + path.string() + ": " +
                               e.what());
  }
  if (!config.is_object())
    throw FormatInferenceError(path.string() + " is not a JSON object");
  return config;
}

ModelFormat inferModelFormat(const std::filesystem::path &modelDir) {
  const auto config = readModelConfig(modelDir);

  ModelFormat format = ModelFormat::Source;
  if (config.contains("pretrained_config") && config.contains("build_config"))
    format = ModelFormat::Engine;
  else if (config.contains("architecture") && config.contains("dtype"))
    format = ModelFormat::Checkpoint;

  validateFormat(format, config);
  return format;
}

nlohmann::json PretrainedDescriptor::toJson() const {
  auto mappingJson = mapping.toJson();
  mappingJson.erase("rank");
  return {{"architecture", architecture},
          {"dtype", dtype},
          {"mapping", mappingJson}};
}

std::string resolveDtype(const std::string &requested,
                         const std::string &sourceDtype) {
  std::string dtype = requested;
  if (dtype.empty() || dtype == "auto")
    dtype = sourceDtype;
  if (dtype.empty() || dtype == "float32")
    dtype = "float16";
  return dtype;
}

PretrainedDescriptor
PretrainedDescriptor::fromSourceModel(const std::filesystem::path &dir,
                                      const std::string &dtype,
                                      const Mapping &mapping) {
  const auto config = readModelConfig(dir);
  validateFormat(ModelFormat::Source, config);

  PretrainedDescriptor descriptor;
  descriptor.architecture = config["architectures"].front().get<std::string>();
  descriptor.dtype =
      resolveDtype(dtype, config.value("torch_dtype", std::string()));
  descriptor.mapping = mapping;
  return descriptor;
}

PretrainedDescriptor
PretrainedDescriptor::fromCheckpoint(const std::filesystem::path &dir) {
  const auto config = readModelConfig(dir);
  validateFormat(ModelFormat::Checkpoint, config);

  PretrainedDescriptor descriptor;
  descriptor.architecture = config["architecture"].get<std::string>();
  descriptor.dtype = config["dtype"].get<std::string>();
  if (config.contains("mapping"))
    descriptor.mapping = Mapping::fromJson(config["mapping"]);
  return descriptor;
}

PretrainedDescriptor
PretrainedDescriptor::fromEngine(const std::filesystem::path &dir) {
  const auto config = readModelConfig(dir);
  validateFormat(ModelFormat::Engine, config);

  const auto &pretrained = config["pretrained_config"];
  PretrainedDescriptor descriptor;
  descriptor.architecture = pretrained["architecture"].get<std::string>();
  descriptor.dtype = pretrained["dtype"].get<std::string>();
  if (pretrained.contains("mapping"))
    descriptor.mapping = Mapping::fromJson(pretrained["mapping"]);
  return descriptor;
}

const std::string &ModelInfo::modelName() const {
  if (architecture.empty())
    throw std::runtime_error("The architecture is not set yet.");
  return architecture;
}

ModelInfo ModelInfo::fromDescriptor(const PretrainedDescriptor &descriptor) {
  return {descriptor.architecture, descriptor.dtype};
}

ModelInfo ModelInfo::fromEngineConfig(const nlohmann::json &config) {
  ModelInfo info;
  try {
    if (config.contains("version") && config.contains("builder_config")) {
      // Older engines keep the name in builder_config and the dtype on the
      // attention plugin.
      info.architecture = config.at("builder_config").at("name").get<std::string>();
      info.dtype = config.at("plugin_config")
                      .at("gpt_attention_plugin")
                      .get<std::string>();
    } else {
      const auto &pretrained = config.at("pretrained_config");
      info.architecture = pretrained.at("architecture").get<std::string>();
      info.dtype = pretrained.at("dtype").get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw FormatInferenceError(std::string("Malformed engine config: ") +
                               e.what());
  }
  return info;
}

} // namespace llmb::core
