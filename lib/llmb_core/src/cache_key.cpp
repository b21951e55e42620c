#include "llmb/core/cache_key.hpp"

#include "llmb/core/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace llmb::core {

std::string sha256Hex(const std::string &data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(),
                 nullptr) != 1)
    throw CacheError("SHA-256 digest failed");

  static const char *hexDigits = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(hexDigits[digest[i] >> 4]);
    hex.push_back(hexDigits[digest[i] & 0x0f]);
  }
  return hex;
}

Fingerprint::Fingerprint(std::string hex) : hex_(std::move(hex)) {
  if (!isValid(hex_))
    throw InvalidArgumentError("Invalid cache fingerprint '" + hex_ + "'");
}

bool Fingerprint::isValid(const std::string &hex) noexcept {
  if (hex.size() != 64)
    return false;
  return std::all_of(hex.begin(), hex.end(), [](char ch) {
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
  });
}

namespace {

struct ListedFile {
  std::string path;
  std::uintmax_t size = 0;
  std::int64_t mtime = 0;

  bool operator<(const ListedFile &other) const { return path < other.path; }
};

} // namespace

nlohmann::json directoryListing(const std::filesystem::path &dir) {
  std::vector<ListedFile> files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec)
    throw CacheError("Cannot list " + dir.string() + ": " + ec.message());

  for (const auto end = std::filesystem::recursive_directory_iterator();
       it != end; it.increment(ec)) {
    if (ec)
      throw CacheError("Cannot list " + dir.string() + ": " + ec.message());
    std::error_code statError;
    if (!it->is_regular_file(statError))
      continue;
    auto size = it->file_size(statError);
    if (statError)
      continue;
    auto written = it->last_write_time(statError);
    if (statError)
      continue;
    files.push_back(
        {std::filesystem::relative(it->path(), dir).generic_string(), size,
         static_cast<std::int64_t>(written.time_since_epoch().count())});
  }

  std::sort(files.begin(), files.end());
  nlohmann::json listing = nlohmann::json::array();
  for (const auto &file : files)
    listing.push_back(nlohmann::json{
        {"path", file.path}, {"size", file.size}, {"mtime", file.mtime}});
  return listing;
}

CacheKeyBuilder::CacheKeyBuilder() : document_(nlohmann::json::object()) {
  document_["format_version"] = kCacheFormatVersion;
}

CacheKeyBuilder &CacheKeyBuilder::buildConfig(const BuildConfig &config) {
  document_["build_config"] = config.toJson();
  return *this;
}

CacheKeyBuilder &CacheKeyBuilder::pluginConfig(const PluginConfig &config) {
  document_["plugin_config"] = config.toJson();
  return *this;
}

CacheKeyBuilder &
CacheKeyBuilder::parallelConfig(const ParallelConfig &config) {
  document_["parallel_config"] = config.toJson();
  return *this;
}

CacheKeyBuilder &CacheKeyBuilder::quantConfig(const QuantConfig &config) {
  document_["quant_config"] = config.toJson();
  return *this;
}

CacheKeyBuilder &
CacheKeyBuilder::pretrained(const PretrainedDescriptor &descriptor) {
  document_["pretrained_config"] = descriptor.toJson();
  return *this;
}

CacheKeyBuilder &CacheKeyBuilder::hubModel(const std::string &modelId,
                                           const std::string &revision) {
  document_["model_source"] = {
      {"kind", "hub"}, {"id", modelId}, {"revision", revision}};
  return *this;
}

CacheKeyBuilder &
CacheKeyBuilder::localModel(const std::filesystem::path &modelDir) {
  std::error_code ec;
  auto location = std::filesystem::weakly_canonical(modelDir, ec);
  if (ec)
    throw CacheError("Cannot resolve " + modelDir.string() + ": " +
                     ec.message());
  document_["model_source"] = {{"kind", "local"},
                               {"path", location.generic_string()},
                               {"files", directoryListing(modelDir)}};
  return *this;
}

CacheKeyBuilder &CacheKeyBuilder::formatVersion(const std::string &version) {
  document_["format_version"] = version;
  return *this;
}

Fingerprint CacheKeyBuilder::fingerprint() const {
  return Fingerprint(sha256Hex(document_.dump()));
}

} // namespace llmb::core
