#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace llmb::core {

// Fetches the config.json of hub models so their identity can be computed
// without downloading any weights.
class HubClient {
public:
  explicit HubClient(std::string endpoint = defaultEndpoint(),
                     std::filesystem::path cacheDir = defaultCacheDir());
  ~HubClient();

  HubClient(const HubClient &) = delete;
  HubClient &operator=(const HubClient &) = delete;

  // $LLMB_HUB_ENDPOINT, or https://huggingface.co.
  static std::string defaultEndpoint();
  // $XDG_CACHE_HOME/llmbuild/hub, or ~/.cache/llmbuild/hub.
  static std::filesystem::path defaultCacheDir();

  const std::string &endpoint() const { return endpoint_; }
  std::filesystem::path configDirFor(const std::string &modelId,
                                     const std::string &revision) const;
  std::string configUrl(const std::string &modelId,
                        const std::string &revision) const;

  // Returns the local directory holding config.json. A previously fetched
  // file is reused.
  std::optional<std::filesystem::path>
  fetchConfig(const std::string &modelId, const std::string &revision = "main",
              std::string *errorMessage = nullptr) const;

private:
  bool downloadFile(const std::string &url,
                    const std::filesystem::path &destination,
                    std::string *errorMessage) const;

  std::string endpoint_;
  std::filesystem::path cacheDir_;
};

} // namespace llmb::core
