#pragma once

#include "llmb/core/build_args.hpp"
#include "llmb/core/build_cache.hpp"
#include "llmb/core/build_stats.hpp"
#include "llmb/core/engine.hpp"
#include "llmb/core/hub_client.hpp"
#include "llmb/core/worker_session.hpp"

#include <filesystem>
#include <memory>
#include <optional>

namespace llmb::core {

/**
 * @brief Produces a usable engine directory for a set of BuildArgs.
 *
 * Engine input is returned as is. Source models are built through the build
 * cache when it is enabled: a hit reuses the cached slot, a miss builds inside
 * the slot's write guard and publishes it. When the cache root has less free
 * space than the model occupies the build goes to the workspace instead and
 * BuildStats::cacheInfo says so.
 *
 * Multi-GPU builds run every rank through the WorkerSession. Uncached engines
 * live in the workspace, which is deleted with the loader unless the caller
 * supplied it; use save() to keep them.
 */
class CachedModelLoader {
public:
  CachedModelLoader(BuildArgs &args, Toolchain toolchain, BuildStats &stats,
                    WorkerSession *session = nullptr,
                    std::filesystem::path workspace = {});
  ~CachedModelLoader();

  CachedModelLoader(const CachedModelLoader &) = delete;
  CachedModelLoader &operator=(const CachedModelLoader &) = delete;

  std::filesystem::path run();

  // Where the engine is or will be.
  std::filesystem::path engineDir() const;
  bool buildCacheEnabled() const;
  const std::filesystem::path &workspace() const noexcept { return workspace_; }

  BuildCache &buildCache() noexcept { return *cache_; }
  void setHubClient(std::shared_ptr<HubClient> client) {
    hubClient_ = std::move(client);
  }

  // Descriptor that goes into the cache key.
  PretrainedDescriptor pretrainedDescriptor() const;

  // Copies the engine directory to target.
  void save(const std::filesystem::path &target) const;

private:
  CachedStage engineCacheStage();
  std::filesystem::path buildModel();
  void buildTask(const std::filesystem::path &engineDir);

  BuildArgs &args_;
  Toolchain toolchain_;
  BuildStats &stats_;
  WorkerSession *session_;
  std::filesystem::path workspace_;
  bool ownsWorkspace_ = false;

  std::unique_ptr<BuildCache> cache_;
  std::shared_ptr<HubClient> hubClient_;
  std::optional<std::filesystem::path> sourceModelDir_;
  std::optional<CachedStage> stage_;
  bool cachingActive_ = false;
};

} // namespace llmb::core
