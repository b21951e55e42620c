#pragma once

#include "llmb/core/cache_key.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace llmb::core {

inline constexpr const char *kManifestFileName = "manifest.json";

struct BuildCacheConfig {
  std::filesystem::path root = defaultRoot();
  std::size_t maxRecords = 10;
  double maxStorageGb = 256.0;

  // $XDG_CACHE_HOME/llmbuild/engines, or ~/.cache/llmbuild/engines.
  static std::filesystem::path defaultRoot();
};

struct BuildCacheEnvironment {
  bool enabled = false;
  BuildCacheConfig config;
};

// LLMB_BUILD_CACHE=1 turns caching on; LLMB_BUILD_CACHE_ROOT moves the root.
BuildCacheEnvironment buildCacheConfigFromEnv(BuildCacheConfig base = {});

// Total size of the regular files below dir. Throws CacheError when dir is not
// a directory.
double directorySizeInGb(const std::filesystem::path &dir);

struct CacheRecord {
  Fingerprint fingerprint;
  std::filesystem::path path;
  std::int64_t createdAtMs = 0;
  double sizeGb = 0.0;
  nlohmann::json inputs;
};

class BuildCache;

/**
 * @brief Exclusive right to populate one cache slot.
 *
 * Holds an flock on the slot's lock file for its whole lifetime, so writers in
 * other processes wait. Output goes to a private staging directory that
 * commit() renames onto the slot; a guard destroyed without commit() deletes
 * the staging directory and the slot stays absent.
 *
 * When another writer published the slot while this one waited for the lock,
 * alreadyPublished() is true and directory() points at the finished slot.
 */
class WriteGuard {
public:
  WriteGuard(WriteGuard &&other) noexcept;
  WriteGuard &operator=(WriteGuard &&other) noexcept;
  WriteGuard(const WriteGuard &) = delete;
  WriteGuard &operator=(const WriteGuard &) = delete;
  ~WriteGuard();

  const Fingerprint &fingerprint() const noexcept { return fingerprint_; }
  const std::filesystem::path &directory() const noexcept {
    return published_ ? slot_ : staging_;
  }
  const std::filesystem::path &slotPath() const noexcept { return slot_; }
  bool alreadyPublished() const noexcept { return published_; }
  bool committed() const noexcept { return committed_; }

  // Writes the manifest and publishes the staging directory. Throws
  // CacheError when the rename fails; the slot is then left absent.
  void commit();

private:
  friend class BuildCache;

  WriteGuard(BuildCache &cache, Fingerprint fingerprint,
             std::filesystem::path slot, nlohmann::json inputs, int lockFd);

  void release() noexcept;

  BuildCache *cache_;
  Fingerprint fingerprint_;
  std::filesystem::path slot_;
  std::filesystem::path staging_;
  nlohmann::json inputs_;
  int lockFd_ = -1;
  bool published_ = false;
  bool committed_ = false;
};

// One fingerprint looked up in a BuildCache, together with the key document it
// was computed from.
class CachedStage {
public:
  CachedStage(BuildCache &cache, Fingerprint fingerprint,
              nlohmann::json inputs);

  const Fingerprint &fingerprint() const noexcept { return fingerprint_; }
  const nlohmann::json &inputs() const noexcept { return inputs_; }
  BuildCache &parent() const noexcept { return *cache_; }

  bool isCached() const;
  std::filesystem::path enginePath() const;
  WriteGuard writeGuard() const;

private:
  BuildCache *cache_;
  Fingerprint fingerprint_;
  nlohmann::json inputs_;
};

/**
 * @brief Content addressed store of built engines.
 *
 * Layout below the root:
 *   <fingerprint>/            complete slot: engine files + manifest.json
 *   .staging/<fp>.<pid>.<n>/  in-progress writes
 *   .locks/<fp>.lock          per-slot flock files
 */
class BuildCache {
public:
  using StorageProbe = std::function<double(const std::filesystem::path &)>;
  using Clock = std::function<std::int64_t()>;

  explicit BuildCache(BuildCacheConfig config = {});

  const BuildCacheConfig &config() const noexcept { return config_; }
  const std::filesystem::path &root() const noexcept { return config_.root; }

  bool isCached(const Fingerprint &fingerprint) const;
  std::filesystem::path pathFor(const Fingerprint &fingerprint) const;

  CachedStage stage(const CacheKeyBuilder &key);
  WriteGuard writeGuard(const Fingerprint &fingerprint,
                        nlohmann::json inputs = nlohmann::json::object());

  double freeStorageInGb() const;

  // Complete slots, oldest first.
  std::vector<CacheRecord> records() const;
  std::optional<CacheRecord> record(const Fingerprint &fingerprint) const;

  // Removes the oldest complete slots until both the record and the storage
  // limits hold. Slots locked by a writer and the keep slot are skipped, so a
  // freshly committed slot survives even when it alone exceeds the limits.
  // Returns the number of removed slots.
  std::size_t prune(const std::optional<Fingerprint> &keep = std::nullopt);
  std::size_t clear();

  void setStorageProbe(StorageProbe probe) { storageProbe_ = std::move(probe); }
  void setClock(Clock clock) { clock_ = std::move(clock); }

private:
  friend class WriteGuard;

  std::filesystem::path lockPath(const Fingerprint &fingerprint) const;
  std::filesystem::path stagingRoot() const;
  std::optional<CacheRecord> readRecord(const std::filesystem::path &slot) const;
  bool removeUnlocked(const std::filesystem::path &target,
                      const Fingerprint &fingerprint);
  void ensureLayout() const;
  std::int64_t nowMs() const;

  BuildCacheConfig config_;
  StorageProbe storageProbe_;
  Clock clock_;
};

} // namespace llmb::core
