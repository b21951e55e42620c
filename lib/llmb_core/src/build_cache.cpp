#include "llmb/core/build_cache.hpp"

#include "llmb/core/errors.hpp"
#include "llmb/log.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>

namespace llmb::core {
namespace {

constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;

// Opens (creating if needed) and locks a lock file. Returns -1 when the lock
// is held elsewhere and blocking is false.
int lockFile(const std::filesystem::path &path, bool blocking) {
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0)
    throw CacheError("Cannot open lock file " + path.string() + ": " +
                     std::strerror(errno));

  int operation = LOCK_EX | (blocking ? 0 : LOCK_NB);
  while (::flock(fd, operation) != 0) {
    if (errno == EINTR)
      continue;
    int error = errno;
    ::close(fd);
    if (!blocking && error == EWOULDBLOCK)
      return -1;
    throw CacheError("Cannot lock " + path.string() + ": " +
                     std::strerror(error));
  }
  return fd;
}

void unlockFile(int fd) noexcept {
  if (fd < 0)
    return;
  ::flock(fd, LOCK_UN);
  ::close(fd);
}

std::filesystem::path existingAncestor(std::filesystem::path path) {
  std::error_code ec;
  while (!path.empty() && !std::filesystem::exists(path, ec)) {
    auto parent = path.parent_path();
    if (parent == path)
      break;
    path = parent;
  }
  return path.empty() ? std::filesystem::current_path() : path;
}

// Unique directory name below .staging for fingerprint, e.g. "<fp>.<pid>.<n>".
std::string stagingName(const Fingerprint &fingerprint, const char *tag) {
  static std::atomic<unsigned> counter{0};
  return fingerprint.str() + "." + tag + std::to_string(::getpid()) + "." +
         std::to_string(counter.fetch_add(1));
}

bool envFlag(const char *name) {
  const char *value = std::getenv(name);
  if (!value)
    return false;
  std::string text(value);
  return text == "1" || text == "true" || text == "TRUE" || text == "on" ||
         text == "yes";
}

} // namespace

std::filesystem::path BuildCacheConfig::defaultRoot() {
  std::filesystem::path cacheHome;
  if (const char *xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
    cacheHome = xdg;
  else if (const char *home = std::getenv("HOME"); home && *home)
    cacheHome = std::filesystem::path(home) / ".cache";
  else
    cacheHome = std::filesystem::temp_directory_path();
  return cacheHome / "llmbuild" / "engines";
}

BuildCacheEnvironment buildCacheConfigFromEnv(BuildCacheConfig base) {
  BuildCacheEnvironment env;
  env.enabled = envFlag("LLMB_BUILD_CACHE");
  env.config = std::move(base);
  if (const char *root = std::getenv("LLMB_BUILD_CACHE_ROOT"); root && *root)
    env.config.root = root;
  return env;
}

double directorySizeInGb(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec))
    throw CacheError(dir.string() + " is not a directory");

  std::uintmax_t total = 0;
  std::filesystem::recursive_directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  for (const auto end = std::filesystem::recursive_directory_iterator();
       !ec && it != end; it.increment(ec)) {
    std::error_code statError;
    if (it->is_regular_file(statError)) {
      auto size = it->file_size(statError);
      if (!statError)
        total += size;
    }
  }
  if (ec)
    throw CacheError("Cannot measure " + dir.string() + ": " + ec.message());
  return static_cast<double>(total) / kBytesPerGb;
}

WriteGuard::WriteGuard(BuildCache &cache, Fingerprint fingerprint,
                       std::filesystem::path slot, nlohmann::json inputs,
                       int lockFd)
    : cache_(&cache), fingerprint_(std::move(fingerprint)),
      slot_(std::move(slot)), inputs_(std::move(inputs)), lockFd_(lockFd) {}

WriteGuard::WriteGuard(WriteGuard &&other) noexcept
    : cache_(other.cache_), fingerprint_(other.fingerprint_),
      slot_(std::move(other.slot_)), staging_(std::move(other.staging_)),
      inputs_(std::move(other.inputs_)), lockFd_(other.lockFd_),
      published_(other.published_), committed_(other.committed_) {
  other.lockFd_ = -1;
  other.staging_.clear();
  other.committed_ = true;
}

WriteGuard &WriteGuard::operator=(WriteGuard &&other) noexcept {
  if (this != &other) {
    release();
    cache_ = other.cache_;
    fingerprint_ = other.fingerprint_;
    slot_ = std::move(other.slot_);
    staging_ = std::move(other.staging_);
    inputs_ = std::move(other.inputs_);
    lockFd_ = other.lockFd_;
    published_ = other.published_;
    committed_ = other.committed_;
    other.lockFd_ = -1;
    other.staging_.clear();
    other.committed_ = true;
  }
  return *this;
}

WriteGuard::~WriteGuard() { release(); }

void WriteGuard::release() noexcept {
  if (!committed_ && !published_ && !staging_.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(staging_, ec);
  }
  staging_.clear();
  unlockFile(lockFd_);
  lockFd_ = -1;
}

void WriteGuard::commit() {
  if (published_ || committed_)
    return;

  nlohmann::json manifest = {{"version", kCacheFormatVersion},
                             {"fingerprint", fingerprint_.str()},
                             {"created_at", cache_->nowMs()},
                             {"inputs", inputs_}};
  {
    std::ofstream out(staging_ / kManifestFileName);
    out << manifest.dump(2) << '\n';
    if (!out)
      throw CacheError("Cannot write manifest in " + staging_.string());
  }

  std::error_code ec;
  // Leftovers of a writer that died mid-publish never carry a valid manifest.
  if (std::filesystem::exists(slot_, ec))
    std::filesystem::remove_all(slot_, ec);

  std::filesystem::rename(staging_, slot_, ec);
  if (ec)
    throw CacheError("Cannot publish " + slot_.string() + ": " + ec.message());

  committed_ = true;
  staging_.clear();
  unlockFile(lockFd_);
  lockFd_ = -1;

  try {
    cache_->prune(fingerprint_);
  } catch (const CacheError &e) {
    log::warning(std::string("Pruning the build cache failed: ") + e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    log::warning(std::string("Pruning the build cache failed: ") + e.what());
  }
}

CachedStage::CachedStage(BuildCache &cache, Fingerprint fingerprint,
                         nlohmann::json inputs)
    : cache_(&cache), fingerprint_(std::move(fingerprint)),
      inputs_(std::move(inputs)) {}

bool CachedStage::isCached() const { return cache_->isCached(fingerprint_); }

std::filesystem::path CachedStage::enginePath() const {
  return cache_->pathFor(fingerprint_);
}

WriteGuard CachedStage::writeGuard() const {
  return cache_->writeGuard(fingerprint_, inputs_);
}

BuildCache::BuildCache(BuildCacheConfig config) : config_(std::move(config)) {}

std::filesystem::path BuildCache::pathFor(const Fingerprint &fingerprint) const {
  return config_.root / fingerprint.str();
}

std::filesystem::path
BuildCache::lockPath(const Fingerprint &fingerprint) const {
  return config_.root / ".locks" / (fingerprint.str() + ".lock");
}

std::filesystem::path BuildCache::stagingRoot() const {
  return config_.root / ".staging";
}

void BuildCache::ensureLayout() const {
  std::error_code ec;
  std::filesystem::create_directories(config_.root / ".locks", ec);
  if (!ec)
    std::filesystem::create_directories(stagingRoot(), ec);
  if (ec)
    throw CacheError("Cannot create cache root " + config_.root.string() +
                     ": " + ec.message());
}

std::int64_t BuildCache::nowMs() const {
  if (clock_)
    return clock_();
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::optional<CacheRecord>
BuildCache::readRecord(const std::filesystem::path &slot) const {
  const auto name = slot.filename().string();
  if (!Fingerprint::isValid(name))
    return std::nullopt;

  std::ifstream in(slot / kManifestFileName);
  if (!in)
    return std::nullopt;

  nlohmann::json manifest;
  try {
    in >> manifest;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
  if (!manifest.is_object() ||
      manifest.value("version", std::string()) != kCacheFormatVersion ||
      manifest.value("fingerprint", std::string()) != name)
    return std::nullopt;

  CacheRecord record{Fingerprint(name), slot, 0, 0.0, nlohmann::json()};
  record.createdAtMs = manifest.value("created_at", std::int64_t{0});
  if (manifest.contains("inputs"))
    record.inputs = manifest["inputs"];
  try {
    record.sizeGb = directorySizeInGb(slot);
  } catch (const CacheError &) {
    return std::nullopt;
  }
  return record;
}

bool BuildCache::isCached(const Fingerprint &fingerprint) const {
  const auto slot = pathFor(fingerprint);
  std::ifstream in(slot / kManifestFileName);
  if (!in)
    return false;
  try {
    nlohmann::json manifest;
    in >> manifest;
    return manifest.is_object() &&
           manifest.value("version", std::string()) == kCacheFormatVersion &&
           manifest.value("fingerprint", std::string()) == fingerprint.str();
  } catch (const nlohmann::json::exception &) {
    return false;
  }
}

CachedStage BuildCache::stage(const CacheKeyBuilder &key) {
  return CachedStage(*this, key.fingerprint(), key.document());
}

WriteGuard BuildCache::writeGuard(const Fingerprint &fingerprint,
                                  nlohmann::json inputs) {
  ensureLayout();
  int fd = lockFile(lockPath(fingerprint), true);
  WriteGuard guard(*this, fingerprint, pathFor(fingerprint), std::move(inputs),
                   fd);

  if (isCached(fingerprint)) {
    guard.published_ = true;
    return guard;
  }

  auto staging = stagingRoot() / stagingName(fingerprint, "");
  std::error_code ec;
  std::filesystem::remove_all(staging, ec);
  std::filesystem::create_directories(staging, ec);
  if (ec)
    throw CacheError("Cannot create staging directory " + staging.string() +
                     ": " + ec.message());
  guard.staging_ = std::move(staging);
  return guard;
}

double BuildCache::freeStorageInGb() const {
  if (storageProbe_)
    return storageProbe_(config_.root);

  std::error_code ec;
  auto info = std::filesystem::space(existingAncestor(config_.root), ec);
  if (ec)
    throw CacheError("Cannot query free space of " + config_.root.string() +
                     ": " + ec.message());
  return static_cast<double>(info.available) / kBytesPerGb;
}

std::vector<CacheRecord> BuildCache::records() const {
  std::vector<CacheRecord> result;
  std::error_code ec;
  if (!std::filesystem::is_directory(config_.root, ec))
    return result;

  for (const auto &entry :
       std::filesystem::directory_iterator(config_.root, ec)) {
    std::error_code typeError;
    if (!entry.is_directory(typeError))
      continue;
    if (auto record = readRecord(entry.path()))
      result.push_back(std::move(*record));
  }

  std::sort(result.begin(), result.end(),
            [](const CacheRecord &a, const CacheRecord &b) {
              if (a.createdAtMs != b.createdAtMs)
                return a.createdAtMs < b.createdAtMs;
              return a.fingerprint < b.fingerprint;
            });
  return result;
}

std::optional<CacheRecord>
BuildCache::record(const Fingerprint &fingerprint) const {
  return readRecord(pathFor(fingerprint));
}

bool BuildCache::removeUnlocked(const std::filesystem::path &target,
                                const Fingerprint &fingerprint) {
  ensureLayout();
  int fd = lockFile(lockPath(fingerprint), false);
  if (fd < 0) {
    log::debug("Skipping locked cache slot " + fingerprint.str());
    return false;
  }

  // A slot leaves the root in one rename, so isCached() never sees it half
  // deleted.
  std::error_code ec;
  auto doomed = target;
  if (target.parent_path() != stagingRoot()) {
    doomed = stagingRoot() / stagingName(fingerprint, "removed.");
    std::filesystem::rename(target, doomed, ec);
    if (ec) {
      unlockFile(fd);
      log::warning("Cannot remove " + target.string() + ": " + ec.message());
      return false;
    }
  }

  std::filesystem::remove_all(doomed, ec);
  unlockFile(fd);
  if (ec)
    log::warning("Cannot remove " + doomed.string() + ": " + ec.message());
  return true;
}

std::size_t BuildCache::prune(const std::optional<Fingerprint> &keep) {
  auto all = records();
  std::size_t count = all.size();
  double totalGb = 0.0;
  for (const auto &record : all)
    totalGb += record.sizeGb;

  std::size_t removed = 0;
  for (const auto &record : all) {
    if (count <= config_.maxRecords && totalGb <= config_.maxStorageGb)
      break;
    if (keep && record.fingerprint == *keep)
      continue;
    if (!removeUnlocked(record.path, record.fingerprint))
      continue;
    log::info("Removed cached engine " + record.fingerprint.str());
    --count;
    totalGb -= record.sizeGb;
    ++removed;
  }
  return removed;
}

std::size_t BuildCache::clear() {
  std::size_t removed = 0;
  for (const auto &record : records()) {
    if (removeUnlocked(record.path, record.fingerprint))
      ++removed;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(stagingRoot(), ec))
    return removed;
  for (const auto &entry : std::filesystem::directory_iterator(stagingRoot(), ec)) {
    const auto name = entry.path().filename().string();
    const auto dot = name.find('.');
    if (dot == std::string::npos || !Fingerprint::isValid(name.substr(0, dot)))
      continue;
    removeUnlocked(entry.path(), Fingerprint(name.substr(0, dot)));
  }
  return removed;
}

} // namespace llmb::core
