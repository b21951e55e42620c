#include "llmb/core/build_cache.hpp"
#include "llmb/core/errors.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <future>
#include <stdexcept>
#include <thread>

using llmb::core::BuildCache;
using llmb::core::Fingerprint;

namespace {

Fingerprint fingerprintOf(const std::string &text) {
  return Fingerprint(llmb::core::sha256Hex(text));
}

class BuildCacheTest : public ::testing::Test {
protected:
  BuildCache makeCache(std::size_t maxRecords = 10, double maxStorageGb = 256.0) {
    llmb::core::BuildCacheConfig config;
    config.root = dir_ / "cache";
    config.maxRecords = maxRecords;
    config.maxStorageGb = maxStorageGb;
    BuildCache cache(config);
    cache.setClock([this]() { return ++now_; });
    return cache;
  }

  // Runs one successful build into the slot of fingerprint.
  static void publish(BuildCache &cache, const Fingerprint &fingerprint) {
    auto guard = cache.writeGuard(fingerprint, {{"model", "test"}});
    ASSERT_FALSE(guard.alreadyPublished());
    llmb::test::writeFile(guard.directory() / "rank0.engine", "engine");
    guard.commit();
  }

  llmb::test::TempDir dir_{"llmb_build_cache"};
  std::int64_t now_ = 1000;
};

} // namespace

TEST_F(BuildCacheTest, CommittedSlotIsCached) {
  auto cache = makeCache();
  const auto fp = fingerprintOf("engine-a");
  EXPECT_FALSE(cache.isCached(fp));
  EXPECT_EQ(cache.pathFor(fp), dir_ / "cache" / fp.str());

  {
    auto guard = cache.writeGuard(fp, {{"model", "test"}});
    EXPECT_NE(guard.directory(), cache.pathFor(fp));
    llmb::test::writeFile(guard.directory() / "rank0.engine", "engine");
    EXPECT_FALSE(cache.isCached(fp));
    guard.commit();
    EXPECT_TRUE(guard.committed());
  }

  EXPECT_TRUE(cache.isCached(fp));
  EXPECT_TRUE(std::filesystem::exists(cache.pathFor(fp) / "rank0.engine"));

  auto manifest = llmb::test::readJson(cache.pathFor(fp) / "manifest.json");
  EXPECT_EQ(manifest["fingerprint"], fp.str());
  EXPECT_EQ(manifest["version"], llmb::core::kCacheFormatVersion);
  EXPECT_EQ(manifest["inputs"]["model"], "test");

  auto record = cache.record(fp);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->fingerprint, fp);
  EXPECT_EQ(record->createdAtMs, 1001);
  EXPECT_EQ(record->inputs["model"], "test");
}

TEST_F(BuildCacheTest, FailedBuildLeavesNoSlot) {
  auto cache = makeCache();
  const auto fp = fingerprintOf("engine-a");
  std::filesystem::path staging;

  EXPECT_THROW(
      {
        auto guard = cache.writeGuard(fp);
        staging = guard.directory();
        llmb::test::writeFile(staging / "rank0.engine", "partial");
        throw std::runtime_error("builder crashed");
      },
      std::runtime_error);

  EXPECT_FALSE(cache.isCached(fp));
  EXPECT_FALSE(std::filesystem::exists(cache.pathFor(fp)));
  EXPECT_FALSE(std::filesystem::exists(staging));
  EXPECT_TRUE(cache.records().empty());
}

TEST_F(BuildCacheTest, SlotWithoutManifestIsNotCached) {
  auto cache = makeCache();
  const auto fp = fingerprintOf("engine-a");
  llmb::test::writeFile(cache.pathFor(fp) / "rank0.engine", "orphan");
  EXPECT_FALSE(cache.isCached(fp));

  llmb::test::writeJson(cache.pathFor(fp) / "manifest.json",
                        {{"version", llmb::core::kCacheFormatVersion},
                         {"fingerprint", fingerprintOf("other").str()}});
  EXPECT_FALSE(cache.isCached(fp));

  publish(cache, fp);
  EXPECT_TRUE(cache.isCached(fp));
  std::ifstream engine(cache.pathFor(fp) / "rank0.engine");
  std::string content;
  std::getline(engine, content);
  EXPECT_EQ(content, "engine");
}

TEST_F(BuildCacheTest, LaterWriterSeesPublishedSlot) {
  auto cache = makeCache();
  const auto fp = fingerprintOf("engine-a");
  publish(cache, fp);

  auto guard = cache.writeGuard(fp);
  EXPECT_TRUE(guard.alreadyPublished());
  EXPECT_EQ(guard.directory(), cache.pathFor(fp));
  guard.commit();
  EXPECT_TRUE(cache.isCached(fp));
}

TEST_F(BuildCacheTest, ConcurrentWritersBuildOnce) {
  auto cache = makeCache();
  const auto fp = fingerprintOf("engine-a");

  std::promise<void> locked;
  auto firstWriter = std::async(std::launch::async, [&]() {
    auto guard = cache.writeGuard(fp);
    locked.set_value();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    llmb::test::writeFile(guard.directory() / "rank0.engine", "first");
    guard.commit();
  });

  locked.get_future().wait();
  auto guard = cache.writeGuard(fp);
  firstWriter.get();

  EXPECT_TRUE(guard.alreadyPublished());
  EXPECT_TRUE(cache.isCached(fp));
  EXPECT_EQ(cache.records().size(), 1u);
}

TEST_F(BuildCacheTest, MovedGuardKeepsOwnership) {
  auto cache = makeCache();
  const auto fp = fingerprintOf("engine-a");

  auto original = cache.writeGuard(fp);
  const auto staging = original.directory();
  llmb::core::WriteGuard moved(std::move(original));
  EXPECT_EQ(moved.directory(), staging);
  EXPECT_TRUE(std::filesystem::exists(staging));

  llmb::test::writeFile(moved.directory() / "rank0.engine", "engine");
  moved.commit();
  EXPECT_TRUE(cache.isCached(fp));
}

TEST_F(BuildCacheTest, RecordsAreOldestFirst) {
  auto cache = makeCache();
  const auto a = fingerprintOf("a");
  const auto b = fingerprintOf("b");
  const auto c = fingerprintOf("c");
  publish(cache, b);
  publish(cache, c);
  publish(cache, a);

  auto records = cache.records();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].fingerprint, b);
  EXPECT_EQ(records[1].fingerprint, c);
  EXPECT_EQ(records[2].fingerprint, a);
}

TEST_F(BuildCacheTest, PublishPrunesOldestBeyondLimit) {
  auto cache = makeCache(2);
  const auto a = fingerprintOf("a");
  const auto b = fingerprintOf("b");
  const auto c = fingerprintOf("c");
  publish(cache, a);
  publish(cache, b);
  publish(cache, c);

  EXPECT_FALSE(cache.isCached(a));
  EXPECT_TRUE(cache.isCached(b));
  EXPECT_TRUE(cache.isCached(c));
  EXPECT_EQ(cache.prune(), 0u);
}

TEST_F(BuildCacheTest, PruneEnforcesStorageLimit) {
  auto cache = makeCache();
  publish(cache, fingerprintOf("a"));
  publish(cache, fingerprintOf("b"));

  llmb::core::BuildCacheConfig tight = cache.config();
  tight.maxStorageGb = 0.0;
  BuildCache strict(tight);
  EXPECT_EQ(strict.prune(), 2u);
  EXPECT_TRUE(strict.records().empty());
}

TEST_F(BuildCacheTest, PruneSkipsLockedSlots) {
  auto cache = makeCache();
  const auto a = fingerprintOf("a");
  const auto b = fingerprintOf("b");
  publish(cache, a);
  publish(cache, b);

  llmb::core::BuildCacheConfig tight = cache.config();
  tight.maxRecords = 0;
  BuildCache strict(tight);

  {
    auto reader = strict.writeGuard(a);
    ASSERT_TRUE(reader.alreadyPublished());
    EXPECT_EQ(strict.prune(), 1u);
    EXPECT_TRUE(strict.isCached(a));
    EXPECT_FALSE(strict.isCached(b));
  }
  EXPECT_EQ(strict.prune(), 1u);
  EXPECT_FALSE(strict.isCached(a));
}

TEST_F(BuildCacheTest, ClearRemovesEverything) {
  auto cache = makeCache();
  publish(cache, fingerprintOf("a"));
  publish(cache, fingerprintOf("b"));
  EXPECT_EQ(cache.clear(), 2u);
  EXPECT_TRUE(cache.records().empty());
}

TEST_F(BuildCacheTest, CommittedSlotSurvivesItsOwnPrune) {
  auto cache = makeCache(10, 1e-7);
  const auto a = fingerprintOf("a");
  const auto b = fingerprintOf("b");

  auto guard = cache.writeGuard(a);
  llmb::test::writeFile(guard.directory() / "rank0.engine",
                        std::string(4096, 'e'));
  guard.commit();
  EXPECT_TRUE(cache.isCached(a));
  EXPECT_TRUE(std::filesystem::exists(cache.pathFor(a) / "rank0.engine"));

  publish(cache, b);
  EXPECT_FALSE(cache.isCached(a));
  EXPECT_TRUE(cache.isCached(b));
}

TEST_F(BuildCacheTest, ZeroRecordLimitKeepsTheNewestSlot) {
  auto cache = makeCache(0);
  const auto a = fingerprintOf("a");
  publish(cache, a);
  EXPECT_TRUE(cache.isCached(a));
  ASSERT_EQ(cache.records().size(), 1u);
  EXPECT_EQ(cache.prune(), 1u);
  EXPECT_FALSE(cache.isCached(a));
}

TEST_F(BuildCacheTest, RemovedSlotsLeaveNothingBehind) {
  auto cache = makeCache();
  const auto a = fingerprintOf("a");
  publish(cache, a);

  llmb::core::BuildCacheConfig tight = cache.config();
  tight.maxRecords = 0;
  BuildCache strict(tight);
  EXPECT_EQ(strict.prune(), 1u);

  EXPECT_FALSE(std::filesystem::exists(cache.pathFor(a)));
  EXPECT_TRUE(std::filesystem::is_empty(dir_ / "cache" / ".staging"));
}

TEST_F(BuildCacheTest, SlotBeingRemovedIsNotCached) {
  auto cache = makeCache();
  const auto a = fingerprintOf("a");
  publish(cache, a);

  // State a removal interrupted after the rename leaves: the manifest is
  // intact but the slot no longer sits below the root.
  const auto doomed =
      dir_ / "cache" / ".staging" / (a.str() + ".removed.1.0");
  std::filesystem::rename(cache.pathFor(a), doomed);
  std::filesystem::remove(doomed / "rank0.engine");

  EXPECT_FALSE(cache.isCached(a));
  EXPECT_TRUE(cache.records().empty());
  cache.clear();
  EXPECT_FALSE(std::filesystem::exists(doomed));
}

TEST_F(BuildCacheTest, StorageProbeOverridesFilesystem) {
  auto cache = makeCache();
  EXPECT_GE(cache.freeStorageInGb(), 0.0);
  cache.setStorageProbe([](const std::filesystem::path &) { return 0.5; });
  EXPECT_DOUBLE_EQ(cache.freeStorageInGb(), 0.5);
}

TEST_F(BuildCacheTest, DirectorySizeCountsFiles) {
  llmb::test::writeFile(dir_ / "model" / "weights.bin",
                        std::string(1024 * 1024, 'x'));
  EXPECT_NEAR(llmb::core::directorySizeInGb(dir_ / "model"), 1.0 / 1024.0,
              1e-9);
  EXPECT_THROW(llmb::core::directorySizeInGb(dir_ / "missing"),
               llmb::core::CacheError);
}

TEST(BuildCacheEnvTest, EnvironmentOverridesRoot) {
  ::setenv("LLMB_BUILD_CACHE", "1", 1);
  ::setenv("LLMB_BUILD_CACHE_ROOT", "/tmp/llmb-env-root", 1);
  auto env = llmb::core::buildCacheConfigFromEnv();
  EXPECT_TRUE(env.enabled);
  EXPECT_EQ(env.config.root, std::filesystem::path("/tmp/llmb-env-root"));
  EXPECT_EQ(env.config.maxRecords, 10u);

  ::unsetenv("LLMB_BUILD_CACHE");
  ::unsetenv("LLMB_BUILD_CACHE_ROOT");
  llmb::core::BuildCacheConfig base;
  base.root = "/srv/engines";
  env = llmb::core::buildCacheConfigFromEnv(base);
  EXPECT_FALSE(env.enabled);
  EXPECT_EQ(env.config.root, std::filesystem::path("/srv/engines"));
}
