#include "llmb/core/cached_model_loader.hpp"

#include "llmb/core/build_pipeline.hpp"
#include "llmb/core/cache_key.hpp"
#include "llmb/core/errors.hpp"
#include "llmb/core/model_loader.hpp"
#include "llmb/log.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <unistd.h>

namespace llmb::core {
namespace {

std::filesystem::path makeWorkspace() {
  std::random_device rd;
  std::mt19937_64 rng(rd());
  std::uniform_int_distribution<std::uint64_t> dist;
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 8; ++attempt) {
    auto candidate = base / ("llmbuild-" + std::to_string(::getpid()) + "-" +
                             std::to_string(dist(rng)));
    if (std::filesystem::create_directory(candidate))
      return candidate;
  }
  throw CacheError("Cannot create a workspace under " + base.string());
}

} // namespace

CachedModelLoader::CachedModelLoader(BuildArgs &args, Toolchain toolchain,
                                     BuildStats &stats, WorkerSession *session,
                                     std::filesystem::path workspace)
    : args_(args), toolchain_(std::move(toolchain)), stats_(stats),
      session_(session), workspace_(std::move(workspace)) {
  if (workspace_.empty()) {
    workspace_ = makeWorkspace();
    ownsWorkspace_ = true;
  }

  BuildCacheConfig cacheConfig = args_.buildCacheConfig
                                     ? *args_.buildCacheConfig
                                     : buildCacheConfigFromEnv().config;
  cache_ = std::make_unique<BuildCache>(std::move(cacheConfig));
}

CachedModelLoader::~CachedModelLoader() {
  if (ownsWorkspace_) {
    std::error_code ec;
    std::filesystem::remove_all(workspace_, ec);
  }
}

bool CachedModelLoader::buildCacheEnabled() const {
  const bool requested =
      args_.enableBuildCache || buildCacheConfigFromEnv().enabled;
  return requested && args_.modelFormat() == ModelFormat::Source &&
         !args_.parallel.autoParallel;
}

std::filesystem::path CachedModelLoader::run() {
  if (args_.modelFormat() == ModelFormat::Engine) {
    stats_.engineDir = args_.modelDir();
    return args_.modelDir();
  }

  stats_.modelFromHub = args_.isHubModel();
  if (args_.isLocalModel())
    stats_.localModelDir = args_.modelDir();

  if (buildCacheEnabled()) {
    if (args_.isHubModel()) {
      if (!hubClient_)
        hubClient_ = std::make_shared<HubClient>();
      std::string error;
      auto dir = hubClient_->fetchConfig(
          args_.model, args_.revision.empty() ? "main" : args_.revision,
          &error);
      if (!dir)
        throw CacheError("Cannot fetch the config of " + args_.model + ": " +
                         error);
      sourceModelDir_ = *dir;
    } else {
      sourceModelDir_ = args_.modelDir();
    }

    stage_.emplace(engineCacheStage());
    if (stage_->isCached()) {
      const auto path = stage_->enginePath();
      stats_.cacheHit = true;
      log::info("Reusing cached engine in " + path.string());
      args_.useEngine(path);
      stats_.engineDir = path;
      return path;
    }
  }

  return buildModel();
}

PretrainedDescriptor CachedModelLoader::pretrainedDescriptor() const {
  if (!sourceModelDir_)
    throw CacheError("A source model directory is required for the cache key.");

  Mapping mapping;
  mapping.worldSize = args_.parallel.worldSize();
  mapping.tpSize = args_.parallel.tpSize;
  mapping.ppSize = args_.parallel.ppSize;
  return PretrainedDescriptor::fromSourceModel(*sourceModelDir_, args_.dtype,
                                               mapping);
}

CachedStage CachedModelLoader::engineCacheStage() {
  const auto &build = *args_.buildConfig;

  CacheKeyBuilder key;
  key.buildConfig(build)
      .pluginConfig(build.plugin_config)
      .parallelConfig(args_.parallel)
      .quantConfig(*args_.quantConfig)
      .pretrained(pretrainedDescriptor());
  if (args_.isHubModel())
    key.hubModel(args_.model,
                 args_.revision.empty() ? "main" : args_.revision);
  else
    key.localModel(*sourceModelDir_);

  return cache_->stage(key);
}

std::filesystem::path CachedModelLoader::engineDir() const {
  if (args_.modelFormat() == ModelFormat::Engine)
    return args_.modelDir();
  if (cachingActive_ && stage_)
    return stage_->enginePath();
  return workspace_ / "tmp.engine";
}

std::filesystem::path CachedModelLoader::buildModel() {
  const bool cacheEnabled = buildCacheEnabled() && stage_.has_value();
  bool hasStorage = true;

  if (cacheEnabled) {
    if (args_.isLocalModel()) {
      try {
        hasStorage = stage_->parent().freeStorageInGb() >=
                     directorySizeInGb(args_.modelDir());
      } catch (const CacheError &e) {
        log::error(e.what());
        hasStorage = false;
      } catch (const std::filesystem::filesystem_error &e) {
        log::error(e.what());
        hasStorage = false;
      }
    }

    if (hasStorage) {
      cachingActive_ = true;
      WriteGuard guard = stage_->writeGuard();
      if (guard.alreadyPublished()) {
        stats_.cacheHit = true;
        log::info("Reusing engine published concurrently in " +
                  guard.directory().string());
      } else {
        buildTask(guard.directory());
        guard.commit();
        stats_.cacheHit = false;
      }
    } else {
      log::info("The cache directory is too small, build-cache is disabled.");
      stats_.cacheHit = false;
      stats_.cacheInfo = "The cache root directory is too small.";
    }
  }

  if (!(cacheEnabled && hasStorage))
    buildTask(engineDir());

  const auto dir = engineDir();
  stats_.engineDir = dir;
  return dir;
}

void CachedModelLoader::buildTask(const std::filesystem::path &engineDir) {
  if (args_.parallel.isMultiGpu()) {
    const auto worldSize = static_cast<std::size_t>(args_.parallel.worldSize());
    if (!session_ || session_->size() != worldSize)
      throw InvalidArgumentError(
          "A worker session with " + std::to_string(worldSize) +
          " workers is required for multi-GPU builds.");

    // Failures travel back as results so the steps rank 0 finished are kept.
    auto results = session_->submitSync([&](std::size_t rank) {
      BuildStats workerStats;
      nlohmann::json report = nlohmann::json::object();
      try {
        ModelLoader loader(args_, toolchain_, workspace_, workerStats, rank);
        loader.run(engineDir);
      } catch (const std::exception &e) {
        report["error"] = e.what();
      }
      report["stats"] = workerStats.toJson();
      return report;
    });
    stats_.buildSteps =
        BuildStats::fromJson(results.front().value("stats", nlohmann::json()))
            .buildSteps;
    for (std::size_t rank = 0; rank < results.size(); ++rank) {
      const auto &report = results[rank];
      if (report.contains("error"))
        throw WorkerError("Worker " + std::to_string(rank) + " failed: " +
                              report["error"].get<std::string>(),
                          rank);
    }
  } else {
    ModelLoader loader(args_, toolchain_, workspace_, stats_, 0);
    loader.run(engineDir);
  }

  BuildPipeline::releaseMemory();
}

void CachedModelLoader::save(const std::filesystem::path &target) const {
  std::filesystem::copy(engineDir(), target,
                        std::filesystem::copy_options::recursive);
}

} // namespace llmb::core
