#include "llmb/core/build_cache.hpp"
#include "llmb/core/errors.hpp"
#include "llmb/core/settings.hpp"
#include "llmb/log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace
{

constexpr const char *kExecutable = "llmb-cache";

enum class CliAction
{
    None,
    Info,
    List,
    Show,
    Prune,
    Clear
};

struct CliOptions
{
    CliAction action = CliAction::None;
    std::string fingerprint;
    std::optional<std::filesystem::path> root;
    bool json = false;
};

void printUsage()
{
    std::cout << kExecutable << " - inspect and maintain the engine build cache\n\n"
              << "Usage: " << kExecutable << " [options]\n"
              << "  --info                  Show the cache root, free space and usage\n"
              << "  --list                  List cached engines, oldest first\n"
              << "  --show FINGERPRINT      Display the manifest of one cached engine\n"
              << "  --prune                 Remove old engines beyond the configured limits\n"
              << "  --clear                 Remove every cached engine\n"
              << "  --root DIR              Use DIR as the cache root for this run\n"
              << "  --json                  Print --info and --list as JSON\n"
              << "  --help                  Show this help message\n"
              << "\nSettings are read from " << llmb::core::SettingsLoader::default_config_path().string()
              << ".\nLLMB_BUILD_CACHE_ROOT overrides the cache root." << std::endl;
}

std::string formatTimestamp(std::int64_t ms)
{
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    localtime_r(&seconds, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string formatGb(double gb)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << gb << " GB";
    return out.str();
}

int showInfo(const llmb::core::BuildCache &cache, const CliOptions &opts)
{
    auto records = cache.records();
    double used = 0.0;
    for (const auto &record : records)
        used += record.sizeGb;

    double freeGb = 0.0;
    bool haveFree = true;
    try
    {
        freeGb = cache.freeStorageInGb();
    }
    catch (const std::exception &e)
    {
        llmb::log::warning(std::string("cannot query free space: ") + e.what());
        haveFree = false;
    }

    if (opts.json)
    {
        nlohmann::json out = {
            {"root", cache.root().string()},
            {"records", records.size()},
            {"max_records", cache.config().maxRecords},
            {"used_gb", used},
            {"max_storage_gb", cache.config().maxStorageGb},
        };
        out["free_gb"] = haveFree ? nlohmann::json(freeGb) : nlohmann::json(nullptr);
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Root:     " << cache.root().string() << std::endl;
    std::cout << "Engines:  " << records.size() << " (limit " << cache.config().maxRecords << ")" << std::endl;
    std::cout << "Used:     " << formatGb(used) << " (limit " << formatGb(cache.config().maxStorageGb) << ")"
              << std::endl;
    if (haveFree)
        std::cout << "Free:     " << formatGb(freeGb) << std::endl;
    return 0;
}

int listRecords(const llmb::core::BuildCache &cache, const CliOptions &opts)
{
    auto records = cache.records();
    if (opts.json)
    {
        nlohmann::json out = nlohmann::json::array();
        for (const auto &record : records)
        {
            out.push_back({{"fingerprint", record.fingerprint.str()},
                           {"path", record.path.string()},
                           {"created_at", record.createdAtMs},
                           {"size_gb", record.sizeGb}});
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (records.empty())
    {
        std::cout << "(no cached engines)" << std::endl;
        return 0;
    }
    for (const auto &record : records)
    {
        std::cout << record.fingerprint.str() << "\t" << formatTimestamp(record.createdAtMs) << "\t"
                  << formatGb(record.sizeGb) << std::endl;
    }
    return 0;
}

int showRecord(const llmb::core::BuildCache &cache, const CliOptions &opts)
{
    if (!llmb::core::Fingerprint::isValid(opts.fingerprint))
    {
        std::cerr << kExecutable << ": '" << opts.fingerprint << "' is not a fingerprint" << std::endl;
        return 1;
    }
    auto record = cache.record(llmb::core::Fingerprint(opts.fingerprint));
    if (!record)
    {
        std::cerr << kExecutable << ": no cached engine for " << opts.fingerprint << std::endl;
        return 1;
    }

    std::cout << "Fingerprint: " << record->fingerprint.str() << std::endl;
    std::cout << "Path:        " << record->path.string() << std::endl;
    std::cout << "Created:     " << formatTimestamp(record->createdAtMs) << std::endl;
    std::cout << "Size:        " << formatGb(record->sizeGb) << std::endl;
    std::cout << "Inputs:" << std::endl << record->inputs.dump(2) << std::endl;
    return 0;
}

int pruneRecords(llmb::core::BuildCache &cache)
{
    auto removed = cache.prune();
    std::cout << "Removed " << removed << " cached engine" << (removed == 1 ? "" : "s") << std::endl;
    return 0;
}

int clearRecords(llmb::core::BuildCache &cache)
{
    auto removed = cache.clear();
    std::cout << "Removed " << removed << " cached engine" << (removed == 1 ? "" : "s") << " from "
              << cache.root().string() << std::endl;
    return 0;
}

int executeCliAction(const CliOptions &opts)
{
    auto settings = llmb::core::SettingsLoader::load_or_default();
    if (settings.log_level)
        llmb::log::setThreshold(*settings.log_level);

    auto config = settings.cacheConfig();
    if (opts.root)
        config.root = *opts.root;
    llmb::core::BuildCache cache(config);

    switch (opts.action)
    {
    case CliAction::Info:
        return showInfo(cache, opts);
    case CliAction::List:
        return listRecords(cache, opts);
    case CliAction::Show:
        return showRecord(cache, opts);
    case CliAction::Prune:
        return pruneRecords(cache);
    case CliAction::Clear:
        return clearRecords(cache);
    case CliAction::None:
        break;
    }
    printUsage();
    return 1;
}

bool selectAction(CliOptions &opts, CliAction action)
{
    if (opts.action != CliAction::None)
        return false;
    opts.action = action;
    return true;
}

int runCli(int argc, char **argv)
{
    CliOptions opts;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--info")
        {
            ok = selectAction(opts, CliAction::Info);
        }
        else if (arg == "--list")
        {
            ok = selectAction(opts, CliAction::List);
        }
        else if (arg == "--show")
        {
            ok = i + 1 < argc && selectAction(opts, CliAction::Show);
            if (ok)
                opts.fingerprint = argv[++i];
        }
        else if (arg == "--prune")
        {
            ok = selectAction(opts, CliAction::Prune);
        }
        else if (arg == "--clear")
        {
            ok = selectAction(opts, CliAction::Clear);
        }
        else if (arg == "--root")
        {
            ok = i + 1 < argc;
            if (ok)
                opts.root = std::filesystem::path(argv[++i]);
        }
        else if (arg.rfind("--root=", 0) == 0)
        {
            opts.root = std::filesystem::path(arg.substr(7));
        }
        else if (arg == "--json")
        {
            opts.json = true;
        }
        else
        {
            std::cerr << kExecutable << ": unknown argument '" << arg << "'" << std::endl;
            ok = false;
        }

        if (!ok)
        {
            printUsage();
            return 1;
        }
    }

    if (opts.action == CliAction::None)
        opts.action = CliAction::Info;
    return executeCliAction(opts);
}

} // namespace

int main(int argc, char **argv)
{
    try
    {
        return runCli(argc, argv);
    }
    catch (const llmb::core::CacheError &e)
    {
        std::cerr << kExecutable << ": " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << kExecutable << ": " << e.what() << std::endl;
        return 1;
    }
}
