#include "llmb/log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace llmb::log
{
namespace
{
struct LogState
{
    std::mutex mutex;
    Sink sink;
    Level threshold = Level::Info;

    LogState()
    {
        if (const char *env = std::getenv("LLMB_LOG_LEVEL"))
        {
            if (auto parsed = parseLevel(env))
                threshold = *parsed;
        }
    }
};

LogState &state()
{
    static LogState instance;
    return instance;
}

} // namespace

const char *levelName(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warning:
        return "warning";
    case Level::Error:
        return "error";
    }
    return "info";
}

std::optional<Level> parseLevel(std::string_view text)
{
    std::string lower;
    lower.reserve(text.size());
    for (char ch : text)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "debug")
        return Level::Debug;
    if (lower == "info")
        return Level::Info;
    if (lower == "warning" || lower == "warn")
        return Level::Warning;
    if (lower == "error")
        return Level::Error;
    return std::nullopt;
}

void setSink(Sink sink)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = std::move(sink);
}

void setThreshold(Level level)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threshold = level;
}

Level threshold()
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.threshold;
}

void write(Level level, const std::string &message)
{
    auto &s = state();
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (level < s.threshold)
            return;
        sink = s.sink;
    }

    if (sink)
    {
        sink(level, message);
        return;
    }
    std::cerr << "llmbuild: " << levelName(level) << ": " << message << std::endl;
}

void debug(const std::string &message)
{
    write(Level::Debug, message);
}

void info(const std::string &message)
{
    write(Level::Info, message);
}

void warning(const std::string &message)
{
    write(Level::Warning, message);
}

void error(const std::string &message)
{
    write(Level::Error, message);
}

} // namespace llmb::log
