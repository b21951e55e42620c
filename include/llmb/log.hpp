#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace llmb::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

using Sink = std::function<void(Level level, const std::string &message)>;

const char *levelName(Level level) noexcept;
std::optional<Level> parseLevel(std::string_view text);

// Replaces the active sink. An empty sink restores the stderr fallback.
void setSink(Sink sink);
void setThreshold(Level level);
Level threshold();

void write(Level level, const std::string &message);
void debug(const std::string &message);
void info(const std::string &message);
void warning(const std::string &message);
void error(const std::string &message);

} // namespace llmb::log
