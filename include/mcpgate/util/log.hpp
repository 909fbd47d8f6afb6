#pragma once

#include <functional>
#include <string>

namespace mcpgate::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

using Sink = std::function<void(Level, const std::string&)>;

/// Replace the output sink. Passing an empty function restores the default,
/// which writes "[mcpgate] LEVEL message" lines to stderr.
void set_sink(Sink sink);

void set_level(Level level);
Level level();

/// Parse DEBUG/INFO/WARNING/WARN/ERROR/OFF (case-insensitive); unknown -> Info.
Level level_from_string(const std::string& s);

bool enabled(Level level);
void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warn(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace mcpgate::log
