#include "mcpgate/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpgate::log
{

namespace
{
std::mutex sink_mutex;
Sink current_sink;
std::atomic<int> threshold{static_cast<int>(Level::Info)};

const char* level_name(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}
} // namespace

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    current_sink = std::move(sink);
}

void set_level(Level level)
{
    threshold.store(static_cast<int>(level));
}

Level level()
{
    return static_cast<Level>(threshold.load());
}

Level level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR")
        return Level::Error;
    if (upper == "OFF" || upper == "NONE")
        return Level::Off;
    return Level::Info;
}

bool enabled(Level level)
{
    return level != Level::Off && static_cast<int>(level) >= threshold.load();
}

void write(Level level, const std::string& message)
{
    if (!enabled(level))
        return;

    std::lock_guard<std::mutex> lock(sink_mutex);
    if (current_sink)
    {
        current_sink(level, message);
        return;
    }
    std::cerr << "[mcpgate] " << level_name(level) << " " << message << std::endl;
}

} // namespace mcpgate::log
