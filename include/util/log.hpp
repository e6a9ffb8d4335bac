#ifndef LOG_HPP
#define LOG_HPP

#include <string>

#include <spdlog/spdlog.h>

namespace logging
{
    // Installs the default logger: stderr (unless quietConsole) plus an optional file sink
    void init(const std::string &level, const std::string &logFile, bool quietConsole);

    // Parses "trace", "debug", "info", "warn", "error", "off"; throws ConfigError otherwise
    spdlog::level::level_enum parseLevel(const std::string &level);
}

#endif
