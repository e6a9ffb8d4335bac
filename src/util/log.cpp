#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/TransferError.hpp"
#include "util/log.hpp"

namespace logging
{
    spdlog::level::level_enum parseLevel(const std::string &level)
    {
        if (level == "trace")
            return spdlog::level::trace;
        if (level == "debug")
            return spdlog::level::debug;
        if (level == "info")
            return spdlog::level::info;
        if (level == "warn")
            return spdlog::level::warn;
        if (level == "error")
            return spdlog::level::err;
        if (level == "off")
            return spdlog::level::off;

        throw ConfigError("unknown log level: " + level);
    }

    void init(const std::string &level, const std::string &logFile, bool quietConsole)
    {
        std::vector<spdlog::sink_ptr> sinks;

        if (!quietConsole)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        if (!logFile.empty())
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile));
            }
            catch (const spdlog::spdlog_ex &e)
            {
                throw ConfigError("cannot open log file " + logFile + ": " + e.what());
            }
        }

        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto logger = std::make_shared<spdlog::logger>("bdm", sinks.begin(), sinks.end());
        logger->set_level(parseLevel(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
    }
}
