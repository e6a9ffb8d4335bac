#include <climits>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

#include "app/EngineConfig.hpp"
#include "core/TransferError.hpp"

namespace
{
    constexpr double MAX_RETRY_DELAY_SECONDS = 24 * 60 * 60;
    constexpr double MAX_BACKOFF_FACTOR = 1000.0;

    // Values outside [minimum, maximum] are rejected rather than wrapped
    unsigned long parseNumber(const std::string &option, const std::string &value, unsigned long minimum,
                              unsigned long maximum = ULONG_MAX)
    {
        size_t consumed = 0;
        unsigned long number = 0;
        try
        {
            number = std::stoul(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw ConfigError("invalid value for " + option + ": " + value);
        }

        if (consumed != value.size() || value[0] == '-' || number < minimum || number > maximum)
        {
            throw ConfigError("invalid value for " + option + ": " + value);
        }
        return number;
    }

    double parseReal(const std::string &option, const std::string &value, double minimum, double maximum)
    {
        size_t consumed = 0;
        double number = 0.0;
        try
        {
            number = std::stod(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw ConfigError("invalid value for " + option + ": " + value);
        }

        if (consumed != value.size() || !(number >= minimum && number <= maximum))
        {
            throw ConfigError("invalid value for " + option + ": " + value);
        }
        return number;
    }
}

SchedulerOptions EngineConfig::schedulerOptions() const
{
    SchedulerOptions options;
    options.retryBudget = retryBudget;
    options.maxRounds = maxRounds;
    return options;
}

std::string defaultManifestPath()
{
    const char *home = std::getenv("HOME");
    if (!home)
    {
        // Fallback to current directory if HOME is not set
        return BDM_MANIFEST_FILENAME;
    }

    std::string stateDirectory = std::string(home) + "/." + BDM_STATE_DIRECTORY;
    mkdir(stateDirectory.c_str(), 0755); // Create directory if it doesn't exist
    return stateDirectory + "/" + BDM_MANIFEST_FILENAME;
}

EngineConfig parseCommandLine(int argc, const char *const argv[])
{
    EngineConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        auto next = [&]() -> std::string
        {
            if (i + 1 >= argc)
            {
                throw ConfigError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help")
        {
            config.showHelp = true;
        }
        else if (arg == "-j" || arg == "--concurrency")
        {
            config.concurrencyLimit = parseNumber(arg, next(), 1);
        }
        else if (arg == "--retries")
        {
            config.retryBudget = static_cast<uint32_t>(parseNumber(arg, next(), 0, UINT32_MAX));
        }
        else if (arg == "--max-rounds")
        {
            config.maxRounds = static_cast<uint32_t>(parseNumber(arg, next(), 0, UINT32_MAX));
        }
        else if (arg == "--chunk-size")
        {
            config.transport.chunkSize = parseNumber(arg, next(), 1);
        }
        else if (arg == "--retry-delay")
        {
            config.retry.baseDelay = std::chrono::milliseconds(
                static_cast<long long>(parseReal(arg, next(), 0.0, MAX_RETRY_DELAY_SECONDS) * 1000.0));
        }
        else if (arg == "--backoff")
        {
            config.retry.backoffFactor = parseReal(arg, next(), 1.0, MAX_BACKOFF_FACTOR);
        }
        else if (arg == "--timeout")
        {
            config.transport.connectTimeoutSeconds = static_cast<long>(parseNumber(arg, next(), 1, LONG_MAX));
        }
        else if (arg == "--stall-timeout")
        {
            config.transport.lowSpeedTimeSeconds = static_cast<long>(parseNumber(arg, next(), 1, LONG_MAX));
        }
        else if (arg == "--insecure")
        {
            config.transport.verifyTls = false;
        }
        else if (arg == "--user-agent")
        {
            config.transport.userAgent = next();
        }
        else if (arg == "--manifest")
        {
            config.manifestPath = next();
        }
        else if (arg == "--log-level")
        {
            config.logLevel = next();
        }
        else if (arg == "--log-file")
        {
            config.logFile = next();
        }
        else if (arg == "--no-ui")
        {
            config.useUi = false;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw ConfigError("unknown option: " + arg);
        }
        else if (config.batchFile.empty())
        {
            config.batchFile = arg;
        }
        else
        {
            throw ConfigError("unexpected argument: " + arg);
        }
    }

    if (config.batchFile.empty() && !config.showHelp)
    {
        throw ConfigError("no batch file given");
    }

    if (config.manifestPath.empty())
    {
        config.manifestPath = defaultManifestPath();
    }

    return config;
}

std::string usage(const std::string &program)
{
    std::ostringstream oss;
    oss << "Usage: " << program << " [options] <batch-file>\n"
        << "\n"
        << "  batch-file            one download per line:\n"
        << "                        <url> <destination> [episode] [\"title\"] [\"Header: value\"]...\n"
        << "\nOptions:\n"
        << "  -j, --concurrency N   downloads in flight at once (default: 3)\n"
        << "  --retries N           retry budget per download (default: 3)\n"
        << "  --max-rounds N        give up after N rounds (default: unlimited)\n"
        << "  --chunk-size BYTES    bytes written per flush (default: 1048576)\n"
        << "  --retry-delay SECS    pause between retry rounds (default: 2)\n"
        << "  --backoff FACTOR      multiply the pause on every retry (default: 1)\n"
        << "  --timeout SECS        connect timeout (default: 30)\n"
        << "  --stall-timeout SECS  abort a transfer stalled this long (default: 60)\n"
        << "  --insecure            do not verify TLS certificates\n"
        << "  --user-agent TEXT     User-Agent header\n"
        << "  --manifest PATH       resume manifest (default: ~/.bdm/download_resume)\n"
        << "  --log-level LEVEL     trace, debug, info, warn, error, off (default: info)\n"
        << "  --log-file PATH       also write the log to PATH\n"
        << "  --no-ui               log progress instead of drawing it\n"
        << "  -h, --help            show this help\n"
        << "\nPress q (or Ctrl-C) to pause; run again to resume.\n";
    return oss.str();
}
