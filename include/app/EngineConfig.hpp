#ifndef ENGINECONFIG_HPP
#define ENGINECONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "core/ProgressAggregator.hpp"
#include "core/ResumeStore.hpp"
#include "core/RetryPolicy.hpp"
#include "core/Scheduler.hpp"
#include "core/Transport.hpp"

static constexpr const char BDM_STATE_DIRECTORY[] = "bdm";
static constexpr const char BDM_MANIFEST_FILENAME[] = "download_resume";

struct EngineConfig
{
    std::string batchFile;
    size_t concurrencyLimit{3};
    uint32_t retryBudget{DEFAULT_RETRY_BUDGET};
    uint32_t maxRounds{0};
    std::string manifestPath;
    std::chrono::milliseconds progressInterval{DEFAULT_PROGRESS_INTERVAL};

    TransportOptions transport;
    RetryOptions retry;

    std::string logLevel{"info"};
    std::string logFile;
    bool useUi{true};
    bool showHelp{false};

    SchedulerOptions schedulerOptions() const;
};

// Returns $HOME/.bdm/download_resume, creating the directory if necessary
std::string defaultManifestPath();

// Throws ConfigError on unknown options or invalid values
EngineConfig parseCommandLine(int argc, const char *const argv[]);

std::string usage(const std::string &program);

#endif
