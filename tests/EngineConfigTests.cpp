#include <catch2/catch.hpp>

#include <vector>

#include "app/EngineConfig.hpp"

namespace
{
    EngineConfig parse(std::vector<const char *> args)
    {
        args.insert(args.begin(), "bdm");
        return parseCommandLine(static_cast<int>(args.size()), args.data());
    }
}

TEST_CASE("Defaults match the documented configuration", "[config]")
{
    EngineConfig config = parse({"batch.txt", "--manifest", "/tmp/bdm-manifest"});

    CHECK(config.batchFile == "batch.txt");
    CHECK(config.concurrencyLimit == 3);
    CHECK(config.retryBudget == 3);
    CHECK(config.maxRounds == 0);
    CHECK(config.transport.chunkSize == DEFAULT_CHUNK_SIZE);
    CHECK(config.transport.verifyTls);
    CHECK(config.transport.connectTimeoutSeconds == 30);
    CHECK(config.retry.baseDelay == std::chrono::milliseconds(2000));
    CHECK(config.retry.backoffFactor == 1.0);
    CHECK(config.progressInterval == std::chrono::milliseconds(500));
    CHECK(config.logLevel == "info");
    CHECK(config.useUi);
    CHECK(config.manifestPath == "/tmp/bdm-manifest");
}

TEST_CASE("Options override the defaults", "[config]")
{
    EngineConfig config = parse({"-j", "5", "--retries", "7", "--max-rounds", "4",
                                 "--chunk-size", "65536", "--retry-delay", "0.5", "--backoff", "2",
                                 "--timeout", "10", "--stall-timeout", "20", "--insecure",
                                 "--user-agent", "podcatcher/2", "--manifest", "m",
                                 "--log-level", "debug", "--log-file", "bdm.log", "--no-ui", "batch.txt"});

    CHECK(config.concurrencyLimit == 5);
    CHECK(config.retryBudget == 7);
    CHECK(config.maxRounds == 4);
    CHECK(config.transport.chunkSize == 65536);
    CHECK(config.retry.baseDelay == std::chrono::milliseconds(500));
    CHECK(config.retry.backoffFactor == 2.0);
    CHECK(config.transport.connectTimeoutSeconds == 10);
    CHECK(config.transport.lowSpeedTimeSeconds == 20);
    CHECK_FALSE(config.transport.verifyTls);
    CHECK(config.transport.userAgent == "podcatcher/2");
    CHECK(config.manifestPath == "m");
    CHECK(config.logLevel == "debug");
    CHECK(config.logFile == "bdm.log");
    CHECK_FALSE(config.useUi);

    SchedulerOptions options = config.schedulerOptions();
    CHECK(options.retryBudget == 7);
    CHECK(options.maxRounds == 4);
}

TEST_CASE("Invalid command lines raise ConfigError", "[config]")
{
    CHECK_THROWS_AS(parse({}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "-j", "0"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "-j", "-2"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "-j", "two"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "--chunk-size"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "--backoff", "0.5"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "--frobnicate"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "other.txt"}), ConfigError);
}

TEST_CASE("Counts beyond their range are rejected instead of wrapping", "[config]")
{
    CHECK_THROWS_AS(parse({"batch.txt", "--retries", "4294967296"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "--max-rounds", "4294967297"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "--retries", "99999999999999999999999"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "--retry-delay", "1e300"}), ConfigError);
    CHECK_THROWS_AS(parse({"batch.txt", "--retry-delay", "nan"}), ConfigError);

    EngineConfig config = parse({"batch.txt", "--retries", "4294967295"});
    CHECK(config.retryBudget == 4294967295u);
}

TEST_CASE("Help needs no batch file", "[config]")
{
    EngineConfig config = parse({"--help", "--manifest", "m"});
    CHECK(config.showHelp);
    CHECK(usage("bdm").find("--concurrency") != std::string::npos);
}
