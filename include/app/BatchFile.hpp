#ifndef BATCHFILE_HPP
#define BATCHFILE_HPP

#include <optional>
#include <string>
#include <vector>

#include "core/DownloadTask.hpp"

// Parses one batch line; nullopt for blank and comment lines, ConfigError if malformed
std::optional<TaskSpec> parseBatchLine(const std::string &line);

// Reads every task from a batch file; throws ConfigError naming the bad line
std::vector<TaskSpec> loadBatchFile(const std::string &path);

#endif
