#include <fstream>

#include "app/BatchFile.hpp"
#include "core/TransferError.hpp"
#include "util/args.hpp"

namespace
{
    bool isInteger(const std::string &text)
    {
        if (text.empty())
            return false;

        for (char c : text)
        {
            if (c < '0' || c > '9')
                return false;
        }
        return text.size() < 10;
    }

    // "Name: value" where Name is a single token
    bool looksLikeHeader(const std::string &field)
    {
        const size_t colon = field.find(':');
        return colon != std::string::npos && colon > 0 &&
               field.find_first_of(" \t") > colon;
    }
}

std::optional<TaskSpec> parseBatchLine(const std::string &line)
{
    const size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#')
    {
        return std::nullopt;
    }

    std::string trimmed = line;
    if (!trimmed.empty() && trimmed.back() == '\r')
    {
        trimmed.pop_back();
    }

    auto args = splitArguments(trimmed);
    if (args.size() < 2)
    {
        throw ConfigError("expected <url> <destination>");
    }

    TaskSpec spec;
    spec.url = args[0];
    spec.destination = args[1];

    size_t next = 2;
    if (next < args.size() && isInteger(args[next]))
    {
        spec.ordinal = std::stoi(args[next++]);
    }

    if (next < args.size() && !looksLikeHeader(args[next]))
    {
        spec.title = args[next++];
    }

    for (; next < args.size(); ++next)
    {
        const std::string &header = args[next];
        if (!looksLikeHeader(header))
        {
            throw ConfigError("malformed header: " + header);
        }

        const size_t colon = header.find(':');
        std::string value = header.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        spec.headers[header.substr(0, colon)] = value;
    }

    return spec;
}

std::vector<TaskSpec> loadBatchFile(const std::string &path)
{
    std::ifstream inFile(path);
    if (!inFile.is_open())
    {
        throw ConfigError("cannot open batch file " + path);
    }

    std::vector<TaskSpec> specs;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(inFile, line))
    {
        ++lineNumber;
        try
        {
            auto spec = parseBatchLine(line);
            if (!spec)
                continue;

            // Episodes without a number are numbered by position
            if (spec->ordinal == 0)
            {
                spec->ordinal = static_cast<int>(specs.size() + 1);
            }
            specs.push_back(*spec);
        }
        catch (const ConfigError &e)
        {
            throw ConfigError(path + ":" + std::to_string(lineNumber) + ": " + e.what());
        }
    }

    return specs;
}
