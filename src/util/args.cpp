#include <vector>
#include <string>

#include "util/args.hpp"

std::vector<std::string> splitArguments(const std::string &line)
{
    std::vector<std::string> parts;
    std::string currentArg;
    bool isQuoted = false; // Allows for parsing of quoted arguments (e.g. titles with spaces)
    bool hasArg = false;   // Distinguishes "" from no argument at all

    for (size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];

        if (c == '\\' && isQuoted && i + 1 < line.size())
        {
            currentArg += line[++i];
        }
        else if (c == '"')
        {
            isQuoted = !isQuoted;
            hasArg = true;
        }
        else if ((c == ' ' || c == '\t') && !isQuoted)
        {
            if (hasArg)
            {
                parts.push_back(currentArg);
                currentArg.clear();
                hasArg = false;
            }
        }
        else
        {
            currentArg += c;
            hasArg = true;
        }
    }

    if (hasArg)
    {
        parts.push_back(currentArg);
    }

    return parts;
}
