#ifndef ARGS_HPP
#define ARGS_HPP

#include <string>
#include <vector>

// Splits a line on spaces, keeping "quoted strings" together
std::vector<std::string> splitArguments(const std::string &line);

#endif
