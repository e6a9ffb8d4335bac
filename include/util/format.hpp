#ifndef FORMAT_HPP
#define FORMAT_HPP

#include <string>

std::string formatBytes(double bytes);
std::string formatSpeed(double bytesPerSecond);
std::string formatDuration(double seconds);

#endif
