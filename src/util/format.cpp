#include <iomanip>
#include <sstream>

#include "util/format.hpp"

std::string formatBytes(double bytes) {
    static const char *const UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    static const int PRECISION[] = {0, 1, 1, 2, 2};
    const size_t unitCount = sizeof(UNITS) / sizeof(UNITS[0]);

    size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < unitCount) {
        bytes /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(PRECISION[unit]) << bytes << " " << UNITS[unit];
    return oss.str();
}

std::string formatSpeed(double bytesPerSecond) {
    return formatBytes(bytesPerSecond) + "/s";
}

// HH:MM:SS, clamped at zero
std::string formatDuration(double seconds) {
    long total = seconds > 0.0 ? static_cast<long>(seconds) : 0;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << total / 3600 << ":"
        << std::setw(2) << (total % 3600) / 60 << ":"
        << std::setw(2) << total % 60;
    return oss.str();
}
