#ifndef LAYOUT_HPP
#define LAYOUT_HPP

#include <algorithm>
#include <climits>
#include <cstddef>

// Title line, bar line and a blank separator per download
static constexpr int TASK_ROWS = 3;

// Pad rows needed to list taskCount downloads, never fewer than minimum
inline int bodyRowsFor(size_t taskCount, int minimum)
{
    const size_t limit = static_cast<size_t>(INT_MAX - 1) / TASK_ROWS;
    int needed = static_cast<int>(std::min(taskCount, limit)) * TASK_ROWS + 1;
    return std::max(needed, minimum);
}

// Furthest the body can scroll while still filling visibleRows
inline int maxScrollOffset(int contentRows, int visibleRows)
{
    return std::max(contentRows - visibleRows, 0);
}

#endif
