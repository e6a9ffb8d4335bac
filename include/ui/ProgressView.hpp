#ifndef PROGRESSVIEW_HPP
#define PROGRESSVIEW_HPP

#include <curses.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

#include "core/ProgressAggregator.hpp"

static constexpr int LEFT_PADDING = 2;
static constexpr int BAR_WIDTH = 32;

// Full-screen curses rendering of the aggregated progress of a run
class ProgressView
{
public:
    explicit ProgressView(ProgressAggregator &progress);
    ~ProgressView();

    ProgressView(const ProgressView &) = delete;
    ProgressView &operator=(const ProgressView &) = delete;

    // Draws until finished becomes true; requestStop is called when the user presses q
    // or shouldStop() reports an interrupt
    void run(const std::atomic<bool> &finished,
             const std::function<bool()> &shouldStop,
             const std::function<void()> &requestStop);

private:
    ProgressAggregator &_progress;
    SubscriptionId _subscription;

    std::mutex _snapshotMutex;
    ProgressSnapshot _snapshot;
    bool _stopRequested = false;

    WINDOW *_headerWin = nullptr;
    WINDOW *_footerWin = nullptr;
    WINDOW *_bodyPad = nullptr;

    int _headerHeight = 0;
    int _footerHeight = 0;
    int _padHeight = 0;
    int _padWidth = 0;
    int _contentHeight = 0;
    int _scrollOffset = 0;
    int _maxContentHeight = 0;

    void initialiseCurses();
    void cleanupCurses();
    void createWindows();
    void destroyWindows();

    void processInput(const std::function<void()> &requestStop);
    void drawFullScreen();
    void drawHeader(const ProgressSnapshot &snapshot);
    void drawBody(const ProgressSnapshot &snapshot);
    void drawFooter();
    void drawBar(WINDOW *win, double fraction, bool isActive);
    void drawTaskProgress(int &currentRow, WINDOW *win, const TaskProgress &task);
    void scrollUp(int lines = 1);
    void scrollDown(int lines = 1);
};

#endif
