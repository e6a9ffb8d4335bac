#include <curses.h>
#include <algorithm>
#include <thread>

#include "ui/Layout.hpp"
#include "ui/ProgressView.hpp"
#include "util/format.hpp"

ProgressView::ProgressView(ProgressAggregator &progress)
    : _progress(progress)
{
    // Runs under the aggregator's lock, so only copy the snapshot here
    _subscription = _progress.subscribe([this](const ProgressSnapshot &snapshot)
                                        {
                                            std::lock_guard<std::mutex> lock(_snapshotMutex);
                                            _snapshot = snapshot;
                                        });
}

ProgressView::~ProgressView()
{
    _progress.unsubscribe(_subscription);
}

// Runs the drawing loop, initialising and cleaning up curses around it
void ProgressView::run(const std::atomic<bool> &finished,
                       const std::function<bool()> &shouldStop,
                       const std::function<void()> &requestStop)
{
    initialiseCurses();
    createWindows();

    while (!finished.load())
    {
        if (!_stopRequested && shouldStop())
        {
            _stopRequested = true;
            requestStop();
        }

        processInput(requestStop);
        drawFullScreen();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    destroyWindows();
    cleanupCurses();
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

void ProgressView::initialiseCurses()
{
    initscr();
    cbreak(); // Ctrl-C still raises SIGINT
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // Non-blocking getch
}

void ProgressView::cleanupCurses()
{
    endwin(); // Restore terminal settings
}

void ProgressView::createWindows()
{
    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX);

    _headerHeight = 5;
    _footerHeight = 2;
    _headerWin = newwin(_headerHeight, maxX, 0, 0);
    _footerWin = newwin(_footerHeight, maxX, maxY - _footerHeight, 0);

    _padWidth = maxX;
    _padHeight = bodyRowsFor(0, maxY);
    _bodyPad = newpad(_padHeight, _padWidth);

    scrollok(_headerWin, FALSE);
    scrollok(_footerWin, FALSE);
    scrollok(_bodyPad, FALSE);
}

void ProgressView::destroyWindows()
{
    if (_headerWin)
    {
        delwin(_headerWin);
        _headerWin = nullptr;
    }

    if (_footerWin)
    {
        delwin(_footerWin);
        _footerWin = nullptr;
    }

    if (_bodyPad)
    {
        delwin(_bodyPad);
        _bodyPad = nullptr;
    }
}

void ProgressView::processInput(const std::function<void()> &requestStop)
{
    int ch = getch();
    while (ch != ERR)
    {
        switch (ch)
        {
        case 'q':
        case 'Q':
            if (!_stopRequested)
            {
                _stopRequested = true;
                requestStop();
            }
            break;
        case KEY_UP:
            scrollUp();
            break;
        case KEY_DOWN:
            scrollDown();
            break;
        case KEY_PPAGE:
            scrollUp(5);
            break;
        case KEY_NPAGE:
            scrollDown(5);
            break;
        default:
            break;
        }
        ch = getch();
    }
}

// Redraws the entire curses interface from the latest snapshot
void ProgressView::drawFullScreen()
{
    ProgressSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(_snapshotMutex);
        snapshot = _snapshot;
    }

    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX);

    wresize(_headerWin, _headerHeight, maxX);
    mvwin(_footerWin, maxY - _footerHeight, 0);
    wresize(_footerWin, _footerHeight, maxX);
    _maxContentHeight = std::max(maxY - _headerHeight - _footerHeight - 1, 1);

    drawHeader(snapshot);
    drawBody(snapshot);
    drawFooter();

    prefresh(
        _bodyPad,
        _scrollOffset,                     // Pad row to start reading
        0,                                 // Pad col to start reading
        _headerHeight,                     // Top of the visible region
        0,                                 // Left of the visible region
        _headerHeight + _maxContentHeight, // Bottom of the visible region
        std::min(_padWidth, maxX) - 1);
}

// Overall bar, byte totals, speed and per-status counts
void ProgressView::drawHeader(const ProgressSnapshot &snapshot)
{
    werase(_headerWin);

    int currentRow = 0;
    mvwprintw(_headerWin, ++currentRow, LEFT_PADDING, "%s", "BDM - Batch Download Manager");

    wmove(_headerWin, ++currentRow, LEFT_PADDING);
    drawBar(_headerWin, snapshot.overallFraction, true);
    wprintw(_headerWin, " %.1f%% (%s / %s) @ %s  %s",
            snapshot.overallFraction * 100.0,
            formatBytes(static_cast<double>(snapshot.bytesDone)).c_str(),
            formatBytes(static_cast<double>(snapshot.bytesTotal)).c_str(),
            formatSpeed(snapshot.throughputBps).c_str(),
            formatDuration(std::chrono::duration<double>(snapshot.elapsed).count()).c_str());

    auto count = [&](DownloadStatus status) -> size_t
    {
        auto it = snapshot.statusCounts.find(status);
        return it == snapshot.statusCounts.end() ? 0 : it->second;
    };

    mvwprintw(_headerWin, ++currentRow, LEFT_PADDING,
              "Active: %zu  Pending: %zu  Paused: %zu  Completed: %zu  Failed: %zu",
              count(DownloadStatus::DOWNLOADING), count(DownloadStatus::PENDING),
              count(DownloadStatus::PAUSED), count(DownloadStatus::COMPLETED),
              count(DownloadStatus::FAILED));

    wrefresh(_headerWin);
}

void ProgressView::drawBody(const ProgressSnapshot &snapshot)
{
    // Grow the pad so every download has its rows
    int needed = bodyRowsFor(snapshot.tasks.size(), _padHeight);
    if (needed > _padHeight && wresize(_bodyPad, needed, _padWidth) == OK)
    {
        _padHeight = needed;
    }

    werase(_bodyPad);

    int currentRow = 0;
    for (const auto &task : snapshot.tasks)
    {
        if (currentRow + TASK_ROWS > _padHeight)
            break;
        drawTaskProgress(currentRow, _bodyPad, task);
    }

    _contentHeight = currentRow;
    _scrollOffset = std::min(_scrollOffset, maxScrollOffset(_contentHeight, _maxContentHeight));
}

void ProgressView::drawFooter()
{
    werase(_footerWin);
    mvwprintw(_footerWin, 0, LEFT_PADDING, "%s",
              _stopRequested ? "Pausing downloads..." : "q: pause and quit | arrows: scroll");
    wrefresh(_footerWin);
}

// [=======>        ]
void ProgressView::drawBar(WINDOW *win, double fraction, bool isActive)
{
    int filled = static_cast<int>(fraction * BAR_WIDTH);
    filled = std::min(std::max(filled, 0), BAR_WIDTH);

    waddch(win, '[');
    for (int j = 0; j < BAR_WIDTH; ++j)
    {
        if (j < filled)
            waddch(win, '=');
        else if (j == filled)
            waddch(win, isActive ? '>' : '|');
        else
            waddch(win, ' ');
    }
    waddch(win, ']');
}

void ProgressView::drawTaskProgress(int &currentRow, WINDOW *win, const TaskProgress &task)
{
    // <episode>) <title> -> <destination>
    mvwprintw(win, currentRow++, LEFT_PADDING + 1, "%d) %s -> %s",
              task.ordinal, task.title.c_str(), task.destination.c_str());

    double fraction = 0.0;
    if (task.status == DownloadStatus::COMPLETED)
        fraction = 1.0;
    else if (task.expectedTotalSize > 0)
        fraction = static_cast<double>(task.bytesTransferred) / static_cast<double>(task.expectedTotalSize);

    wmove(win, currentRow, LEFT_PADDING);
    drawBar(win, fraction, task.status == DownloadStatus::DOWNLOADING);
    wprintw(win, " %.1f%%", fraction * 100.0);

    if (task.expectedTotalSize == 0)
    {
        wprintw(win, " (%s / size unknown)", formatBytes(static_cast<double>(task.bytesTransferred)).c_str());
    }
    else
    {
        wprintw(win, " (%s / %s)",
                formatBytes(static_cast<double>(task.bytesTransferred)).c_str(),
                formatBytes(static_cast<double>(task.expectedTotalSize)).c_str());
    }

    wprintw(win, " %s", statusName(task.status));
    currentRow += 2;
}

void ProgressView::scrollUp(int lines)
{
    _scrollOffset = std::max(_scrollOffset - lines, 0);
}

void ProgressView::scrollDown(int lines)
{
    _scrollOffset = std::min(_scrollOffset + lines, maxScrollOffset(_contentHeight, _maxContentHeight));
}
