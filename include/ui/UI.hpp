#ifndef UI_HPP
#define UI_HPP

#include <curses.h>
#include <string>
#include <vector>
#include <memory>
#include <chrono>

#include "ui/Screen.hpp"
#include "core/DownloadManager.hpp"

static constexpr int LEFT_PADDING = 2;
static constexpr int BAR_WIDTH = 32;
static constexpr int QDM_PAD_ROWS = 1000;

// Interactive curses front end: header with commands, scrollable task list, status line and prompt
class UI
{
public:
    explicit UI(DownloadManager &manager);

    void run();
    void stop();
    void changeScreen(ScreenType newScreen);
    void setStatus(const std::string &message);

private:
    DownloadManager &_manager;
    bool _isRunning;
    std::string _commandBuffer;
    std::string _statusMessage;
    std::chrono::steady_clock::time_point _lastFullUpdateTime;
    std::unique_ptr<Screen> _screen;

    WINDOW *_headerWin = nullptr;
    WINDOW *_cmdLineWin = nullptr;
    WINDOW *_bodyPad = nullptr;

    int _cmdLineHeight = 0;
    int _headerHeight = 0;
    int _padHeight = 0;
    int _padWidth = 0;
    int _scrollOffset = 0;
    int _maxContentHeight = 0;

    void initialiseCurses();
    void cleanupCurses();
    void createWindows();
    void destroyWindows();

    void processInput();
    void drainEvents();
    void handleKeyPress(int ch);
    void handleCommand(const std::string &rawInput);
    void updateScreen(bool immediate = false);

    void drawFullScreen();
    void drawHeader();
    void drawBody();
    void drawCommandLine();
    void clearScreen();
    void scrollUp(int lines = 1);
    void scrollDown(int lines = 1);

    void sleepBriefly(int intervalMs);
};

#endif
