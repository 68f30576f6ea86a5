#include <curses.h>
#include <chrono>
#include <thread>
#include <algorithm>
#include <cctype>

#include "ui/UI.hpp"
#include "ui/ActiveScreen.hpp"
#include "ui/HistoryScreen.hpp"
#include "util/format.hpp"

// Constructs the UI object on the active screen
UI::UI(DownloadManager &manager)
    : _manager(manager),
      _isRunning(true),
      _lastFullUpdateTime(std::chrono::steady_clock::now()),
      _screen(std::make_unique<ActiveScreen>(_manager, *this))
{
}

// Runs the main UI loop, initialising and cleaning up curses and drawing the full screen
void UI::run()
{
    initialiseCurses();
    createWindows();
    drawFullScreen();

    while (_isRunning)
    {
        processInput();
        updateScreen();
        sleepBriefly(10); // 10ms sleep between render
    }

    destroyWindows();
    cleanupCurses();
}

// Stops the UI loop
void UI::stop()
{
    _isRunning = false;
}

// Sets the message shown above the prompt
void UI::setStatus(const std::string &message)
{
    _statusMessage = message;
}

// Changes the current screen to the specified type
void UI::changeScreen(ScreenType newScreen)
{
    switch (newScreen)
    {
    case ScreenType::ACTIVE:
        _screen = std::make_unique<ActiveScreen>(_manager, *this);
        break;
    case ScreenType::HISTORY:
        _screen = std::make_unique<HistoryScreen>(_manager, *this);
        break;
    }

    _scrollOffset = 0; // Reset scroll offset
    drawFullScreen();
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

// Initialises curses and sets up the terminal
void UI::initialiseCurses()
{
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // Non-blocking getch
    set_escdelay(25);      // Escape clears the prompt without a long wait
}

// Restores terminal state from curses mode
void UI::cleanupCurses()
{
    endwin(); // Restore terminal settings
}

// Creates the windows for the header, command line, and body
void UI::createWindows()
{
    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX);

    _headerHeight = 1;                                                    // Determined according to content
    _cmdLineHeight = 4;                                                   // Status line and prompt, padded above and below
    _headerWin = newwin(_headerHeight, maxX, 0, 0);                       // Create header window, default to 1 row
    _cmdLineWin = newwin(_cmdLineHeight, maxX, maxY - _cmdLineHeight, 0); // Create command line window

    _padWidth = maxX;
    _padHeight = QDM_PAD_ROWS;
    _bodyPad = newpad(_padHeight, _padWidth); // Create a pad for the screen body

    // Disable scrolling
    scrollok(_headerWin, FALSE);
    scrollok(_cmdLineWin, FALSE);
    scrollok(_bodyPad, FALSE);
}

// Destroys the windows created by createWindows
void UI::destroyWindows()
{
    if (_headerWin)
    {
        delwin(_headerWin);
        _headerWin = nullptr;
    }

    if (_cmdLineWin)
    {
        delwin(_cmdLineWin);
        _cmdLineWin = nullptr;
    }

    if (_bodyPad)
    {
        delwin(_bodyPad);
        _bodyPad = nullptr;
    }
}

// Checks for keyboard input and processes each keypress if available
void UI::processInput()
{
    int ch = getch();
    while (ch != ERR)
    {
        handleKeyPress(ch);
        ch = getch();
    }
}

// Interprets a single keypress to update or complete the command buffer
void UI::handleKeyPress(int ch)
{
    switch (ch)
    {
    case '\n':
    case '\r':
    case KEY_ENTER:
    {
        std::string command = _commandBuffer;
        _commandBuffer.clear();
        handleCommand(command);
        return;
    }

    case KEY_BACKSPACE:
    case 127: // DEL
    case '\b':
        if (!_commandBuffer.empty())
            _commandBuffer.pop_back();
        break;

    case 27: // Escape
        _commandBuffer.clear();
        break;

    case KEY_UP: // Up arrow
        scrollUp();
        break;
    case KEY_DOWN: // Down arrow
        scrollDown();
        break;
    case KEY_PPAGE: // Page up
        scrollUp(5);
        break;
    case KEY_NPAGE: // Page down
        scrollDown(5);
        break;

    case KEY_RESIZE:
        // The pad keeps the width it was created with, so rebuild at the new size
        destroyWindows();
        createWindows();
        _scrollOffset = 0;
        break;

    default:
        if (ch >= 0 && ch < 256 && std::isprint(ch))
            // Add printable characters to the command buffer
            _commandBuffer.push_back(static_cast<char>(ch));
        break;
    }

    updateScreen(true);
}

// Matches the user input against the dispatch table and runs the first corresponding action
void UI::handleCommand(const std::string &rawInput)
{
    // Trim surrounding spaces
    std::string userInput = rawInput;
    userInput.erase(0, userInput.find_first_not_of(' '));
    userInput.erase(userInput.find_last_not_of(' ') + 1);

    bool handled = false;
    const std::vector<CommandEntry> table = _screen->getCommandTable();
    for (const auto &entry : table)
    {
        for (const auto &alias : entry.commands)
        {
            bool match = false;
            switch (entry.matchType)
            {
            case MatchType::EXACT:
                if (userInput == alias)
                    match = true;
                break;
            case MatchType::PREFIX:
                // The alias must be the whole first word
                if (userInput == alias || userInput.rfind(alias + " ", 0) == 0)
                    match = true;
                break;
            }
            if (match)
            {
                entry.action(userInput);
                handled = true;
                break;
            }
        }
        if (handled)
            break;
    }

    if (!handled && !userInput.empty())
        setStatus("Unknown command: " + userInput);

    updateScreen(true);
}

// Consumes pushed task events so the channel never fills; terminal events become the status line
void UI::drainEvents()
{
    TaskEvent event;
    while (_manager.events().tryPop(event))
    {
        if (event.type != EventType::FINISHED)
            continue;

        _statusMessage = "Task " + std::to_string(event.taskId) + " " +
                         taskStateName(event.state) + ": " + event.detail;
    }
}

// Periodically updates the screen (full or partial) based on elapsed time
void UI::updateScreen(bool immediate)
{
    auto now = std::chrono::steady_clock::now();
    double secondsSinceLastFullUpdate = std::chrono::duration<double>(now - _lastFullUpdateTime).count();

    // Redraw the entire interface every half second or immediately, if specified
    if (immediate || secondsSinceLastFullUpdate >= 0.5)
    {
        drainEvents();
        drawFullScreen();
        _lastFullUpdateTime = now;
    }
    else
    {
        drawCommandLine(); // Only update the command line
    }
}

// Redraws the entire curses interface
void UI::drawFullScreen()
{
    clearScreen();

    drawHeader(); // Draw the header and dynamically update the header height

    int maxY, maxX;
    getmaxyx(stdscr, maxY, maxX); // Get current screen size

    mvwin(_headerWin, 0, 0);                  // Move the header window to the top
    wresize(_headerWin, _headerHeight, maxX); // Resize the header window
    wrefresh(_headerWin);                     // Refresh the header window

    _maxContentHeight = std::max(maxY - _headerHeight - _cmdLineHeight - 1, 1);

    mvwin(_cmdLineWin, maxY - _cmdLineHeight, 0); // Move the command line window to the bottom
    wresize(_cmdLineWin, _cmdLineHeight, maxX);   // Resize the command line window
    wrefresh(_cmdLineWin);                        // Refresh the command line window

    drawBody();
    drawCommandLine();

    _scrollOffset = std::min(_scrollOffset, std::max(_padHeight - _maxContentHeight, 0));
    prefresh(
        _bodyPad,
        _scrollOffset,                     // Pad row to start reading
        0,                                 // Pad col to start reading
        _headerHeight,                     // Top alignment of the pad (below the header, with gap)
        0,                                 // Left alignment of the pad
        _headerHeight + _maxContentHeight, // Bottom alignment of the pad (above the command line)
        _padWidth - 1);                    // Right alignment of the pad
}

// Draws the title, the engine totals and the available commands
void UI::drawHeader()
{
    werase(_headerWin); // Clear the header window

    size_t running = 0;
    double speed = 0.0;
    std::uint64_t downloaded = 0;
    for (const auto &task : _manager.snapshot())
    {
        if (task.state != TaskState::ACTIVE)
            continue;
        ++running;
        speed += task.progress.currentSpeed;
        downloaded += task.progress.bytesDownloaded;
    }

    // Print the header content
    int currentRow = 0;
    mvwprintw(_headerWin, ++currentRow, LEFT_PADDING, "QDM - Queued Download Manager");
    mvwprintw(_headerWin, ++currentRow, LEFT_PADDING, "%d worker(s) | %zu running | %zu queued | %s @ %s",
              _manager.getConfig().workerCount, running, _manager.queuedCount(),
              formatBytes(static_cast<double>(downloaded)).c_str(), formatSpeed(speed).c_str());
    mvwprintw(_headerWin, currentRow += 2, LEFT_PADDING, "Commands:");
    _screen->drawAvailableCommands(currentRow, _headerWin);

    wrefresh(_headerWin); // Refresh the header window

    _headerHeight = currentRow + 2;
}

// Draws the main content of the screen body
void UI::drawBody()
{
    // Draw the screen body content and calculate the pad height
    int currentRow = 0;
    _screen->drawScreen(currentRow, _bodyPad);
    _padHeight = std::max(currentRow + 1, _maxContentHeight);
}

// Draws the status line and the command line at the bottom of the screen
void UI::drawCommandLine()
{
    werase(_cmdLineWin); // Clear command line window

    // Print the status, the current command buffer and position the cursor
    mvwprintw(_cmdLineWin, 1, LEFT_PADDING, "%s", _statusMessage.c_str());
    mvwprintw(_cmdLineWin, 2, LEFT_PADDING, "> %s", _commandBuffer.c_str());
    wmove(_cmdLineWin, 2, LEFT_PADDING + 2 + static_cast<int>(_commandBuffer.size()));

    wrefresh(_cmdLineWin);
}

// Clears the screen windows
void UI::clearScreen()
{
    werase(_headerWin);
    werase(_cmdLineWin);
    werase(_bodyPad);
}

// Scrolls the screen body up by n lines
void UI::scrollUp(int lines)
{
    _scrollOffset = std::max(_scrollOffset - lines, 0);
}

// Scrolls the screen body down by n lines
void UI::scrollDown(int lines)
{
    int maxOffset = std::max(_padHeight - _maxContentHeight, 0);
    _scrollOffset = std::min(_scrollOffset + lines, maxOffset);
}

// Pauses execution briefly to prevent excessive CPU usage in the UI loop
void UI::sleepBriefly(int intervalMs)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(intervalMs));
}
