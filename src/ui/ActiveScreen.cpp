#include <curses.h>
#include <algorithm>
#include <string>
#include <vector>

#include "ui/ActiveScreen.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

ActiveScreen::ActiveScreen(DownloadManager &manager, UI &ui)
    : Screen(manager, ui),
      _commandTable{
          {{"exit", "quit", "q"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.stop();
           }},
          {{"download", "d"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseDownloadCommand(command);
           }},
          {{"load"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseLoadCommand(command);
           }},
          {{"pause", "p"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseControlCommand(command, "Paused",
                                   [this](TaskId id)
                                   { return _manager.pauseDownload(id); },
                                   [this]()
                                   { _manager.pauseAllDownloads(); });
           }},
          {{"resume", "r"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseControlCommand(command, "Resumed",
                                   [this](TaskId id)
                                   { return _manager.resumeDownload(id); },
                                   [this]()
                                   { _manager.resumeAllDownloads(); });
           }},
          {{"cancel", "c"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseControlCommand(command, "Cancelled",
                                   [this](TaskId id)
                                   { return _manager.cancelDownload(id); },
                                   [this]()
                                   { _manager.cancelAllDownloads(); });
           }},
          {{"up", "u"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseMoveCommand(command, -1);
           }},
          {{"down"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseMoveCommand(command, 1);
           }},
          {{"limit", "l"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               parseLimitCommand(command);
           }},
          {{"history", "h"},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::HISTORY);
           }}}
{
}

void ActiveScreen::drawAvailableCommands(int &currentRow, WINDOW *win)
{
    size_t completed = 0;
    size_t failed = 0;
    for (const auto &task : _manager.snapshot())
    {
        if (task.state == TaskState::COMPLETED)
            ++completed;
        else if (isTerminalState(task.state))
            ++failed;
    }

    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "download <URL> [file] [sha256] | Start a new download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "load <file>                    | Queue every URL in a text file");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "pause [id]                     | Pause a download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "resume [id]                    | Resume a paused download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "cancel [id]                    | Cancel a download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "up <id> | down <id>            | Reorder a queued download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "limit <id> <KiB/s>             | Limit bandwidth (0 = unlimited)");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "history                        | Show past downloads (%zu|%zu)",
              completed, failed);
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "exit                           | Quit the program");
}

void ActiveScreen::drawScreen(int &currentRow, WINDOW *win)
{
    std::vector<TaskSnapshot> active;
    std::vector<TaskSnapshot> paused;
    std::vector<TaskSnapshot> queued;
    std::vector<TaskSnapshot> failed;

    for (auto &task : _manager.snapshot())
    {
        switch (task.state)
        {
        case TaskState::ACTIVE:
            active.push_back(task);
            break;
        case TaskState::PAUSED:
            paused.push_back(task);
            break;
        case TaskState::QUEUED:
            queued.push_back(task);
            break;
        case TaskState::FAILED:
            failed.push_back(task);
            break;
        default:
            break;
        }
    }

    // Active downloads
    if (active.empty())
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Active Downloads: None");
    }
    else
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Active Downloads: %zu", active.size());
        for (const auto &task : active)
        {
            drawDownloadProgress(++currentRow, win, task);
        }
    }

    // Paused downloads
    if (!paused.empty())
    {
        mvwprintw(win, currentRow += 2, LEFT_PADDING, "Paused Downloads: %zu", paused.size());
        for (const auto &task : paused)
        {
            drawDownloadProgress(++currentRow, win, task);
        }
    }

    // Queued downloads, in the order workers will take them
    if (!queued.empty())
    {
        mvwprintw(win, currentRow += 2, LEFT_PADDING, "Queued Downloads: %zu", queued.size());
        std::vector<TaskId> order = _manager.queueOrder();
        std::stable_sort(queued.begin(), queued.end(), [&order](const TaskSnapshot &a, const TaskSnapshot &b)
                         { return std::find(order.begin(), order.end(), a.id) < std::find(order.begin(), order.end(), b.id); });
        for (const auto &task : queued)
        {
            mvwprintw(win, ++currentRow, LEFT_PADDING + 1, "%llu) %s [%s]",
                      static_cast<unsigned long long>(task.id), task.url.c_str(), task.detail.c_str());
        }
    }

    // Failed downloads
    if (!failed.empty())
    {
        mvwprintw(win, currentRow += 2, LEFT_PADDING, "Failed Downloads: %zu", failed.size());
    }
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

void ActiveScreen::parseDownloadCommand(const std::string &command)
{
    auto args = extractArguments(command, 3);
    if (args.empty())
    {
        _ui.setStatus("Usage: download <URL> [file] [sha256]");
        return;
    }

    TaskInput input;
    input.url = args[0];
    if (args.size() > 1)
        input.fileName = args[1];
    if (args.size() > 2)
        input.expectedHash = args[2];

    TaskId id = _manager.queueDownload(input);
    _ui.setStatus("Queued task " + std::to_string(id));
}

// Queues one task per line of the file, each line a URL with an optional #sha256
void ActiveScreen::parseLoadCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _ui.setStatus("Usage: load <file>");
        return;
    }

    std::vector<std::string> urls;
    if (!readUrlFile(args[0], urls))
    {
        _ui.setStatus("Cannot read " + args[0]);
        return;
    }
    if (urls.empty())
    {
        _ui.setStatus("No URLs in " + args[0]);
        return;
    }

    for (const auto &line : urls)
    {
        TaskInput input;
        splitUrlAndHash(line, input.url, input.expectedHash);
        _manager.queueDownload(input);
    }
    _ui.setStatus("Queued " + std::to_string(urls.size()) + " download(s) from " + args[0]);
}

void ActiveScreen::parseControlCommand(const std::string &command,
                                       const char *verb,
                                       const std::function<bool(TaskId)> &single,
                                       const std::function<void()> &all)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        // No id provided, apply to all
        all();
        _ui.setStatus(std::string(verb) + " all downloads");
        return;
    }

    std::uint64_t id = 0;
    if (!parseUnsigned(args[0], id) || !single(id))
    {
        _ui.setStatus("No applicable task " + args[0]);
        return;
    }
    _ui.setStatus(std::string(verb) + " task " + args[0]);
}

void ActiveScreen::parseMoveCommand(const std::string &command, int direction)
{
    auto args = extractArguments(command, 1);
    std::uint64_t id = 0;
    if (args.empty() || !parseUnsigned(args[0], id))
    {
        _ui.setStatus("Usage: up|down <id>");
        return;
    }

    if (!_manager.moveDownload(id, direction))
    {
        _ui.setStatus("Task " + args[0] + " cannot move further");
    }
}

void ActiveScreen::parseLimitCommand(const std::string &command)
{
    auto args = extractArguments(command, 2);
    std::uint64_t id = 0;
    std::uint64_t kibPerSecond = 0;
    if (args.size() < 2 || !parseUnsigned(args[0], id) || !parseUnsigned(args[1], kibPerSecond))
    {
        _ui.setStatus("Usage: limit <id> <KiB/s>");
        return;
    }

    if (!_manager.setBandwidthLimit(id, static_cast<std::int64_t>(kibPerSecond * 1024)))
    {
        _ui.setStatus("No applicable task " + args[0]);
        return;
    }
    _ui.setStatus(kibPerSecond == 0 ? "Task " + args[0] + " unlimited"
                                    : "Task " + args[0] + " limited to " + args[1] + " KiB/s");
}

void ActiveScreen::drawDownloadProgress(int &currentRow, WINDOW *win, const TaskSnapshot &task)
{
    const ProgressSnapshot &progress = task.progress;
    bool isActive = task.state == TaskState::ACTIVE;

    // <id>) <url> -> <destination>
    mvwprintw(win, currentRow++, LEFT_PADDING + 1,
              "%llu) %s -> %s",
              static_cast<unsigned long long>(task.id),
              task.url.c_str(),
              task.destination.empty() ? "(resolving)" : task.destination.c_str());

    // Prepare progress bar
    int filled = 0;
    if (progress.percentKnown)
    {
        filled = static_cast<int>((progress.percentage / 100.0) * BAR_WIDTH);
        filled = std::min(filled, BAR_WIDTH);
    }

    // [=======>   ] <progress>% (<current> / <total>) ETA: <time remaining> @ <speed>
    mvwaddstr(win, currentRow, 0, std::string(LEFT_PADDING, ' ').c_str());
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

    // Print percentage progress
    if (progress.percentKnown)
        wprintw(win, " %s", formatPercent(progress.percentage).c_str());
    else
        wprintw(win, " --%%");

    // Print size info
    if (progress.totalSize == 0)
    {
        wprintw(win, " (%s / size unknown)", formatBytes(static_cast<double>(progress.bytesDownloaded)).c_str());
    }
    else
    {
        std::string currentStr = formatBytes(static_cast<double>(progress.bytesDownloaded));
        std::string totalStr = formatBytes(static_cast<double>(progress.totalSize));
        wprintw(win, " (%s / %s)", currentStr.c_str(), totalStr.c_str());
    }

    // If active, show ETA and speed
    if (isActive)
    {
        wprintw(win, " ETA: %s @ %s",
                progress.etaSeconds > 0.0 ? formatDuration(progress.etaSeconds).c_str() : "--",
                formatSpeed(progress.currentSpeed).c_str());
    }

    // <phase> | position p/t | limit | detail
    mvwprintw(win, ++currentRow, LEFT_PADDING + 3, "%s", phaseName(progress.phase));
    if (progress.queuePosition > 0)
        wprintw(win, " | position %d/%d", progress.queuePosition, progress.queueTotal);
    if (task.bandwidthLimit > 0)
        wprintw(win, " | limit %s", formatSpeed(static_cast<double>(task.bandwidthLimit)).c_str());
    if (!task.detail.empty())
        wprintw(win, " | %s", task.detail.c_str());

    currentRow++;
}
