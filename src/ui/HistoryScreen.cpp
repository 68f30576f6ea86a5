#include <curses.h>
#include <algorithm>
#include <string>
#include <vector>

#include "ui/HistoryScreen.hpp"
#include "ui/UI.hpp"
#include "util/format.hpp"
#include "util/args.hpp"

HistoryScreen::HistoryScreen(DownloadManager &manager, UI &ui)
    : Screen(manager, ui),
      _commandTable{
          {{"retry", "r"},
           MatchType::PREFIX,
           [this](const std::string &command)
           {
               if (parseRetryCommand(command))
                   _ui.changeScreen(ScreenType::ACTIVE);
           }},
          {{"clear", "c"},
           MatchType::EXACT,
           [this](const std::string & /*command*/)
           {
               size_t removed = _manager.clearFinished();
               _ui.setStatus("Cleared " + std::to_string(removed) + " finished download(s)");
           }},
          {{"back", "b", ""},
           MatchType::EXACT,
           [this](const std::string & /*unused*/)
           {
               _ui.changeScreen(ScreenType::ACTIVE);
           }}}
{
}

void HistoryScreen::drawAvailableCommands(int &currentRow, WINDOW *win)
{
    size_t active = 0;
    size_t queued = 0;
    size_t paused = 0;
    for (const auto &task : _manager.snapshot())
    {
        if (task.state == TaskState::ACTIVE)
            ++active;
        else if (task.state == TaskState::QUEUED)
            ++queued;
        else if (task.state == TaskState::PAUSED)
            ++paused;
    }

    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "retry [id] | Retry a failed or cancelled download");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "clear      | Clear download history");
    mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "back       | Return to active downloads (%zu|%zu|%zu)",
              active, queued, paused);
}

void HistoryScreen::drawScreen(int &currentRow, WINDOW *win)
{
    std::vector<TaskSnapshot> completed;
    std::vector<TaskSnapshot> failed;

    for (auto &task : _manager.snapshot())
    {
        if (task.state == TaskState::COMPLETED)
            completed.push_back(task);
        else if (isTerminalState(task.state))
            failed.push_back(task);
    }

    // Completed downloads
    if (completed.empty())
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Completed downloads: None");
    }
    else
    {
        mvwprintw(win, currentRow, LEFT_PADDING, "Completed Downloads: %zu", completed.size());
        for (const auto &task : completed)
        {
            // <id>) <time> - <url>
            mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "%llu) %s - %s",
                      static_cast<unsigned long long>(task.id),
                      formatTime(task.endedAt).c_str(),
                      task.url.c_str());
            // Saved to <destination> (<size>, <detail>)
            mvwprintw(win, ++currentRow, LEFT_PADDING + 3, "Saved to %s (%s, %s)",
                      task.destination.c_str(),
                      formatBytes(static_cast<double>(task.progress.bytesDownloaded)).c_str(),
                      task.detail.c_str());
        }
    }

    // Failed and cancelled downloads
    if (!failed.empty())
    {
        mvwprintw(win, currentRow += 2, LEFT_PADDING, "Failed Downloads: %zu", failed.size());
        for (const auto &task : failed)
        {
            // <id>) <time> - <url>
            mvwprintw(win, ++currentRow, LEFT_PADDING + 2, "%llu) %s - %s",
                      static_cast<unsigned long long>(task.id),
                      formatTime(task.endedAt).c_str(),
                      task.url.c_str());
            // <error kind> after <n> attempt(s): <reason>
            mvwprintw(win, ++currentRow, LEFT_PADDING + 3, "%s after %d attempt(s): %s",
                      errorKindName(task.errorKind),
                      task.attempt,
                      task.detail.c_str());
        }
    }
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

bool HistoryScreen::parseRetryCommand(const std::string &command)
{
    auto args = extractArguments(command, 1);
    if (args.empty())
    {
        // No id provided, retry every failed or cancelled download
        size_t retried = 0;
        for (const auto &task : _manager.snapshot())
        {
            if (_manager.retryDownload(task.id) != 0)
                ++retried;
        }
        _ui.setStatus("Retrying " + std::to_string(retried) + " download(s)");
        return retried > 0;
    }

    std::uint64_t id = 0;
    TaskId newId = parseUnsigned(args[0], id) ? _manager.retryDownload(id) : 0;
    if (newId == 0)
    {
        _ui.setStatus("Task " + args[0] + " cannot be retried");
        return false;
    }
    _ui.setStatus("Task " + args[0] + " queued again as task " + std::to_string(newId));
    return true;
}
