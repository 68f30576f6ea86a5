#ifndef ACTIVE_SCREEN_HPP
#define ACTIVE_SCREEN_HPP

#include "ui/Screen.hpp"
#include "ui/UI.hpp"

class ActiveScreen : public Screen
{
public:
    explicit ActiveScreen(DownloadManager &manager, UI &ui);

    std::vector<CommandEntry> getCommandTable() const override { return _commandTable; }
    void drawAvailableCommands(int &currentRow, WINDOW *window) override;
    void drawScreen(int &currentRow, WINDOW *window) override;

private:
    const std::vector<CommandEntry> _commandTable;

    void parseDownloadCommand(const std::string &command);
    void parseLoadCommand(const std::string &command);
    void parseControlCommand(const std::string &command,
                             const char *verb,
                             const std::function<bool(TaskId)> &single,
                             const std::function<void()> &all);
    void parseMoveCommand(const std::string &command, int direction);
    void parseLimitCommand(const std::string &command);
    void drawDownloadProgress(int &currentRow, WINDOW *win, const TaskSnapshot &task);
};

#endif
