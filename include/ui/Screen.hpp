#ifndef SCREEN_HPP
#define SCREEN_HPP

#include <curses.h>
#include <string>
#include <vector>
#include <functional>

#include "aux/MessageLog.hpp"
#include "core/DownloadManager.hpp"

class UI;

static constexpr int MARGIN = 2;

enum class MatchType
{
    EXACT,  // whole input equals an alias
    PREFIX  // alias followed by arguments
};

struct CommandEntry
{
    std::vector<std::string> aliases;
    MatchType matchType;
    std::string usage;
    std::string description;
    std::function<void(const std::string &)> action;

    bool matches(const std::string &input) const;
};

enum class ScreenType
{
    DOWNLOADS,
    FILES
};

class Screen
{
public:
    Screen(DownloadManager &manager, MessageLog &msgs, UI &ui) : _manager(manager), _msgs(msgs), _ui(ui) {}
    virtual ~Screen() = default;

    virtual std::string title() const = 0;
    virtual const std::vector<CommandEntry> &commands() const = 0;
    virtual void drawBody(int &row, WINDOW *pad) = 0;

    // Runs the first matching entry; false when nothing matched
    bool dispatch(const std::string &input) const;

protected:
    DownloadManager &_manager;
    MessageLog &_msgs;
    UI &_ui;
};

#endif
