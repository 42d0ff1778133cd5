#include <curses.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

#include "ui/UI.hpp"
#include "ui/DownloadsScreen.hpp"
#include "ui/FilesScreen.hpp"

namespace
{
    constexpr auto INPUT_POLL = std::chrono::milliseconds(20);
    constexpr auto REDRAW_INTERVAL = std::chrono::milliseconds(500);
    constexpr int BODY_PAD_ROWS = 1000;
    constexpr int USAGE_COLUMN = 24;
}

UI::UI(DownloadManager &manager, MessageLog &msgs, std::atomic<bool> &changed)
    : _manager(manager),
      _msgs(msgs),
      _changed(changed),
      _isRunning(true),
      _lastRedraw(std::chrono::steady_clock::now()),
      _screen(std::make_unique<DownloadsScreen>(_manager, _msgs, *this))
{
}

// Owns the terminal until the user exits
void UI::run()
{
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);

    openWindows();
    redraw();

    while (_isRunning)
    {
        pollKeys();
        refresh();
        std::this_thread::sleep_for(INPUT_POLL);
    }

    closeWindows();
    endwin();
}

void UI::stop()
{
    _isRunning = false;
}

void UI::changeScreen(ScreenType type)
{
    _nextScreen = type;
}

// ------------------------------------------------------------------------------
// Windows
// ------------------------------------------------------------------------------

void UI::switchScreen(ScreenType type)
{
    switch (type)
    {
    case ScreenType::DOWNLOADS:
        _screen = std::make_unique<DownloadsScreen>(_manager, _msgs, *this);
        break;
    case ScreenType::FILES:
        _screen = std::make_unique<FilesScreen>(_manager, _msgs, *this);
        break;
    }

    _scroll = 0;

    // The help height follows the command count
    closeWindows();
    openWindows();
}

void UI::openWindows()
{
    int rows, cols;
    getmaxyx(stdscr, rows, cols);

    _layout.width = cols;
    _layout.helpRows = static_cast<int>(_screen->commands().size()) + 4;
    _layout.help = newwin(_layout.helpRows, cols, 0, 0);
    _layout.prompt = newwin(_layout.promptRows, cols, rows - _layout.promptRows, 0);
    _layout.body = newpad(BODY_PAD_ROWS, cols);
    _layout.visibleRows = std::max(rows - _layout.helpRows - _layout.promptRows, 1);
}

void UI::closeWindows()
{
    for (WINDOW **win : {&_layout.help, &_layout.prompt, &_layout.body})
    {
        if (*win)
        {
            delwin(*win);
            *win = nullptr;
        }
    }
}

// ------------------------------------------------------------------------------
// Input
// ------------------------------------------------------------------------------

void UI::pollKeys()
{
    int ch;
    while ((ch = getch()) != ERR)
    {
        onKey(ch);
    }
}

void UI::onKey(int ch)
{
    switch (ch)
    {
    case '\n':
    case '\r':
    {
        const std::string input = _input;
        _input.clear();
        submit(input);
        break;
    }
    case KEY_BACKSPACE:
    case 127:
    case 8:
        if (!_input.empty())
        {
            _input.pop_back();
        }
        break;
    case KEY_UP:
        scrollBy(-1);
        break;
    case KEY_DOWN:
        scrollBy(1);
        break;
    case KEY_PPAGE:
        scrollBy(-std::max(_layout.visibleRows - 1, 1));
        break;
    case KEY_NPAGE:
        scrollBy(std::max(_layout.visibleRows - 1, 1));
        break;
    case KEY_RESIZE:
        closeWindows();
        openWindows();
        break;
    default:
        if (ch >= 0 && ch < 256 && std::isprint(ch))
        {
            _input.push_back(static_cast<char>(ch));
        }
        break;
    }

    refresh(true);
}

void UI::submit(const std::string &input)
{
    if (input.empty())
    {
        return;
    }

    if (!_screen->dispatch(input))
    {
        _msgs.push("Unknown command: " + input);
        return;
    }

    if (_nextScreen && _isRunning)
    {
        switchScreen(*_nextScreen);
    }
    _nextScreen.reset();
}

// Full redraw when forced, after a registry change or every REDRAW_INTERVAL;
// otherwise only the prompt
void UI::refresh(bool force)
{
    const auto now = std::chrono::steady_clock::now();
    if (force || _changed.exchange(false) || now - _lastRedraw >= REDRAW_INTERVAL)
    {
        redraw();
        _lastRedraw = now;
    }
    else
    {
        drawPrompt();
    }
}

// ------------------------------------------------------------------------------
// Drawing
// ------------------------------------------------------------------------------

void UI::redraw()
{
    if (!_isRunning || !_layout.body)
    {
        return;
    }

    drawHelp();
    drawBody();
    drawPrompt();
}

void UI::drawHelp()
{
    WINDOW *win = _layout.help;
    werase(win);

    int row = 1;
    mvwprintw(win, row, MARGIN, "mdm - %s", _screen->title().c_str());
    row += 2;
    for (const auto &entry : _screen->commands())
    {
        mvwprintw(win, row++, MARGIN + 2, "%-*s %s", USAGE_COLUMN, entry.usage.c_str(), entry.description.c_str());
    }

    wnoutrefresh(win);
}

void UI::drawBody()
{
    werase(_layout.body);

    int row = 0;
    _screen->drawBody(row, _layout.body);
    _layout.bodyRows = row;
    scrollBy(0);

    pnoutrefresh(_layout.body,
                 _scroll, 0,
                 _layout.helpRows, 0,
                 _layout.helpRows + _layout.visibleRows - 1, _layout.width - 1);
}

void UI::drawPrompt()
{
    WINDOW *win = _layout.prompt;
    werase(win);
    mvwprintw(win, 1, MARGIN, "> %s", _input.c_str());
    wmove(win, 1, MARGIN + 2 + static_cast<int>(_input.size()));
    wnoutrefresh(win);
    doupdate();
}

// Clamps to the drawn content; scrollBy(0) just re-clamps
void UI::scrollBy(int lines)
{
    const int maxScroll = std::max(_layout.bodyRows - _layout.visibleRows, 0);
    _scroll = std::clamp(_scroll + lines, 0, maxScroll);
}
