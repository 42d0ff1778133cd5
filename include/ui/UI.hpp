#ifndef UI_HPP
#define UI_HPP

#include <curses.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "ui/Screen.hpp"
#include "aux/MessageLog.hpp"
#include "core/DownloadManager.hpp"

// Curses front end: command help on top, a scrollable body, a prompt at the bottom
class UI
{
public:
    // changed is raised by the registry's change callback and cleared on redraw
    UI(DownloadManager &manager, MessageLog &msgs, std::atomic<bool> &changed);

    void run();
    void stop();
    // Takes effect once the running command returns
    void changeScreen(ScreenType type);

private:
    struct Layout
    {
        WINDOW *help = nullptr;
        WINDOW *prompt = nullptr;
        WINDOW *body = nullptr; // pad
        int helpRows = 0;
        int promptRows = 3;
        int bodyRows = 0;       // rows drawn into the pad
        int visibleRows = 0;
        int width = 0;
    };

    DownloadManager &_manager;
    MessageLog &_msgs;
    std::atomic<bool> &_changed;
    bool _isRunning;
    std::string _input;
    int _scroll = 0;
    std::chrono::steady_clock::time_point _lastRedraw;
    std::unique_ptr<Screen> _screen;
    std::optional<ScreenType> _nextScreen;
    Layout _layout;

    void switchScreen(ScreenType type);
    void openWindows();
    void closeWindows();

    void pollKeys();
    void onKey(int ch);
    void submit(const std::string &input);
    void refresh(bool force = false);

    void redraw();
    void drawHelp();
    void drawBody();
    void drawPrompt();
    void scrollBy(int lines);
};

#endif
