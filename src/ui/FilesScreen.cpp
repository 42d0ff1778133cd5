#include <curses.h>
#include <string>
#include <vector>

#include "ui/FilesScreen.hpp"
#include "ui/UI.hpp"

FilesScreen::FilesScreen(DownloadManager &manager, MessageLog &msgs, UI &ui)
    : Screen(manager, msgs, ui),
      _commands{
          {{"back", "b"}, MatchType::EXACT, "back", "Return to downloads",
           [this](const std::string &) { _ui.changeScreen(ScreenType::DOWNLOADS); }},
          {{"exit", "quit", "q"}, MatchType::EXACT, "exit", "Quit the program",
           [this](const std::string &) { _ui.stop(); }}}
{
}

std::string FilesScreen::title() const
{
    return "Downloaded files (" + std::to_string(_manager.getIndex().size()) + ")";
}

void FilesScreen::drawBody(int &row, WINDOW *pad)
{
    const std::vector<LocalFile> files = _manager.getIndex().items();
    if (files.empty())
    {
        mvwaddstr(pad, row, MARGIN, "Nothing downloaded yet.");
        return;
    }

    for (size_t i = 0; i < files.size(); ++i)
    {
        const LocalFile &file = files[i];
        std::string line = std::to_string(i + 1) + ") " + file.fileName + "  " + file.game +
                           " mod " + std::to_string(file.modId);
        if (file.version)
        {
            line += " v" + *file.version;
        }
        mvwaddstr(pad, row++, MARGIN, line.c_str());
    }
}
