#ifndef FILES_SCREEN_HPP
#define FILES_SCREEN_HPP

#include "ui/Screen.hpp"

// Completed files known to the local index
class FilesScreen : public Screen
{
public:
    FilesScreen(DownloadManager &manager, MessageLog &msgs, UI &ui);

    std::string title() const override;
    const std::vector<CommandEntry> &commands() const override { return _commands; }
    void drawBody(int &row, WINDOW *pad) override;

private:
    const std::vector<CommandEntry> _commands;
};

#endif
