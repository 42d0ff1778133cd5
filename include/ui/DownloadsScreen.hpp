#ifndef DOWNLOADS_SCREEN_HPP
#define DOWNLOADS_SCREEN_HPP

#include <optional>

#include "ui/Screen.hpp"

// Transfers in registry order, followed by the message log
class DownloadsScreen : public Screen
{
public:
    DownloadsScreen(DownloadManager &manager, MessageLog &msgs, UI &ui);

    std::string title() const override;
    const std::vector<CommandEntry> &commands() const override { return _commands; }
    void drawBody(int &row, WINDOW *pad) override;

private:
    const std::vector<CommandEntry> _commands;

    void queueLink(const std::string &command);
    std::optional<size_t> indexArgument(const std::string &command, const char *usage);
    void dismiss(const std::string &command);

    void drawEntry(int &row, WINDOW *pad, size_t position, const DownloadSnapshot &download);
    void drawMessages(int &row, WINDOW *pad);
};

#endif
