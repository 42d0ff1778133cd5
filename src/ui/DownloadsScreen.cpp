#include <curses.h>
#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "ui/DownloadsScreen.hpp"
#include "ui/UI.hpp"
#include "util/args.hpp"
#include "util/format.hpp"

namespace
{
    constexpr int BAR_WIDTH = 32;

    bool showsFailure(const DownloadSnapshot &download)
    {
        return !download.failureMessage.empty() &&
               (download.state == DownloadState::Error || download.state == DownloadState::Expired);
    }

    // [=======>      ] while running, [=======|      ] otherwise
    std::string progressBar(const DownloadSnapshot &download, const std::optional<double> &percent)
    {
        const int filled = percent ? std::min(static_cast<int>(*percent / 100.0 * BAR_WIDTH), BAR_WIDTH) : 0;

        std::string bar(BAR_WIDTH, ' ');
        std::fill(bar.begin(), bar.begin() + filled, '=');
        if (filled < BAR_WIDTH)
        {
            bar[filled] = download.state == DownloadState::Downloading ? '>' : '|';
        }
        return "[" + bar + "]";
    }
}

DownloadsScreen::DownloadsScreen(DownloadManager &manager, MessageLog &msgs, UI &ui)
    : Screen(manager, msgs, ui),
      _commands{
          {{"download", "d"}, MatchType::PREFIX, "download <nxm://...>", "Queue a mod file",
           [this](const std::string &command) { queueLink(command); }},
          {{"pause", "p"}, MatchType::PREFIX, "pause <index>", "Pause or resume a download",
           [this](const std::string &command)
           {
               if (auto index = indexArgument(command, "Usage: pause <index>"))
               {
                   _manager.togglePauseFor(*index);
               }
           }},
          {{"delete", "x"}, MatchType::PREFIX, "delete <index>", "Remove a download and its partial data",
           [this](const std::string &command)
           {
               if (auto index = indexArgument(command, "Usage: delete <index>"))
               {
                   _manager.deleteDownload(*index);
               }
           }},
          {{"dismiss", "m"}, MatchType::PREFIX, "dismiss [index]", "Dismiss a message (all without index)",
           [this](const std::string &command) { dismiss(command); }},
          {{"files", "f"}, MatchType::EXACT, "files", "Show downloaded files",
           [this](const std::string &) { _ui.changeScreen(ScreenType::FILES); }},
          {{"exit", "quit", "q"}, MatchType::EXACT, "exit", "Quit the program",
           [this](const std::string &) { _ui.stop(); }}}
{
}

std::string DownloadsScreen::title() const
{
    return "Downloads (" + std::to_string(_manager.size()) + ")";
}

void DownloadsScreen::drawBody(int &row, WINDOW *pad)
{
    const std::vector<DownloadSnapshot> downloads = _manager.snapshot();

    if (downloads.empty())
    {
        mvwaddstr(pad, row++, MARGIN, "Nothing queued. Open an nxm:// link or use 'download'.");
    }

    for (size_t i = 0; i < downloads.size(); ++i)
    {
        drawEntry(row, pad, i + 1, downloads[i]);
    }

    drawMessages(row, pad);
}

// ------------------------------------------------------------------------------
// Commands
// ------------------------------------------------------------------------------

void DownloadsScreen::queueLink(const std::string &command)
{
    const auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _msgs.push("Usage: download <nxm://...>");
        return;
    }

    try
    {
        _manager.queue(args[0]);
    }
    catch (const DownloadError &e)
    {
        _msgs.push(e.what());
    }
}

std::optional<size_t> DownloadsScreen::indexArgument(const std::string &command, const char *usage)
{
    const auto args = extractArguments(command, 1);
    auto index = args.empty() ? std::nullopt : parseIndex(args[0]);
    if (!index)
    {
        _msgs.push(usage);
    }
    return index;
}

void DownloadsScreen::dismiss(const std::string &command)
{
    const auto args = extractArguments(command, 1);
    if (args.empty())
    {
        _msgs.clear();
        return;
    }

    if (auto index = parseIndex(args[0]))
    {
        _msgs.remove(*index);
    }
    else
    {
        _msgs.push("Usage: dismiss [index]");
    }
}

// ------------------------------------------------------------------------------
// Drawing
// ------------------------------------------------------------------------------

void DownloadsScreen::drawEntry(int &row, WINDOW *pad, size_t position, const DownloadSnapshot &download)
{
    mvwprintw(pad, row++, MARGIN, "%zu) %s [%s]",
              position, download.fileInfo.fileName.c_str(), toString(download.state));

    const auto percent = progressPercent(download.bytesRead, download.size);
    std::string line = progressBar(download, percent);
    if (percent)
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), " %.1f%%", *percent);
        line += buf;
    }
    line += " (" + formatProgress(download.bytesRead, download.size) + ")";
    mvwaddstr(pad, row++, MARGIN + 1, line.c_str());

    if (showsFailure(download))
    {
        mvwaddstr(pad, row++, MARGIN + 3, download.failureMessage.c_str());
    }
}

void DownloadsScreen::drawMessages(int &row, WINDOW *pad)
{
    const std::vector<std::string> messages = _msgs.items();
    if (messages.empty())
    {
        return;
    }

    mvwprintw(pad, ++row, MARGIN, "Messages (%zu)", messages.size());
    ++row;
    for (size_t i = 0; i < messages.size(); ++i)
    {
        mvwprintw(pad, row++, MARGIN + 2, "%zu) %s", i + 1, messages[i].c_str());
    }
}
