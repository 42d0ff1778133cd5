#ifndef DOWNLOADAPPLICATION_HPP
#define DOWNLOADAPPLICATION_HPP

#include <optional>
#include <string>

struct AppOptions
{
    bool daemon = false;
    std::optional<std::string> link;
    std::optional<std::string> configPath;
};

// Wires configuration, logging, the registry and the instance coordinator
// together for one process
class DownloadApplication
{
public:
    explicit DownloadApplication(AppOptions options);
    ~DownloadApplication();

    // Exit status for main
    int run();

private:
    AppOptions _options;
};

#endif
