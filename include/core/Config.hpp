#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "core/DownloadInfo.hpp"

static constexpr const char MDM_DIRECTORY[] = "mdm";
static constexpr const char MDM_CONFIG_FILENAME[] = "config.json";
static constexpr const char MDM_LOG_FILENAME[] = "mdm.log";
static constexpr const char MDM_SOCKET_FILENAME[] = "mdm.socket";
static constexpr const char MDM_API_KEY_ENV[] = "MDM_API_KEY";
static constexpr size_t MDM_DEFAULT_MAX_CONCURRENT = 5;

struct Config
{
    std::optional<std::string> apiKey;
    std::string downloadDir;
    std::string stateDir; // Log files
    std::string socketPath;
    std::string logLevel{"info"};
    size_t maxConcurrentDownloads{MDM_DEFAULT_MAX_CONCURRENT};

    // Defaults derived from the XDG variables, falling back to $HOME
    static Config defaults();

    // Reads a JSON config file on top of the defaults. A missing file is not
    // an error; malformed content throws ConfigError.
    static Config load(const std::string &path);

    static std::string defaultConfigPath();

    // <downloadDir>/<game>
    std::string downloadDirFor(const std::string &game) const;

    // <downloadDir>/<game>/<fileName>
    std::string pathFor(const FileInfo &fileInfo) const;
};

#endif
