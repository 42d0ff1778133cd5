#include <cstdlib>
#include <fstream>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "core/Config.hpp"
#include "core/Errors.hpp"

using nlohmann::json;

namespace
{
    std::string envOr(const char *name, const std::string &fallback)
    {
        const char *value = std::getenv(name);
        if (value && *value)
        {
            return value;
        }
        return fallback;
    }

    std::string homeDirectory()
    {
        // Fallback to current directory if HOME is not set
        return envOr("HOME", ".");
    }

    std::string defaultSocketPath()
    {
        const char *runtimeDir = std::getenv("XDG_RUNTIME_DIR");
        if (runtimeDir && *runtimeDir)
        {
            return std::string(runtimeDir) + "/" + MDM_SOCKET_FILENAME;
        }

        return "/tmp/mdm-" + std::to_string(getuid()) + ".socket";
    }

    template <typename T>
    void readOptional(const json &j, const char *key, T &target)
    {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null())
        {
            target = it->get<T>();
        }
    }
}

Config Config::defaults()
{
    Config config;

    const std::string dataHome = envOr("XDG_DATA_HOME", homeDirectory() + "/.local/share");
    const std::string stateHome = envOr("XDG_STATE_HOME", homeDirectory() + "/.local/state");

    config.downloadDir = dataHome + "/" + MDM_DIRECTORY + "/downloads";
    config.stateDir = stateHome + "/" + MDM_DIRECTORY;
    config.socketPath = defaultSocketPath();

    const char *apiKey = std::getenv(MDM_API_KEY_ENV);
    if (apiKey && *apiKey)
    {
        config.apiKey = std::string(apiKey);
    }

    return config;
}

Config Config::load(const std::string &path)
{
    Config config = defaults();

    std::ifstream in(path);
    if (!in.is_open())
    {
        return config; // No file => defaults
    }

    json j;
    try
    {
        j = json::parse(in);
    }
    catch (const json::parse_error &e)
    {
        throw ConfigError("unable to parse " + path + ": " + e.what());
    }

    if (!j.is_object())
    {
        throw ConfigError(path + ": expected a JSON object");
    }

    try
    {
        // The environment wins over the file for the key
        if (!config.apiKey)
        {
            std::string apiKey;
            readOptional(j, "apikey", apiKey);
            if (!apiKey.empty())
            {
                config.apiKey = apiKey;
            }
        }
        readOptional(j, "download_dir", config.downloadDir);
        readOptional(j, "state_dir", config.stateDir);
        readOptional(j, "socket_path", config.socketPath);
        readOptional(j, "log_level", config.logLevel);
        readOptional(j, "max_concurrent_downloads", config.maxConcurrentDownloads);
    }
    catch (const json::exception &e)
    {
        throw ConfigError(path + ": " + e.what());
    }

    if (config.maxConcurrentDownloads == 0)
    {
        throw ConfigError(path + ": max_concurrent_downloads must be at least 1");
    }
    if (config.downloadDir.empty())
    {
        throw ConfigError(path + ": download_dir must not be empty");
    }

    return config;
}

std::string Config::defaultConfigPath()
{
    const std::string configHome = envOr("XDG_CONFIG_HOME", homeDirectory() + "/.config");
    return configHome + "/" + MDM_DIRECTORY + "/" + MDM_CONFIG_FILENAME;
}

std::string Config::downloadDirFor(const std::string &game) const
{
    return downloadDir + "/" + game;
}

std::string Config::pathFor(const FileInfo &fileInfo) const
{
    return downloadDirFor(fileInfo.game) + "/" + fileInfo.fileName;
}
