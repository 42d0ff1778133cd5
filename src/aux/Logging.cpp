#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "aux/Logging.hpp"

void initialiseLogging(const Config &config, bool interactive)
{
    const auto level = spdlog::level::from_str(config.logLevel);

    std::vector<spdlog::sink_ptr> sinks;

    if (!interactive)
    {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        sinks.push_back(consoleSink);
    }

    try
    {
        std::filesystem::create_directories(config.stateDir);
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.stateDir + "/" + MDM_LOG_FILENAME,
            1024 * 1024 * 5, // 5 MB
            3);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }
    catch (const std::exception &e)
    {
        // Keep going with whatever sinks we have; the UI still shows messages
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        spdlog::warn("Unable to open log file in {}: {}", config.stateDir, e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("mdm", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
}

void shutdownLogging()
{
    spdlog::shutdown();
}
