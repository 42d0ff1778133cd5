#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include <pthread.h>
#include <spdlog/spdlog.h>

#include "aux/Logging.hpp"
#include "aux/MessageLog.hpp"
#include "cache/LocalFileIndex.hpp"
#include "core/Config.hpp"
#include "core/DownloadApplication.hpp"
#include "core/DownloadManager.hpp"
#include "core/Errors.hpp"
#include "core/LinkResolver.hpp"
#include "ipc/InstanceCoordinator.hpp"
#include "ui/UI.hpp"
#include "util/http.hpp"

namespace
{
    // Blocks SIGINT/SIGTERM in the calling thread and every thread it starts
    // afterwards, so a daemon can collect them with sigwait
    sigset_t blockTerminationSignals()
    {
        sigset_t signals{};
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
        return signals;
    }

    void queueReported(DownloadManager &manager, MessageLog &msgs, const std::string &link)
    {
        try
        {
            manager.queue(link);
        }
        catch (const DownloadError &e)
        {
            msgs.push(e.what());
        }
    }
}

DownloadApplication::DownloadApplication(AppOptions options)
    : _options(std::move(options))
{
}

DownloadApplication::~DownloadApplication() {}

int DownloadApplication::run()
{
    Config config;
    try
    {
        config = Config::load(_options.configPath.value_or(Config::defaultConfigPath()));
    }
    catch (const ConfigError &e)
    {
        std::cerr << "mdm: " << e.what() << std::endl;
        return 1;
    }

    sigset_t signals{};
    if (_options.daemon)
    {
        signals = blockTerminationSignals();
    }

    InstanceCoordinator coordinator(config.socketPath);
    try
    {
        switch (coordinator.claimOrForward(_options.link))
        {
        case InstanceRole::Owner:
            break;
        case InstanceRole::Forwarded:
            return 0;
        case InstanceRole::AlreadyRunning:
            std::cerr << "mdm is already running." << std::endl;
            return 1;
        }
    }
    catch (const ChannelError &e)
    {
        std::cerr << "mdm: " << e.what() << std::endl;
        return 1;
    }

    initialiseLogging(config, !_options.daemon);
    spdlog::info("Starting mdm, downloading to {}", config.downloadDir);

    MessageLog msgs;
    std::atomic<bool> changed{true};

    int status = 0;
    try
    {
        auto index = std::make_shared<LocalFileIndex>();
        const size_t known = index->hydrate(config.downloadDir);
        spdlog::info("Found {} downloaded file(s)", known);

        auto client = std::make_shared<http::CurlClient>();
        auto resolver = std::make_shared<NexusLinkResolver>(client, config.apiKey);

        DownloadManager manager(config, client, resolver, index, msgs, [&changed]()
                                { changed = true; });
        msgs.setListener([&changed]()
                         { changed = true; });

        manager.resumeOnStartup();

        if (_options.link)
        {
            queueReported(manager, msgs, *_options.link);
        }

        coordinator.listen([&manager, &msgs](const std::string &link)
                           { queueReported(manager, msgs, link); });

        try
        {
            if (_options.daemon)
            {
                int received = 0;
                sigwait(&signals, &received);
                spdlog::info("Received signal {}, shutting down", received);
            }
            else
            {
                UI ui(manager, msgs, changed);
                ui.run();
            }
        }
        catch (...)
        {
            // The listener calls into the manager; end it before the manager goes
            coordinator.stop();
            throw;
        }

        // No new links once the registry starts shutting down
        coordinator.stop();
        manager.stop();
    }
    catch (const std::exception &e)
    {
        spdlog::critical("{}", e.what());
        std::cerr << "mdm: " << e.what() << std::endl;
        status = 1;
    }

    coordinator.stop();
    spdlog::info("mdm stopped");
    shutdownLogging();
    return status;
}
