#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "ipc/InstanceCoordinator.hpp"

namespace
{
    constexpr int LISTEN_BACKLOG = 16;
    constexpr int POLL_INTERVAL_MS = 200;
    constexpr auto FORWARD_RETRY_DELAY = std::chrono::milliseconds(50);

    std::string errnoMessage(const std::string &what)
    {
        return what + ": " + std::strerror(errno);
    }

    sockaddr_un makeAddress(const std::string &path)
    {
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        if (path.size() >= sizeof(addr.sun_path))
        {
            throw ChannelError("Socket path is too long: " + path);
        }
        std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
        return addr;
    }

    std::string trim(const std::string &value)
    {
        const char *whitespace = " \t\r\n";
        const size_t first = value.find_first_not_of(whitespace);
        if (first == std::string::npos)
        {
            return "";
        }
        const size_t last = value.find_last_not_of(whitespace);
        return value.substr(first, last - first + 1);
    }
}

InstanceCoordinator::InstanceCoordinator(std::string socketPath, std::chrono::milliseconds forwardTimeout)
    : _socketPath(std::move(socketPath)),
      _lockPath(_socketPath + ".lock"),
      _forwardTimeout(forwardTimeout)
{
}

InstanceCoordinator::~InstanceCoordinator()
{
    stop();
}

InstanceRole InstanceCoordinator::claimOrForward(const std::optional<std::string> &link)
{
    if (tryLock())
    {
        try
        {
            bindSocket();
        }
        catch (const ChannelError &)
        {
            stop();
            throw;
        }

        spdlog::info("Listening for links on {}", _socketPath);
        return InstanceRole::Owner;
    }

    if (!link)
    {
        return InstanceRole::AlreadyRunning;
    }

    forward(*link);
    spdlog::info("Forwarded {} to the running instance", *link);
    return InstanceRole::Forwarded;
}

void InstanceCoordinator::listen(LinkHandler handler)
{
    if (_listenFd < 0)
    {
        throw ChannelError("Only the owning instance can listen on " + _socketPath);
    }
    if (_listener.joinable())
    {
        return;
    }

    _handler = std::move(handler);
    _stopping = false;
    _listener = std::thread(&InstanceCoordinator::listenLoop, this);
}

void InstanceCoordinator::stop()
{
    _stopping = true;
    if (_listener.joinable())
    {
        _listener.join();
    }

    if (_listenFd >= 0)
    {
        close(_listenFd);
        _listenFd = -1;
        if (unlink(_socketPath.c_str()) != 0 && errno != ENOENT)
        {
            spdlog::warn("{}", errnoMessage("Unable to remove " + _socketPath));
        }
    }

    // The lock file itself stays; removing it would let two owners race
    if (_lockFd >= 0)
    {
        flock(_lockFd, LOCK_UN);
        close(_lockFd);
        _lockFd = -1;
    }
}

//---------------------------------------------------------------------------------
// Claim
//---------------------------------------------------------------------------------

// Takes the exclusive claim; false if another process holds it
bool InstanceCoordinator::tryLock()
{
    std::error_code ec;
    const auto parent = std::filesystem::path(_socketPath).parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }

    int fd = open(_lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        throw ChannelError(errnoMessage("Unable to open " + _lockPath));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        const int err = errno;
        close(fd);
        if (err == EWOULDBLOCK)
        {
            return false;
        }
        errno = err;
        throw ChannelError(errnoMessage("Unable to lock " + _lockPath));
    }

    _lockFd = fd;
    return true;
}

void InstanceCoordinator::bindSocket()
{
    const sockaddr_un addr = makeAddress(_socketPath);

    // Holding the lock means any socket file is a leftover from a dead owner
    if (unlink(_socketPath.c_str()) != 0 && errno != ENOENT)
    {
        throw ChannelError(errnoMessage("Unable to remove stale socket " + _socketPath));
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        throw ChannelError(errnoMessage("Unable to create socket"));
    }

    if (bind(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, LISTEN_BACKLOG) != 0)
    {
        const std::string message = errnoMessage("Unable to listen on " + _socketPath);
        close(fd);
        throw ChannelError(message);
    }

    _listenFd = fd;
}

// Hands the link to the owner, retrying while it is between claim and listen
void InstanceCoordinator::forward(const std::string &link)
{
    const sockaddr_un addr = makeAddress(_socketPath);
    const auto deadline = std::chrono::steady_clock::now() + _forwardTimeout;

    while (true)
    {
        int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0)
        {
            throw ChannelError(errnoMessage("Unable to create socket"));
        }

        if (connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) == 0)
        {
            size_t sent = 0;
            while (sent < link.size())
            {
                const ssize_t n = send(fd, link.data() + sent, link.size() - sent, MSG_NOSIGNAL);
                if (n < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    const std::string message = errnoMessage("Unable to send link to the running instance");
                    close(fd);
                    throw ChannelError(message);
                }
                sent += static_cast<size_t>(n);
            }
            close(fd);
            return;
        }

        const int err = errno;
        close(fd);

        if ((err != ECONNREFUSED && err != ENOENT) || std::chrono::steady_clock::now() >= deadline)
        {
            errno = err;
            throw ChannelError(errnoMessage("Unable to reach the running instance at " + _socketPath));
        }
        std::this_thread::sleep_for(FORWARD_RETRY_DELAY);
    }
}

//---------------------------------------------------------------------------------
// Listener
//---------------------------------------------------------------------------------

void InstanceCoordinator::listenLoop()
{
    while (!_stopping)
    {
        pollfd pfd{};
        pfd.fd = _listenFd;
        pfd.events = POLLIN;

        const int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::error("{}", errnoMessage("Link listener stopped"));
            return;
        }
        if (rc == 0 || !(pfd.revents & POLLIN))
        {
            continue;
        }

        int clientFd = accept4(_listenFd, nullptr, nullptr, SOCK_CLOEXEC);
        if (clientFd < 0)
        {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
            {
                spdlog::warn("{}", errnoMessage("Unable to accept connection"));
            }
            continue;
        }

        handleConnection(clientFd);
        close(clientFd);
    }
}

// Reads one link per connection, up to EOF
void InstanceCoordinator::handleConnection(int clientFd)
{
    timeval timeout{};
    timeout.tv_sec = 2;
    setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    std::string payload;
    char buffer[1024];

    while (true)
    {
        const ssize_t n = recv(clientFd, buffer, sizeof(buffer), 0);
        if (n == 0)
        {
            break;
        }
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::warn("{}", errnoMessage("Dropped incomplete link from socket"));
            return;
        }

        payload.append(buffer, static_cast<size_t>(n));
        if (payload.size() > MAX_LINK_LENGTH)
        {
            spdlog::warn("Dropped oversized payload ({}+ bytes) from socket", payload.size());
            return;
        }
    }

    const std::string link = trim(payload);
    if (link.empty())
    {
        return;
    }

    spdlog::info("Received link {}", link);
    try
    {
        _handler(link);
    }
    catch (const std::exception &e)
    {
        spdlog::warn("Unable to queue {}: {}", link, e.what());
    }
}
