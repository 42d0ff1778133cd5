#ifndef INSTANCECOORDINATOR_HPP
#define INSTANCECOORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

static constexpr size_t MAX_LINK_LENGTH = 4096;

enum class InstanceRole
{
    Owner,         // This process holds the socket and should run normally
    Forwarded,     // The link was handed to the running instance
    AlreadyRunning // Another instance runs and there was nothing to hand over
};

// Keeps a single instance per socket path. The owner holds an exclusive
// flock on <socket>.lock for its lifetime and listens on the socket; later
// invocations forward their link to it and exit.
class InstanceCoordinator
{
public:
    using LinkHandler = std::function<void(const std::string &)>;

    explicit InstanceCoordinator(std::string socketPath,
                                 std::chrono::milliseconds forwardTimeout = std::chrono::milliseconds(2000));
    ~InstanceCoordinator();

    InstanceCoordinator(const InstanceCoordinator &) = delete;
    InstanceCoordinator &operator=(const InstanceCoordinator &) = delete;

    // Throws ChannelError if neither claiming nor forwarding is possible
    InstanceRole claimOrForward(const std::optional<std::string> &link);

    // Starts the listener thread; only valid for the owner. Each received
    // link is passed to the handler on that thread.
    void listen(LinkHandler handler);

    // Ends the listener, removes the socket and releases the claim
    void stop();

    bool isOwner() const { return _lockFd >= 0; }

private:
    bool tryLock();
    void bindSocket();
    void forward(const std::string &link);
    void listenLoop();
    void handleConnection(int clientFd);

    std::string _socketPath;
    std::string _lockPath;
    std::chrono::milliseconds _forwardTimeout;

    int _lockFd{-1};
    int _listenFd{-1};

    LinkHandler _handler;
    std::thread _listener;
    std::atomic<bool> _stopping{false};
};

#endif
