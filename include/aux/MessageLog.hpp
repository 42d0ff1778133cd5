#ifndef MESSAGELOG_HPP
#define MESSAGELOG_HPP

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

static constexpr size_t MESSAGE_LOG_CAPACITY = 200;

// User-facing notification sink. Every message is also written to the
// application log; the newest MESSAGE_LOG_CAPACITY are kept for display.
class MessageLog
{
public:
    explicit MessageLog(size_t capacity = MESSAGE_LOG_CAPACITY);

    void push(const std::string &message);
    void remove(size_t index);
    void clear();

    std::vector<std::string> items() const;
    size_t size() const;
    bool contains(const std::string &needle) const;

    // Invoked (outside the lock) after every push
    void setListener(std::function<void()> listener);

private:
    std::deque<std::string> _messages;
    size_t _capacity;
    std::function<void()> _listener;
    mutable std::mutex _mutex;
};

#endif
