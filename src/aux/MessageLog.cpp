#include <spdlog/spdlog.h>

#include "aux/MessageLog.hpp"

MessageLog::MessageLog(size_t capacity)
    : _capacity(capacity == 0 ? 1 : capacity)
{
}

void MessageLog::push(const std::string &message)
{
    spdlog::info("{}", message);

    std::function<void()> listener;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _messages.push_back(message);
        while (_messages.size() > _capacity)
        {
            _messages.pop_front();
        }
        listener = _listener;
    }

    if (listener)
    {
        listener();
    }
}

void MessageLog::remove(size_t index)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (index < _messages.size())
    {
        _messages.erase(_messages.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

void MessageLog::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _messages.clear();
}

std::vector<std::string> MessageLog::items() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return std::vector<std::string>(_messages.begin(), _messages.end());
}

size_t MessageLog::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _messages.size();
}

// True if any kept message contains the given text
bool MessageLog::contains(const std::string &needle) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto &message : _messages)
    {
        if (message.find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

void MessageLog::setListener(std::function<void()> listener)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _listener = std::move(listener);
}
