#ifndef TESTSUPPORT_HPP
#define TESTSUPPORT_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "util/http.hpp"

// Fresh directory under the system temp dir, removed with its contents
class TempDir
{
public:
    TempDir()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "mdm-test-XXXXXX").string();
        if (!mkdtemp(pattern.data()))
        {
            throw std::runtime_error("mkdtemp failed");
        }
        _path = pattern;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::string &path() const { return _path; }
    std::string operator/(const std::string &name) const { return _path + "/" + name; }

private:
    std::string _path;
};

inline void writeFile(const std::string &path, const std::string &content)
{
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// "0123456789" repeated up to size bytes
inline std::string makeBody(size_t size)
{
    std::string body(size, '\0');
    for (size_t i = 0; i < size; ++i)
    {
        body[i] = static_cast<char>('0' + i % 10);
    }
    return body;
}

// One scripted exchange of FakeHttpClient
struct FakeResponse
{
    long status = 200;
    std::optional<uint64_t> contentLength;
    std::string body;
    size_t chunkSize = 100;

    bool connectFailure = false;      // Fails before any response
    std::optional<size_t> failAfter;  // Transport error after this many body bytes
    std::optional<size_t> stallAfter; // Holds the connection open until cancelled

    static FakeResponse ok(const std::string &body, long status = 200)
    {
        FakeResponse r;
        r.status = status;
        r.body = body;
        r.contentLength = body.size();
        return r;
    }

    static FakeResponse statusOnly(long status)
    {
        FakeResponse r;
        r.status = status;
        r.contentLength = 0;
        return r;
    }
};

// In-process http::Client replaying FakeResponses in order and recording
// every request it was given
class FakeHttpClient : public http::Client
{
public:
    void push(FakeResponse response)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _script.push_back(std::move(response));
    }

    http::Result perform(const http::Request &request, http::ResponseHandler &handler) override
    {
        FakeResponse response;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _requests.push_back(request);
            if (_script.empty())
            {
                http::Result result;
                result.error = "no scripted response for " + request.url;
                return result;
            }
            response = std::move(_script.front());
            _script.pop_front();
        }

        http::Result result;
        if (response.connectFailure)
        {
            result.error = "Could not connect to server";
            return result;
        }

        result.status = response.status;
        if (!handler.onResponse(response.status, response.contentLength))
        {
            result.outcome = http::Outcome::Aborted;
            return result;
        }

        size_t offset = 0;
        while (offset < response.body.size())
        {
            if (response.stallAfter && offset >= *response.stallAfter)
            {
                markStalled();
                while (!handler.isCancelled())
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
                result.outcome = http::Outcome::Aborted;
                return result;
            }
            if (response.failAfter && offset >= *response.failAfter)
            {
                result.outcome = http::Outcome::Failed;
                result.error = "Connection reset by peer";
                return result;
            }
            if (handler.isCancelled())
            {
                result.outcome = http::Outcome::Aborted;
                return result;
            }

            const size_t n = std::min(response.chunkSize, response.body.size() - offset);
            if (!handler.onData(response.body.data() + offset, n))
            {
                result.outcome = http::Outcome::Aborted;
                return result;
            }
            offset += n;
        }

        result.outcome = http::Outcome::Completed;
        return result;
    }

    std::vector<http::Request> requests() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _requests;
    }

    size_t requestCount() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _requests.size();
    }

    // Waits until a response scripted with stallAfter has reached its stall point
    bool waitForStall(std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(_mutex);
        const bool reached = _stallCondition.wait_for(lock, timeout, [this]
                                                      { return _stalls > 0; });
        if (reached)
        {
            --_stalls;
        }
        return reached;
    }

private:
    void markStalled()
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            ++_stalls;
        }
        _stallCondition.notify_all();
    }

    mutable std::mutex _mutex;
    std::condition_variable _stallCondition;
    std::deque<FakeResponse> _script;
    std::vector<http::Request> _requests;
    size_t _stalls = 0;
};

// Polls pred until it holds or the timeout runs out
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

#endif
