#ifndef HTTP_HPP
#define HTTP_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

static constexpr char MDM_USER_AGENT[] = "mdm/0.4";

namespace http
{
    struct Request
    {
        std::string url;
        std::vector<std::string> headers;  // "Name: value"
        std::optional<uint64_t> rangeStart; // Sent as "Range: bytes=<n>-"
    };

    enum class Outcome
    {
        Completed, // Body fully received
        Aborted,   // The handler asked to stop
        Failed     // Transport error, see Result::error
    };

    struct Result
    {
        Outcome outcome{Outcome::Failed};
        long status{0};
        std::string error;
    };

    // Receives a streamed response. Returning false from onResponse or
    // onData aborts the transfer at that point.
    class ResponseHandler
    {
    public:
        virtual ~ResponseHandler() = default;

        virtual bool onResponse(long status, std::optional<uint64_t> contentLength) = 0;
        virtual bool onData(const char *data, size_t size) = 0;

        // Polled between chunks so a stalled connection can still be abandoned
        virtual bool isCancelled() const { return false; }
    };

    class Client
    {
    public:
        virtual ~Client() = default;

        virtual Result perform(const Request &request, ResponseHandler &handler) = 0;
    };

    class CurlClient : public Client
    {
    public:
        explicit CurlClient(long connectTimeoutSecs = 30);

        Result perform(const Request &request, ResponseHandler &handler) override;

    private:
        long _connectTimeoutSecs;
    };

    struct TextResponse
    {
        long status{0};
        std::string body;
    };

    // Collects a whole (small) response body. Throws NetworkError when the
    // origin can't be reached.
    TextResponse fetchText(Client &client, const Request &request);

    void ensureCurlInitialised();
}

#endif
