#include <curl/curl.h>
#include <cstdlib>
#include <mutex>
#include <string>

#include "core/Errors.hpp"
#include "util/http.hpp"

namespace http
{
    namespace
    {
        struct TransferContext
        {
            CURL *curl = nullptr;
            ResponseHandler *handler = nullptr;
            bool responseDelivered = false;
            bool aborted = false;
        };

        // Hands status and length to the handler once, before the first body byte
        bool deliverResponse(TransferContext &ctx)
        {
            ctx.responseDelivered = true;

            long status = 0;
            curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &status);

            curl_off_t length = -1;
            curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

            std::optional<uint64_t> contentLength;
            if (length >= 0)
            {
                contentLength = static_cast<uint64_t>(length);
            }

            if (!ctx.handler->onResponse(status, contentLength))
            {
                ctx.aborted = true;
                return false;
            }
            return true;
        }

        // Streams each body chunk to the handler; returning a short count aborts curl
        size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            auto *ctx = static_cast<TransferContext *>(userdata);
            const size_t total = size * nmemb;

            if (!ctx->responseDelivered && !deliverResponse(*ctx))
            {
                return 0;
            }

            if (!ctx->handler->onData(ptr, total))
            {
                ctx->aborted = true;
                return 0;
            }
            return total;
        }

        int progressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            auto *ctx = static_cast<TransferContext *>(clientp);
            if (ctx->handler->isCancelled())
            {
                ctx->aborted = true;
                return 1;
            }
            return 0;
        }

        class TextCollector : public ResponseHandler
        {
        public:
            bool onResponse(long status, std::optional<uint64_t>) override
            {
                _status = status;
                return true;
            }

            bool onData(const char *data, size_t size) override
            {
                _body.append(data, size);
                return _body.size() <= MAX_TEXT_BODY;
            }

            long status() const { return _status; }
            std::string &body() { return _body; }

        private:
            static constexpr size_t MAX_TEXT_BODY = 4 * 1024 * 1024;
            long _status = 0;
            std::string _body;
        };
    }

    void ensureCurlInitialised()
    {
        static std::once_flag flag;
        std::call_once(flag, []
                       {
                           if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                           {
                               throw NetworkError("Failed to initialise libcurl");
                           }
                           std::atexit(curl_global_cleanup);
                       });
    }

    CurlClient::CurlClient(long connectTimeoutSecs)
        : _connectTimeoutSecs(connectTimeoutSecs)
    {
        ensureCurlInitialised();
    }

    Result CurlClient::perform(const Request &request, ResponseHandler &handler)
    {
        Result result;

        CURL *curl = curl_easy_init();
        if (!curl)
        {
            result.error = curl_easy_strerror(CURLE_FAILED_INIT);
            return result;
        }

        TransferContext ctx;
        ctx.curl = curl;
        ctx.handler = &handler;

        struct curl_slist *headers = nullptr;
        for (const auto &header : request.headers)
        {
            headers = curl_slist_append(headers, header.c_str());
        }

        std::string range;
        if (request.rangeStart)
        {
            range = std::to_string(*request.rangeStart) + "-";
        }

        char errorBuffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, MDM_USER_AGENT);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L); // CDN links redirect
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);       // Called from worker threads
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, _connectTimeoutSecs);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L); // Give up on a connection that
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L); // stalls for a minute
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
        if (headers)
        {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        }
        if (!range.empty())
        {
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status);

        if (res == CURLE_OK)
        {
            // Bodiless responses (e.g. a bare 410) never reach writeCallback
            if (!ctx.responseDelivered)
            {
                deliverResponse(ctx);
            }
            result.outcome = ctx.aborted ? Outcome::Aborted : Outcome::Completed;
        }
        else if (ctx.aborted)
        {
            result.outcome = Outcome::Aborted;
        }
        else
        {
            result.outcome = Outcome::Failed;
            result.error = errorBuffer[0] != '\0' ? std::string(errorBuffer) : curl_easy_strerror(res);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        return result;
    }

    TextResponse fetchText(Client &client, const Request &request)
    {
        TextCollector collector;
        Result result = client.perform(request, collector);

        if (result.outcome == Outcome::Failed)
        {
            throw NetworkError("Unable to contact " + request.url + ": " + result.error);
        }
        if (result.outcome == Outcome::Aborted)
        {
            throw ProtocolError("Response from " + request.url + " was too large");
        }

        TextResponse response;
        response.status = collector.status() != 0 ? collector.status() : result.status;
        response.body = std::move(collector.body());
        return response;
    }
}
