#ifndef LINKRESOLVER_HPP
#define LINKRESOLVER_HPP

#include <memory>
#include <optional>
#include <string>

#include "core/DownloadInfo.hpp"
#include "util/http.hpp"
#include "util/nxm.hpp"

static constexpr char NEXUS_API_BASE[] = "https://api.nexusmods.com/v1";

struct ResolvedLink
{
    FileInfo fileInfo;
    std::string url; // Direct CDN URL of the file
};

// Turns a user-facing link into file metadata and a downloadable URL
class LinkResolver
{
public:
    virtual ~LinkResolver() = default;

    // Throws LinkParseError, ExpiredError, NetworkError or ProtocolError
    virtual ResolvedLink resolve(const std::string &link) = 0;
};

// Resolves nxm:// links through the Nexus Mods API
class NexusLinkResolver : public LinkResolver
{
public:
    NexusLinkResolver(std::shared_ptr<http::Client> client,
                      std::optional<std::string> apiKey,
                      std::string apiBase = NEXUS_API_BASE);

    ResolvedLink resolve(const std::string &link) override;

private:
    FileInfo fetchFileInfo(const nxm::Link &link);
    std::string fetchDownloadUrl(const nxm::Link &link);
    // GET against the API; body of a 200 response
    std::string get(const std::string &url, const std::string &what);

    std::string filesUrl(const nxm::Link &link) const;

    std::shared_ptr<http::Client> _client;
    std::optional<std::string> _apiKey;
    std::string _apiBase;
};

#endif
