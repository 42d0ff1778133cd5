#include <ctime>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/LinkResolver.hpp"

namespace
{
    nlohmann::json parseBody(const std::string &body, const std::string &what)
    {
        try
        {
            return nlohmann::json::parse(body);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ProtocolError("Malformed " + what + " response: " + e.what());
        }
    }
}

NexusLinkResolver::NexusLinkResolver(std::shared_ptr<http::Client> client,
                                     std::optional<std::string> apiKey,
                                     std::string apiBase)
    : _client(std::move(client)),
      _apiKey(std::move(apiKey)),
      _apiBase(std::move(apiBase))
{
}

ResolvedLink NexusLinkResolver::resolve(const std::string &value)
{
    const nxm::Link link = nxm::parse(value);

    if (nxm::isExpired(link, std::time(nullptr)))
    {
        throw ExpiredError("Download link for file " + std::to_string(link.fileId) + " expired, please download again.");
    }

    if (!_apiKey)
    {
        throw ConfigError("No API key configured, set apikey in the config file or " + std::string(MDM_API_KEY_ENV) + ".");
    }

    ResolvedLink resolved;
    resolved.fileInfo = fetchFileInfo(link);
    resolved.url = fetchDownloadUrl(link);

    spdlog::debug("Resolved {} to {}", link.raw, resolved.url);
    return resolved;
}

std::string NexusLinkResolver::filesUrl(const nxm::Link &link) const
{
    return _apiBase + "/games/" + link.game + "/mods/" + std::to_string(link.modId) +
           "/files/" + std::to_string(link.fileId);
}

FileInfo NexusLinkResolver::fetchFileInfo(const nxm::Link &link)
{
    const nlohmann::json j = parseBody(get(filesUrl(link) + ".json", "file details"), "file details");

    FileInfo info;
    info.fileId = link.fileId;
    info.modId = link.modId;
    info.game = link.game;

    try
    {
        info.fileName = j.at("file_name").get<std::string>();
        info.name = j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : info.fileName;
        if (j.contains("version") && j["version"].is_string())
        {
            info.version = j["version"].get<std::string>();
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ProtocolError("Unexpected file details response: " + std::string(e.what()));
    }

    return info;
}

std::string NexusLinkResolver::fetchDownloadUrl(const nxm::Link &link)
{
    std::string url = filesUrl(link) + "/download_link.json";
    if (link.key && link.expires)
    {
        url += "?key=" + *link.key + "&expires=" + std::to_string(*link.expires);
    }

    const nlohmann::json j = parseBody(get(url, "download link"), "download link");

    if (!j.is_array() || j.empty() || !j[0].is_object() || !j[0].contains("URI") || !j[0]["URI"].is_string())
    {
        throw ProtocolError("No download location offered for file " + std::to_string(link.fileId) + ".");
    }

    return j[0]["URI"].get<std::string>();
}

std::string NexusLinkResolver::get(const std::string &url, const std::string &what)
{
    http::Request request;
    request.url = url;
    request.headers.push_back("apikey: " + _apiKey.value_or(""));
    request.headers.push_back("Accept: application/json");

    const http::TextResponse response = http::fetchText(*_client, request);

    if (response.status == 410)
    {
        throw ExpiredError("Download link expired, please download again.");
    }
    if (response.status != 200)
    {
        throw ProtocolError("Request for " + what + " got unexpected HTTP response: " + std::to_string(response.status) + ".");
    }

    return response.body;
}
