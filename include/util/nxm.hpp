#ifndef NXM_HPP
#define NXM_HPP

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

static constexpr char NXM_SCHEME[] = "nxm://";

namespace nxm
{
    // nxm://<game>/mods/<mod_id>/files/<file_id>?key=..&expires=..&user_id=..
    struct Link
    {
        std::string game;
        uint32_t modId{0};
        uint64_t fileId{0};
        std::optional<std::string> key;
        std::optional<int64_t> expires;
        std::optional<uint64_t> userId;
        std::string raw;
    };

    bool looksLikeLink(const std::string &value);

    // Throws LinkParseError
    Link parse(const std::string &value);

    bool isExpired(const Link &link, std::time_t now);
}

#endif
