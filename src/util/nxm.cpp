#include <algorithm>
#include <cctype>
#include <limits>
#include <vector>

#include "core/Errors.hpp"
#include "util/nxm.hpp"

namespace nxm
{
    namespace
    {
        std::vector<std::string> split(const std::string &value, char delimiter)
        {
            std::vector<std::string> parts;
            size_t start = 0;
            while (true)
            {
                const size_t pos = value.find(delimiter, start);
                parts.push_back(value.substr(start, pos - start));
                if (pos == std::string::npos)
                {
                    break;
                }
                start = pos + 1;
            }
            return parts;
        }

        // Strict unsigned decimal; no sign, no whitespace, no overflow
        bool parseUnsigned(const std::string &digits, uint64_t max, uint64_t &out)
        {
            if (digits.empty() || digits.size() > 20)
            {
                return false;
            }

            uint64_t value = 0;
            for (char c : digits)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                {
                    return false;
                }
                const uint64_t digit = static_cast<uint64_t>(c - '0');
                if (value > (max - digit) / 10)
                {
                    return false;
                }
                value = value * 10 + digit;
            }
            out = value;
            return true;
        }

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        void parseQuery(const std::string &query, Link &link)
        {
            for (const auto &pair : split(query, '&'))
            {
                if (pair.empty())
                {
                    continue;
                }

                const size_t eq = pair.find('=');
                const std::string name = pair.substr(0, eq);
                const std::string value = eq == std::string::npos ? std::string() : pair.substr(eq + 1);

                uint64_t number = 0;
                if (name == "key")
                {
                    if (value.empty())
                    {
                        throw LinkParseError("empty key in " + link.raw);
                    }
                    link.key = value;
                }
                else if (name == "expires")
                {
                    if (!parseUnsigned(value, static_cast<uint64_t>(std::numeric_limits<int64_t>::max()), number))
                    {
                        throw LinkParseError("invalid expires value in " + link.raw);
                    }
                    link.expires = static_cast<int64_t>(number);
                }
                else if (name == "user_id")
                {
                    if (!parseUnsigned(value, std::numeric_limits<uint64_t>::max(), number))
                    {
                        throw LinkParseError("invalid user_id in " + link.raw);
                    }
                    link.userId = number;
                }
                // Anything else is passed through by the site and irrelevant here
            }
        }
    }

    bool looksLikeLink(const std::string &value)
    {
        const size_t schemeLength = sizeof(NXM_SCHEME) - 1;
        return value.size() > schemeLength && lowercase(value.substr(0, schemeLength)) == NXM_SCHEME;
    }

    Link parse(const std::string &value)
    {
        if (!looksLikeLink(value))
        {
            throw LinkParseError("not an nxm:// link: " + value);
        }

        Link link;
        link.raw = value;

        std::string rest = value.substr(sizeof(NXM_SCHEME) - 1);
        std::string query;
        const size_t qpos = rest.find('?');
        if (qpos != std::string::npos)
        {
            query = rest.substr(qpos + 1);
            rest = rest.substr(0, qpos);
        }

        const auto segments = split(rest, '/');
        if (segments.size() != 5 || segments[1] != "mods" || segments[3] != "files")
        {
            throw LinkParseError("expected nxm://<game>/mods/<id>/files/<id>, got " + value);
        }

        if (segments[0].empty())
        {
            throw LinkParseError("missing game in " + value);
        }
        link.game = lowercase(segments[0]);

        uint64_t number = 0;
        if (!parseUnsigned(segments[2], std::numeric_limits<uint32_t>::max(), number))
        {
            throw LinkParseError("invalid mod id in " + value);
        }
        link.modId = static_cast<uint32_t>(number);

        if (!parseUnsigned(segments[4], std::numeric_limits<uint64_t>::max(), number))
        {
            throw LinkParseError("invalid file id in " + value);
        }
        link.fileId = number;

        parseQuery(query, link);

        if (link.key.has_value() != link.expires.has_value())
        {
            throw LinkParseError("key and expires must be given together in " + value);
        }

        return link;
    }

    bool isExpired(const Link &link, std::time_t now)
    {
        return link.expires && *link.expires <= static_cast<int64_t>(now);
    }
}
