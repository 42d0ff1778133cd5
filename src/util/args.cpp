#include <cctype>
#include <sstream>

#include "util/args.hpp"

std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs)
{
    std::istringstream iss(command);
    std::vector<std::string> parts;
    std::string word;
    std::string currentArg;
    bool isQuoted = false;

    iss >> word; // The command word itself

    char c;
    while (parts.size() < maxArgs && iss.get(c))
    {
        if (c == '"')
        {
            isQuoted = !isQuoted;
        }
        else if (std::isspace(static_cast<unsigned char>(c)) && !isQuoted)
        {
            if (!currentArg.empty())
            {
                parts.push_back(currentArg);
                currentArg.clear();
            }
        }
        else
        {
            currentArg += c;
        }
    }

    if (!currentArg.empty() && parts.size() < maxArgs)
    {
        parts.push_back(currentArg);
    }

    return parts;
}

std::optional<size_t> parseIndex(const std::string &value)
{
    if (value.empty() || value.size() > 9)
    {
        return std::nullopt;
    }

    size_t index = 0;
    for (char c : value)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            return std::nullopt;
        }
        index = index * 10 + static_cast<size_t>(c - '0');
    }

    if (index == 0)
    {
        return std::nullopt;
    }
    return index - 1;
}
