#include "ui/Screen.hpp"

bool CommandEntry::matches(const std::string &input) const
{
    for (const auto &alias : aliases)
    {
        if (input == alias)
        {
            return true;
        }
        if (matchType == MatchType::PREFIX && input.compare(0, alias.size() + 1, alias + " ") == 0)
        {
            return true;
        }
    }
    return false;
}

bool Screen::dispatch(const std::string &input) const
{
    for (const auto &entry : commands())
    {
        if (entry.matches(input))
        {
            entry.action(input);
            return true;
        }
    }
    return false;
}
