#ifndef ARGS_HPP
#define ARGS_HPP

#include <optional>
#include <string>
#include <vector>

// Arguments following the command word; double quotes group words
std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs);

// 1-based index as typed by the user -> 0-based index
std::optional<size_t> parseIndex(const std::string &value);

#endif
