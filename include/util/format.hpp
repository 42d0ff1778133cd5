#ifndef FORMAT_HPP
#define FORMAT_HPP

#include <cstdint>
#include <optional>
#include <string>

std::string formatBytes(uint64_t bytes);

// "<read> / <size>" or "<read> / ?" when the size isn't known yet
std::string formatProgress(uint64_t bytesRead, std::optional<uint64_t> size);

// 0-100, or nothing without a known size
std::optional<double> progressPercent(uint64_t bytesRead, std::optional<uint64_t> size);

#endif
