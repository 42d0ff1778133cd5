#ifndef FILE_HPP
#define FILE_HPP

#include <cstdint>
#include <optional>
#include <string>

static constexpr char PART_SUFFIX[] = ".part";
static constexpr char PART_META_SUFFIX[] = ".part.json";
static constexpr char LOCAL_META_SUFFIX[] = ".json";

bool fileExists(const std::string &path);
std::optional<uint64_t> fileSize(const std::string &path);

bool hasSuffix(const std::string &value, const std::string &suffix);

std::string partPath(const std::string &finalPath);
std::string partMetaPath(const std::string &finalPath);
std::string localMetaPath(const std::string &finalPath);

// True for a downloaded file that carries its own <name>.json record
bool hasLocalRecord(const std::string &path);

#endif
