#include <algorithm>
#include <filesystem>
#include <mutex>

#include <spdlog/spdlog.h>

#include "cache/LocalFileIndex.hpp"
#include "cache/MetadataStore.hpp"
#include "core/Errors.hpp"
#include "util/file.hpp"

namespace fs = std::filesystem;

namespace
{
    // Any <name>.json except a downloaded file that happens to end in .json
    bool isRecordCandidate(const fs::directory_entry &entry)
    {
        std::error_code ec;
        if (!entry.is_regular_file(ec))
        {
            return false;
        }

        const std::string path = entry.path().string();
        return hasSuffix(path, LOCAL_META_SUFFIX) && !hasLocalRecord(path);
    }
}

size_t LocalFileIndex::hydrate(const std::string &downloadDir)
{
    std::unordered_map<uint64_t, LocalFile> loaded;

    std::error_code ec;
    fs::directory_iterator gameDirs(downloadDir, ec);
    if (ec)
    {
        // Nothing downloaded yet
        spdlog::debug("LocalFileIndex: {} not readable: {}", downloadDir, ec.message());
        return 0;
    }

    for (const auto &gameDir : gameDirs)
    {
        if (!gameDir.is_directory(ec))
        {
            continue;
        }

        fs::directory_iterator files(gameDir.path(), ec);
        if (ec)
        {
            spdlog::warn("LocalFileIndex: skipping {}: {}", gameDir.path().string(), ec.message());
            continue;
        }

        for (const auto &entry : files)
        {
            if (!isRecordCandidate(entry))
            {
                continue;
            }

            // Transfer records of unfinished downloads share the suffix
            const std::string path = entry.path().string();
            try
            {
                if (MetadataStore::recordKind(path) != RecordKind::LocalFile)
                {
                    continue;
                }

                LocalFile lf = MetadataStore::loadLocalFile(path);
                loaded[lf.fileId] = std::move(lf);
            }
            catch (const MetadataError &e)
            {
                spdlog::warn("LocalFileIndex: {}", e.what());
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    for (auto &entry : loaded)
    {
        _files[entry.first] = std::move(entry.second);
    }
    spdlog::info("LocalFileIndex: {} completed files indexed", loaded.size());
    return loaded.size();
}

void LocalFileIndex::insert(const LocalFile &localFile)
{
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _files[localFile.fileId] = localFile;
}

std::optional<LocalFile> LocalFileIndex::get(uint64_t fileId) const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _files.find(fileId);
    if (it == _files.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool LocalFileIndex::contains(uint64_t fileId) const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _files.count(fileId) != 0;
}

size_t LocalFileIndex::size() const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _files.size();
}

std::vector<LocalFile> LocalFileIndex::items() const
{
    std::vector<LocalFile> result;
    {
        std::shared_lock<std::shared_mutex> lock(_mutex);
        result.reserve(_files.size());
        for (const auto &entry : _files)
        {
            result.push_back(entry.second);
        }
    }

    std::sort(result.begin(), result.end(), [](const LocalFile &a, const LocalFile &b)
              { return a.fileName < b.fileName; });
    return result;
}
