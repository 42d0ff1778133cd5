#ifndef LOCALFILEINDEX_HPP
#define LOCALFILEINDEX_HPP

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/DownloadInfo.hpp"

// Completed files known on disk, keyed by file id.
// Readers share the lock; insert takes it exclusively for the single insert.
class LocalFileIndex
{
public:
    // Scans <downloadDir>/<game>/ for completed-file records and returns how
    // many were loaded. Unreadable records are skipped.
    size_t hydrate(const std::string &downloadDir);

    void insert(const LocalFile &localFile);
    std::optional<LocalFile> get(uint64_t fileId) const;
    bool contains(uint64_t fileId) const;
    size_t size() const;

    // All records, sorted by file name
    std::vector<LocalFile> items() const;

private:
    std::unordered_map<uint64_t, LocalFile> _files;
    mutable std::shared_mutex _mutex;
};

#endif
