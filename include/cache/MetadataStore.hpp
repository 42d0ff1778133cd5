#ifndef METADATASTORE_HPP
#define METADATASTORE_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "core/DownloadInfo.hpp"

void to_json(nlohmann::json &j, const FileInfo &fi);
void from_json(const nlohmann::json &j, FileInfo &fi);
void to_json(nlohmann::json &j, const DownloadInfo &info);
void from_json(const nlohmann::json &j, DownloadInfo &info);
void to_json(nlohmann::json &j, const LocalFile &lf);
void from_json(const nlohmann::json &j, LocalFile &lf);

// What a sidecar holds; file names alone can't tell a completed
// "x.part" record apart from the transfer record of "x"
enum class RecordKind
{
    Transfer,  // DownloadInfo of an unfinished download
    LocalFile, // record of a completed file
    Other      // valid JSON that is neither
};

// Stateless JSON persistence of sidecar records, addressed by path.
// Callers serialize access to a given path; every method throws
// MetadataError on failure.
class MetadataStore
{
public:
    static void saveDownloadInfo(const DownloadInfo &info, const std::string &path);
    static DownloadInfo loadDownloadInfo(const std::string &path);

    static void saveLocalFile(const LocalFile &localFile, const std::string &path);
    static LocalFile loadLocalFile(const std::string &path);

    // Throws MetadataError when the file can't be read or parsed
    static RecordKind recordKind(const std::string &path);

    static void remove(const std::string &path);

private:
    static void writeJson(const nlohmann::json &j, const std::string &path);
    static nlohmann::json readJson(const std::string &path);
};

#endif
