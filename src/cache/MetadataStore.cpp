#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include "cache/MetadataStore.hpp"
#include "core/Errors.hpp"

using nlohmann::json;

void to_json(json &j, const FileInfo &fi)
{
    j = json{{"file_id", fi.fileId},
             {"name", fi.name},
             {"file_name", fi.fileName},
             {"mod_id", fi.modId},
             {"game", fi.game}};
    if (fi.version)
    {
        j["version"] = *fi.version;
    }
}

void from_json(const json &j, FileInfo &fi)
{
    j.at("file_id").get_to(fi.fileId);
    j.at("name").get_to(fi.name);
    j.at("file_name").get_to(fi.fileName);
    j.at("mod_id").get_to(fi.modId);
    j.at("game").get_to(fi.game);

    fi.version.reset();
    auto it = j.find("version");
    if (it != j.end() && !it->is_null())
    {
        fi.version = it->get<std::string>();
    }
}

void to_json(json &j, const DownloadInfo &info)
{
    json progress{{"bytes_read", info.progress.bytesRead->load()}};
    progress["size"] = info.progress.size ? json(*info.progress.size) : json(nullptr);

    j = json{{"file_info", info.fileInfo},
             {"url", info.url},
             {"state", toString(info.state)},
             {"progress", progress}};
}

void from_json(const json &j, DownloadInfo &info)
{
    j.at("file_info").get_to(info.fileInfo);
    j.at("url").get_to(info.url);

    const auto stateName = j.at("state").get<std::string>();
    auto state = downloadStateFromString(stateName);
    if (!state)
    {
        throw MetadataError("unknown download state \"" + stateName + "\"");
    }
    info.state = *state;

    const auto &progress = j.at("progress");
    std::optional<uint64_t> size;
    auto it = progress.find("size");
    if (it != progress.end() && !it->is_null())
    {
        size = it->get<uint64_t>();
    }
    info.progress = DownloadProgress(progress.at("bytes_read").get<uint64_t>(), size);
}

void to_json(json &j, const LocalFile &lf)
{
    j = json{{"file_id", lf.fileId},
             {"game", lf.game},
             {"mod_id", lf.modId},
             {"file_name", lf.fileName},
             {"path", lf.path}};
    if (lf.version)
    {
        j["version"] = *lf.version;
    }
}

void from_json(const json &j, LocalFile &lf)
{
    j.at("file_id").get_to(lf.fileId);
    j.at("game").get_to(lf.game);
    j.at("mod_id").get_to(lf.modId);
    j.at("file_name").get_to(lf.fileName);
    j.at("path").get_to(lf.path);

    lf.version.reset();
    auto it = j.find("version");
    if (it != j.end() && !it->is_null())
    {
        lf.version = it->get<std::string>();
    }
}

void MetadataStore::saveDownloadInfo(const DownloadInfo &info, const std::string &path)
{
    writeJson(json(info), path);
}

DownloadInfo MetadataStore::loadDownloadInfo(const std::string &path)
{
    try
    {
        return readJson(path).get<DownloadInfo>();
    }
    catch (const json::exception &e)
    {
        throw MetadataError("malformed download record " + path + ": " + e.what());
    }
}

void MetadataStore::saveLocalFile(const LocalFile &localFile, const std::string &path)
{
    writeJson(json(localFile), path);
}

LocalFile MetadataStore::loadLocalFile(const std::string &path)
{
    try
    {
        return readJson(path).get<LocalFile>();
    }
    catch (const json::exception &e)
    {
        throw MetadataError("malformed file record " + path + ": " + e.what());
    }
}

RecordKind MetadataStore::recordKind(const std::string &path)
{
    const json j = readJson(path);
    if (!j.is_object())
    {
        return RecordKind::Other;
    }

    if (j.contains("file_info") && j.contains("state"))
    {
        return RecordKind::Transfer;
    }
    if (j.contains("file_id") && j.contains("path"))
    {
        return RecordKind::LocalFile;
    }
    return RecordKind::Other;
}

// Removes a record; a record that is already gone is not an error
void MetadataStore::remove(const std::string &path)
{
    if (std::remove(path.c_str()) != 0 && errno != ENOENT)
    {
        throw MetadataError("unable to remove " + path + ": " + std::strerror(errno));
    }
}

// Writes to <path>.tmp and renames it over the target, so a crash never
// leaves a truncated record behind
void MetadataStore::writeJson(const json &j, const std::string &path)
{
    // Serialise first so a field that can't be encoded leaves no file behind
    std::string text;
    try
    {
        text = j.dump(2);
    }
    catch (const json::exception &e)
    {
        throw MetadataError("unable to encode " + path + ": " + e.what());
    }

    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
        if (!out.is_open())
        {
            throw MetadataError("unable to open " + tmpPath + ": " + std::strerror(errno));
        }

        out << text;
        out.flush();
        if (!out)
        {
            throw MetadataError("unable to write " + tmpPath);
        }
    }

    if (std::rename(tmpPath.c_str(), path.c_str()) != 0)
    {
        const int err = errno;
        std::remove(tmpPath.c_str());
        throw MetadataError("unable to replace " + path + ": " + std::strerror(err));
    }
}

json MetadataStore::readJson(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw MetadataError("unable to open " + path + ": " + std::strerror(errno));
    }

    try
    {
        return json::parse(in);
    }
    catch (const json::parse_error &e)
    {
        throw MetadataError("unable to parse " + path + ": " + e.what());
    }
}
