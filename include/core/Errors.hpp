#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class of every error raised across an operation boundary
class DownloadError : public std::runtime_error
{
public:
    explicit DownloadError(const std::string &message) : std::runtime_error(message) {}
};

// Malformed nxm:// link, rejected before any task exists
class LinkParseError : public DownloadError
{
public:
    explicit LinkParseError(const std::string &message) : DownloadError(message) {}
};

// A live transfer for the same file id is already registered
class DuplicateError : public DownloadError
{
public:
    explicit DuplicateError(const std::string &message) : DownloadError(message) {}
};

class NetworkError : public DownloadError
{
public:
    explicit NetworkError(const std::string &message) : DownloadError(message) {}
};

// The origin answered with a status or body we don't understand
class ProtocolError : public DownloadError
{
public:
    explicit ProtocolError(const std::string &message) : DownloadError(message) {}
};

class ExpiredError : public DownloadError
{
public:
    explicit ExpiredError(const std::string &message) : DownloadError(message) {}
};

class FilesystemError : public DownloadError
{
public:
    explicit FilesystemError(const std::string &message) : DownloadError(message) {}
};

// Reading or writing a sidecar record failed
class MetadataError : public DownloadError
{
public:
    explicit MetadataError(const std::string &message) : DownloadError(message) {}
};

class ConfigError : public DownloadError
{
public:
    explicit ConfigError(const std::string &message) : DownloadError(message) {}
};

// Claiming, binding or talking to the instance socket failed
class ChannelError : public DownloadError
{
public:
    explicit ChannelError(const std::string &message) : DownloadError(message) {}
};

#endif
