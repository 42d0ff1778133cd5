#include <cerrno>
#include <cstring>

#include "aux/FileWriter.hpp"

FileWriter::FileWriter(const std::string &fp, bool isAppendMode, size_t bufferSize)
    : _bufferSize(bufferSize == 0 ? 1 : bufferSize),
      _path(fp)
{
    std::ios::openmode mode = std::ios::binary | std::ios::out;
    if (isAppendMode)
    {
        mode |= std::ios::app; // Continue after the bytes already on disk
    }
    else
    {
        mode |= std::ios::trunc; // Fresh response, discard whatever was there
    }

    _out.open(fp, mode);
    if (!_out.is_open())
    {
        _error = "unable to open " + fp + ": " + std::strerror(errno);
    }
    _buffer.reserve(_bufferSize);
}

FileWriter::~FileWriter()
{
    close();
}

bool FileWriter::isOpen() const
{
    return _out.is_open();
}

// Appends to the buffer, spilling it to disk whenever it fills up
bool FileWriter::write(const char *data, size_t size)
{
    if (!_out.is_open())
    {
        if (_error.empty())
        {
            _error = "write to closed file " + _path;
        }
        return false;
    }

    while (size > 0)
    {
        const size_t room = _bufferSize - _buffer.size();
        const size_t n = size < room ? size : room;
        _buffer.insert(_buffer.end(), data, data + n);
        data += n;
        size -= n;

        if (_buffer.size() >= _bufferSize && !flush())
        {
            return false;
        }
    }
    return true;
}

bool FileWriter::flush()
{
    if (!_out.is_open())
    {
        return _buffer.empty();
    }

    if (!_buffer.empty())
    {
        _out.write(_buffer.data(), static_cast<std::streamsize>(_buffer.size()));
        _buffer.clear();
    }
    _out.flush();

    if (!_out)
    {
        _error = "unable to write " + _path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

void FileWriter::close()
{
    if (_out.is_open())
    {
        flush();
        _out.close();
    }
}
