#ifndef FILEWRITER_HPP
#define FILEWRITER_HPP

#include <string>
#include <fstream>
#include <vector>

static constexpr size_t FILE_WRITER_BUFFER_SIZE = 64 * 1024;

// Buffered writer for a .part file. Everything accepted by write() is on
// disk once flush() returns true; the destructor flushes what is left.
class FileWriter
{
public:
    FileWriter(const std::string &filePath, bool isAppendMode, size_t bufferSize = FILE_WRITER_BUFFER_SIZE);
    ~FileWriter();

    FileWriter(const FileWriter &) = delete;
    FileWriter &operator=(const FileWriter &) = delete;

    bool isOpen() const;
    bool write(const char *data, size_t size);
    bool flush();
    void close();

    const std::string &error() const { return _error; }

private:
    std::ofstream _out;
    std::vector<char> _buffer;
    size_t _bufferSize;
    std::string _path;
    std::string _error;
};

#endif
