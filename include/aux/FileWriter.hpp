#ifndef FILEWRITER_HPP
#define FILEWRITER_HPP

#include <string>
#include <cstdio>
#include <cstdint>

class FileWriter
{
public:
    FileWriter(const std::string& filePath, bool isAppendMode);
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    bool isOpen() const;
    bool write(const char* data, size_t size);
    bool flush();
    void close();

    std::uint64_t bytesWritten() const { return _bytesWritten; }
    int lastErrno() const { return _lastErrno; }

private:
    std::FILE* _out{nullptr};
    std::uint64_t _bytesWritten{0};
    int _lastErrno{0};
};

#endif
