#include <cerrno>

#include "aux/FileWriter.hpp"

FileWriter::FileWriter(const std::string& fp, bool isAppendMode)
{
    // Binary mode; append keeps the partial bytes of a resumed transfer, otherwise truncate
    _out = std::fopen(fp.c_str(), isAppendMode ? "ab" : "wb");
    if (!_out) {
        _lastErrno = errno;
    }
}

FileWriter::~FileWriter()
{
    close();
}

bool FileWriter::isOpen() const
{
    return _out != nullptr;
}

bool FileWriter::write(const char* data, size_t size)
{
    if (!_out) {
        return false;
    }

    size_t written = std::fwrite(data, 1, size, _out);
    _bytesWritten += written;
    if (written != size) {
        _lastErrno = errno;
        return false;
    }
    return true;
}

bool FileWriter::flush()
{
    if (!_out) {
        return false;
    }
    if (std::fflush(_out) != 0) {
        _lastErrno = errno;
        return false;
    }
    return true;
}

void FileWriter::close()
{
    // Close file if still open
    if (_out) {
        if (std::fclose(_out) != 0 && _lastErrno == 0) {
            _lastErrno = errno;
        }
        _out = nullptr;
    }
}
