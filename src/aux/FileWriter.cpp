#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "aux/FileWriter.hpp"

FileWriter::FileWriter(const std::string &filePath, uint64_t keepBytes)
    : _filePath(filePath)
{
    _fd = ::open(filePath.c_str(), O_WRONLY | O_CREAT, 0644);
    if (_fd < 0)
    {
        _error = "cannot open " + filePath + ": " + std::strerror(errno);
        return;
    }

    // Drop anything past the resume offset, then position at the end
    if (::ftruncate(_fd, static_cast<off_t>(keepBytes)) != 0 ||
        ::lseek(_fd, 0, SEEK_END) < 0)
    {
        _error = "cannot prepare " + filePath + ": " + std::strerror(errno);
        ::close(_fd);
        _fd = -1;
    }
}

FileWriter::~FileWriter()
{
    // Close file in destructor if still open
    if (_fd >= 0)
    {
        ::close(_fd);
    }
}

bool FileWriter::isOpen() const
{
    return _fd >= 0;
}

bool FileWriter::write(const char *data, size_t size)
{
    if (_fd < 0)
    {
        return false;
    }

    size_t written = 0;
    while (written < size)
    {
        ssize_t n = ::write(_fd, data + written, size - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            _error = "write to " + _filePath + " failed: " + std::strerror(errno);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(_fd) != 0)
    {
        _error = "sync of " + _filePath + " failed: " + std::strerror(errno);
        return false;
    }

    return true;
}
