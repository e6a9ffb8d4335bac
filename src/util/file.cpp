#include <sys/stat.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <unistd.h>

#include "util/file.hpp"

// Checks if a file exists at the given path
bool fileExists(const std::string &path)
{
    struct stat buf;
    return (stat(path.c_str(), &buf) == 0);
}

uint64_t fileSize(const std::string &path)
{
    struct stat buf{};
    if (stat(path.c_str(), &buf) != 0 || !S_ISREG(buf.st_mode))
    {
        return 0;
    }
    return static_cast<uint64_t>(buf.st_size);
}

bool ensureParentDirectory(const std::string &path)
{
    const std::size_t slashPos = path.find_last_of('/');
    if (slashPos == std::string::npos || slashPos == 0)
        return true;

    const std::string parent = path.substr(0, slashPos);

    // Walk the parent path and create each component in turn
    std::size_t pos = 0;
    while (pos != std::string::npos)
    {
        pos = parent.find('/', pos + 1);
        const std::string partial = parent.substr(0, pos);
        if (partial.empty())
            continue;

        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST)
            return false;
    }

    struct stat buf{};
    return stat(parent.c_str(), &buf) == 0 && S_ISDIR(buf.st_mode);
}

bool replaceFileContents(const std::string &path, const std::string &contents, std::string &error)
{
    const std::string tempPath = path + ".tmp";

    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0)
    {
        error = "cannot create " + tempPath + ": " + std::strerror(errno);
        return false;
    }

    size_t written = 0;
    while (written < contents.size())
    {
        ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            error = "cannot write " + tempPath + ": " + std::strerror(errno);
            ::close(fd);
            std::remove(tempPath.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0)
    {
        error = "cannot sync " + tempPath + ": " + std::strerror(errno);
        ::close(fd);
        std::remove(tempPath.c_str());
        return false;
    }
    ::close(fd);

    // rename() replaces the old file atomically, so readers see old or new, never half
    if (std::rename(tempPath.c_str(), path.c_str()) != 0)
    {
        error = "cannot replace " + path + ": " + std::strerror(errno);
        std::remove(tempPath.c_str());
        return false;
    }

    return true;
}
