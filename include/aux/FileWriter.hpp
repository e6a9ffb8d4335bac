#ifndef FILEWRITER_HPP
#define FILEWRITER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Appends to a destination file; every write is followed by a durable flush
class FileWriter
{
public:
    // Opens for appending after truncating the file to keepBytes
    FileWriter(const std::string &filePath, uint64_t keepBytes);
    ~FileWriter();

    FileWriter(const FileWriter &) = delete;
    FileWriter &operator=(const FileWriter &) = delete;

    bool isOpen() const;
    const std::string &getError() const { return _error; }

    // Writes the whole buffer and syncs it to storage; false on failure
    bool write(const char *data, size_t size);

private:
    int _fd{-1};
    std::string _filePath;
    std::string _error;
};

#endif
