#ifndef FILE_HPP
#define FILE_HPP

#include <cstdint>
#include <string>

bool fileExists(const std::string &path);

// Size in bytes of a regular file, or 0 if it does not exist
uint64_t fileSize(const std::string &path);

// Creates every missing directory above path; false if one cannot be created
bool ensureParentDirectory(const std::string &path);

// Writes contents to a temporary sibling, syncs it and renames it over path
bool replaceFileContents(const std::string &path, const std::string &contents, std::string &error);

#endif
