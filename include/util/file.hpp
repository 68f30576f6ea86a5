#ifndef FILE_HPP
#define FILE_HPP

#include <string>
#include <cstdint>

bool fileExists(const std::string &path);
std::int64_t fileSize(const std::string &path);
bool removeFile(const std::string &path);
bool ensureDirectory(const std::string &path);
std::string parentDirectory(const std::string &path);
std::string joinPath(const std::string &directory, const std::string &name);
std::string sanitiseFilename(const std::string &name);
std::int64_t availableDiskSpace(const std::string &directory);

#endif
