#include <sys/stat.h>
#include <sys/statvfs.h>
#include <cerrno>
#include <cstdio>
#include <string>

#include "util/file.hpp"

// Checks if a file exists at the given path
bool fileExists(const std::string &path)
{
    struct stat buf;
    return (stat(path.c_str(), &buf) == 0);
}

// Size of a regular file in bytes, or -1 if it does not exist
std::int64_t fileSize(const std::string &path)
{
    struct stat buf;
    if (stat(path.c_str(), &buf) != 0 || !S_ISREG(buf.st_mode))
        return -1;
    return static_cast<std::int64_t>(buf.st_size);
}

// Deletes a file; a file that is already gone counts as removed
bool removeFile(const std::string &path)
{
    if (std::remove(path.c_str()) == 0)
        return true;
    return errno == ENOENT;
}

// Creates the directory and any missing parents
bool ensureDirectory(const std::string &path)
{
    if (path.empty())
        return true;

    struct stat buf;
    if (stat(path.c_str(), &buf) == 0)
        return S_ISDIR(buf.st_mode);

    std::string parent = parentDirectory(path);
    if (parent != path && !ensureDirectory(parent))
        return false;

    return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

// Directory part of a path ("." when there is none)
std::string parentDirectory(const std::string &path)
{
    const std::size_t slashPos = path.find_last_of('/');
    if (slashPos == std::string::npos)
        return ".";
    if (slashPos == 0)
        return "/";
    return path.substr(0, slashPos);
}

std::string joinPath(const std::string &directory, const std::string &name)
{
    if (directory.empty())
        return name;
    if (directory.back() == '/')
        return directory + name;
    return directory + "/" + name;
}

// Replaces characters that are not allowed in file names
std::string sanitiseFilename(const std::string &name)
{
    std::string safe = name;
    for (char &c : safe)
    {
        switch (c)
        {
        case '\\':
        case '/':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|':
            c = '_';
            break;
        default:
            break;
        }
    }
    return safe;
}

// Bytes available to an unprivileged user on the filesystem holding the directory, or -1 if unknown
std::int64_t availableDiskSpace(const std::string &directory)
{
    struct statvfs fs;
    if (statvfs(directory.c_str(), &fs) != 0)
        return -1;
    return static_cast<std::int64_t>(fs.f_bavail) * static_cast<std::int64_t>(fs.f_frsize);
}
