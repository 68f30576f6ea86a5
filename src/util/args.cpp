#include <sstream>
#include <fstream>
#include <vector>
#include <string>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "util/args.hpp"

std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs)
{
    std::istringstream iss(command);
    std::vector<std::string> parts;
    std::string part;
    std::string currentArg;
    bool isQuoted = false; // Allows for parsing of quoted arguments (e.g. filenames with spaces)

    iss >> part; // Skip the command token itself (e.g. "download", "pause")

    while (iss)
    {
        char c = iss.get();
        if (iss.eof()) break;

        if (c == '"')
        {
            isQuoted = !isQuoted;
        }
        else if (c == ' ' && !isQuoted)
        {
            if (!currentArg.empty())
            {
                parts.push_back(currentArg);
                currentArg.clear();
                if (parts.size() >= maxArgs) return parts;
            }
        }
        else
        {
            currentArg += c;
        }
    }

    if (!currentArg.empty() && parts.size() < maxArgs)
    {
        parts.push_back(currentArg);
    }

    return parts;
}

bool parseUnsigned(const std::string &text, std::uint64_t &out)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c)
                                     { return std::isdigit(c); }))
    {
        return false;
    }

    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE)
    {
        return false;
    }
    out = static_cast<std::uint64_t>(value);
    return true;
}

void splitUrlAndHash(const std::string &argument, std::string &url, std::string &hash)
{
    url = argument;
    hash.clear();

    auto pos = argument.find_last_of('#');
    if (pos == std::string::npos)
    {
        return;
    }

    std::string fragment = argument.substr(pos + 1);
    if (fragment.size() == 64 && std::all_of(fragment.begin(), fragment.end(), [](unsigned char c)
                                             { return std::isxdigit(c); }))
    {
        url = argument.substr(0, pos);
        hash = fragment;
    }
}

std::vector<std::string> parseUrlList(std::istream &in)
{
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line))
    {
        // Also strips the '\r' left by CRLF files
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);

        if (line.empty() || line[0] == '#')
        {
            continue;
        }
        urls.push_back(line);
    }
    return urls;
}

bool readUrlFile(const std::string &path, std::vector<std::string> &urls)
{
    std::ifstream file(path);
    if (!file)
    {
        return false;
    }

    std::vector<std::string> parsed = parseUrlList(file);
    if (file.bad())
    {
        return false;
    }
    urls.insert(urls.end(), parsed.begin(), parsed.end());
    return true;
}
