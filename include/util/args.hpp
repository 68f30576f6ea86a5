#ifndef ARGS_HPP
#define ARGS_HPP

#include <string>
#include <vector>
#include <istream>
#include <cstdint>

std::vector<std::string> extractArguments(const std::string &command, size_t maxArgs);

// Parses a positive decimal id or count; returns false on anything else
bool parseUnsigned(const std::string &text, std::uint64_t &out);

// Splits "<url>#<sha256>" into its parts; the hash is empty when absent or not 64 hex digits
void splitUrlAndHash(const std::string &argument, std::string &url, std::string &hash);

// One entry per line, trimmed; blank lines and lines starting with '#' are skipped
std::vector<std::string> parseUrlList(std::istream &in);

// Appends the entries of a URL list file; returns false if it cannot be read
bool readUrlFile(const std::string &path, std::vector<std::string> &urls);

#endif
