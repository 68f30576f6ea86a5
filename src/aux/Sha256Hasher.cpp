#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

#include "aux/Sha256Hasher.hpp"

Sha256Hasher::Sha256Hasher()
    : _ctx(EVP_MD_CTX_new())
{
    if (!_ctx)
    {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

Sha256Hasher::~Sha256Hasher()
{
    EVP_MD_CTX_free(_ctx);
}

void Sha256Hasher::reset()
{
    if (EVP_DigestInit_ex(_ctx, EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void Sha256Hasher::update(const char *data, size_t size)
{
    if (size > 0)
    {
        EVP_DigestUpdate(_ctx, data, size);
    }
}

std::int64_t Sha256Hasher::updateFromFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        return -1;
    }

    std::vector<char> buffer(64 * 1024);
    std::int64_t total = 0;
    while (in)
    {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0)
        {
            update(buffer.data(), static_cast<size_t>(got));
            total += got;
        }
    }

    if (in.bad())
    {
        return -1;
    }
    return total;
}

std::string Sha256Hasher::hexDigest() const
{
    // Finalise a copy so more data can still be appended to the original context
    EVP_MD_CTX *copy = EVP_MD_CTX_new();
    if (!copy || EVP_MD_CTX_copy_ex(copy, _ctx) != 1)
    {
        EVP_MD_CTX_free(copy);
        throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_DigestFinal_ex(copy, digest, &length);
    EVP_MD_CTX_free(copy);

    static const char hexChars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
        hex.push_back(hexChars[digest[i] >> 4]);
        hex.push_back(hexChars[digest[i] & 0x0f]);
    }
    return hex;
}

bool digestsEqual(const std::string &a, const std::string &b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
                      { return std::tolower(static_cast<unsigned char>(x)) ==
                               std::tolower(static_cast<unsigned char>(y)); });
}

// Returns an empty string if the file cannot be read
std::string sha256OfFile(const std::string &path)
{
    Sha256Hasher hasher;
    if (hasher.updateFromFile(path) < 0)
    {
        return std::string();
    }
    return hasher.hexDigest();
}
