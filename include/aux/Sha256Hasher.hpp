#ifndef SHA256HASHER_HPP
#define SHA256HASHER_HPP

#include <string>
#include <cstdint>

typedef struct evp_md_ctx_st EVP_MD_CTX;

// Incremental SHA-256 over OpenSSL's EVP interface
class Sha256Hasher
{
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher &) = delete;
    Sha256Hasher &operator=(const Sha256Hasher &) = delete;

    void reset();
    void update(const char *data, size_t size);

    // Feeds the file's bytes into the running digest; returns the number of bytes hashed or -1 on a read error
    std::int64_t updateFromFile(const std::string &path);

    // Lowercase hex digest of everything fed so far; the hasher stays usable
    std::string hexDigest() const;

private:
    EVP_MD_CTX *_ctx;
};

// Case-insensitive comparison of two hex digests
bool digestsEqual(const std::string &a, const std::string &b);

std::string sha256OfFile(const std::string &path);

#endif
