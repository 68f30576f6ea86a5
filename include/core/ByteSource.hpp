#ifndef BYTESOURCE_HPP
#define BYTESOURCE_HPP

#include <string>
#include <vector>
#include <cstdint>

#include "core/TransferError.hpp"

static constexpr size_t QDM_DEFAULT_CHUNK_SIZE = 32 * 1024;

struct FetchRequest
{
    std::string url;
    std::uint64_t offset{0}; // 0 requests the whole body, otherwise bytes=<offset>-
    std::vector<std::string> headers;
    size_t bufferSize{QDM_DEFAULT_CHUNK_SIZE};
    long connectTimeoutSeconds{30};
    long lowSpeedTimeSeconds{60};
};

// Receives the response of a fetch; returning false from either callback aborts the fetch
class FetchHandler
{
public:
    virtual ~FetchHandler() = default;

    // Called once before the first body byte; contentLength is the body length or -1 if unknown
    virtual bool onResponse(long httpStatus, std::int64_t contentLength) = 0;
    virtual bool onData(const char *data, size_t size) = 0;
};

struct FetchResult
{
    long httpStatus{0};
    ErrorKind error{ErrorKind::NONE}; // transport or HTTP failure, already classified
    std::string errorText;
    int curlCode{0};
    bool aborted{false};              // the handler stopped the fetch
    bool responseSeen{false};
};

// An HTTP(S) GET that honours a start offset and streams the body
class ByteSource
{
public:
    virtual ~ByteSource() = default;

    virtual FetchResult fetch(const FetchRequest &request, FetchHandler &handler) = 0;
};

#endif
