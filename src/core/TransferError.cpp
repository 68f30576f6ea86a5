#include "core/TransferError.hpp"

bool isRetryable(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::RATE_LIMITED:
    case ErrorKind::TRANSIENT_NETWORK:
        return true;
    default:
        return false;
    }
}

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NONE:
        return "none";
    case ErrorKind::RESOLUTION:
        return "resolution";
    case ErrorKind::AUTH:
        return "auth";
    case ErrorKind::NOT_FOUND:
        return "not-found";
    case ErrorKind::RATE_LIMITED:
        return "rate-limited";
    case ErrorKind::TRANSIENT_NETWORK:
        return "network";
    case ErrorKind::HTTP_ERROR:
        return "http";
    case ErrorKind::RANGE_UNSUPPORTED:
        return "range-unsupported";
    case ErrorKind::INTEGRITY_MISMATCH:
        return "integrity";
    case ErrorKind::INSUFFICIENT_SPACE:
        return "disk-space";
    case ErrorKind::INVALID_INPUT:
        return "invalid-input";
    case ErrorKind::IO_ERROR:
        return "io";
    case ErrorKind::USER_CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

ErrorKind classifyHttpStatus(long httpStatus)
{
    if (httpStatus == 401 || httpStatus == 403)
    {
        return ErrorKind::AUTH;
    }
    if (httpStatus == 404 || httpStatus == 410)
    {
        return ErrorKind::NOT_FOUND;
    }
    if (httpStatus == 416)
    {
        return ErrorKind::RANGE_UNSUPPORTED;
    }
    if (httpStatus == 429)
    {
        return ErrorKind::RATE_LIMITED;
    }
    if (httpStatus >= 500)
    {
        return ErrorKind::TRANSIENT_NETWORK;
    }
    // Remaining 4xx codes are client errors that a retry will not fix
    return ErrorKind::HTTP_ERROR;
}
