#ifndef TRANSFERERROR_HPP
#define TRANSFERERROR_HPP

#include <string>
#include <utility>
#include <stdexcept>

enum class ErrorKind
{
    NONE,
    RESOLUTION,
    AUTH,
    NOT_FOUND,
    RATE_LIMITED,
    TRANSIENT_NETWORK,
    HTTP_ERROR,
    RANGE_UNSUPPORTED,
    INTEGRITY_MISMATCH,
    INSUFFICIENT_SPACE,
    INVALID_INPUT,
    IO_ERROR,
    USER_CANCELLED
};

struct TransferError
{
    ErrorKind kind{ErrorKind::NONE};
    std::string message;
    long httpStatus{0};
    int curlCode{0};

    TransferError() = default;
    TransferError(ErrorKind k, std::string msg, long status = 0, int code = 0)
        : kind(k), message(std::move(msg)), httpStatus(status), curlCode(code)
    {
    }
};

// Whether the worker pool may schedule another attempt after this kind of failure
bool isRetryable(ErrorKind kind);

const char *errorKindName(ErrorKind kind);

// Maps an HTTP status code of a failed response onto the error taxonomy
ErrorKind classifyHttpStatus(long httpStatus);

// Holds either a value or the error that prevented producing it
template <typename T>
class Result
{
public:
    Result(T value) : _value(std::move(value)) {}

    Result(TransferError error) : _error(std::move(error))
    {
        if (_error.kind == ErrorKind::NONE)
        {
            throw std::logic_error("Result constructed from an error of kind NONE");
        }
    }

    bool ok() const { return _error.kind == ErrorKind::NONE; }
    explicit operator bool() const { return ok(); }

    const T &value() const
    {
        if (!ok())
        {
            throw std::logic_error("Result::value() called on error: " + _error.message);
        }
        return _value;
    }

    T &value()
    {
        if (!ok())
        {
            throw std::logic_error("Result::value() called on error: " + _error.message);
        }
        return _value;
    }

    const TransferError &error() const { return _error; }

private:
    T _value{};
    TransferError _error;
};

#endif
