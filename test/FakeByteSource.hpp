#ifndef FAKEBYTESOURCE_HPP
#define FAKEBYTESOURCE_HPP

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <limits>
#include <functional>

#include "core/ByteSource.hpp"

// One scripted reply; replies are consumed in order, then the default reply repeats
struct FakeResponse
{
    long status{0};                                            // 0: 200, or 206 for an honoured range
    ErrorKind error{ErrorKind::NONE};                          // transport failure before any byte
    bool honourRange{true};                                    // false: answer ranged requests with the whole body
    size_t failAfter{std::numeric_limits<size_t>::max()};      // drop the connection after this many body bytes
    std::int64_t contentLength{-1};                            // announced body length, -1 for the true one
};

// In-memory stand-in for an HTTP server, recording every requested offset
class FakeByteSource : public ByteSource
{
public:
    explicit FakeByteSource(std::string content, size_t chunkSize = 1024)
        : _content(std::move(content)), _chunkSize(chunkSize == 0 ? 1 : chunkSize)
    {
    }

    void script(FakeResponse response)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _script.push_back(response);
    }

    // Invoked after each delivered chunk with the number of body bytes delivered by this fetch
    void setChunkHook(std::function<void(size_t)> hook)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _chunkHook = std::move(hook);
    }

    std::vector<std::uint64_t> offsets() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _offsets;
    }

    size_t fetchCount() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _offsets.size();
    }

    const std::string &content() const { return _content; }

    FetchResult fetch(const FetchRequest &request, FetchHandler &handler) override
    {
        FakeResponse response;
        std::function<void(size_t)> hook;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _offsets.push_back(request.offset);
            if (!_script.empty())
            {
                response = _script.front();
                _script.pop_front();
            }
            hook = _chunkHook;
        }

        FetchResult result;
        if (response.error != ErrorKind::NONE)
        {
            result.error = response.error;
            result.errorText = "scripted transport failure";
            result.httpStatus = response.status;
            return result;
        }

        // Failing statuses never reach the handler, as with CURLOPT_FAILONERROR
        if (response.status >= 400)
        {
            result.httpStatus = response.status;
            result.error = classifyHttpStatus(response.status);
            result.errorText = "HTTP " + std::to_string(response.status);
            return result;
        }

        bool ranged = request.offset > 0 && response.honourRange;
        size_t start = ranged ? static_cast<size_t>(request.offset) : 0;
        if (start > _content.size())
        {
            result.httpStatus = 416;
            result.error = ErrorKind::RANGE_UNSUPPORTED;
            result.errorText = "HTTP 416";
            return result;
        }

        result.httpStatus = response.status != 0 ? response.status : (ranged ? 206 : 200);
        result.responseSeen = true;
        std::int64_t announced = response.contentLength >= 0 ? response.contentLength
                                                             : static_cast<std::int64_t>(_content.size() - start);
        if (!handler.onResponse(result.httpStatus, announced))
        {
            result.aborted = true;
            return result;
        }

        size_t chunk = std::min(request.bufferSize, _chunkSize);
        size_t delivered = 0;
        for (size_t pos = start; pos < _content.size(); pos += chunk)
        {
            size_t step = std::min(chunk, _content.size() - pos);
            if (delivered + step > response.failAfter)
            {
                step = response.failAfter - delivered;
            }
            if (step > 0)
            {
                if (!handler.onData(_content.data() + pos, step))
                {
                    result.aborted = true;
                    return result;
                }
                delivered += step;
                if (hook)
                {
                    hook(delivered);
                }
            }
            if (delivered >= response.failAfter)
            {
                result.error = ErrorKind::TRANSIENT_NETWORK;
                result.errorText = "Transferred a partial file";
                return result;
            }
        }
        return result;
    }

private:
    const std::string _content;
    const size_t _chunkSize;

    mutable std::mutex _mutex;
    std::deque<FakeResponse> _script;
    std::vector<std::uint64_t> _offsets;
    std::function<void(size_t)> _chunkHook;
};

// Deterministic, non-repeating test payload
inline std::string makeContent(size_t size)
{
    std::string content(size, '\0');
    std::uint32_t state = 2463534242u;
    for (size_t i = 0; i < size; ++i)
    {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        content[i] = static_cast<char>(state & 0xff);
    }
    return content;
}

#endif
