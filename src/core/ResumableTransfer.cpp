#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <memory>

#include "core/ResumableTransfer.hpp"
#include "aux/BandwidthShaper.hpp"
#include "aux/FileWriter.hpp"
#include "aux/Sha256Hasher.hpp"
#include "util/file.hpp"

namespace
{
    std::string baseName(const std::string &path)
    {
        auto pos = path.find_last_of('/');
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }

    TransferError writeFailure(const std::string &path, int err)
    {
        if (err == ENOSPC)
        {
            return TransferError(ErrorKind::INSUFFICIENT_SPACE, "Insufficient disk space writing " + path);
        }
        return TransferError(ErrorKind::IO_ERROR, "Cannot write " + path + ": " + std::strerror(err));
    }

    // Applies the per-chunk rules of a transfer to the body the byte source streams
    class ChunkSink : public FetchHandler
    {
    public:
        ChunkSink(const TransferRequest &request,
                  const TransferSettings &settings,
                  TaskSignals &signals,
                  const TransferHooks &hooks,
                  Sha256Hasher &hasher,
                  std::uint64_t offset)
            : _request(request),
              _settings(settings),
              _signals(signals),
              _hooks(hooks),
              _hasher(hasher),
              _offset(offset),
              _downloaded(offset),
              _total(request.expectedSize > 0 ? static_cast<std::uint64_t>(request.expectedSize) : 0)
        {
        }

        bool onResponse(long httpStatus, std::int64_t contentLength) override
        {
            _responseSeen = true;

            // A full 200 body answering a ranged request would corrupt the partial file
            if (_offset > 0 && httpStatus == 200)
            {
                return abort(TransferError(ErrorKind::RANGE_UNSUPPORTED,
                                           "Server ignored the resume range", httpStatus));
            }
            if (httpStatus >= 300)
            {
                return abort(TransferError(classifyHttpStatus(httpStatus),
                                           "HTTP " + std::to_string(httpStatus), httpStatus));
            }

            if (contentLength >= 0)
            {
                _total = _offset + static_cast<std::uint64_t>(contentLength);
            }

            _writer = std::make_unique<FileWriter>(_request.destination, _offset > 0);
            if (!_writer->isOpen())
            {
                return abort(writeFailure(_request.destination, _writer->lastErrno()));
            }

            notifyPhase(TransferPhase::DOWNLOADING);
            return true;
        }

        bool onData(const char *data, size_t size) override
        {
            if (_signals.isCancelled())
            {
                return abort(TransferError(ErrorKind::USER_CANCELLED, "Interrupted by user"));
            }

            // Park on the gate with the chunk in hand; it is written once resumed
            if (_signals.isPaused())
            {
                notifyPhase(TransferPhase::PAUSED);
                if (!_signals.waitWhilePaused())
                {
                    return abort(TransferError(ErrorKind::USER_CANCELLED, "Interrupted by user"));
                }
                notifyPhase(TransferPhase::DOWNLOADING);
            }

            // Bytes past the announced length cannot belong to the artifact
            if (_total > 0 && _downloaded + size > _total)
            {
                return abort(TransferError(ErrorKind::TRANSIENT_NETWORK,
                                           "Server sent more than the announced " + std::to_string(_total) + " bytes"));
            }

            if (!_writer || !_writer->write(data, size))
            {
                return abort(writeFailure(_request.destination, _writer ? _writer->lastErrno() : EBADF));
            }

            _hasher.update(data, size);
            _downloaded += size;
            _received += size;
            reportProgress(false);

            std::int64_t limit = _hooks.bandwidthLimit ? _hooks.bandwidthLimit() : 0;
            auto delay = _shaper.consume(size, limit);
            if (delay.count() > 0 && !_signals.sleepFor(delay))
            {
                return abort(TransferError(ErrorKind::USER_CANCELLED, "Interrupted by user"));
            }
            return true;
        }

        // Emits the tally at most once per progress interval unless forced
        void reportProgress(bool force)
        {
            auto now = std::chrono::steady_clock::now();
            if (!force && _reported && now - _lastReport < _settings.progressInterval)
            {
                return;
            }
            _reported = true;
            _lastReport = now;
            if (_hooks.onProgress)
            {
                _hooks.onProgress(_downloaded, _total);
            }
        }

        // Reports the bytes already on disk as the starting point of this call
        void reportResume()
        {
            _reported = true;
            _lastReport = std::chrono::steady_clock::now();
            if (_hooks.onResume)
            {
                _hooks.onResume(_downloaded, _total);
            }
            else if (_hooks.onProgress)
            {
                _hooks.onProgress(_downloaded, _total);
            }
        }

        void notifyPhase(TransferPhase phase)
        {
            if (_hooks.onPhase)
            {
                _hooks.onPhase(phase);
            }
        }

        bool closeFile()
        {
            if (!_writer)
            {
                return true;
            }
            bool flushed = _writer->flush();
            _writer->close();
            return flushed && _writer->lastErrno() == 0;
        }

        int fileErrno() const { return _writer ? _writer->lastErrno() : 0; }
        bool responseSeen() const { return _responseSeen; }
        const TransferError &abortReason() const { return _abortReason; }
        std::uint64_t downloaded() const { return _downloaded; }
        std::uint64_t received() const { return _received; }
        std::uint64_t total() const { return _total; }

    private:
        const TransferRequest &_request;
        const TransferSettings &_settings;
        TaskSignals &_signals;
        const TransferHooks &_hooks;
        Sha256Hasher &_hasher;

        const std::uint64_t _offset;
        std::uint64_t _downloaded;
        std::uint64_t _received{0};
        std::uint64_t _total;

        std::unique_ptr<FileWriter> _writer;
        BandwidthShaper _shaper;
        std::chrono::steady_clock::time_point _lastReport;
        bool _reported{false};
        bool _responseSeen{false};
        TransferError _abortReason;

        bool abort(TransferError reason)
        {
            _abortReason = std::move(reason);
            return false;
        }
    };
}

ResumableTransfer::ResumableTransfer(ByteSource &source, TransferSettings settings)
    : _source(source),
      _settings(settings)
{
}

// Runs the transfer, restarting from zero at most maxRangeRestarts times when the server rejects a resume
Result<TransferSummary> ResumableTransfer::run(const TransferRequest &request, TaskSignals &signals, const TransferHooks &hooks)
{
    if (request.url.empty())
    {
        return TransferError(ErrorKind::INVALID_INPUT, "Invalid URL: empty");
    }
    if (request.destination.empty())
    {
        return TransferError(ErrorKind::INVALID_INPUT, "Invalid destination: empty");
    }
    if (!ensureDirectory(parentDirectory(request.destination)))
    {
        return TransferError(ErrorKind::IO_ERROR, "Cannot create directory " + parentDirectory(request.destination));
    }

    int restarts = 0;
    while (true)
    {
        Result<TransferSummary> result = attempt(request, signals, hooks);
        if (result.ok())
        {
            result.value().restarts = restarts;
            return result;
        }

        if (result.error().kind != ErrorKind::RANGE_UNSUPPORTED || restarts >= _settings.maxRangeRestarts)
        {
            return result;
        }

        ++restarts;
        spdlog::info("{}: resume rejected ({}), restarting from zero", baseName(request.destination), result.error().message);
        if (!removeFile(request.destination))
        {
            return TransferError(ErrorKind::IO_ERROR, "Cannot delete partial file " + request.destination);
        }
    }
}

Result<TransferSummary> ResumableTransfer::attempt(const TransferRequest &request, TaskSignals &signals, const TransferHooks &hooks)
{
    if (signals.isCancelled())
    {
        return TransferError(ErrorKind::USER_CANCELLED, "Interrupted by user");
    }

    std::int64_t existing = fileSize(request.destination);
    std::uint64_t offset = existing > 0 ? static_cast<std::uint64_t>(existing) : 0;

    // A partial file longer than the artifact cannot be a prefix of it
    if (request.expectedSize > 0 && offset > static_cast<std::uint64_t>(request.expectedSize))
    {
        spdlog::warn("{}: partial file larger than expected size, discarding", baseName(request.destination));
        if (!removeFile(request.destination))
        {
            return TransferError(ErrorKind::IO_ERROR, "Cannot delete partial file " + request.destination);
        }
        offset = 0;
    }

    if (request.expectedSize > 0)
    {
        std::uint64_t needed = static_cast<std::uint64_t>(request.expectedSize) - offset;
        std::int64_t available = availableDiskSpace(parentDirectory(request.destination));
        if (available >= 0 && static_cast<std::uint64_t>(available) < needed)
        {
            return TransferError(ErrorKind::INSUFFICIENT_SPACE,
                                 "Insufficient disk space: need " + std::to_string(needed) +
                                     " bytes, " + std::to_string(available) + " available");
        }
    }

    // Seed the running hash with the bytes already on disk
    Sha256Hasher hasher;
    if (offset > 0)
    {
        std::int64_t hashed = hasher.updateFromFile(request.destination);
        if (hashed != static_cast<std::int64_t>(offset))
        {
            return TransferError(ErrorKind::IO_ERROR, "Cannot read partial file " + request.destination);
        }
        spdlog::info("{}: resuming from byte {}", baseName(request.destination), offset);
    }

    ChunkSink sink(request, _settings, signals, hooks, hasher, offset);
    sink.notifyPhase(TransferPhase::CONNECTING);
    sink.reportResume();

    FetchRequest fetch;
    fetch.url = request.url;
    fetch.offset = offset;
    fetch.headers = request.headers;
    fetch.bufferSize = _settings.chunkSize;
    fetch.connectTimeoutSeconds = _settings.connectTimeoutSeconds;
    fetch.lowSpeedTimeSeconds = _settings.lowSpeedTimeSeconds;

    FetchResult result = _source.fetch(fetch, sink);

    // An empty 2xx body never reaches the data callback
    if (result.error == ErrorKind::NONE && !result.aborted && !sink.responseSeen())
    {
        if (!sink.onResponse(result.httpStatus, 0))
        {
            result.aborted = true;
        }
    }

    bool closed = sink.closeFile();

    if (result.aborted)
    {
        // Cancelled transfers keep their partial file for a later resume
        return sink.abortReason();
    }
    if (result.error != ErrorKind::NONE)
    {
        return TransferError(result.error, result.errorText, result.httpStatus, result.curlCode);
    }
    if (!closed)
    {
        return writeFailure(request.destination, sink.fileErrno());
    }

    sink.reportProgress(true);

    if (sink.total() > 0 && sink.downloaded() < sink.total())
    {
        return TransferError(ErrorKind::TRANSIENT_NETWORK,
                             "Transfer ended early at " + std::to_string(sink.downloaded()) +
                                 " of " + std::to_string(sink.total()) + " bytes",
                             result.httpStatus);
    }

    sink.notifyPhase(TransferPhase::VERIFYING);
    std::string digest = hasher.hexDigest();

    if (!request.expectedHash.empty() && !digestsEqual(digest, request.expectedHash))
    {
        if (!removeFile(request.destination))
        {
            spdlog::error("{}: could not delete corrupt file", request.destination);
        }
        return TransferError(ErrorKind::INTEGRITY_MISMATCH,
                             "SHA256 mismatch for " + baseName(request.destination) + ": expected " +
                                 request.expectedHash + ", got " + digest + ". File deleted.");
    }

    TransferSummary summary;
    summary.resumedFrom = offset;
    summary.bytesReceived = sink.received();
    summary.finalSize = sink.downloaded();
    summary.sha256 = digest;
    return summary;
}
