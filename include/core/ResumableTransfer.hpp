#ifndef RESUMABLETRANSFER_HPP
#define RESUMABLETRANSFER_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

#include "core/ByteSource.hpp"
#include "core/ProgressTracker.hpp"
#include "core/TransferError.hpp"
#include "aux/TaskSignals.hpp"

struct TransferSettings
{
    size_t chunkSize{QDM_DEFAULT_CHUNK_SIZE};
    std::chrono::milliseconds progressInterval{100};
    long connectTimeoutSeconds{30};
    long lowSpeedTimeSeconds{60};
    int maxRangeRestarts{1};
};

struct TransferRequest
{
    std::string url;
    std::string destination;
    std::string expectedHash;
    std::int64_t expectedSize{-1};
    std::vector<std::string> headers;
};

struct TransferSummary
{
    std::uint64_t resumedFrom{0};
    std::uint64_t bytesReceived{0}; // body bytes fetched by this call
    std::uint64_t finalSize{0};
    std::string sha256;
    int restarts{0};
};

struct TransferHooks
{
    std::function<void(TransferPhase)> onPhase;
    std::function<void(std::uint64_t bytesDownloaded, std::uint64_t totalSize)> onProgress;
    std::function<void(std::uint64_t bytesOnDisk, std::uint64_t totalSize)> onResume; // before fetching; onProgress if unset
    std::function<std::int64_t()> bandwidthLimit; // bytes per second, <= 0 for unlimited
};

// Streams one remote artifact into a local file, resuming any partial file and verifying its SHA-256
class ResumableTransfer
{
public:
    ResumableTransfer(ByteSource &source, TransferSettings settings);

    Result<TransferSummary> run(const TransferRequest &request, TaskSignals &signals, const TransferHooks &hooks);

private:
    ByteSource &_source;
    TransferSettings _settings;

    Result<TransferSummary> attempt(const TransferRequest &request, TaskSignals &signals, const TransferHooks &hooks);
};

#endif
