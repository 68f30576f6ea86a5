#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <functional>

static constexpr const char QDM_STATE_DIRECTORY[] = ".qdm";
static constexpr const char QDM_CONFIG_FILENAME[] = "config";
static constexpr const char QDM_LOG_FILENAME[] = "qdm.log";

static constexpr int QDM_MIN_WORKERS = 1;
static constexpr int QDM_MAX_WORKERS = 16;
static constexpr int QDM_MAX_RETRIES = 10;

struct EngineConfig
{
    int workerCount{1};
    int retryCount{2};
    std::chrono::milliseconds backoffBase{2000};
    std::chrono::milliseconds backoffCap{60000};
    std::int64_t bandwidthLimitBps{0};
    size_t chunkSize{32 * 1024};
    std::chrono::milliseconds progressInterval{100};
    size_t eventCapacity{256};
    std::string downloadDirectory{"."};
    std::string apiKey;
    long connectTimeoutSeconds{30};
    long lowSpeedTimeSeconds{60};
    std::string logLevel{"info"};
    std::string logFile;
};

// Variable lookup used by loadConfig; returns nullptr when the variable is unset
using EnvironmentLookup = std::function<const char *(const char *)>;

// Returns $HOME/.qdm, or .qdm in the working directory when HOME is unset
std::string getStateDirectory();

// Defaults, then the KEY=VALUE file, then the environment
EngineConfig loadConfig(const std::string &configPath, const EnvironmentLookup &lookup);
EngineConfig loadConfig();

// Applies one KEY=VALUE setting; returns false for an unknown key or a malformed value
bool applySetting(EngineConfig &config, const std::string &key, const std::string &value);

#endif
