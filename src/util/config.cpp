#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <cerrno>
#include <fstream>

#include "util/config.hpp"
#include "util/file.hpp"

namespace
{
    std::string trim(const std::string &s)
    {
        const char *space = " \t\r\n";
        auto begin = s.find_first_not_of(space);
        if (begin == std::string::npos)
        {
            return std::string();
        }
        auto end = s.find_last_not_of(space);
        return s.substr(begin, end - begin + 1);
    }

    std::string unquote(const std::string &s)
    {
        if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
        {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }

    bool parseInteger(const std::string &text, long long &out)
    {
        if (text.empty())
        {
            return false;
        }
        errno = 0;
        char *end = nullptr;
        long long value = std::strtoll(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0')
        {
            return false;
        }
        out = value;
        return true;
    }

    // Parses an integer and clamps it into [low, high]
    bool parseClamped(const std::string &text, long long low, long long high, long long &out)
    {
        long long value = 0;
        if (!parseInteger(text, value))
        {
            return false;
        }
        out = std::min(std::max(value, low), high);
        return true;
    }

    const char *QDM_KEYS[] = {
        "MAX_PARALLEL_DOWNLOADS",
        "DOWNLOAD_RETRY_COUNT",
        "BANDWIDTH_LIMIT_KBPS",
        "RETRY_BACKOFF_BASE_SECONDS",
        "RETRY_BACKOFF_MAX_SECONDS",
        "DOWNLOAD_PATH",
        "QDM_API_KEY",
        "QDM_LOG_LEVEL",
        "QDM_LOG_FILE",
    };
}

std::string getStateDirectory()
{
    const char *home = std::getenv("HOME");
    if (!home || !*home)
    {
        // Fallback to current directory if HOME is not set
        return QDM_STATE_DIRECTORY;
    }
    return joinPath(home, QDM_STATE_DIRECTORY);
}

bool applySetting(EngineConfig &config, const std::string &key, const std::string &value)
{
    long long number = 0;

    if (key == "MAX_PARALLEL_DOWNLOADS")
    {
        if (!parseClamped(value, QDM_MIN_WORKERS, QDM_MAX_WORKERS, number))
            return false;
        config.workerCount = static_cast<int>(number);
    }
    else if (key == "DOWNLOAD_RETRY_COUNT")
    {
        if (!parseClamped(value, 0, QDM_MAX_RETRIES, number))
            return false;
        config.retryCount = static_cast<int>(number);
    }
    else if (key == "BANDWIDTH_LIMIT_KBPS")
    {
        if (!parseClamped(value, 0, 1024LL * 1024 * 1024, number))
            return false;
        config.bandwidthLimitBps = static_cast<std::int64_t>(number) * 1024;
    }
    else if (key == "RETRY_BACKOFF_BASE_SECONDS")
    {
        if (!parseClamped(value, 0, 3600, number))
            return false;
        config.backoffBase = std::chrono::seconds(number);
    }
    else if (key == "RETRY_BACKOFF_MAX_SECONDS")
    {
        if (!parseClamped(value, 0, 3600, number))
            return false;
        config.backoffCap = std::chrono::seconds(number);
    }
    else if (key == "DOWNLOAD_PATH")
    {
        if (value.empty())
            return false;
        config.downloadDirectory = value;
    }
    else if (key == "QDM_API_KEY")
    {
        config.apiKey = value;
    }
    else if (key == "QDM_LOG_LEVEL")
    {
        if (spdlog::level::from_str(value) == spdlog::level::off && value != "off")
            return false;
        config.logLevel = value;
    }
    else if (key == "QDM_LOG_FILE")
    {
        if (value.empty())
            return false;
        config.logFile = value;
    }
    else
    {
        return false;
    }

    return true;
}

EngineConfig loadConfig(const std::string &configPath, const EnvironmentLookup &lookup)
{
    EngineConfig config;
    config.logFile = joinPath(getStateDirectory(), QDM_LOG_FILENAME);

    std::ifstream file(configPath);
    std::string line;
    int lineNumber = 0;
    while (file && std::getline(file, line))
    {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#')
        {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
        {
            spdlog::warn("{}:{}: expected KEY=VALUE", configPath, lineNumber);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));
        if (!applySetting(config, key, value))
        {
            spdlog::warn("{}:{}: ignoring invalid setting {}={}", configPath, lineNumber, key, value);
        }
    }

    // Environment overrides the file
    if (lookup)
    {
        for (const char *key : QDM_KEYS)
        {
            const char *value = lookup(key);
            if (value && !applySetting(config, key, value))
            {
                spdlog::warn("ignoring invalid environment setting {}={}", key, value);
            }
        }
    }

    if (config.backoffCap < config.backoffBase)
    {
        config.backoffCap = config.backoffBase;
    }

    return config;
}

EngineConfig loadConfig()
{
    return loadConfig(joinPath(getStateDirectory(), QDM_CONFIG_FILENAME),
                      [](const char *name)
                      { return static_cast<const char *>(std::getenv(name)); });
}
