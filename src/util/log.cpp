#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>
#include <memory>

#include "util/log.hpp"
#include "util/file.hpp"

void initialiseLogging(const EngineConfig &config, bool toConsole)
{
    std::shared_ptr<spdlog::logger> logger;
    spdlog::drop("qdm");

    if (toConsole)
    {
        logger = spdlog::stderr_color_mt("qdm");
    }
    else
    {
        try
        {
            if (ensureDirectory(parentDirectory(config.logFile)))
            {
                logger = spdlog::rotating_logger_mt("qdm", config.logFile, QDM_LOG_MAX_SIZE, QDM_LOG_MAX_FILES);
            }
        }
        catch (const spdlog::spdlog_ex &e)
        {
            spdlog::warn("cannot open log file {}: {}", config.logFile, e.what());
        }

        // Nowhere to write without disturbing the curses screen
        if (!logger)
        {
            logger = spdlog::null_logger_mt("qdm");
        }
    }

    logger->set_level(spdlog::level::from_str(config.logLevel));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
