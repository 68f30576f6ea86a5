#ifndef LOG_HPP
#define LOG_HPP

#include "util/config.hpp"

static constexpr size_t QDM_LOG_MAX_SIZE = 1024 * 1024;
static constexpr size_t QDM_LOG_MAX_FILES = 3;

// Installs the default spdlog logger: a rotating file while curses owns the terminal, stderr otherwise
void initialiseLogging(const EngineConfig &config, bool toConsole);

#endif
