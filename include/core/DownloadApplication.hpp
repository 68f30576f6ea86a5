#ifndef DOWNLOADAPPLICATION_HPP
#define DOWNLOADAPPLICATION_HPP

#include <string>
#include <vector>
#include <memory>

#include "core/DownloadManager.hpp"
#include "util/config.hpp"

class DownloadApplication
{
public:
    explicit DownloadApplication(EngineConfig config);
    ~DownloadApplication();

    // Interactive curses front end when no URLs are given, batch mode otherwise; returns the exit code
    int run(const std::vector<std::string> &urls);

private:
    EngineConfig _config;

    int runInteractive(DownloadManager &manager);
    int runBatch(DownloadManager &manager, const std::vector<std::string> &urls);
};

#endif
