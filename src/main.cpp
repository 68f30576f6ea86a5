#include <spdlog/spdlog.h>
#include <cstdio>
#include <string>
#include <vector>
#include <exception>

#include "core/DownloadApplication.hpp"
#include "util/args.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

// qdm [-f <file>] [<url>[#sha256]...]
int main(int argc, char *argv[])
{
    std::vector<std::string> urls;
    bool fromFile = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string argument = argv[i];
        if (argument != "-f")
        {
            urls.push_back(argument);
            continue;
        }

        if (i + 1 >= argc)
        {
            std::fprintf(stderr, "qdm: -f needs a file of URLs\n");
            return 2;
        }
        if (!readUrlFile(argv[++i], urls))
        {
            std::fprintf(stderr, "qdm: cannot read %s\n", argv[i]);
            return 2;
        }
        fromFile = true;
    }

    // An empty list file is not a request for the interactive UI
    if (fromFile && urls.empty())
    {
        std::fprintf(stderr, "qdm: no URLs to download\n");
        return 2;
    }

    try
    {
        EngineConfig config = loadConfig();
        initialiseLogging(config, !urls.empty());

        DownloadApplication app(config);
        return app.run(urls);
    }
    catch (const std::exception &e)
    {
        spdlog::critical("qdm: {}", e.what());
        return 2;
    }
}
