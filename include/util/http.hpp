#ifndef HTTP_HPP
#define HTTP_HPP

#include <string>

#include "core/ByteSource.hpp"
#include "core/Collaborators.hpp"

static constexpr char DEFAULT_FILENAME[] = "downloaded_file";

namespace http
{
    // Maps a libcurl result (plus the response status, if any) onto the error taxonomy
    ErrorKind classifyCurlCode(int curlCode, long httpStatus);

    std::string extractFilenameFromContentDisposition(const std::string &headerLine);
    std::string deriveFilenameFromUrl(const std::string &url);

    // Streams a GET through the libcurl easy interface, resuming at the requested offset
    class CurlByteSource : public ByteSource
    {
    public:
        FetchResult fetch(const FetchRequest &request, FetchHandler &handler) override;
    };

    // Resolves a plain URL with a HEAD request: file name, size and any auth header the GET needs
    class DirectUrlResolver : public CatalogResolver
    {
    public:
        explicit DirectUrlResolver(std::string apiKey = std::string(), long timeoutSeconds = 30);

        Result<ResolvedArtifact> resolve(const TaskInput &input) override;

    private:
        const std::string _apiKey;
        const long _timeoutSeconds;
    };
}

#endif
