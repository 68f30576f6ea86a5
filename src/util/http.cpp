#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>

#include "util/http.hpp"

namespace http
{
    namespace
    {
        std::string toLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        // Owns a curl_slist of request headers for the lifetime of one request
        class HeaderList
        {
        public:
            explicit HeaderList(const std::vector<std::string> &headers)
            {
                for (const auto &header : headers)
                {
                    curl_slist *appended = curl_slist_append(_list, header.c_str());
                    if (appended)
                    {
                        _list = appended;
                    }
                }
            }
            ~HeaderList() { curl_slist_free_all(_list); }

            HeaderList(const HeaderList &) = delete;
            HeaderList &operator=(const HeaderList &) = delete;

            curl_slist *get() const { return _list; }

        private:
            curl_slist *_list{nullptr};
        };

        struct FetchContext
        {
            CURL *curl;
            FetchHandler &handler;
            FetchResult &result;
        };

        // Writes incoming data from libcurl to the fetch handler
        // The response status is reported to the handler before the first body byte
        size_t curlWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            auto *context = static_cast<FetchContext *>(userdata);
            size_t totalBytes = size * nmemb;

            if (!context->result.responseSeen)
            {
                context->result.responseSeen = true;

                long status = 0;
                curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);
                context->result.httpStatus = status;

                curl_off_t length = -1;
                curl_easy_getinfo(context->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

                if (!context->handler.onResponse(status, static_cast<std::int64_t>(length)))
                {
                    context->result.aborted = true;
                    return 0;
                }
            }

            if (!context->handler.onData(ptr, totalBytes))
            {
                context->result.aborted = true;
                return 0; // Makes curl stop with CURLE_WRITE_ERROR
            }
            return totalBytes;
        }

        struct ProbeHeaders
        {
            std::string filename;
        };

        // Callback function for processing HTTP headers received by libcurl; invoked for each header line
        // If the header contains a Content-Disposition field with a filename, it is extracted
        size_t curlHeaderCallback(char *buffer, size_t size, size_t nmemb, void *userData)
        {
            size_t length = size * nmemb;
            std::string header(buffer, length);

            // Header names are case-insensitive, and HTTP/2 sends them lowercased
            if (toLower(header).compare(0, 20, "content-disposition:") == 0)
            {
                std::string fname = extractFilenameFromContentDisposition(header);
                if (!fname.empty())
                {
                    static_cast<ProbeHeaders *>(userData)->filename = fname;
                }
            }

            return length;
        }
    }

    ErrorKind classifyCurlCode(int curlCode, long httpStatus)
    {
        switch (static_cast<CURLcode>(curlCode))
        {
        case CURLE_OK:
            return httpStatus >= 400 ? classifyHttpStatus(httpStatus) : ErrorKind::NONE;
        case CURLE_HTTP_RETURNED_ERROR:
            return classifyHttpStatus(httpStatus);
        case CURLE_RANGE_ERROR:
            return ErrorKind::RANGE_UNSUPPORTED;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorKind::INVALID_INPUT;
        case CURLE_LOGIN_DENIED:
            return ErrorKind::AUTH;
        case CURLE_WRITE_ERROR:
            return ErrorKind::IO_ERROR;
        default:
            // Connect, resolve, timeout, receive and partial-file failures
            return ErrorKind::TRANSIENT_NETWORK;
        }
    }

    // Extracts the filename from a Content-Disposition header line
    // Searches for the "filename=" parameter and extracts the filename string
    // Returns an empty string if no filename can be extracted
    std::string extractFilenameFromContentDisposition(const std::string &headerLine)
    {
        auto pos = toLower(headerLine).find("filename=");
        if (pos == std::string::npos)
        {
            return std::string();
        }

        pos += 9; // Advance position to start of filename (after "filename=")

        // If the filename is quoted, extract the quoted string
        if (pos < headerLine.size() && headerLine[pos] == '"')
        {
            auto endPos = headerLine.find('"', pos + 1);
            if (endPos != std::string::npos)
            {
                return headerLine.substr(pos + 1, endPos - (pos + 1));
            }
            return std::string();
        }

        // If not quoted, extract until the first delimiter (space, semicolon, CR or LF)
        size_t endPos = headerLine.find_first_of(" ;\r\n", pos);
        return headerLine.substr(pos, endPos == std::string::npos ? std::string::npos : endPos - pos);
    }

    // Derives a filename from the last path segment of the URL
    // Falls back to the default filename if the segment does not look like a file
    std::string deriveFilenameFromUrl(const std::string &url)
    {
        std::string path = url.substr(0, url.find_first_of("?#"));

        auto pos = path.find_last_of('/');
        if (pos == std::string::npos || pos == path.size() - 1)
        {
            return DEFAULT_FILENAME;
        }

        std::string fname = path.substr(pos + 1);

        auto dotPos = fname.find_last_of('.');
        if (dotPos == std::string::npos)
        {
            return DEFAULT_FILENAME;
        }

        size_t extLength = fname.size() - dotPos - 1;
        if (extLength < 1 || extLength > 4)
        {
            return DEFAULT_FILENAME;
        }

        return fname;
    }

    //---------------------------------------------------------------------------------
    // CurlByteSource
    //---------------------------------------------------------------------------------

    FetchResult CurlByteSource::fetch(const FetchRequest &request, FetchHandler &handler)
    {
        FetchResult result;

        CURL *curlHandle = curl_easy_init();
        if (!curlHandle)
        {
            result.error = ErrorKind::TRANSIENT_NETWORK;
            result.errorText = "Failed to initialise libcurl";
            result.curlCode = CURLE_FAILED_INIT;
            return result;
        }

        HeaderList headers(request.headers);
        FetchContext context{curlHandle, handler, result};

        curl_easy_setopt(curlHandle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, curlWriteCallback);
        curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curlHandle, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curlHandle, CURLOPT_BUFFERSIZE, static_cast<long>(request.bufferSize));
        curl_easy_setopt(curlHandle, CURLOPT_CONNECTTIMEOUT, request.connectTimeoutSeconds);
        curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_TIME, request.lowSpeedTimeSeconds);
        if (headers.get())
        {
            curl_easy_setopt(curlHandle, CURLOPT_HTTPHEADER, headers.get());
        }

        // Tell libcurl to resume the download at the size of the partial file
        if (request.offset > 0)
        {
            curl_easy_setopt(curlHandle, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(request.offset));
        }

        CURLcode res = curl_easy_perform(curlHandle);

        long status = 0;
        curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &status);
        result.httpStatus = status;
        result.curlCode = res;

        if (!result.aborted)
        {
            result.error = classifyCurlCode(res, status);
            if (result.error != ErrorKind::NONE)
            {
                result.errorText = res != CURLE_OK ? curl_easy_strerror(res) : "HTTP " + std::to_string(status);
                if (status > 0 && res != CURLE_OK)
                {
                    result.errorText += " (HTTP " + std::to_string(status) + ")";
                }
            }
        }

        curl_easy_cleanup(curlHandle);
        return result;
    }

    //---------------------------------------------------------------------------------
    // DirectUrlResolver
    //---------------------------------------------------------------------------------

    DirectUrlResolver::DirectUrlResolver(std::string apiKey, long timeoutSeconds)
        : _apiKey(std::move(apiKey)),
          _timeoutSeconds(timeoutSeconds)
    {
    }

    // Performs an HTTP HEAD request to retrieve header information
    // If a Content-Disposition header is present and includes a filename, that name is used
    // Else, the filename is derived from the effective URL after following redirects
    Result<ResolvedArtifact> DirectUrlResolver::resolve(const TaskInput &input)
    {
        if (input.url.empty())
        {
            return TransferError(ErrorKind::INVALID_INPUT, "Invalid URL: empty");
        }

        ResolvedArtifact artifact;
        artifact.downloadUrl = input.url;
        artifact.filename = deriveFilenameFromUrl(input.url);
        artifact.expectedHash = input.expectedHash;
        if (!_apiKey.empty())
        {
            artifact.headers.push_back("Authorization: Bearer " + _apiKey);
        }

        CURL *curl = curl_easy_init();
        if (!curl)
        {
            return TransferError(ErrorKind::RESOLUTION, "Failed to initialise libcurl", 0, CURLE_FAILED_INIT);
        }

        HeaderList headers(artifact.headers);
        ProbeHeaders probe;

        curl_easy_setopt(curl, CURLOPT_URL, input.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);         // HEAD request
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L); // Follow HTTP redirects
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, _timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, curlHeaderCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &probe);
        if (headers.get())
        {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        }

        CURLcode res = curl_easy_perform(curl);

        long httpStatus = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

        curl_off_t length = -1;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

        std::string effectiveUrl;
        char *effective = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective)
        {
            effectiveUrl = effective;
        }

        curl_easy_cleanup(curl);

        if (res != CURLE_OK)
        {
            ErrorKind kind = classifyCurlCode(res, httpStatus) == ErrorKind::INVALID_INPUT
                                 ? ErrorKind::INVALID_INPUT
                                 : ErrorKind::RESOLUTION;
            return TransferError(kind, std::string("Fetching info failed: ") + curl_easy_strerror(res), httpStatus, res);
        }

        if (httpStatus == 401 || httpStatus == 403)
        {
            return TransferError(ErrorKind::AUTH, "Access denied (HTTP " + std::to_string(httpStatus) + ")", httpStatus);
        }
        if (httpStatus == 404 || httpStatus == 410)
        {
            return TransferError(ErrorKind::NOT_FOUND, "Not found (HTTP " + std::to_string(httpStatus) + ")", httpStatus);
        }
        if (httpStatus == 405 || httpStatus == 501)
        {
            // HEAD not supported; the GET will report the real outcome
            spdlog::debug("{}: HEAD rejected with HTTP {}, using URL metadata", input.url, httpStatus);
            return artifact;
        }
        if (httpStatus >= 400)
        {
            return TransferError(ErrorKind::RESOLUTION, "Fetching info failed (HTTP " + std::to_string(httpStatus) + ")", httpStatus);
        }

        if (!probe.filename.empty())
        {
            artifact.filename = probe.filename;
        }
        else if (!effectiveUrl.empty())
        {
            artifact.filename = deriveFilenameFromUrl(effectiveUrl);
        }
        artifact.size = length >= 0 ? static_cast<std::int64_t>(length) : -1;
        return artifact;
    }
}
