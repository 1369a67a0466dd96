#include "http.hpp"
#include "errors.hpp"

#include <curl/curl.h>
#include <fstream>
#include <mutex>

namespace KoStore {

namespace {

    std::once_flag curlInitFlag;

    struct DownloadSink {
        std::ofstream* outFile = nullptr;
        const ProgressCallback* progress = nullptr;
        bool canceled = false;
        bool writeFailed = false;
    };

    /**
     * cURL write callback for receiving data and writing directly to
     * an output file stream.
     */
    size_t FileWriteCallback(void* ptr, size_t size, size_t nmemb, void* userdata)
    {
        auto* sink = static_cast<DownloadSink*>(userdata);
        size_t totalSize = size * nmemb;

        if (sink->outFile && sink->outFile->is_open()) {
            sink->outFile->write(static_cast<char*>(ptr), totalSize);
            if (!sink->outFile->good()) {
                sink->writeFailed = true;
                return 0; // Signal error to cURL
            }
        }
        return totalSize;
    }

    /**
     * cURL transfer info callback; forwards progress and lets the caller
     * abort between chunks.
     */
    int XferInfoCallback(void* userdata,
                         curl_off_t totalToDownload,
                         curl_off_t nowDownloaded,
                         curl_off_t /*totalToUpload*/,
                         curl_off_t /*nowUploaded*/)
    {
        auto* sink = static_cast<DownloadSink*>(userdata);
        if (!sink->progress || !*sink->progress) {
            return 0;
        }

        std::optional<std::uint64_t> total;
        if (totalToDownload > 0) {
            total = static_cast<std::uint64_t>(totalToDownload);
        }
        if (!(*sink->progress)(static_cast<std::uint64_t>(nowDownloaded), total)) {
            sink->canceled = true;
            return 1; // Non-zero aborts the transfer
        }
        return 0;
    }

    size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata)
    {
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        size_t totalSize = size * nitems;
        std::string line(buffer, totalSize);

        // A new status line starts a new header block (redirects)
        if (line.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return totalSize;
        }

        auto colon = line.find(':');
        if (colon != std::string::npos) {
            headers->emplace(toLower(trim(line.substr(0, colon))),
                             trim(line.substr(colon + 1)));
        }
        return totalSize;
    }

    bool isTransientCurlCode(CURLcode code)
    {
        switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
            return true;
        default:
            return false;
        }
    }

    // Owns one easy handle and its header list for the duration of a request
    class EasyHandle
    {
    public:
        explicit EasyHandle(const HttpRequest& request)
        {
            curl = curl_easy_init();
            if (!curl) {
                throw NetworkError("Failed to initialize libcurl", false);
            }
            for (const auto& [name, value] : request.headers) {
                headerList = curl_slist_append(headerList, (name + ": " + value).c_str());
            }

            curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.connectTimeoutSeconds);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeoutSeconds);
            curl_easy_setopt(curl, CURLOPT_USERAGENT, "KOStore/1.0");
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        }

        ~EasyHandle()
        {
            curl_slist_free_all(headerList);
            curl_easy_cleanup(curl);
        }

        EasyHandle(const EasyHandle&) = delete;
        EasyHandle& operator=(const EasyHandle&) = delete;

        CURL* get() const { return curl; }

    private:
        CURL* curl = nullptr;
        curl_slist* headerList = nullptr;
    };

} // namespace

std::string HttpResponse::header(const std::string& name) const
{
    auto it = headers.find(toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

bool isTransientStatus(long status)
{
    return status == 429 || (status >= 500 && status < 600);
}

std::optional<std::string> nextLinkFromHeader(const std::string& linkHeader)
{
    // <https://api.github.com/...&page=2>; rel="next", <...>; rel="last"
    std::string::size_type start = 0;
    while (start < linkHeader.size()) {
        auto end = linkHeader.find(',', start);
        std::string part = trim(linkHeader.substr(start, end == std::string::npos
                                                            ? std::string::npos
                                                            : end - start));
        auto open  = part.find('<');
        auto close = part.find('>');
        if (open != std::string::npos && close != std::string::npos && close > open &&
            part.find("rel=\"next\"", close) != std::string::npos) {
            return part.substr(open + 1, close - open - 1);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

// ============================================================================
// CurlHttpClient
// ============================================================================
CurlHttpClient::CurlHttpClient()
{
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::get(const HttpRequest& request)
{
    EasyHandle handle(request);
    HttpResponse response;

    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERDATA, &response.headers);

    log_debug("GET " + request.url);
    CURLcode res = curl_easy_perform(handle.get());
    if (res != CURLE_OK) {
        throw NetworkError("Request to " + request.url + " failed: " +
                           curl_easy_strerror(res),
                           isTransientCurlCode(res));
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

void CurlHttpClient::download(const HttpRequest& request,
                              const fs::path& destPath,
                              const ProgressCallback& progress)
{
    std::ofstream outFile(destPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw IOError("Failed to open file for writing: " + destPath.string());
    }

    EasyHandle handle(request);
    DownloadSink sink;
    sink.outFile  = &outFile;
    sink.progress = &progress;

    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, FileWriteCallback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, XferInfoCallback);
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &sink);

    log_debug("Downloading " + request.url + " -> " + destPath.string());
    CURLcode res = curl_easy_perform(handle.get());
    long responseCode = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &responseCode);
    outFile.close();

    if (sink.canceled) {
        throw CancellationError();
    }
    if (sink.writeFailed) {
        throw IOError("Error writing to download file " + destPath.string());
    }
    if (res == CURLE_HTTP_RETURNED_ERROR || responseCode >= 400) {
        throw NetworkError("Server responded with code " + std::to_string(responseCode) +
                           " for " + request.url,
                           isTransientStatus(responseCode), responseCode);
    }
    if (res != CURLE_OK) {
        throw NetworkError("Error downloading " + request.url + ": " +
                           curl_easy_strerror(res),
                           isTransientCurlCode(res));
    }
}

} // namespace KoStore
